#pragma once

#include <string>

namespace warden
{
    /**
     * Raw device attributes hashed into the machine fingerprint.
     * Empty fields are skipped when the digest is computed.
     */
    struct DeviceAttributes
    {
        std::string hostname;
        std::string os_family;
        std::string architecture;
        std::string os_version;
        std::string os_release;
        std::string mac_token{"mac-unknown"};
        std::string system_uuid{"uuid-unknown"};
    };

    class FingerprintGenerator
    {
    public:
        /**
         * Probe the local device. Never fails: unreadable sources degrade to
         * placeholder components.
         */
        static DeviceAttributes collect();

        /** SHA-256 hex digest of the '|'-joined non-empty attributes */
        static std::string digest(const DeviceAttributes &attrs);

        /** digest(collect()) */
        static std::string current();

        /** Short platform description sent with verification requests */
        static std::string platform_string(const DeviceAttributes &attrs);

    private:
        static std::string read_mac_token();
        static std::string read_system_uuid();
    };

} // namespace warden

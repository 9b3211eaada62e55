#pragma once

#include "license_payload.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace warden
{

    /**
     * Single-assignment cell. The first set() wins; later calls are ignored
     * and report false.
     */
    template <typename T>
    class SetOnce
    {
    public:
        bool set(T value)
        {
            std::lock_guard lock(mutex_);
            if (value_)
                return false;
            value_.emplace(std::move(value));
            return true;
        }

        std::optional<T> get() const
        {
            std::lock_guard lock(mutex_);
            return value_;
        }

    private:
        std::optional<T> value_;
        mutable std::mutex mutex_;
    };

    /**
     * The license payload this process runs under. Applying happens at most
     * once; with environment export enabled the first payload is also
     * published as WARDEN_LICENSE_* variables (existing values are kept).
     */
    class AppliedLicense
    {
    public:
        explicit AppliedLicense(bool export_environment = false);

        AppliedLicense(const AppliedLicense &) = delete;
        AppliedLicense &operator=(const AppliedLicense &) = delete;

        /** Process-wide instance with environment export enabled */
        static AppliedLicense &process();

        /** True if this call applied the payload */
        bool apply(const LicensePayload &payload);

        std::optional<LicensePayload> current() const { return cell_.get(); }

        /** <client_name or "unknown">::<masked key> */
        static std::string watermark(const LicensePayload &payload);

        /** hex SHA-256 of "<key>|<fingerprint>|<client_name>" */
        static std::string signature(const LicensePayload &payload);

    private:
        void export_environment(const LicensePayload &payload) const;

        SetOnce<LicensePayload> cell_;
        bool export_environment_;
    };

} // namespace warden

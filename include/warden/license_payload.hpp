#pragma once

#include "types.hpp"
#include "timestamp.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace warden
{

    /**
     * Trusted result of a successful (or accepted-offline) verification.
     * Fields the server sends that are not modelled here are kept in extra
     * and written back unchanged.
     */
    struct LicensePayload
    {
        std::string license_key;
        std::optional<std::string> email;
        std::optional<std::string> client_name;
        std::int64_t activation_count{0};
        std::int64_t max_activations{0};
        std::string machine_fingerprint;
        std::optional<Timestamp> verified_at;
        std::optional<Timestamp> cache_expires_at;
        bool offline_mode{false};
        nlohmann::json extra = nlohmann::json::object();

        nlohmann::json to_json() const;

        static Result<LicensePayload> from_json(const nlohmann::json &j);

        /** True when no expiry is recorded or the expiry has passed */
        bool is_expired(Timestamp now) const;

        /** Bound to this fingerprint and not yet expired */
        bool is_trusted_for(const std::string &fingerprint, Timestamp now) const;

        bool operator==(const LicensePayload &other) const = default;
    };

    /** Key shown in logs and status output; never the full key */
    std::string mask_license_key(const std::string &license_key);

} // namespace warden

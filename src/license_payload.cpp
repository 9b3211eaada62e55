#include "warden/license_payload.hpp"
#include <algorithm>
#include <iterator>

using json = nlohmann::json;

namespace warden
{
    namespace
    {
        const char *const kKnownFields[] = {
            "license_key",
            "email",
            "client_name",
            "activation_count",
            "max_activations",
            "machine_fingerprint",
            "verified_at",
            "cache_expires_at",
            "offline_mode",
        };

        bool is_known_field(const std::string &key)
        {
            return std::any_of(std::begin(kKnownFields), std::end(kKnownFields),
                               [&](const char *field) { return key == field; });
        }

        std::optional<std::string> optional_string(const json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string())
                return std::nullopt;
            auto value = it->get<std::string>();
            if (value.empty())
                return std::nullopt;
            return value;
        }

        Result<std::int64_t> integer_field(const json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return 0;
            if (it->is_number_integer())
                return it->get<std::int64_t>();
            return std::unexpected(WardenError::parsing(std::string("License field is not an integer: ") + key));
        }

        std::optional<Timestamp> timestamp_field(const json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string())
                return std::nullopt;
            auto parsed = parse_iso8601(it->get<std::string>());
            if (!parsed)
                return std::nullopt;
            return *parsed;
        }
    } // namespace

    json LicensePayload::to_json() const
    {
        json j = extra.is_object() ? extra : json::object();
        j["license_key"] = license_key;
        j["email"] = email ? json(*email) : json(nullptr);
        j["client_name"] = client_name ? json(*client_name) : json(nullptr);
        j["activation_count"] = activation_count;
        j["max_activations"] = max_activations;
        j["machine_fingerprint"] = machine_fingerprint;
        j["verified_at"] = verified_at ? json(format_iso8601(*verified_at)) : json(nullptr);
        j["cache_expires_at"] = cache_expires_at ? json(format_iso8601(*cache_expires_at)) : json(nullptr);
        j["offline_mode"] = offline_mode;
        return j;
    }

    Result<LicensePayload> LicensePayload::from_json(const json &j)
    {
        if (!j.is_object())
        {
            return std::unexpected(WardenError::parsing("License payload must be a JSON object"));
        }

        LicensePayload payload;
        if (auto key = j.find("license_key"); key != j.end() && key->is_string())
            payload.license_key = key->get<std::string>();
        if (auto fp = j.find("machine_fingerprint"); fp != j.end() && fp->is_string())
            payload.machine_fingerprint = fp->get<std::string>();
        payload.email = optional_string(j, "email");
        payload.client_name = optional_string(j, "client_name");

        auto activations = integer_field(j, "activation_count");
        if (!activations)
            return std::unexpected(activations.error());
        payload.activation_count = *activations;

        auto max_activations = integer_field(j, "max_activations");
        if (!max_activations)
            return std::unexpected(max_activations.error());
        payload.max_activations = *max_activations;

        payload.verified_at = timestamp_field(j, "verified_at");
        payload.cache_expires_at = timestamp_field(j, "cache_expires_at");
        if (auto offline = j.find("offline_mode"); offline != j.end() && offline->is_boolean())
            payload.offline_mode = offline->get<bool>();

        for (auto it = j.begin(); it != j.end(); ++it)
        {
            if (!is_known_field(it.key()))
                payload.extra[it.key()] = it.value();
        }
        return payload;
    }

    bool LicensePayload::is_expired(Timestamp now) const
    {
        return !cache_expires_at || now >= *cache_expires_at;
    }

    bool LicensePayload::is_trusted_for(const std::string &fingerprint, Timestamp now) const
    {
        return !machine_fingerprint.empty() && machine_fingerprint == fingerprint && !is_expired(now);
    }

    std::string mask_license_key(const std::string &license_key)
    {
        if (license_key.empty())
            return "unknown";
        std::string key;
        std::copy_if(license_key.begin(), license_key.end(), std::back_inserter(key),
                     [](char c) { return c != '-'; });
        if (key.size() <= 8)
            return key;
        return key.substr(0, 6) + "…" + key.substr(key.size() - 4);
    }

} // namespace warden

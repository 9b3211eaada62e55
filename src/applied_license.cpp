#include "warden/applied_license.hpp"
#include "warden/crypto.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace warden
{
    namespace
    {
        void set_default_env(const char *name, const std::string &value)
        {
            if (::setenv(name, value.c_str(), 0) != 0)
            {
                spdlog::warn("Unable to export {}", name);
            }
        }
    } // namespace

    AppliedLicense::AppliedLicense(bool export_environment)
        : export_environment_(export_environment)
    {
    }

    AppliedLicense &AppliedLicense::process()
    {
        static AppliedLicense instance(true);
        return instance;
    }

    bool AppliedLicense::apply(const LicensePayload &payload)
    {
        if (!cell_.set(payload))
        {
            spdlog::debug("License already applied for this process; keeping the first payload");
            return false;
        }
        if (export_environment_)
            export_environment(payload);
        return true;
    }

    std::string AppliedLicense::watermark(const LicensePayload &payload)
    {
        return payload.client_name.value_or("unknown") + "::" + mask_license_key(payload.license_key);
    }

    std::string AppliedLicense::signature(const LicensePayload &payload)
    {
        std::string source = payload.license_key + "|" + payload.machine_fingerprint + "|" +
                             payload.client_name.value_or("");
        return crypto::SHA256::to_hex(crypto::SHA256::hash(source));
    }

    void AppliedLicense::export_environment(const LicensePayload &payload) const
    {
        set_default_env("WARDEN_LICENSE_KEY", payload.license_key);
        if (payload.email)
            set_default_env("WARDEN_LICENSE_EMAIL", *payload.email);
        if (payload.client_name)
            set_default_env("WARDEN_LICENSE_CLIENT", *payload.client_name);
        set_default_env("WARDEN_LICENSE_TAG", watermark(payload));
        set_default_env("WARDEN_LICENSE_SIGNATURE", signature(payload));
    }

} // namespace warden

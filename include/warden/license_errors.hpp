#pragma once

#include <string>
#include <string_view>

namespace warden
{

    /**
     * Failure kinds reported by the license server or raised locally by the
     * verification flow. Wire codes are the snake_case names.
     */
    enum class LicenseErrorKind
    {
        InvalidLicense,
        LicenseRevoked,
        LicenseExpired,
        EmailMismatch,
        ActivationLimitReached,
        NetworkError,
        InvalidServerResponse,
        MissingLicenseKey,
        MissingMachineFingerprint,
        ConfigurationError,
        Unknown
    };

    /** Wire code for a kind ("unknown" for Unknown) */
    std::string to_wire_code(LicenseErrorKind kind);

    /** Parse a server error code; unrecognized codes map to Unknown */
    LicenseErrorKind kind_from_wire_code(std::string_view code);

    /** True for failures that permit falling back to a cached activation */
    bool permits_offline_fallback(LicenseErrorKind kind);

    /**
     * Human-readable message for a raw server code. Unmapped codes get the
     * generic "contact support" message.
     */
    std::string humanize_error(std::string_view code);

    inline std::string humanize_error(LicenseErrorKind kind)
    {
        return humanize_error(to_wire_code(kind));
    }

} // namespace warden

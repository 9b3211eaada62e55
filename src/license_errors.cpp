#include "warden/license_errors.hpp"
#include <array>
#include <utility>

namespace warden
{
    namespace
    {
        constexpr std::array<std::pair<LicenseErrorKind, std::string_view>, 10> kWireCodes{{
            {LicenseErrorKind::InvalidLicense, "invalid_license"},
            {LicenseErrorKind::LicenseRevoked, "license_revoked"},
            {LicenseErrorKind::LicenseExpired, "license_expired"},
            {LicenseErrorKind::EmailMismatch, "email_mismatch"},
            {LicenseErrorKind::ActivationLimitReached, "activation_limit_reached"},
            {LicenseErrorKind::NetworkError, "network_error"},
            {LicenseErrorKind::InvalidServerResponse, "invalid_server_response"},
            {LicenseErrorKind::MissingLicenseKey, "missing_license_key"},
            {LicenseErrorKind::MissingMachineFingerprint, "missing_machine_fingerprint"},
            {LicenseErrorKind::ConfigurationError, "configuration_error"},
        }};

        constexpr std::array<std::pair<std::string_view, std::string_view>, 9> kMessages{{
            {"invalid_license", "The license key you entered is not recognized. Please verify and try again."},
            {"license_revoked", "This license has been revoked. Contact support for assistance."},
            {"license_expired", "Your license has expired. Contact support to renew your access."},
            {"email_mismatch", "The license key does not match the provided email address."},
            {"activation_limit_reached",
             "This license has reached the maximum number of activations. Contact support to reset it."},
            {"network_error", "Could not reach the license server. Check your internet connection and try again."},
            {"invalid_server_response",
             "Received an unexpected response from the license server. Try again later."},
            {"missing_license_key", "License key missing from request."},
            {"missing_machine_fingerprint", "Machine fingerprint missing from request."},
        }};

        constexpr std::string_view kGenericMessage =
            "Unable to verify your license. Please try again or contact support.";
    } // namespace

    std::string to_wire_code(LicenseErrorKind kind)
    {
        for (const auto &[k, code] : kWireCodes)
        {
            if (k == kind)
                return std::string(code);
        }
        return "unknown";
    }

    LicenseErrorKind kind_from_wire_code(std::string_view code)
    {
        for (const auto &[k, wire] : kWireCodes)
        {
            if (wire == code)
                return k;
        }
        return LicenseErrorKind::Unknown;
    }

    bool permits_offline_fallback(LicenseErrorKind kind)
    {
        return kind == LicenseErrorKind::NetworkError || kind == LicenseErrorKind::InvalidServerResponse;
    }

    std::string humanize_error(std::string_view code)
    {
        for (const auto &[wire, message] : kMessages)
        {
            if (wire == code)
                return std::string(message);
        }
        return std::string(kGenericMessage);
    }

} // namespace warden

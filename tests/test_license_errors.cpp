#include <catch2/catch_test_macros.hpp>
#include "warden/license_errors.hpp"

using namespace warden;

TEST_CASE("Wire codes map both ways", "[errors]")
{
    REQUIRE(to_wire_code(LicenseErrorKind::ActivationLimitReached) == "activation_limit_reached");
    REQUIRE(kind_from_wire_code("license_revoked") == LicenseErrorKind::LicenseRevoked);
    REQUIRE(kind_from_wire_code("network_error") == LicenseErrorKind::NetworkError);
    REQUIRE(kind_from_wire_code("something_new") == LicenseErrorKind::Unknown);
    REQUIRE(kind_from_wire_code("") == LicenseErrorKind::Unknown);
}

TEST_CASE("Only reachability failures permit offline fallback", "[errors]")
{
    REQUIRE(permits_offline_fallback(LicenseErrorKind::NetworkError));
    REQUIRE(permits_offline_fallback(LicenseErrorKind::InvalidServerResponse));
    REQUIRE_FALSE(permits_offline_fallback(LicenseErrorKind::InvalidLicense));
    REQUIRE_FALSE(permits_offline_fallback(LicenseErrorKind::LicenseRevoked));
    REQUIRE_FALSE(permits_offline_fallback(LicenseErrorKind::Unknown));
}

TEST_CASE("Humanized messages", "[errors]")
{
    REQUIRE(humanize_error("invalid_license") ==
            "The license key you entered is not recognized. Please verify and try again.");
    REQUIRE(humanize_error(LicenseErrorKind::EmailMismatch) ==
            "The license key does not match the provided email address.");

    const std::string generic = "Unable to verify your license. Please try again or contact support.";
    REQUIRE(humanize_error("teapot") == generic);
    REQUIRE(humanize_error("") == generic);
}

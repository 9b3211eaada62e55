#include <catch2/catch_test_macros.hpp>
#include "warden/applied_license.hpp"
#include "warden/crypto.hpp"
#include <cstdlib>
#include <thread>
#include <vector>

using namespace warden;

namespace
{
    LicensePayload payload_for(const std::string &key)
    {
        LicensePayload payload;
        payload.license_key = key;
        payload.email = "ops@acme.example";
        payload.client_name = "Acme";
        payload.machine_fingerprint = "f00d";
        return payload;
    }
}

TEST_CASE("SetOnce keeps the first value", "[applied]")
{
    SetOnce<int> cell;
    REQUIRE_FALSE(cell.get().has_value());
    REQUIRE(cell.set(1));
    REQUIRE_FALSE(cell.set(2));
    REQUIRE(cell.get() == std::optional<int>(1));
}

TEST_CASE("SetOnce accepts exactly one concurrent writer", "[applied]")
{
    SetOnce<int> cell;
    std::vector<std::thread> threads;
    std::vector<int> wins(8, 0);
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&cell, &wins, i]() { wins[i] = cell.set(i) ? 1 : 0; });
    }
    for (auto &t : threads)
        t.join();

    int total = 0;
    for (int w : wins)
        total += w;
    REQUIRE(total == 1);
    REQUIRE(cell.get().has_value());
}

TEST_CASE("Applied license ignores later payloads", "[applied]")
{
    AppliedLicense applied;
    REQUIRE_FALSE(applied.current().has_value());
    REQUIRE(applied.apply(payload_for("FIRST-KEY-0001")));
    REQUIRE_FALSE(applied.apply(payload_for("SECOND-KEY-0002")));
    REQUIRE(applied.current()->license_key == "FIRST-KEY-0001");
}

TEST_CASE("Watermark and signature", "[applied]")
{
    auto payload = payload_for("ABCD-EFGH-IJKL-MNOP");
    REQUIRE(AppliedLicense::watermark(payload) == "Acme::ABCDEF…MNOP");

    payload.client_name.reset();
    REQUIRE(AppliedLicense::watermark(payload) == "unknown::ABCDEF…MNOP");

    auto expected = crypto::SHA256::to_hex(crypto::SHA256::hash(std::string("ABCD-EFGH-IJKL-MNOP|f00d|")));
    REQUIRE(AppliedLicense::signature(payload) == expected);
}

TEST_CASE("Process license publishes environment variables once", "[applied]")
{
    ::unsetenv("WARDEN_LICENSE_KEY");
    ::unsetenv("WARDEN_LICENSE_EMAIL");
    ::unsetenv("WARDEN_LICENSE_CLIENT");
    ::unsetenv("WARDEN_LICENSE_TAG");
    ::unsetenv("WARDEN_LICENSE_SIGNATURE");

    AppliedLicense exporting(true);
    auto payload = payload_for("ABCD-EFGH-IJKL-MNOP");
    REQUIRE(exporting.apply(payload));

    REQUIRE(std::string(std::getenv("WARDEN_LICENSE_KEY")) == "ABCD-EFGH-IJKL-MNOP");
    REQUIRE(std::string(std::getenv("WARDEN_LICENSE_EMAIL")) == "ops@acme.example");
    REQUIRE(std::string(std::getenv("WARDEN_LICENSE_CLIENT")) == "Acme");
    REQUIRE(std::string(std::getenv("WARDEN_LICENSE_TAG")) == "Acme::ABCDEF…MNOP");
    REQUIRE(std::string(std::getenv("WARDEN_LICENSE_SIGNATURE")) == AppliedLicense::signature(payload));

    // A second exporter does not override published values
    AppliedLicense other(true);
    REQUIRE(other.apply(payload_for("ZZZZ-YYYY-XXXX-WWWW")));
    REQUIRE(std::string(std::getenv("WARDEN_LICENSE_KEY")) == "ABCD-EFGH-IJKL-MNOP");

    AppliedLicense silent;
    ::unsetenv("WARDEN_LICENSE_KEY");
    REQUIRE(silent.apply(payload));
    REQUIRE(std::getenv("WARDEN_LICENSE_KEY") == nullptr);
}

#include <catch2/catch_test_macros.hpp>
#include "warden/timestamp.hpp"

using namespace warden;
using namespace std::chrono;

TEST_CASE("ISO 8601 formatting uses microseconds and explicit offset", "[timestamp]")
{
    Timestamp ts{seconds(1700000000) + microseconds(123456)};
    REQUIRE(format_iso8601(ts) == "2023-11-14T22:13:20.123456+00:00");

    Timestamp epoch{};
    REQUIRE(format_iso8601(epoch) == "1970-01-01T00:00:00.000000+00:00");
}

TEST_CASE("ISO 8601 parsing variants", "[timestamp]")
{
    Timestamp expected{seconds(1700000000)};

    REQUIRE(parse_iso8601("2023-11-14T22:13:20+00:00").value() == expected);
    REQUIRE(parse_iso8601("2023-11-14T22:13:20Z").value() == expected);
    REQUIRE(parse_iso8601("2023-11-14T22:13:20").value() == expected);
    REQUIRE(parse_iso8601("2023-11-14 22:13:20").value() == expected);
    REQUIRE(parse_iso8601("2023-11-15T00:13:20+02:00").value() == expected);
    REQUIRE(parse_iso8601("2023-11-14T17:13:20-05:00").value() == expected);

    auto fractional = parse_iso8601("2023-11-14T22:13:20.5Z");
    REQUIRE(fractional.has_value());
    REQUIRE(*fractional == expected + milliseconds(500));
}

TEST_CASE("ISO 8601 round trip", "[timestamp]")
{
    auto now = now_utc();
    auto parsed = parse_iso8601(format_iso8601(now));
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == now);
}

TEST_CASE("ISO 8601 parsing rejects garbage", "[timestamp]")
{
    REQUIRE_FALSE(parse_iso8601("").has_value());
    REQUIRE_FALSE(parse_iso8601("yesterday").has_value());
    REQUIRE_FALSE(parse_iso8601("2023-11-14").has_value());
    REQUIRE_FALSE(parse_iso8601("2023-11-14T22:13:20+0x:00").has_value());
}

TEST_CASE("Timestamps beyond the nanosecond clock range stay exact", "[timestamp]")
{
    Timestamp far{seconds(10413792000LL)};
    REQUIRE(format_iso8601(far) == "2300-01-01T00:00:00.000000+00:00");

    auto parsed = parse_iso8601("2300-01-01T00:00:00Z");
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == far);
}

#include "Utility/dateTime.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("DateTime parses RFC 3339 timestamps", "[datetime]") {
    SECTION("UTC designator") {
        auto dt = DateTime::parse("2009-02-13T23:31:30Z");
        REQUIRE(dt.has_value());
        REQUIRE(dt->utc.time_since_epoch().count() == 1234567890);
        REQUIRE(dt->offsetMinutes == 0);
    }

    SECTION("Numeric offsets are applied") {
        auto plus = DateTime::parse("2009-02-14T00:31:30+01:00");
        REQUIRE(plus.has_value());
        REQUIRE(plus->utc.time_since_epoch().count() == 1234567890);
        REQUIRE(plus->offsetMinutes == 60);

        auto minus = DateTime::parse("2009-02-13T18:01:30-05:30");
        REQUIRE(minus.has_value());
        REQUIRE(minus->utc.time_since_epoch().count() == 1234567890);
        REQUIRE(minus->offsetMinutes == -330);
    }

    SECTION("Fractional seconds") {
        REQUIRE(DateTime::parse("2024-01-01T12:00:00.123Z").has_value());
        REQUIRE(DateTime::parse("2024-01-01T12:00:00.123456789+02:00").has_value());
        REQUIRE_FALSE(DateTime::parse("2024-01-01T12:00:00.Z").has_value());
    }

    SECTION("Leap years") {
        REQUIRE(DateTime::parse("2024-02-29T00:00:00Z").has_value());
        REQUIRE(DateTime::parse("2000-02-29T00:00:00Z").has_value());
        REQUIRE_FALSE(DateTime::parse("2023-02-29T00:00:00Z").has_value());
        REQUIRE_FALSE(DateTime::parse("1900-02-29T00:00:00Z").has_value());
    }
}

TEST_CASE("DateTime rejects malformed timestamps", "[datetime]") {
    REQUIRE_FALSE(DateTime::parse("").has_value());
    REQUIRE_FALSE(DateTime::parse("2024-01-01").has_value());
    REQUIRE_FALSE(DateTime::parse("2024-01-01T12:00:00").has_value());
    REQUIRE_FALSE(DateTime::parse("2024-01-01t12:00:00Z").has_value());
    REQUIRE_FALSE(DateTime::parse("2024-01-01 12:00:00Z").has_value());
    REQUIRE_FALSE(DateTime::parse("2024-01-01T12:00:00z").has_value());
    REQUIRE_FALSE(DateTime::parse("2024-01-01T12:00:00-00:00").has_value());
    REQUIRE_FALSE(DateTime::parse("2024-01-01T24:00:00Z").has_value());
    REQUIRE_FALSE(DateTime::parse("2024-01-01T12:60:00Z").has_value());
    REQUIRE_FALSE(DateTime::parse("2024-01-32T12:00:00Z").has_value());
    REQUIRE_FALSE(DateTime::parse("2024-00-10T12:00:00Z").has_value());
    REQUIRE_FALSE(DateTime::parse("2024-01-01T12:00:00+0100").has_value());
    REQUIRE_FALSE(DateTime::parse("2024-01-01T12:00:00Zjunk").has_value());

    auto error = DateTime::parse("2024-01-01T12:00:00");
    REQUIRE(error.error() == "missing timezone");
}

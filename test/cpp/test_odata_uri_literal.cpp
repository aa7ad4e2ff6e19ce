#include <catch2/catch.hpp>
#include "odata_uri_literal.hpp"

using namespace odata_writer;
using duckdb::Value;

TEST_CASE("Strings are quoted with doubled single quotes", "[odata_uri_literal]") {
    REQUIRE(ODataUriLiteral::QuoteString("A'1") == "'A''1'");
    REQUIRE(ODataUriLiteral::Format(Value("O'Neil"), String, ODataVersion::V4) == "'O''Neil'");
    REQUIRE(ODataUriLiteral::Format(Value(duckdb::LogicalType::VARCHAR), String, ODataVersion::V4) == "null");
}

TEST_CASE("Numeric literals", "[odata_uri_literal]") {
    REQUIRE(ODataUriLiteral::Format(Value::INTEGER(3), Int32, ODataVersion::V4) == "3");
    REQUIRE(ODataUriLiteral::Format(Value::BOOLEAN(true), Boolean, ODataVersion::V2) == "true");

    SECTION("V4 has no suffixes") {
        REQUIRE(ODataUriLiteral::Format(Value::BIGINT(3), Int64, ODataVersion::V4) == "3");
        REQUIRE(ODataUriLiteral::Format(Value::DECIMAL(int64_t(1250), 10, 2), Decimal, ODataVersion::V4) == "12.50");
    }

    SECTION("V2 marks the wide and floating kinds") {
        REQUIRE(ODataUriLiteral::Format(Value::BIGINT(3), Int64, ODataVersion::V2) == "3L");
        REQUIRE(ODataUriLiteral::Format(Value::DECIMAL(int64_t(1250), 10, 2), Decimal, ODataVersion::V2) == "12.50M");
        REQUIRE(ODataUriLiteral::Format(Value::DOUBLE(2.5), Double, ODataVersion::V2) == "2.5d");
    }
}

TEST_CASE("Temporal literals", "[odata_uri_literal]") {
    auto date = Value::DATE(2024, 1, 31);
    auto timestamp = Value::TIMESTAMP(2024, 1, 31, 10, 0, 0, 0);

    SECTION("V4") {
        REQUIRE(ODataUriLiteral::Format(date, Date, ODataVersion::V4) == "2024-01-31");
        REQUIRE(ODataUriLiteral::Format(timestamp, DateTimeOffset, ODataVersion::V4) == "2024-01-31T10:00:00Z");
    }

    SECTION("V2") {
        REQUIRE(ODataUriLiteral::Format(date, DateTime, ODataVersion::V2) == "datetime'2024-01-31T00:00:00'");
        REQUIRE(ODataUriLiteral::Format(timestamp, DateTime, ODataVersion::V2) == "datetime'2024-01-31T10:00:00'");
        REQUIRE(ODataUriLiteral::Format(timestamp, DateTimeOffset, ODataVersion::V2) == "datetimeoffset'2024-01-31T10:00:00Z'");
        REQUIRE(ODataUriLiteral::Format(Value::TIME(10, 30, 0, 0), Time, ODataVersion::V2) == "time'PT10H30M'");
    }
}

TEST_CASE("Durations use ISO 8601", "[odata_uri_literal]") {
    duckdb::interval_t zero;
    zero.months = 0;
    zero.days = 0;
    zero.micros = 0;
    REQUIRE(ODataUriLiteral::FormatDuration(zero) == "PT0S");

    duckdb::interval_t mixed;
    mixed.months = 14;
    mixed.days = 3;
    mixed.micros = (4 * 3600 + 5 * 60 + 6) * int64_t(1000000) + 500000;
    REQUIRE(ODataUriLiteral::FormatDuration(mixed) == "P1Y2M3DT4H5M6.5S");

    duckdb::interval_t negative;
    negative.months = 0;
    negative.days = -1;
    negative.micros = 0;
    REQUIRE(ODataUriLiteral::FormatDuration(negative) == "-P1D");

    duckdb::interval_t hour;
    hour.months = 0;
    hour.days = 0;
    hour.micros = 3600 * int64_t(1000000);
    REQUIRE(ODataUriLiteral::Format(Value::INTERVAL(hour), Duration, ODataVersion::V4) == "duration'PT1H'");
    REQUIRE(ODataUriLiteral::Format(Value::INTERVAL(hour), Time, ODataVersion::V2) == "time'PT1H'");
}

TEST_CASE("Guid and binary literals", "[odata_uri_literal]") {
    auto guid = Value::UUID("0b7d3f6e-1a2b-4c5d-8e9f-001122334455");
    REQUIRE(ODataUriLiteral::Format(guid, Guid, ODataVersion::V4) == "0b7d3f6e-1a2b-4c5d-8e9f-001122334455");
    REQUIRE(ODataUriLiteral::Format(guid, Guid, ODataVersion::V2) == "guid'0b7d3f6e-1a2b-4c5d-8e9f-001122334455'");

    auto bytes = Value::BLOB(duckdb::const_data_ptr_cast("hi"), 2);
    REQUIRE(ODataUriLiteral::Format(bytes, Binary, ODataVersion::V4) == "binary'aGk='");
    REQUIRE(ODataUriLiteral::Format(bytes, Binary, ODataVersion::V2) == "X'6869'");
}

TEST_CASE("Key segments", "[odata_uri_literal]") {
    REQUIRE(ODataUriLiteral::FormatKey({{"Id", "3"}}) == "(3)");
    REQUIRE(ODataUriLiteral::FormatKey({{"OrderId", "1"}, {"Code", "'A''1'"}}) == "(OrderId=1,Code='A''1')");
}

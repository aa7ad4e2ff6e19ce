#pragma once

#include "duckdb.hpp"
#include "odata_edm.hpp"

#include <string>
#include <utility>
#include <vector>

namespace odata_writer
{

// Formats values as OData URI literals and key segments.
//
//   V4: Employees(3), Orders('A''1'), Items(Order=1,Line=2), guid 0b7d...-... unquoted
//   V2: Products(3L), Events(datetime'2024-01-31T10:00:00'), Users(guid'0b7d...')
class ODataUriLiteral
{
public:
    static std::string Format(const duckdb::Value &value, const PrimitiveType &wire_type, ODataVersion version);

    // (literal) for a single key, (Name=literal,...) for composite keys
    static std::string FormatKey(const std::vector<std::pair<std::string, std::string>> &key_literals);

    static std::string QuoteString(const std::string &text);

    // ISO 8601 duration, e.g. P1Y2M3DT4H5M6.5S
    static std::string FormatDuration(const duckdb::interval_t &interval);
    // 2024-01-31T10:00:00 with fractional seconds only when present
    static std::string FormatDateTime(const duckdb::timestamp_t &timestamp);
    static std::string FormatTime(const duckdb::dtime_t &time);
};

} // namespace odata_writer

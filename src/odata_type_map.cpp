#include "odata_type_map.hpp"
#include "odata_exceptions.hpp"
#include "tracing.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace odata_writer {

using duckdb::LogicalType;

static LogicalType Coordinates(int depth)
{
    LogicalType type = LogicalType::DOUBLE;
    for (int i = 0; i < depth; i++) {
        type = LogicalType::LIST(type);
    }
    return type;
}

static void AddSpatialMappings(std::vector<ODataTypeMapping> &mappings, const std::string &family)
{
    mappings.push_back({ LogicalType::VARCHAR, PrimitiveType("Edm." + family) });
    mappings.push_back({ Coordinates(1), PrimitiveType("Edm." + family + "Point") });
    mappings.push_back({ Coordinates(2), PrimitiveType("Edm." + family + "LineString") });
    mappings.push_back({ Coordinates(3), PrimitiveType("Edm." + family + "Polygon") });
    mappings.push_back({ LogicalType::VARCHAR, PrimitiveType("Edm." + family + "Collection") });
    mappings.push_back({ Coordinates(3), PrimitiveType("Edm." + family + "MultiLineString") });
    mappings.push_back({ Coordinates(2), PrimitiveType("Edm." + family + "MultiPoint") });
    mappings.push_back({ Coordinates(4), PrimitiveType("Edm." + family + "MultiPolygon") });
}

const std::vector<ODataTypeMapping> &ODataTypeMap::Mappings()
{
    static const std::vector<ODataTypeMapping> mappings = [] {
        std::vector<ODataTypeMapping> m = {
            { LogicalType::VARCHAR, String },
            { LogicalType::BOOLEAN, Boolean },
            { LogicalType::UTINYINT, Byte },
            { LogicalType::DECIMAL(38, 0), Decimal },
            { LogicalType::DOUBLE, Double },
            { LogicalType::UUID, Guid },
            { LogicalType::SMALLINT, Int16 },
            { LogicalType::INTEGER, Int32 },
            { LogicalType::BIGINT, Int64 },
            { LogicalType::TINYINT, SByte },
            { LogicalType::FLOAT, Single },
            { LogicalType::BLOB, Binary },
            { LogicalType::BLOB, Stream },
        };

        AddSpatialMappings(m, "Geography");
        AddSpatialMappings(m, "Geometry");

        std::vector<ODataTypeMapping> tail = {
            { LogicalType::TIMESTAMP_TZ, DateTimeOffset },
            { LogicalType::TIMESTAMP, DateTimeOffset },
            { LogicalType::INTERVAL, Duration },
            { LogicalType::DATE, Date },
            { LogicalType::TIME, TimeOfDay },
            { LogicalType::TIMESTAMP, DateTime },
            { LogicalType::INTERVAL, Time },

            // Widening of unsigned types without an EDM counterpart
            { LogicalType::USMALLINT, Int32 },
            { LogicalType::UINTEGER, Int64 },
            { LogicalType::UBIGINT, Int64 },
        };
        m.insert(m.end(), tail.begin(), tail.end());
        return m;
    }();

    return mappings;
}

static bool NativeTypeMatches(const LogicalType &row_type, const LogicalType &native_type)
{
    if (row_type.id() == duckdb::LogicalTypeId::LIST) {
        return row_type == native_type;
    }
    return row_type.id() == native_type.id();
}

std::optional<PrimitiveType> ODataTypeMap::Resolve(const LogicalType &native_type)
{
    for (const auto &mapping : Mappings()) {
        if (NativeTypeMatches(mapping.native_type, native_type)) {
            return mapping.wire_type;
        }
    }
    return std::nullopt;
}

std::vector<LogicalType> ODataTypeMap::Candidates(const PrimitiveType &wire_type)
{
    std::vector<LogicalType> candidates;
    for (const auto &mapping : Mappings()) {
        if (mapping.wire_type == wire_type) {
            candidates.push_back(mapping.native_type);
        }
    }
    return candidates;
}

// Digits after the decimal point in the value's text form, with any exponent folded in
static int InferScale(const duckdb::Value &value)
{
    auto &type = value.type();
    if (type.id() == duckdb::LogicalTypeId::DECIMAL) {
        return duckdb::DecimalType::GetScale(type);
    }
    if (type.IsIntegral() || type.id() == duckdb::LogicalTypeId::BOOLEAN) {
        return 0;
    }

    auto text = duckdb::StringUtil::Lower(value.ToString());
    auto exponent_pos = text.find('e');
    auto mantissa = exponent_pos == std::string::npos ? text : text.substr(0, exponent_pos);

    int fraction_digits = 0;
    auto dot = mantissa.find('.');
    if (dot != std::string::npos) {
        auto digits = mantissa.substr(dot + 1);
        auto end = digits.find_first_not_of("0123456789");
        fraction_digits = static_cast<int>(end == std::string::npos ? digits.size() : end);
    }

    int exponent = 0;
    if (exponent_pos != std::string::npos) {
        try {
            exponent = std::stoi(text.substr(exponent_pos + 1));
        } catch (const std::exception &) {
            // Not a number; the cast rejects it
            return 0;
        }
    }

    return std::max(0, std::min(fraction_digits - exponent, static_cast<int>(duckdb::Decimal::MAX_WIDTH_DECIMAL)));
}

LogicalType ODataTypeMap::DecimalTargetType(const duckdb::Value &value, const PrimitiveFacets &facets)
{
    const int max_width = duckdb::Decimal::MAX_WIDTH_DECIMAL;

    int precision = facets.precision > 0 ? std::min(facets.precision, max_width) : max_width;
    int scale = facets.scale >= 0 ? facets.scale : InferScale(value);
    scale = std::min(scale, precision);

    return LogicalType::DECIMAL(static_cast<uint8_t>(precision), static_cast<uint8_t>(scale));
}

duckdb::Value ODataTypeMap::Convert(const duckdb::Value &value, const PrimitiveType &wire_type, const PrimitiveFacets &facets)
{
    if (value.IsNull()) {
        return value;
    }

    auto candidates = Candidates(wire_type);
    if (candidates.empty()) {
        return value;
    }

    for (auto candidate : candidates) {
        if (candidate.id() == duckdb::LogicalTypeId::DECIMAL) {
            candidate = DecimalTargetType(value, facets);
        }

        if (value.type() == candidate) {
            return value;
        }

        duckdb::Value result;
        std::string error;
        bool converted = false;
        try {
            converted = value.DefaultTryCastAs(candidate, result, &error, true);
        } catch (const duckdb::Exception &e) {
            error = e.what();
        }

        if (converted) {
            return result;
        }
        ODATA_WRITER_TRACE_TRACE("ODATA_TYPE_MAP", "Candidate " + candidate.ToString() + " rejected " +
                                 value.type().ToString() + " value for " + wire_type.name + ": " + error);
    }

    throw ODataFormatException("Unable to convert value of type " + value.type().ToString() +
                               " to OData type " + wire_type.ToString());
}

} // namespace odata_writer

#pragma once

#include "duckdb.hpp"
#include "odata_edm.hpp"

#include <optional>
#include <string>
#include <vector>

namespace odata_writer
{

// Facets of a declared primitive property that shape the native target type
struct PrimitiveFacets
{
    int precision = -1;
    int scale = -1;

    static PrimitiveFacets FromProperty(const Property &property)
    {
        return PrimitiveFacets { property.precision, property.scale };
    }
};

struct ODataTypeMapping
{
    duckdb::LogicalType native_type;
    PrimitiveType wire_type;
};

// Static mapping between DuckDB value types and EDM primitive wire kinds.
//
// The table is ordered. A wire kind that several native types map to is
// converted by trying each of those native types in table order, so e.g.
// an Edm.Int64 value first tries BIGINT and only then the unsigned types.
class ODataTypeMap
{
public:
    static const std::vector<ODataTypeMapping> &Mappings();

    // Wire kind of the first row whose native type matches; DECIMAL matches any width and scale
    static std::optional<PrimitiveType> Resolve(const duckdb::LogicalType &native_type);

    // Native types a wire kind can be converted to, in table order
    static std::vector<duckdb::LogicalType> Candidates(const PrimitiveType &wire_type);

    // Converts value to the first candidate native type that accepts it.
    // NULL and wire kinds without candidates pass through unchanged.
    // Throws ODataFormatException when every candidate rejects the value.
    static duckdb::Value Convert(const duckdb::Value &value, const PrimitiveType &wire_type,
                                 const PrimitiveFacets &facets = PrimitiveFacets());

    // DECIMAL(p, s) used for an Edm.Decimal value with the given facets
    static duckdb::LogicalType DecimalTargetType(const duckdb::Value &value, const PrimitiveFacets &facets);
};

} // namespace odata_writer

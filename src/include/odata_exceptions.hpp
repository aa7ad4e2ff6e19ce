#pragma once

#include "duckdb.hpp"
#include <string>

namespace odata_writer
{

// A field or link name in the entity data has no declared counterpart on the
// entity type, or a link target lacks one of its key values.
class ODataSchemaMismatchException : public duckdb::CatalogException
{
public:
    explicit ODataSchemaMismatchException(const std::string &msg)
        : duckdb::CatalogException(msg)
    { }
};

// No candidate native representation of a wire kind accepted the value.
class ODataFormatException : public duckdb::ConversionException
{
public:
    explicit ODataFormatException(const std::string &msg)
        : duckdb::ConversionException(msg)
    { }
};

// No entity set holds the target type of a navigation link.
class ODataMissingNavigationTargetException : public duckdb::CatalogException
{
public:
    explicit ODataMissingNavigationTargetException(const std::string &msg)
        : duckdb::CatalogException(msg)
    { }
};

} // namespace odata_writer

#pragma once

#include "duckdb.hpp"
#include "odata_name_matcher.hpp"

#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace odata_writer
{

class EntityData;
using EntityDataPtr = std::shared_ptr<EntityData>;

// A field value: a DuckDB value (STRUCT for nested records, LIST for ordered
// sequences, SQL NULL), one linked entity, or a list of linked entities.
using EntityValue = std::variant<duckdb::Value, EntityDataPtr, std::vector<EntityDataPtr>>;

/**
 * @brief Field values of one entity, in caller order.
 *
 * Batch writes identify an EntityData by its address, so two instances with
 * equal fields are still two different entities.
 */
class EntityData
{
public:
    using Field = std::pair<std::string, EntityValue>;

    EntityData() = default;
    EntityData(std::initializer_list<Field> fields);

    static EntityDataPtr Create(std::initializer_list<Field> fields);
    // Top-level children of a STRUCT value become primitive fields
    static EntityData FromStruct(const duckdb::Value &struct_value);

    // Replaces the value of an existing field with the same name
    EntityData &Set(const std::string &name, EntityValue value);

    const EntityValue *Find(const std::string &name) const;
    const EntityValue *Find(const std::string &name, const ODataNameMatcher &matcher) const;

    std::vector<std::string> Names() const;
    const std::vector<Field> &Fields() const { return fields; }
    size_t Size() const { return fields.size(); }
    bool IsEmpty() const { return fields.empty(); }

    std::string ToString() const;

private:
    std::vector<Field> fields;
};

// True for a NULL value, a null entity pointer or an empty entity list
bool IsNullEntityValue(const EntityValue &value);
std::string EntityValueToString(const EntityValue &value);

} // namespace odata_writer

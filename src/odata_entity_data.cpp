#include "odata_entity_data.hpp"

#include <sstream>

namespace odata_writer {

EntityData::EntityData(std::initializer_list<Field> fields)
{
    for (const auto &field : fields) {
        Set(field.first, field.second);
    }
}

EntityDataPtr EntityData::Create(std::initializer_list<Field> fields)
{
    return std::make_shared<EntityData>(fields);
}

EntityData EntityData::FromStruct(const duckdb::Value &struct_value)
{
    if (struct_value.type().id() != duckdb::LogicalTypeId::STRUCT) {
        throw duckdb::InvalidInputException("Expected a STRUCT value for entity data, got " + struct_value.type().ToString());
    }

    EntityData data;
    if (struct_value.IsNull()) {
        return data;
    }

    auto &child_types = duckdb::StructType::GetChildTypes(struct_value.type());
    auto &children = duckdb::StructValue::GetChildren(struct_value);
    for (size_t i = 0; i < children.size(); i++) {
        data.Set(child_types[i].first, children[i]);
    }
    return data;
}

EntityData &EntityData::Set(const std::string &name, EntityValue value)
{
    for (auto &field : fields) {
        if (field.first == name) {
            field.second = std::move(value);
            return *this;
        }
    }
    fields.emplace_back(name, std::move(value));
    return *this;
}

const EntityValue *EntityData::Find(const std::string &name) const
{
    for (const auto &field : fields) {
        if (field.first == name) {
            return &field.second;
        }
    }
    return nullptr;
}

const EntityValue *EntityData::Find(const std::string &name, const ODataNameMatcher &matcher) const
{
    auto match = matcher.BestMatch(fields, name, [](const Field &field) { return field.first; });
    return match ? &match->second : nullptr;
}

std::vector<std::string> EntityData::Names() const
{
    std::vector<std::string> names;
    names.reserve(fields.size());
    for (const auto &field : fields) {
        names.push_back(field.first);
    }
    return names;
}

std::string EntityData::ToString() const
{
    std::stringstream ss;
    ss << "{";
    for (size_t i = 0; i < fields.size(); i++) {
        if (i > 0) {
            ss << ", ";
        }
        ss << fields[i].first << ": " << EntityValueToString(fields[i].second);
    }
    ss << "}";
    return ss.str();
}

bool IsNullEntityValue(const EntityValue &value)
{
    if (std::holds_alternative<duckdb::Value>(value)) {
        return std::get<duckdb::Value>(value).IsNull();
    }
    if (std::holds_alternative<EntityDataPtr>(value)) {
        return std::get<EntityDataPtr>(value) == nullptr;
    }
    return std::get<std::vector<EntityDataPtr>>(value).empty();
}

std::string EntityValueToString(const EntityValue &value)
{
    if (std::holds_alternative<duckdb::Value>(value)) {
        return std::get<duckdb::Value>(value).ToString();
    }
    if (std::holds_alternative<EntityDataPtr>(value)) {
        auto &entity = std::get<EntityDataPtr>(value);
        return entity ? entity->ToString() : "NULL";
    }

    std::stringstream ss;
    ss << "[";
    auto &entities = std::get<std::vector<EntityDataPtr>>(value);
    for (size_t i = 0; i < entities.size(); i++) {
        if (i > 0) {
            ss << ", ";
        }
        ss << (entities[i] ? entities[i]->ToString() : "NULL");
    }
    ss << "]";
    return ss.str();
}

} // namespace odata_writer

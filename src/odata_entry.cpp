#include "odata_entry.hpp"

namespace odata_writer {

ODataValue ODataValue::Primitive(duckdb::Value value, std::optional<PrimitiveType> wire_type)
{
    ODataValue result;
    result.kind = Kind::PRIMITIVE;
    if (wire_type) {
        result.type_name = wire_type->name;
    }
    result.value = std::move(value);
    result.wire_type = std::move(wire_type);
    return result;
}

ODataValue ODataValue::Complex(std::string type_name, std::vector<ODataProperty> properties)
{
    ODataValue result;
    result.kind = Kind::COMPLEX;
    result.type_name = std::move(type_name);
    result.properties = std::move(properties);
    return result;
}

ODataValue ODataValue::Collection(std::string type_name, std::vector<ODataValue> items)
{
    ODataValue result;
    result.kind = Kind::COLLECTION;
    result.type_name = std::move(type_name);
    result.items = std::move(items);
    return result;
}

bool ODataValue::operator==(const ODataValue &other) const
{
    if (kind != other.kind || type_name != other.type_name) {
        return false;
    }

    switch (kind) {
        case Kind::PRIMITIVE:
            return value.type() == other.value.type() && duckdb::Value::NotDistinctFrom(value, other.value);
        case Kind::COMPLEX:
            return properties == other.properties;
        case Kind::COLLECTION:
            return items == other.items;
    }
    return false;
}

std::string LinkReference::Url() const
{
    if (IsPending()) {
        return "$" + std::to_string(Pending().content_id);
    }
    return Resolved().entity_set + Resolved().formatted_key;
}

bool ODataNavigationLink::operator==(const ODataNavigationLink &other) const
{
    return name == other.name && is_collection == other.is_collection &&
           target_type_name == other.target_type_name && url == other.url &&
           references == other.references;
}

const ODataProperty *ODataEntry::FindProperty(const std::string &name) const
{
    for (const auto &property : properties) {
        if (property.name == name) {
            return &property;
        }
    }
    return nullptr;
}

const ODataNavigationLink *ODataEntry::FindLink(const std::string &name) const
{
    for (const auto &link : links) {
        if (link.name == name) {
            return &link;
        }
    }
    return nullptr;
}

bool ODataEntry::operator==(const ODataEntry &other) const
{
    return type_name == other.type_name && properties == other.properties && links == other.links;
}

} // namespace odata_writer

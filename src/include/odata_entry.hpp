#pragma once

#include "duckdb.hpp"
#include "odata_edm.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace odata_writer
{

struct ODataProperty;

// Encoded property value: a coerced primitive, a nested record tagged with its
// complex type, or an ordered collection tagged with Collection(<element type>).
class ODataValue
{
public:
    enum class Kind : uint8_t {
        PRIMITIVE,
        COMPLEX,
        COLLECTION
    };

    static ODataValue Primitive(duckdb::Value value, std::optional<PrimitiveType> wire_type = std::nullopt);
    static ODataValue Complex(std::string type_name, std::vector<ODataProperty> properties);
    static ODataValue Collection(std::string type_name, std::vector<ODataValue> items);

    bool IsNull() const { return kind == Kind::PRIMITIVE && value.IsNull(); }

    bool operator==(const ODataValue &other) const;
    bool operator!=(const ODataValue &other) const { return !(*this == other); }

public:
    Kind kind = Kind::PRIMITIVE;
    std::string type_name;
    // PRIMITIVE only
    duckdb::Value value;
    std::optional<PrimitiveType> wire_type;
    // COMPLEX only
    std::vector<ODataProperty> properties;
    // COLLECTION only
    std::vector<ODataValue> items;
};

struct ODataProperty
{
    std::string name;
    ODataValue value;

    bool operator==(const ODataProperty &other) const { return name == other.name && value == other.value; }
    bool operator!=(const ODataProperty &other) const { return !(*this == other); }
};

// Link target that already exists on the service: <entity set><key>
struct ResolvedLinkReference
{
    std::string entity_set;
    std::string formatted_key;

    bool operator==(const ResolvedLinkReference &other) const {
        return entity_set == other.entity_set && formatted_key == other.formatted_key;
    }
};

// Link target created earlier in the same batch: $<content id>
struct PendingLinkReference
{
    int64_t content_id;

    bool operator==(const PendingLinkReference &other) const { return content_id == other.content_id; }
};

class LinkReference
{
public:
    LinkReference(ResolvedLinkReference resolved) : reference(std::move(resolved)) {}
    LinkReference(PendingLinkReference pending) : reference(pending) {}

    bool IsPending() const { return std::holds_alternative<PendingLinkReference>(reference); }
    const ResolvedLinkReference &Resolved() const { return std::get<ResolvedLinkReference>(reference); }
    const PendingLinkReference &Pending() const { return std::get<PendingLinkReference>(reference); }

    // Relative URL of the target
    std::string Url() const;

    bool operator==(const LinkReference &other) const { return reference == other.reference; }
    bool operator!=(const LinkReference &other) const { return !(*this == other); }

private:
    std::variant<ResolvedLinkReference, PendingLinkReference> reference;
};

struct ODataNavigationLink
{
    std::string name;
    bool is_collection = false;
    std::string target_type_name;
    // http://schemas.microsoft.com/ado/2007/08/dataservices/related/<target type>
    std::string url;
    std::vector<LinkReference> references;

    bool operator==(const ODataNavigationLink &other) const;
    bool operator!=(const ODataNavigationLink &other) const { return !(*this == other); }
};

struct ODataEntry
{
    std::string type_name;
    std::vector<ODataProperty> properties;
    std::vector<ODataNavigationLink> links;

    const ODataProperty *FindProperty(const std::string &name) const;
    const ODataNavigationLink *FindLink(const std::string &name) const;

    bool operator==(const ODataEntry &other) const;
    bool operator!=(const ODataEntry &other) const { return !(*this == other); }
};

} // namespace odata_writer

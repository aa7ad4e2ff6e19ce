#pragma once

#include "tinyxml2.h"
#include <cstdint>
#include <string>
#include <vector>
#include <tuple>
#include <variant>
#include <memory>

namespace odata_writer
{

// OData Version enum ---------------------------------------------------
enum class ODataVersion {
    UNKNOWN,
    V2,
    V4
};

std::string ODataVersionToString(ODataVersion version);

// PrimitiveType class ---------------------------------------------------
class PrimitiveType
{
public:
    PrimitiveType(const std::string &class_name)
        : name(class_name)
    {}

    static PrimitiveType FromString(const std::string &class_name);
    static bool IsValidPrimitiveType(const std::string &class_name);

    bool IsGeography() const { return name.rfind("Edm.Geography", 0) == 0; }
    bool IsGeometry() const { return name.rfind("Edm.Geometry", 0) == 0; }
    bool IsSpatial() const { return IsGeography() || IsGeometry(); }
    // Point, LineString, Polygon, Multi*, or empty for the abstract and collection kinds
    std::string SpatialShape() const;

    bool operator==(const PrimitiveType &other) const {
        return name == other.name;
    }

    bool operator!=(const PrimitiveType &other) const {
        return name != other.name;
    }

public:
    std::string name;
    std::string ToString() const { return name; }
};

const PrimitiveType Binary("Edm.Binary");
const PrimitiveType Boolean("Edm.Boolean");
const PrimitiveType Byte("Edm.Byte");
const PrimitiveType Date("Edm.Date");
const PrimitiveType DateTime("Edm.DateTime");
const PrimitiveType DateTimeOffset("Edm.DateTimeOffset");
const PrimitiveType Decimal("Edm.Decimal");
const PrimitiveType Double("Edm.Double");
const PrimitiveType Duration("Edm.Duration");
const PrimitiveType Guid("Edm.Guid");
const PrimitiveType Int16("Edm.Int16");
const PrimitiveType Int32("Edm.Int32");
const PrimitiveType Int64("Edm.Int64");
const PrimitiveType SByte("Edm.SByte");
const PrimitiveType Single("Edm.Single");
const PrimitiveType Stream("Edm.Stream");
const PrimitiveType String("Edm.String");
const PrimitiveType Time("Edm.Time");
const PrimitiveType TimeOfDay("Edm.TimeOfDay");
const PrimitiveType Geography("Edm.Geography");
const PrimitiveType GeographyPoint("Edm.GeographyPoint");
const PrimitiveType GeographyLineString("Edm.GeographyLineString");
const PrimitiveType GeographyPolygon("Edm.GeographyPolygon");
const PrimitiveType GeographyMultiPoint("Edm.GeographyMultiPoint");
const PrimitiveType GeographyMultiLineString("Edm.GeographyMultiLineString");
const PrimitiveType GeographyMultiPolygon("Edm.GeographyMultiPolygon");
const PrimitiveType GeographyCollection("Edm.GeographyCollection");
const PrimitiveType Geometry("Edm.Geometry");
const PrimitiveType GeometryPoint("Edm.GeometryPoint");
const PrimitiveType GeometryLineString("Edm.GeometryLineString");
const PrimitiveType GeometryPolygon("Edm.GeometryPolygon");
const PrimitiveType GeometryMultiPoint("Edm.GeometryMultiPoint");
const PrimitiveType GeometryMultiLineString("Edm.GeometryMultiLineString");
const PrimitiveType GeometryMultiPolygon("Edm.GeometryMultiPolygon");
const PrimitiveType GeometryCollection("Edm.GeometryCollection");

// Annotation class -------------------------------------------------------
class Annotation
{
public:
    static Annotation FromXml(const tinyxml2::XMLElement &element);

    // Compares the term ignoring the "Org.OData.Core.V1." / "Core." style prefix
    bool HasTerm(const std::string &local_term) const;

public:
    std::string term;
    std::string qualifier;
    std::string path;
    std::string bool_value;
    std::string string_value;
};

// Annotations class -------------------------------------------------------
class Annotations
{
public:
    static Annotations FromXml(const tinyxml2::XMLElement &element);

public:
    std::string target;
    std::string qualifier;
    std::vector<Annotation> annotations;
};

// OperationParameter class -----------------------------------------------
class OperationParameter
{
public:
    static OperationParameter FromXml(const tinyxml2::XMLElement &element);

public:
    std::string name;
    std::string type;
    bool nullable = true;
};

// Operation class ---------------------------------------------------------
// A V4 Function or Action. Bound operations take the binding type as their
// first parameter.
class Operation
{
public:
    enum class Kind {
        FUNCTION,
        ACTION
    };

    static Operation FromXml(const tinyxml2::XMLElement &element, Kind kind);

    std::string BindingTypeName() const;

public:
    Kind kind = Kind::FUNCTION;
    std::string name;
    std::string ns;
    bool is_bound = false;
    std::string return_type;
    std::vector<OperationParameter> parameters;
};

// EnumMember class -------------------------------------------------------
class EnumMember
{
public:
    std::string name;
    int64_t value = 0;
};

// EnumType class ---------------------------------------------------------
class EnumType
{
public:
    EnumType() : underlying_type(Int32) {}

    static EnumType FromXml(const tinyxml2::XMLElement &element);

public:
    std::string name;
    PrimitiveType underlying_type;
    bool is_flags = false;
    std::vector<EnumMember> members;
};

// ReferentialConstraint class --------------------------------------------
class ReferentialConstraint
{
public:
    static ReferentialConstraint FromXml(const tinyxml2::XMLElement &element);

    bool operator==(const ReferentialConstraint &other) const {
        return property == other.property && referenced_property == other.referenced_property;
    }

public:
    std::string property;
    std::string referenced_property;
};

// NavigationProperty class -----------------------------------------------
class NavigationProperty
{
public:
    static NavigationProperty FromXml(const tinyxml2::XMLElement &element);

    bool IsCollection() const;
    // Declared type with one level of Collection(...) removed
    std::string TargetTypeName() const;

public:
    std::string name;
    std::string type;
    bool nullable = true;
    std::string partner;
    bool contains_target = false;
    // Action of the OnDelete child: None, Cascade, SetNull or SetDefault
    std::string on_delete;

    // OData v2 specific attributes
    std::string relationship;
    std::string from_role;
    std::string to_role;

    std::vector<ReferentialConstraint> referential_constraints;
    std::vector<Annotation> annotations;
};

// Association classes (OData v2) -----------------------------------------
class AssociationEnd
{
public:
    std::string type;
    std::string multiplicity;
    std::string role;
};

class Association
{
public:
    static Association FromXml(const tinyxml2::XMLElement &element);

public:
    std::string name;
    std::vector<AssociationEnd> ends;
};

class AssociationSetEnd
{
public:
    std::string entity_set;
    std::string role;
};

class AssociationSet
{
public:
    static AssociationSet FromXml(const tinyxml2::XMLElement &element);

public:
    std::string name;
    std::string association;
    std::vector<AssociationSetEnd> ends;
};

// Property class ---------------------------------------------------------
class Property
{
public:
    static Property FromXml(const tinyxml2::XMLElement &element);

    bool IsConcurrencyToken() const { return concurrency_mode == "Fixed"; }

public:
    std::string name;
    std::string type_name;
    bool nullable = true;
    std::string default_value;
    int max_length = -1;
    // -1 when not declared; scale is also -1 for Scale="variable"
    int precision = -1;
    int scale = -1;
    int srid = 0;
    std::string concurrency_mode;
    std::vector<Annotation> annotations;
};

// ComplexType class ------------------------------------------------------
class ComplexType
{
public:
    static ComplexType FromXml(const tinyxml2::XMLElement &element);

    std::string FullName() const { return ns.empty() ? name : ns + "." + name; }

public:
    std::string name;
    std::string ns;
    std::string base_type;
    bool abstract_type = false;
    bool open_type = false;
    std::vector<Property> properties;
    std::vector<NavigationProperty> navigation_properties;
};

// Key class --------------------------------------------------------------
class PropertyRef
{
public:
    std::string name;
    std::string alias;
};

class Key
{
public:
    static Key FromXml(const tinyxml2::XMLElement &element);

public:
    std::vector<PropertyRef> property_refs;
};

// EntityType class --------------------------------------------------------
class EntityType
{
public:
    static EntityType FromXml(const tinyxml2::XMLElement &element);

    std::string FullName() const { return ns.empty() ? name : ns + "." + name; }

public:
    std::string name;
    std::string ns;
    Key key;
    std::string base_type;
    bool abstract_type = false;
    bool open_type = false;
    bool has_stream = false;
    std::vector<Property> properties;
    std::vector<NavigationProperty> navigation_properties;
    std::vector<Annotation> annotations;
};

// TypeDefinition class ---------------------------------------------------
class TypeDefinition
{
public:
    TypeDefinition() : underlying_type(String) {}

    static TypeDefinition FromXml(const tinyxml2::XMLElement &element);

public:
    std::string name;
    PrimitiveType underlying_type;
};

// EntitySet class --------------------------------------------------------
class EntitySet
{
public:
    static EntitySet FromXml(const tinyxml2::XMLElement &element);

public:
    std::string name;
    std::string entity_type_name;
    // Qualified name of the declaring entity container
    std::string container;
    std::vector<Annotation> annotations;
};

// EntityContainer class --------------------------------------------------
class EntityContainer
{
public:
    static EntityContainer FromXml(const tinyxml2::XMLElement &element);

public:
    std::string name;
    std::vector<EntitySet> entity_sets;
    std::vector<AssociationSet> association_sets;
};

// Schema class -----------------------------------------------------------

using TypeVariant = std::variant<PrimitiveType, EnumType, TypeDefinition, ComplexType, EntityType>;

class Schema
{
public:
    static Schema FromXml(const tinyxml2::XMLElement &element);

    TypeVariant FindType(const std::string &type_name) const;

    bool Matches(const std::string &ns_or_alias) const {
        return ns == ns_or_alias || (!alias.empty() && alias == ns_or_alias);
    }

    // Fills in type and partner of OData v2 navigation properties from the associations
    void ResolveV2NavigationProperties();

public:
    std::string ns;
    std::string alias;
    std::vector<EnumType> enum_types;
    std::vector<TypeDefinition> type_definitions;
    std::vector<ComplexType> complex_types;
    std::vector<EntityType> entity_types;
    std::vector<Association> associations;
    std::vector<Operation> operations;
    std::vector<EntityContainer> entity_containers;
    std::vector<Annotations> annotations;
};

// DataServices class -------------------------------------------------------
class DataServices
{
public:
    static DataServices FromXml(const tinyxml2::XMLElement &element);

public:
    std::vector<Schema> schemas;
};

// EdmModel interface ------------------------------------------------------
// Read-only view over a service's schema. Edmx is the parsed document;
// EdmDeltaModel overlays it for partial updates.
class EdmModel
{
public:
    EdmModel() = default;
    EdmModel(const EdmModel &) = default;
    EdmModel &operator=(const EdmModel &) = default;
    virtual ~EdmModel() = default;

    // Accepts qualified, alias-qualified or unqualified names and metadata URLs.
    // Throws std::runtime_error when nothing matches.
    virtual TypeVariant FindType(const std::string &type_name_or_url) const = 0;
    virtual EntitySet FindEntitySet(const std::string &entity_set_name_or_url) const = 0;
    virtual std::vector<EntitySet> FindEntitySets() const = 0;
    virtual std::vector<Operation> FindBoundOperations(const std::string &binding_type_name) const = 0;
    // Annotations declared out of line with the given target path
    virtual std::vector<Annotation> FindAnnotations(const std::string &target) const = 0;
    // Maps a schema alias to its namespace; other input is returned unchanged
    virtual std::string ResolveNamespace(const std::string &ns_or_alias) const = 0;
    virtual ODataVersion GetVersion() const = 0;

    // FindType narrowed to entity types; throws std::runtime_error for any other kind
    EntityType FindEntityType(const std::string &type_name) const;
};

// Edmx class --------------------------------------------------------------
class Edmx : public EdmModel
{
public:
    static Edmx FromXml(const std::string &xml);
    static Edmx FromXml(const tinyxml2::XMLDocument &doc);

    TypeVariant FindType(const std::string &type_name_or_url) const override;
    EntitySet FindEntitySet(const std::string &entity_set_name_or_url) const override;
    std::vector<EntitySet> FindEntitySets() const override;
    std::vector<Operation> FindBoundOperations(const std::string &binding_type_name) const override;
    std::vector<Annotation> FindAnnotations(const std::string &target) const override;
    std::string ResolveNamespace(const std::string &ns_or_alias) const override;
    ODataVersion GetVersion() const override { return version_enum; }

    static std::string StripUrlIfNecessary(const std::string &type_name_or_url);
    static std::tuple<std::string, std::string> SplitNamespace(const std::string &type_name);

public:
    std::string version = "4.0";
    DataServices data_services;

private:
    ODataVersion version_enum = ODataVersion::V4;
};

// Type helpers ------------------------------------------------------------

// Returns (is_collection, element type name) for "Collection(X)" or (false, type_name)
std::tuple<bool, std::string> ExtractCollectionType(const std::string &type_name);

// Structural properties including those inherited through base types, base first
std::vector<Property> AllProperties(const EdmModel &model, const EntityType &entity_type);
std::vector<Property> AllProperties(const EdmModel &model, const ComplexType &complex_type);
std::vector<NavigationProperty> AllNavigationProperties(const EdmModel &model, const EntityType &entity_type);
// The key declared on the type or on its nearest base type
Key EffectiveKey(const EdmModel &model, const EntityType &entity_type);

} // namespace odata_writer

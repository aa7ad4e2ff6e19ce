#include "odata_edm.hpp"
#include "tracing.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <strings.h>

namespace odata_writer {

namespace {

std::string Attribute(const tinyxml2::XMLElement &element, const char *name)
{
    const char *attr = element.Attribute(name);
    return attr ? std::string(attr) : std::string();
}

bool BoolAttribute(const tinyxml2::XMLElement &element, const char *name, bool default_value)
{
    const char *attr = element.Attribute(name);
    if (!attr) {
        return default_value;
    }
    return strcasecmp(attr, "true") == 0;
}

// Unparsable facets fall back to the default
int IntAttribute(const tinyxml2::XMLElement &element, const char *name, int default_value)
{
    const char *attr = element.Attribute(name);
    if (!attr || *attr == '\0') {
        return default_value;
    }
    try {
        return std::stoi(attr);
    } catch (const std::exception &) {
        return default_value;
    }
}

std::vector<Annotation> ChildAnnotations(const tinyxml2::XMLElement &element)
{
    std::vector<Annotation> annotations;
    for (const tinyxml2::XMLElement* annotation_el = element.FirstChildElement("Annotation");
        annotation_el != nullptr;
        annotation_el = annotation_el->NextSiblingElement("Annotation"))
    {
        annotations.push_back(Annotation::FromXml(*annotation_el));
    }
    return annotations;
}

std::string LocalName(const std::string &qualified_name)
{
    auto pos = qualified_name.find_last_of('.');
    return pos == std::string::npos ? qualified_name : qualified_name.substr(pos + 1);
}

const size_t MAX_INHERITANCE_DEPTH = 32;

// Base types of a structured type, root first. Stops at a base of another kind.
template <class TStructuredType>
std::vector<TStructuredType> BaseTypeChain(const EdmModel &model, const TStructuredType &type)
{
    std::vector<TStructuredType> bases;
    std::string base_type = type.base_type;
    while (!base_type.empty()) {
        if (bases.size() >= MAX_INHERITANCE_DEPTH) {
            throw std::runtime_error("Inheritance chain too deep at type " + type.FullName());
        }
        auto base = model.FindType(base_type);
        if (!std::holds_alternative<TStructuredType>(base)) {
            break;
        }
        bases.push_back(std::get<TStructuredType>(base));
        base_type = bases.back().base_type;
    }
    std::reverse(bases.begin(), bases.end());
    return bases;
}

} // namespace

std::string ODataVersionToString(ODataVersion version)
{
    switch (version) {
        case ODataVersion::V2: return "V2";
        case ODataVersion::V4: return "V4";
        default: return "UNKNOWN";
    }
}

// PrimitiveType ----------------------------------------------------------

PrimitiveType PrimitiveType::FromString(const std::string &class_name)
{
    if (!IsValidPrimitiveType(class_name)) {
        throw std::invalid_argument("Invalid primitive type: " + class_name);
    }
    return PrimitiveType(class_name);
}

bool PrimitiveType::IsValidPrimitiveType(const std::string &class_name)
{
    static const std::vector<std::string> primitive_types = {
        "Edm.Binary", "Edm.Boolean", "Edm.Byte", "Edm.Date", "Edm.DateTime",
        "Edm.DateTimeOffset", "Edm.Decimal", "Edm.Double", "Edm.Duration", "Edm.Guid",
        "Edm.Int16", "Edm.Int32", "Edm.Int64", "Edm.SByte", "Edm.Single",
        "Edm.Stream", "Edm.String", "Edm.Time", "Edm.TimeOfDay",
        "Edm.Geography", "Edm.GeographyPoint", "Edm.GeographyLineString", "Edm.GeographyPolygon",
        "Edm.GeographyMultiPoint", "Edm.GeographyMultiLineString", "Edm.GeographyMultiPolygon",
        "Edm.GeographyCollection",
        "Edm.Geometry", "Edm.GeometryPoint", "Edm.GeometryLineString", "Edm.GeometryPolygon",
        "Edm.GeometryMultiPoint", "Edm.GeometryMultiLineString", "Edm.GeometryMultiPolygon",
        "Edm.GeometryCollection"
    };

    return std::find(primitive_types.begin(), primitive_types.end(), class_name) != primitive_types.end();
}

std::string PrimitiveType::SpatialShape() const
{
    std::string prefix;
    if (IsGeography()) {
        prefix = "Edm.Geography";
    } else if (IsGeometry()) {
        prefix = "Edm.Geometry";
    } else {
        return "";
    }

    auto shape = name.substr(prefix.size());
    if (shape == "Collection") {
        return "";
    }
    return shape;
}

// Annotation -------------------------------------------------------------

Annotation Annotation::FromXml(const tinyxml2::XMLElement &element)
{
    Annotation annotation;
    annotation.term = Attribute(element, "Term");
    annotation.qualifier = Attribute(element, "Qualifier");
    annotation.path = Attribute(element, "Path");
    annotation.bool_value = Attribute(element, "Bool");
    annotation.string_value = Attribute(element, "String");
    return annotation;
}

bool Annotation::HasTerm(const std::string &local_term) const
{
    return term == local_term || LocalName(term) == local_term;
}

Annotations Annotations::FromXml(const tinyxml2::XMLElement &element)
{
    Annotations annotations;
    annotations.target = Attribute(element, "Target");
    annotations.qualifier = Attribute(element, "Qualifier");
    annotations.annotations = ChildAnnotations(element);
    return annotations;
}

// Operations -------------------------------------------------------------

OperationParameter OperationParameter::FromXml(const tinyxml2::XMLElement &element)
{
    OperationParameter parameter;
    parameter.name = Attribute(element, "Name");
    parameter.type = Attribute(element, "Type");
    parameter.nullable = BoolAttribute(element, "Nullable", true);
    return parameter;
}

Operation Operation::FromXml(const tinyxml2::XMLElement &element, Kind kind)
{
    Operation operation;
    operation.kind = kind;
    operation.name = Attribute(element, "Name");
    operation.is_bound = BoolAttribute(element, "IsBound", false);

    operation.return_type = Attribute(element, "ReturnType");
    const tinyxml2::XMLElement* return_el = element.FirstChildElement("ReturnType");
    if (return_el) {
        operation.return_type = Attribute(*return_el, "Type");
    }

    for (const tinyxml2::XMLElement* parameter_el = element.FirstChildElement("Parameter");
        parameter_el != nullptr;
        parameter_el = parameter_el->NextSiblingElement("Parameter"))
    {
        operation.parameters.push_back(OperationParameter::FromXml(*parameter_el));
    }

    return operation;
}

std::string Operation::BindingTypeName() const
{
    if (!is_bound || parameters.empty()) {
        return "";
    }
    return std::get<1>(ExtractCollectionType(parameters.front().type));
}

// EnumType ---------------------------------------------------------------

EnumType EnumType::FromXml(const tinyxml2::XMLElement &element)
{
    EnumType enum_type;
    enum_type.name = Attribute(element, "Name");

    auto underlying_type = Attribute(element, "UnderlyingType");
    if (!underlying_type.empty()) {
        enum_type.underlying_type = PrimitiveType(underlying_type);
    }
    enum_type.is_flags = BoolAttribute(element, "IsFlags", false);

    int64_t next_value = 0;
    for (const tinyxml2::XMLElement* member_el = element.FirstChildElement("Member");
        member_el != nullptr;
        member_el = member_el->NextSiblingElement("Member"))
    {
        EnumMember member;
        member.name = Attribute(*member_el, "Name");
        // Members without a Value are numbered implicitly
        member.value = member_el->Int64Attribute("Value", next_value);
        next_value = member.value + 1;
        enum_type.members.push_back(member);
    }

    return enum_type;
}

// Navigation -------------------------------------------------------------

ReferentialConstraint ReferentialConstraint::FromXml(const tinyxml2::XMLElement &element)
{
    ReferentialConstraint referential_constraint;
    referential_constraint.property = Attribute(element, "Property");
    referential_constraint.referenced_property = Attribute(element, "ReferencedProperty");
    return referential_constraint;
}

NavigationProperty NavigationProperty::FromXml(const tinyxml2::XMLElement &element)
{
    NavigationProperty nav_prop;
    nav_prop.name = Attribute(element, "Name");
    nav_prop.type = Attribute(element, "Type");
    nav_prop.nullable = BoolAttribute(element, "Nullable", true);
    nav_prop.partner = Attribute(element, "Partner");
    nav_prop.contains_target = BoolAttribute(element, "ContainsTarget", false);

    nav_prop.relationship = Attribute(element, "Relationship");
    nav_prop.from_role = Attribute(element, "FromRole");
    nav_prop.to_role = Attribute(element, "ToRole");

    const tinyxml2::XMLElement* on_delete_el = element.FirstChildElement("OnDelete");
    if (on_delete_el) {
        nav_prop.on_delete = Attribute(*on_delete_el, "Action");
    }

    for (const tinyxml2::XMLElement* constraint_el = element.FirstChildElement("ReferentialConstraint");
        constraint_el != nullptr;
        constraint_el = constraint_el->NextSiblingElement("ReferentialConstraint"))
    {
        nav_prop.referential_constraints.push_back(ReferentialConstraint::FromXml(*constraint_el));
    }

    nav_prop.annotations = ChildAnnotations(element);
    return nav_prop;
}

bool NavigationProperty::IsCollection() const
{
    return std::get<0>(ExtractCollectionType(type));
}

std::string NavigationProperty::TargetTypeName() const
{
    return std::get<1>(ExtractCollectionType(type));
}

Association Association::FromXml(const tinyxml2::XMLElement &element)
{
    Association association;
    association.name = Attribute(element, "Name");

    for (const tinyxml2::XMLElement* end_el = element.FirstChildElement("End");
        end_el != nullptr;
        end_el = end_el->NextSiblingElement("End"))
    {
        AssociationEnd end;
        end.type = Attribute(*end_el, "Type");
        end.multiplicity = Attribute(*end_el, "Multiplicity");
        end.role = Attribute(*end_el, "Role");
        association.ends.push_back(end);
    }

    return association;
}

AssociationSet AssociationSet::FromXml(const tinyxml2::XMLElement &element)
{
    AssociationSet association_set;
    association_set.name = Attribute(element, "Name");
    association_set.association = Attribute(element, "Association");

    for (const tinyxml2::XMLElement* end_el = element.FirstChildElement("End");
        end_el != nullptr;
        end_el = end_el->NextSiblingElement("End"))
    {
        AssociationSetEnd end;
        end.entity_set = Attribute(*end_el, "EntitySet");
        end.role = Attribute(*end_el, "Role");
        association_set.ends.push_back(end);
    }

    return association_set;
}

// Structured types -------------------------------------------------------

Property Property::FromXml(const tinyxml2::XMLElement &element)
{
    Property property;
    property.name = Attribute(element, "Name");
    property.type_name = Attribute(element, "Type");
    property.nullable = BoolAttribute(element, "Nullable", true);
    property.default_value = Attribute(element, "DefaultValue");
    property.max_length = IntAttribute(element, "MaxLength", -1);
    property.precision = IntAttribute(element, "Precision", -1);
    property.scale = IntAttribute(element, "Scale", -1);
    property.srid = IntAttribute(element, "SRID", 0);
    property.concurrency_mode = Attribute(element, "ConcurrencyMode");
    property.annotations = ChildAnnotations(element);
    return property;
}

ComplexType ComplexType::FromXml(const tinyxml2::XMLElement &element)
{
    ComplexType complex_type;
    complex_type.name = Attribute(element, "Name");
    complex_type.base_type = Attribute(element, "BaseType");
    complex_type.abstract_type = BoolAttribute(element, "Abstract", false);
    complex_type.open_type = BoolAttribute(element, "OpenType", false);

    for (const tinyxml2::XMLElement* prop_el = element.FirstChildElement("Property");
        prop_el != nullptr;
        prop_el = prop_el->NextSiblingElement("Property"))
    {
        complex_type.properties.push_back(Property::FromXml(*prop_el));
    }

    for (const tinyxml2::XMLElement* nav_prop_el = element.FirstChildElement("NavigationProperty");
        nav_prop_el != nullptr;
        nav_prop_el = nav_prop_el->NextSiblingElement("NavigationProperty"))
    {
        complex_type.navigation_properties.push_back(NavigationProperty::FromXml(*nav_prop_el));
    }

    return complex_type;
}

Key Key::FromXml(const tinyxml2::XMLElement &element)
{
    Key key;
    for (const tinyxml2::XMLElement* property_ref_el = element.FirstChildElement("PropertyRef");
        property_ref_el != nullptr;
        property_ref_el = property_ref_el->NextSiblingElement("PropertyRef"))
    {
        PropertyRef property_ref;
        property_ref.name = Attribute(*property_ref_el, "Name");
        property_ref.alias = Attribute(*property_ref_el, "Alias");
        key.property_refs.push_back(property_ref);
    }
    return key;
}

EntityType EntityType::FromXml(const tinyxml2::XMLElement &element)
{
    EntityType entity_type;
    entity_type.name = Attribute(element, "Name");
    entity_type.base_type = Attribute(element, "BaseType");
    entity_type.abstract_type = BoolAttribute(element, "Abstract", false);
    entity_type.open_type = BoolAttribute(element, "OpenType", false);
    entity_type.has_stream = BoolAttribute(element, "HasStream", false);

    const tinyxml2::XMLElement* key_el = element.FirstChildElement("Key");
    if (key_el) {
        entity_type.key = Key::FromXml(*key_el);
    }

    for (const tinyxml2::XMLElement* prop_el = element.FirstChildElement("Property");
        prop_el != nullptr;
        prop_el = prop_el->NextSiblingElement("Property"))
    {
        entity_type.properties.push_back(Property::FromXml(*prop_el));
    }

    for (const tinyxml2::XMLElement* nav_prop_el = element.FirstChildElement("NavigationProperty");
        nav_prop_el != nullptr;
        nav_prop_el = nav_prop_el->NextSiblingElement("NavigationProperty"))
    {
        entity_type.navigation_properties.push_back(NavigationProperty::FromXml(*nav_prop_el));
    }

    entity_type.annotations = ChildAnnotations(element);
    return entity_type;
}

TypeDefinition TypeDefinition::FromXml(const tinyxml2::XMLElement &element)
{
    TypeDefinition type_definition;
    type_definition.name = Attribute(element, "Name");

    auto underlying_type = Attribute(element, "UnderlyingType");
    if (!underlying_type.empty()) {
        type_definition.underlying_type = PrimitiveType(underlying_type);
    }
    return type_definition;
}

// Containers -------------------------------------------------------------

EntitySet EntitySet::FromXml(const tinyxml2::XMLElement &element)
{
    EntitySet entity_set;
    entity_set.name = Attribute(element, "Name");
    entity_set.entity_type_name = Attribute(element, "EntityType");
    entity_set.annotations = ChildAnnotations(element);
    return entity_set;
}

EntityContainer EntityContainer::FromXml(const tinyxml2::XMLElement &element)
{
    EntityContainer entity_container;
    entity_container.name = Attribute(element, "Name");

    for (const tinyxml2::XMLElement* entity_set_el = element.FirstChildElement("EntitySet");
        entity_set_el != nullptr;
        entity_set_el = entity_set_el->NextSiblingElement("EntitySet"))
    {
        entity_container.entity_sets.push_back(EntitySet::FromXml(*entity_set_el));
    }

    for (const tinyxml2::XMLElement* association_set_el = element.FirstChildElement("AssociationSet");
        association_set_el != nullptr;
        association_set_el = association_set_el->NextSiblingElement("AssociationSet"))
    {
        entity_container.association_sets.push_back(AssociationSet::FromXml(*association_set_el));
    }

    return entity_container;
}

// Schema -----------------------------------------------------------------

Schema Schema::FromXml(const tinyxml2::XMLElement &element)
{
    Schema schema;
    schema.ns = Attribute(element, "Namespace");
    schema.alias = Attribute(element, "Alias");

    for (const tinyxml2::XMLElement* enum_type_el = element.FirstChildElement("EnumType");
        enum_type_el != nullptr;
        enum_type_el = enum_type_el->NextSiblingElement("EnumType"))
    {
        schema.enum_types.push_back(EnumType::FromXml(*enum_type_el));
    }

    for (const tinyxml2::XMLElement* type_def_el = element.FirstChildElement("TypeDefinition");
        type_def_el != nullptr;
        type_def_el = type_def_el->NextSiblingElement("TypeDefinition"))
    {
        schema.type_definitions.push_back(TypeDefinition::FromXml(*type_def_el));
    }

    for (const tinyxml2::XMLElement* complex_type_el = element.FirstChildElement("ComplexType");
        complex_type_el != nullptr;
        complex_type_el = complex_type_el->NextSiblingElement("ComplexType"))
    {
        auto complex_type = ComplexType::FromXml(*complex_type_el);
        complex_type.ns = schema.ns;
        schema.complex_types.push_back(complex_type);
    }

    for (const tinyxml2::XMLElement* entity_type_el = element.FirstChildElement("EntityType");
        entity_type_el != nullptr;
        entity_type_el = entity_type_el->NextSiblingElement("EntityType"))
    {
        auto entity_type = EntityType::FromXml(*entity_type_el);
        entity_type.ns = schema.ns;
        schema.entity_types.push_back(entity_type);
    }

    for (const tinyxml2::XMLElement* association_el = element.FirstChildElement("Association");
        association_el != nullptr;
        association_el = association_el->NextSiblingElement("Association"))
    {
        schema.associations.push_back(Association::FromXml(*association_el));
    }

    for (const tinyxml2::XMLElement* function_el = element.FirstChildElement("Function");
        function_el != nullptr;
        function_el = function_el->NextSiblingElement("Function"))
    {
        auto operation = Operation::FromXml(*function_el, Operation::Kind::FUNCTION);
        operation.ns = schema.ns;
        schema.operations.push_back(operation);
    }

    for (const tinyxml2::XMLElement* action_el = element.FirstChildElement("Action");
        action_el != nullptr;
        action_el = action_el->NextSiblingElement("Action"))
    {
        auto operation = Operation::FromXml(*action_el, Operation::Kind::ACTION);
        operation.ns = schema.ns;
        schema.operations.push_back(operation);
    }

    for (const tinyxml2::XMLElement* container_el = element.FirstChildElement("EntityContainer");
        container_el != nullptr;
        container_el = container_el->NextSiblingElement("EntityContainer"))
    {
        auto container = EntityContainer::FromXml(*container_el);
        for (auto &entity_set : container.entity_sets) {
            entity_set.container = schema.ns.empty() ? container.name : schema.ns + "." + container.name;
        }
        schema.entity_containers.push_back(std::move(container));
    }

    for (const tinyxml2::XMLElement* annotations_el = element.FirstChildElement("Annotations");
        annotations_el != nullptr;
        annotations_el = annotations_el->NextSiblingElement("Annotations"))
    {
        schema.annotations.push_back(Annotations::FromXml(*annotations_el));
    }

    schema.ResolveV2NavigationProperties();
    return schema;
}

TypeVariant Schema::FindType(const std::string &type_name) const
{
    for (const auto &enum_type : enum_types) {
        if (enum_type.name == type_name) {
            return enum_type;
        }
    }

    for (const auto &type_def : type_definitions) {
        if (type_def.name == type_name) {
            return type_def;
        }
    }

    for (const auto &complex_type : complex_types) {
        if (complex_type.name == type_name) {
            return complex_type;
        }
    }

    for (const auto &entity_type : entity_types) {
        if (entity_type.name == type_name) {
            return entity_type;
        }
    }

    return PrimitiveType::FromString(type_name);
}

void Schema::ResolveV2NavigationProperties()
{
    auto find_association = [this](const std::string &relationship) -> const Association * {
        auto association_name = LocalName(relationship);
        for (const auto &association : associations) {
            if (association.name == association_name) {
                return &association;
            }
        }
        return nullptr;
    };

    for (auto &entity_type : entity_types) {
        for (auto &nav_prop : entity_type.navigation_properties) {
            if (nav_prop.relationship.empty() || !nav_prop.type.empty()) {
                continue;
            }

            auto association = find_association(nav_prop.relationship);
            if (!association) {
                ODATA_WRITER_TRACE_WARN("ODATA_EDM", "No association '" + nav_prop.relationship + "' for navigation property " + entity_type.name + "." + nav_prop.name);
                continue;
            }

            for (const auto &end : association->ends) {
                if (end.role == nav_prop.to_role) {
                    nav_prop.type = end.multiplicity == "*" ? "Collection(" + end.type + ")" : end.type;
                    break;
                }
            }
        }
    }

    // The partner is the navigation property that walks the same association backwards
    for (auto &entity_type : entity_types) {
        for (auto &nav_prop : entity_type.navigation_properties) {
            if (nav_prop.relationship.empty() || !nav_prop.partner.empty()) {
                continue;
            }

            auto target_name = LocalName(nav_prop.TargetTypeName());
            for (const auto &target_type : entity_types) {
                if (target_type.name != target_name) {
                    continue;
                }
                for (const auto &candidate : target_type.navigation_properties) {
                    if (&candidate != &nav_prop &&
                        LocalName(candidate.relationship) == LocalName(nav_prop.relationship) &&
                        candidate.from_role == nav_prop.to_role) {
                        nav_prop.partner = candidate.name;
                        break;
                    }
                }
            }
        }
    }
}

DataServices DataServices::FromXml(const tinyxml2::XMLElement &element)
{
    DataServices data_svc;
    for (const tinyxml2::XMLElement* schema_el = element.FirstChildElement("Schema");
        schema_el != nullptr;
        schema_el = schema_el->NextSiblingElement("Schema"))
    {
        data_svc.schemas.push_back(Schema::FromXml(*schema_el));
    }
    return data_svc;
}

// EdmModel ---------------------------------------------------------------

EntityType EdmModel::FindEntityType(const std::string &type_name) const
{
    auto type = FindType(type_name);
    if (!std::holds_alternative<EntityType>(type)) {
        throw std::runtime_error("Type is not an entity type: " + type_name);
    }
    return std::get<EntityType>(type);
}

// Edmx -------------------------------------------------------------------

Edmx Edmx::FromXml(const std::string &xml)
{
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLError result = doc.Parse(xml.c_str(), xml.size());
    if (result != tinyxml2::XML_SUCCESS) {
        std::stringstream ss;
        ss << "Failed to parse XML [" << tinyxml2::XMLDocument::ErrorIDToName(result) << "]" << std::endl;
        ss << "Description: " << doc.ErrorStr();
        ODATA_WRITER_TRACE_ERROR_DATA("ODATA_EDM", "Failed to parse metadata document", xml);
        throw std::runtime_error(ss.str());
    }

    return FromXml(doc);
}

Edmx Edmx::FromXml(const tinyxml2::XMLDocument &doc)
{
    const tinyxml2::XMLElement* edmx_el = doc.RootElement();
    if (edmx_el == nullptr) {
        throw std::runtime_error("Missing Edmx root element");
    }

    Edmx edmx;
    edmx.version_enum = ODataVersion::V4;

    auto version_attr = Attribute(*edmx_el, "Version");
    if (!version_attr.empty()) {
        edmx.version = version_attr;
        if (version_attr == "1.0" || version_attr == "2.0") {
            edmx.version_enum = ODataVersion::V2;
        }
    } else {
        auto xmlns = Attribute(*edmx_el, "xmlns:edmx");
        if (xmlns.find("schemas.microsoft.com/ado") != std::string::npos) {
            edmx.version_enum = ODataVersion::V2;
        }
    }

    const tinyxml2::XMLElement* data_svc_el = edmx_el->FirstChildElement("edmx:DataServices");
    if (!data_svc_el) {
        data_svc_el = edmx_el->FirstChildElement("DataServices");
    }
    if (!data_svc_el) {
        throw std::runtime_error("Missing DataServices element in metadata document");
    }

    edmx.data_services = DataServices::FromXml(*data_svc_el);

    ODATA_WRITER_TRACE_DEBUG("ODATA_EDM", "Parsed " + ODataVersionToString(edmx.version_enum) + " metadata with " +
                             std::to_string(edmx.data_services.schemas.size()) + " schema(s)");
    return edmx;
}

std::string Edmx::StripUrlIfNecessary(const std::string &type_name_or_url)
{
    bool is_full_url = type_name_or_url.find("http://") != std::string::npos ||
                       type_name_or_url.find("https://") != std::string::npos;
    bool is_relative_metadata_url = type_name_or_url.rfind("$metadata", 0) == 0;
    if (!is_full_url && !is_relative_metadata_url) {
        return type_name_or_url;
    }

    auto type_name_pos = type_name_or_url.find('#');
    if (type_name_pos != std::string::npos) {
        auto type_name = type_name_or_url.substr(type_name_pos + 1);
        auto type_arg_pos = type_name.find('(');
        if (type_arg_pos != std::string::npos) {
            return type_name.substr(0, type_arg_pos);
        }
        return type_name;
    }

    throw std::runtime_error("Malformed type name or URL: " + type_name_or_url);
}

std::tuple<std::string, std::string> Edmx::SplitNamespace(const std::string &type_name)
{
    size_t pos = type_name.rfind('.');
    if (pos == std::string::npos) {
        return std::make_tuple("", type_name);
    }

    auto ret = std::make_tuple(type_name.substr(0, pos), type_name.substr(pos + 1));
    if (std::get<0>(ret) == "Edm") {
        return std::make_tuple("", type_name);
    }

    return ret;
}

TypeVariant Edmx::FindType(const std::string &type_name_or_url) const
{
    auto type_name = StripUrlIfNecessary(type_name_or_url);

    auto [ns, local_type_name] = SplitNamespace(type_name);
    if (!ns.empty()) {
        for (const auto &schema : data_services.schemas) {
            if (schema.Matches(ns)) {
                return schema.FindType(local_type_name);
            }
        }
    }

    // V2 services often omit the namespace
    for (const auto &schema : data_services.schemas) {
        for (const auto &entity_type : schema.entity_types) {
            if (entity_type.name == local_type_name) {
                return entity_type;
            }
        }
        for (const auto &complex_type : schema.complex_types) {
            if (complex_type.name == local_type_name) {
                return complex_type;
            }
        }
        for (const auto &enum_type : schema.enum_types) {
            if (enum_type.name == local_type_name) {
                return enum_type;
            }
        }
        for (const auto &type_def : schema.type_definitions) {
            if (type_def.name == local_type_name) {
                return type_def;
            }
        }
    }

    if (PrimitiveType::IsValidPrimitiveType(local_type_name)) {
        return PrimitiveType::FromString(local_type_name);
    }

    throw std::runtime_error("Unable to resolve type: " + type_name);
}

EntitySet Edmx::FindEntitySet(const std::string &entity_set_name_or_url) const
{
    auto entity_set_name = StripUrlIfNecessary(entity_set_name_or_url);

    for (const auto &schema : data_services.schemas) {
        for (const auto &container : schema.entity_containers) {
            for (const auto &entity_set : container.entity_sets) {
                if (entity_set.name == entity_set_name) {
                    return entity_set;
                }
            }
        }
    }

    throw std::runtime_error("Unable to resolve entity set: " + entity_set_name);
}

std::vector<EntitySet> Edmx::FindEntitySets() const
{
    std::vector<EntitySet> entity_sets;
    for (const auto &schema : data_services.schemas) {
        for (const auto &container : schema.entity_containers) {
            entity_sets.insert(entity_sets.end(), container.entity_sets.begin(), container.entity_sets.end());
        }
    }
    return entity_sets;
}

std::vector<Operation> Edmx::FindBoundOperations(const std::string &binding_type_name) const
{
    auto [binding_ns, binding_local_name] = SplitNamespace(binding_type_name);
    auto binding_full_ns = ResolveNamespace(binding_ns);

    std::vector<Operation> operations;
    for (const auto &schema : data_services.schemas) {
        for (const auto &operation : schema.operations) {
            if (!operation.is_bound) {
                continue;
            }
            auto [op_ns, op_local_name] = SplitNamespace(operation.BindingTypeName());
            if (op_local_name == binding_local_name &&
                (binding_ns.empty() || op_ns.empty() || ResolveNamespace(op_ns) == binding_full_ns)) {
                operations.push_back(operation);
            }
        }
    }
    return operations;
}

std::vector<Annotation> Edmx::FindAnnotations(const std::string &target) const
{
    std::vector<Annotation> annotations;
    for (const auto &schema : data_services.schemas) {
        for (const auto &group : schema.annotations) {
            if (group.target == target) {
                annotations.insert(annotations.end(), group.annotations.begin(), group.annotations.end());
            }
        }
    }
    return annotations;
}

std::string Edmx::ResolveNamespace(const std::string &ns_or_alias) const
{
    for (const auto &schema : data_services.schemas) {
        if (!schema.alias.empty() && schema.alias == ns_or_alias) {
            return schema.ns;
        }
    }
    return ns_or_alias;
}

// Type helpers -----------------------------------------------------------

std::tuple<bool, std::string> ExtractCollectionType(const std::string &type_name)
{
    static const std::regex collection_regex("^Collection\\(([^\\)]+)\\)$");
    std::smatch match;

    if (std::regex_search(type_name, match, collection_regex)) {
        return std::make_tuple(true, match[1].str());
    }
    return std::make_tuple(false, type_name);
}

std::vector<Property> AllProperties(const EdmModel &model, const EntityType &entity_type)
{
    std::vector<Property> properties;
    for (const auto &base : BaseTypeChain(model, entity_type)) {
        properties.insert(properties.end(), base.properties.begin(), base.properties.end());
    }
    properties.insert(properties.end(), entity_type.properties.begin(), entity_type.properties.end());
    return properties;
}

std::vector<Property> AllProperties(const EdmModel &model, const ComplexType &complex_type)
{
    std::vector<Property> properties;
    for (const auto &base : BaseTypeChain(model, complex_type)) {
        properties.insert(properties.end(), base.properties.begin(), base.properties.end());
    }
    properties.insert(properties.end(), complex_type.properties.begin(), complex_type.properties.end());
    return properties;
}

std::vector<NavigationProperty> AllNavigationProperties(const EdmModel &model, const EntityType &entity_type)
{
    std::vector<NavigationProperty> navigation_properties;
    for (const auto &base : BaseTypeChain(model, entity_type)) {
        navigation_properties.insert(navigation_properties.end(), base.navigation_properties.begin(), base.navigation_properties.end());
    }
    navigation_properties.insert(navigation_properties.end(), entity_type.navigation_properties.begin(), entity_type.navigation_properties.end());
    return navigation_properties;
}

Key EffectiveKey(const EdmModel &model, const EntityType &entity_type)
{
    if (!entity_type.key.property_refs.empty()) {
        return entity_type.key;
    }
    auto bases = BaseTypeChain(model, entity_type);
    for (auto it = bases.rbegin(); it != bases.rend(); ++it) {
        if (!it->key.property_refs.empty()) {
            return it->key;
        }
    }
    return entity_type.key;
}

} // namespace odata_writer

#include "odata_edm_delta_model.hpp"
#include "tracing.hpp"

#include <algorithm>

namespace odata_writer {

static bool IsKept(const std::vector<std::string> &property_names, const std::string &name)
{
    return std::find(property_names.begin(), property_names.end(), name) != property_names.end();
}

EdmDeltaModel::EdmDeltaModel(const EdmModel &source, const EntityType &source_type, const std::vector<std::string> &property_names)
    : source(source)
{
    entity_type.name = source_type.name;
    entity_type.ns = source_type.ns;
    entity_type.key = EffectiveKey(source, source_type);
    entity_type.abstract_type = source_type.abstract_type;
    entity_type.open_type = source_type.open_type;
    entity_type.has_stream = source_type.has_stream;

    for (const auto &property : AllProperties(source, source_type)) {
        if (IsKept(property_names, property.name)) {
            entity_type.properties.push_back(property);
        }
    }

    for (const auto &nav_prop : AllNavigationProperties(source, source_type)) {
        if (!IsKept(property_names, nav_prop.name)) {
            continue;
        }

        NavigationProperty unidirectional;
        unidirectional.name = nav_prop.name;
        unidirectional.type = nav_prop.type;
        unidirectional.nullable = nav_prop.nullable;
        unidirectional.contains_target = nav_prop.contains_target;
        unidirectional.on_delete = nav_prop.on_delete;
        unidirectional.referential_constraints = nav_prop.referential_constraints;
        entity_type.navigation_properties.push_back(unidirectional);
    }

    ODATA_WRITER_TRACE_DEBUG("ODATA_EDM", "Restricted " + entity_type.FullName() + " to " +
                             std::to_string(entity_type.properties.size()) + " properties and " +
                             std::to_string(entity_type.navigation_properties.size()) + " navigation properties");
}

bool EdmDeltaModel::IsRestrictedTypeName(const std::string &type_name_or_url) const
{
    auto [ns, local_name] = Edmx::SplitNamespace(Edmx::StripUrlIfNecessary(type_name_or_url));
    if (local_name != entity_type.name) {
        return false;
    }
    return ns.empty() || ns == entity_type.ns || source.ResolveNamespace(ns) == entity_type.ns;
}

TypeVariant EdmDeltaModel::FindType(const std::string &type_name_or_url) const
{
    if (IsRestrictedTypeName(type_name_or_url)) {
        return entity_type;
    }
    return source.FindType(type_name_or_url);
}

EntitySet EdmDeltaModel::FindEntitySet(const std::string &entity_set_name_or_url) const
{
    return source.FindEntitySet(entity_set_name_or_url);
}

std::vector<EntitySet> EdmDeltaModel::FindEntitySets() const
{
    return source.FindEntitySets();
}

std::vector<Operation> EdmDeltaModel::FindBoundOperations(const std::string &binding_type_name) const
{
    return source.FindBoundOperations(binding_type_name);
}

std::vector<Annotation> EdmDeltaModel::FindAnnotations(const std::string &target) const
{
    return source.FindAnnotations(target);
}

std::string EdmDeltaModel::ResolveNamespace(const std::string &ns_or_alias) const
{
    return source.ResolveNamespace(ns_or_alias);
}

ODataVersion EdmDeltaModel::GetVersion() const
{
    return source.GetVersion();
}

} // namespace odata_writer

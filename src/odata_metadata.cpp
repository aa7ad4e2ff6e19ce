#include "odata_metadata.hpp"
#include "odata_exceptions.hpp"
#include "odata_type_map.hpp"
#include "odata_uri_literal.hpp"
#include "tracing.hpp"

#include <utility>

namespace odata_writer {

ODataMetadata::ODataMetadata(std::shared_ptr<const EdmModel> model,
                             std::shared_ptr<const ODataNameMatcher> name_matcher)
    : model(std::move(model)), name_matcher(std::move(name_matcher))
{
    if (!this->model) {
        throw duckdb::InvalidInputException("ODataMetadata requires a metadata model");
    }
    if (!this->name_matcher) {
        this->name_matcher = std::make_shared<ODataNameMatcher>();
    }
}

std::shared_ptr<ODataMetadata> ODataMetadata::FromXml(const std::string &metadata_xml)
{
    auto edmx = std::make_shared<Edmx>(Edmx::FromXml(metadata_xml));
    ODATA_WRITER_TRACE_DEBUG("ODATA_METADATA", "Loaded " + ODataVersionToString(edmx->GetVersion()) +
                             " metadata with " + std::to_string(edmx->FindEntitySets().size()) + " entity sets");
    return std::make_shared<ODataMetadata>(std::move(edmx));
}

EntitySet ODataMetadata::FindEntitySet(const std::string &collection_name) const
{
    auto entity_sets = model->FindEntitySets();
    auto match = name_matcher->BestMatch(entity_sets, Edmx::StripUrlIfNecessary(collection_name),
                                         [](const EntitySet &entity_set) { return entity_set.name; });
    if (!match) {
        throw duckdb::InvalidInputException("Unknown entity set: '" + collection_name + "'");
    }
    return *match;
}

EntityType ODataMetadata::FindEntityType(const std::string &type_name) const
{
    return model->FindEntityType(type_name);
}

EntityType ODataMetadata::EntitySetType(const std::string &collection_name) const
{
    return model->FindEntityType(FindEntitySet(collection_name).entity_type_name);
}

std::vector<EntitySet> ODataMetadata::FindEntitySetsByType(const std::string &type_name) const
{
    std::vector<EntitySet> matches;
    for (const auto &entity_set : model->FindEntitySets()) {
        if (TypeNamesAreEqual(entity_set.entity_type_name, type_name)) {
            matches.push_back(entity_set);
        }
    }
    return matches;
}

bool ODataMetadata::EntitySetTypeRequiresOptimisticConcurrencyCheck(const std::string &collection_name) const
{
    auto entity_set = FindEntitySet(collection_name);

    auto is_concurrency_annotation = [](const Annotation &annotation) {
        return annotation.HasTerm("OptimisticConcurrency");
    };

    for (const auto &annotation : entity_set.annotations) {
        if (is_concurrency_annotation(annotation)) {
            return true;
        }
    }

    std::vector<std::string> targets;
    if (!entity_set.container.empty()) {
        targets.push_back(entity_set.container + "/" + entity_set.name);
        auto local_container = std::get<1>(Edmx::SplitNamespace(entity_set.container));
        if (local_container != entity_set.container) {
            targets.push_back(local_container + "/" + entity_set.name);
        }
    }
    for (const auto &target : targets) {
        for (const auto &annotation : model->FindAnnotations(target)) {
            if (is_concurrency_annotation(annotation)) {
                return true;
            }
        }
    }

    auto entity_type = model->FindEntityType(entity_set.entity_type_name);
    for (const auto &property : AllProperties(*model, entity_type)) {
        if (property.IsConcurrencyToken()) {
            return true;
        }
    }
    return false;
}

std::string ODataMetadata::ConvertKeyToUriLiteral(const EntityType &entity_type, const EntityData &data) const
{
    auto key = EffectiveKey(*model, entity_type);
    auto properties = AllProperties(*model, entity_type);

    std::vector<std::pair<std::string, std::string>> key_literals;
    for (const auto &property_ref : key.property_refs) {
        auto property = name_matcher->BestMatch(properties, property_ref.name,
                                                [](const Property &p) { return p.name; });
        if (!property) {
            throw ODataSchemaMismatchException("Key property '" + property_ref.name + "' is not declared on " + entity_type.FullName());
        }

        auto value = data.Find(property->name, *name_matcher);
        if (!value || !std::holds_alternative<duckdb::Value>(*value) || std::get<duckdb::Value>(*value).IsNull()) {
            throw ODataSchemaMismatchException("Missing key value '" + property->name + "' for link target of type " + entity_type.FullName());
        }

        auto wire_type = PrimitiveType::IsValidPrimitiveType(property->type_name)
                             ? std::optional<PrimitiveType>(PrimitiveType::FromString(property->type_name))
                             : std::nullopt;
        auto key_value = std::get<duckdb::Value>(*value);
        if (wire_type) {
            key_value = ODataTypeMap::Convert(key_value, *wire_type, PrimitiveFacets::FromProperty(*property));
        }

        auto literal = ODataUriLiteral::Format(key_value, wire_type.value_or(String), model->GetVersion());
        key_literals.emplace_back(property_ref.alias.empty() ? property->name : property_ref.alias, literal);
    }

    if (key_literals.empty()) {
        throw ODataSchemaMismatchException("Entity type " + entity_type.FullName() + " declares no key");
    }
    return ODataUriLiteral::FormatKey(key_literals);
}

bool ODataMetadata::NamesAreEqual(const std::string &actual_name, const std::string &requested_name) const
{
    return name_matcher->NamesAreEqual(actual_name, requested_name);
}

bool ODataMetadata::TypeNamesAreEqual(const std::string &actual_type_name, const std::string &requested_type_name) const
{
    auto [actual_ns, actual_local] = Edmx::SplitNamespace(actual_type_name);
    auto [requested_ns, requested_local] = Edmx::SplitNamespace(requested_type_name);

    if (!name_matcher->NamesAreEqual(actual_local, requested_local)) {
        return false;
    }
    if (actual_ns.empty() || requested_ns.empty()) {
        return true;
    }
    return duckdb::StringUtil::CIEquals(model->ResolveNamespace(actual_ns), model->ResolveNamespace(requested_ns));
}

} // namespace odata_writer

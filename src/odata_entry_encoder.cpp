#include "odata_entry_encoder.hpp"
#include "odata_exceptions.hpp"
#include "tracing.hpp"

#include <cpptrace/cpptrace.hpp>

namespace odata_writer {

static std::optional<PrimitiveType> PrimitiveTypeOf(const std::string &type_name)
{
    if (!PrimitiveType::IsValidPrimitiveType(type_name)) {
        return std::nullopt;
    }
    return PrimitiveType::FromString(type_name);
}

static std::string RawMessage(const std::exception &ex)
{
    return duckdb::ErrorData(ex).RawMessage();
}

std::string QualifiedTypeName(const EdmModel &model, const std::string &type_name)
{
    auto [is_collection, element_type] = ExtractCollectionType(type_name);
    auto [ns, local_name] = Edmx::SplitNamespace(element_type);
    auto qualified = ns.empty() ? element_type : model.ResolveNamespace(ns) + "." + local_name;
    return is_collection ? "Collection(" + qualified + ")" : qualified;
}

ODataEntryEncoder::ODataEntryEncoder(const ODataMetadata &metadata, ContentIdLookup content_ids)
    : metadata(metadata), content_ids(std::move(content_ids))
{ }

ODataEntry ODataEntryEncoder::Encode(const EdmModel &schema, const std::string &entity_type_name, const EntityData &data) const
{
    ScopedErrorContext ctx;
    ctx.Set("entity_type", entity_type_name);

    ODATA_WRITER_TRACE_DEBUG("ODATA_ENCODER", "Encoding " + entity_type_name + " with " + std::to_string(data.Size()) + " fields");

    try {
        auto entity_type = schema.FindEntityType(entity_type_name);
        auto properties = AllProperties(schema, entity_type);
        auto navigation_properties = AllNavigationProperties(schema, entity_type);
        const auto &matcher = metadata.NameMatcher();

        ODataEntry entry;
        entry.type_name = entity_type.FullName();

        for (const auto &field : data.Fields()) {
            ctx.Set("field", field.first);

            auto property = matcher.BestMatch(properties, field.first, [](const Property &p) { return p.name; });
            if (property) {
                if (!std::holds_alternative<duckdb::Value>(field.second)) {
                    throw ODataSchemaMismatchException(ctx.Format("Field holds linked entities but " + property->name +
                                                                  " is a structural property"));
                }
                ODATA_WRITER_TRACE_TRACE("ODATA_ENCODER", "Field " + field.first + " -> property " + property->name + " (" + property->type_name + ")");
                auto value = EncodeValue(schema, property->type_name, PrimitiveFacets::FromProperty(*property),
                                         std::get<duckdb::Value>(field.second), ctx);
                entry.properties.push_back(ODataProperty { property->name, std::move(value) });
                continue;
            }

            auto navigation_property = matcher.BestMatch(navigation_properties, field.first,
                                                         [](const NavigationProperty &p) { return p.name; });
            if (navigation_property) {
                if (IsNullEntityValue(field.second)) {
                    ODATA_WRITER_TRACE_TRACE("ODATA_ENCODER", "Skipping link " + navigation_property->name + " without target data");
                    continue;
                }
                auto owner_type = metadata.Model().FindEntityType(entity_type_name);
                entry.links.push_back(EncodeLink(owner_type, navigation_property->name, field.second));
                continue;
            }

            throw ODataSchemaMismatchException(ctx.Format("Field " + field.first + " is not declared on " + entity_type.FullName()));
        }

        return entry;
    } catch (const std::exception &ex) {
        if (ODataWriterTracer::Instance().ShouldTrace(TraceLevel::ERROR)) {
            ODATA_WRITER_TRACE_ERROR_DATA("ODATA_ENCODER", ctx.Format("Failed to encode entry: " + RawMessage(ex)),
                                          cpptrace::generate_trace(0, 10).to_string());
        }
        throw;
    }
}

ODataValue ODataEntryEncoder::EncodeValue(const EdmModel &schema, const std::string &type_name, const PrimitiveFacets &facets,
                                          const duckdb::Value &value, ErrorContext &ctx) const
{
    if (value.IsNull()) {
        auto result = ODataValue::Primitive(value, PrimitiveTypeOf(type_name));
        result.type_name = QualifiedTypeName(schema, type_name);
        return result;
    }

    auto [is_collection, element_type] = ExtractCollectionType(type_name);
    if (is_collection) {
        if (value.type().id() != duckdb::LogicalTypeId::LIST) {
            throw ODataFormatException(ctx.Format("Unable to convert value of type " + value.type().ToString() +
                                                  " to OData type " + type_name));
        }

        std::vector<ODataValue> items;
        auto &children = duckdb::ListValue::GetChildren(value);
        items.reserve(children.size());
        for (size_t i = 0; i < children.size(); i++) {
            ctx.Set("index", static_cast<int64_t>(i));
            items.push_back(EncodeValue(schema, element_type, facets, children[i], ctx));
        }
        return ODataValue::Collection(QualifiedTypeName(schema, type_name), std::move(items));
    }

    auto wire_type = PrimitiveTypeOf(type_name);
    if (wire_type) {
        try {
            return ODataValue::Primitive(ODataTypeMap::Convert(value, *wire_type, facets), wire_type);
        } catch (const ODataFormatException &ex) {
            throw ODataFormatException(ctx.Format(RawMessage(ex)));
        }
    }

    auto type = schema.FindType(type_name);
    if (std::holds_alternative<ComplexType>(type)) {
        return EncodeComplexValue(schema, std::get<ComplexType>(type), value, ctx);
    }

    // Enum members, type definitions and anything else go out as supplied
    auto result = ODataValue::Primitive(value);
    result.type_name = QualifiedTypeName(schema, type_name);
    return result;
}

ODataValue ODataEntryEncoder::EncodeComplexValue(const EdmModel &schema, const ComplexType &complex_type,
                                                 const duckdb::Value &value, ErrorContext &ctx) const
{
    if (value.type().id() != duckdb::LogicalTypeId::STRUCT) {
        throw ODataFormatException(ctx.Format("Unable to convert value of type " + value.type().ToString() +
                                              " to OData type " + complex_type.FullName()));
    }

    auto properties = AllProperties(schema, complex_type);
    auto &child_types = duckdb::StructType::GetChildTypes(value.type());
    auto &children = duckdb::StructValue::GetChildren(value);

    std::vector<ODataProperty> encoded;
    encoded.reserve(children.size());
    for (size_t i = 0; i < children.size(); i++) {
        auto &child_name = child_types[i].first;
        auto property = metadata.NameMatcher().BestMatch(properties, child_name, [](const Property &p) { return p.name; });
        if (!property) {
            throw ODataSchemaMismatchException(ctx.Format("Field " + child_name + " is not declared on complex type " +
                                                          complex_type.FullName()));
        }
        encoded.push_back(ODataProperty {
            property->name,
            EncodeValue(schema, property->type_name, PrimitiveFacets::FromProperty(*property), children[i], ctx)
        });
    }

    return ODataValue::Complex(complex_type.FullName(), std::move(encoded));
}

ODataNavigationLink ODataEntryEncoder::EncodeLink(const EntityType &owner_type, const std::string &link_name,
                                                  const EntityValue &link_value) const
{
    const auto &model = metadata.Model();
    auto navigation_properties = AllNavigationProperties(model, owner_type);
    auto navigation_property = metadata.NameMatcher().BestMatch(navigation_properties, link_name,
                                                                [](const NavigationProperty &p) { return p.name; });
    if (!navigation_property) {
        throw ODataSchemaMismatchException("Link " + link_name + " is not declared on " + owner_type.FullName());
    }

    ODataNavigationLink link;
    link.name = navigation_property->name;
    link.is_collection = IsManyLink(owner_type, *navigation_property);
    link.target_type_name = QualifiedTypeName(model, navigation_property->TargetTypeName());
    link.url = std::string(RELATED_LINK_URL_PREFIX) + link.target_type_name;

    for (const auto &target : LinkTargets(link.name, link_value)) {
        link.references.push_back(EncodeLinkReference(link.target_type_name, *target));
    }

    ODATA_WRITER_TRACE_DEBUG("ODATA_ENCODER", "Encoded link " + link.name + " to " + link.target_type_name + " with " +
                             std::to_string(link.references.size()) + " references");
    return link;
}

bool ODataEntryEncoder::IsManyLink(const EntityType &owner_type, const NavigationProperty &navigation_property) const
{
    if (navigation_property.partner.empty()) {
        return navigation_property.IsCollection();
    }

    const auto &model = metadata.Model();
    auto target = model.FindType(navigation_property.TargetTypeName());
    if (!std::holds_alternative<EntityType>(target)) {
        throw ODataMissingNavigationTargetException("Target of link " + navigation_property.name + " on " +
                                                    owner_type.FullName() + " is not an entity type");
    }

    for (const auto &partner : AllNavigationProperties(model, std::get<EntityType>(target))) {
        if (partner.name == navigation_property.partner) {
            return partner.IsCollection();
        }
    }

    ODATA_WRITER_TRACE_WARN("ODATA_ENCODER", "Partner " + navigation_property.partner + " of link " +
                            navigation_property.name + " not found, using the link's own multiplicity");
    return navigation_property.IsCollection();
}

std::vector<EntityDataPtr> ODataEntryEncoder::LinkTargets(const std::string &link_name, const EntityValue &link_value) const
{
    std::vector<EntityDataPtr> targets;

    if (std::holds_alternative<EntityDataPtr>(link_value)) {
        if (auto &target = std::get<EntityDataPtr>(link_value)) {
            targets.push_back(target);
        }
        return targets;
    }

    if (std::holds_alternative<std::vector<EntityDataPtr>>(link_value)) {
        for (const auto &target : std::get<std::vector<EntityDataPtr>>(link_value)) {
            if (target) {
                targets.push_back(target);
            }
        }
        return targets;
    }

    const auto &value = std::get<duckdb::Value>(link_value);
    if (value.IsNull()) {
        return targets;
    }
    if (value.type().id() == duckdb::LogicalTypeId::STRUCT) {
        targets.push_back(std::make_shared<EntityData>(EntityData::FromStruct(value)));
        return targets;
    }
    if (value.type().id() == duckdb::LogicalTypeId::LIST) {
        for (const auto &child : duckdb::ListValue::GetChildren(value)) {
            if (child.IsNull()) {
                continue;
            }
            if (child.type().id() != duckdb::LogicalTypeId::STRUCT) {
                throw ODataFormatException("Unable to convert value of type " + child.type().ToString() +
                                           " to a target of link " + link_name);
            }
            targets.push_back(std::make_shared<EntityData>(EntityData::FromStruct(child)));
        }
        return targets;
    }

    throw ODataFormatException("Unable to convert value of type " + value.type().ToString() + " to a target of link " + link_name);
}

LinkReference ODataEntryEncoder::EncodeLinkReference(const std::string &target_type_name, const EntityData &target) const
{
    if (content_ids) {
        if (auto content_id = content_ids(target)) {
            return PendingLinkReference { *content_id };
        }
    }

    auto entity_sets = metadata.FindEntitySetsByType(target_type_name);
    if (entity_sets.empty()) {
        throw ODataMissingNavigationTargetException("No entity set holds entities of type " + target_type_name);
    }
    if (entity_sets.size() > 1) {
        ODATA_WRITER_TRACE_WARN("ODATA_ENCODER", std::to_string(entity_sets.size()) + " entity sets hold " +
                                target_type_name + ", linking to " + entity_sets.front().name);
    }

    auto target_type = metadata.Model().FindEntityType(target_type_name);
    return ResolvedLinkReference { entity_sets.front().name, metadata.ConvertKeyToUriLiteral(target_type, target) };
}

} // namespace odata_writer

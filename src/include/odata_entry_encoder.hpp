#pragma once

#include "error_context.hpp"
#include "odata_edm.hpp"
#include "odata_entity_data.hpp"
#include "odata_entry.hpp"
#include "odata_metadata.hpp"
#include "odata_type_map.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace odata_writer
{

/**
 * @brief Builds the wire tree of one entity from caller-supplied field values.
 *
 * Fields are matched against the entity type's structural properties first and
 * its navigation properties second, each by insensitive and plural-tolerant
 * name. Structural values are coerced to their declared kinds through
 * ODataTypeMap, recursing into complex types and collections. Navigation fields
 * become links; links are always resolved against the full model of the
 * metadata, even when the entry itself is encoded against a restricted view.
 *
 * Encoding does not modify its inputs and keeps no state between calls.
 */
class ODataEntryEncoder
{
public:
    // Content id of an entity queued earlier in the same batch, matched by object identity
    using ContentIdLookup = std::function<std::optional<int64_t>(const EntityData &)>;

    static constexpr const char *RELATED_LINK_URL_PREFIX = "http://schemas.microsoft.com/ado/2007/08/dataservices/related/";

    explicit ODataEntryEncoder(const ODataMetadata &metadata, ContentIdLookup content_ids = nullptr);

    ODataEntry Encode(const EdmModel &schema, const std::string &entity_type_name, const EntityData &data) const;

    ODataNavigationLink EncodeLink(const EntityType &owner_type, const std::string &link_name,
                                   const EntityValue &link_value) const;

private:
    ODataValue EncodeValue(const EdmModel &schema, const std::string &type_name, const PrimitiveFacets &facets,
                           const duckdb::Value &value, ErrorContext &ctx) const;
    ODataValue EncodeComplexValue(const EdmModel &schema, const ComplexType &complex_type,
                                  const duckdb::Value &value, ErrorContext &ctx) const;
    LinkReference EncodeLinkReference(const std::string &target_type_name, const EntityData &target) const;

    bool IsManyLink(const EntityType &owner_type, const NavigationProperty &navigation_property) const;
    std::vector<EntityDataPtr> LinkTargets(const std::string &link_name, const EntityValue &link_value) const;

    const ODataMetadata &metadata;
    ContentIdLookup content_ids;
};

// Qualifies type_name with its resolved namespace; Collection(...) is kept around the element type
std::string QualifiedTypeName(const EdmModel &model, const std::string &type_name);

} // namespace odata_writer

#pragma once

#include "odata_edm.hpp"
#include "odata_entity_data.hpp"
#include "odata_name_matcher.hpp"

#include <memory>
#include <string>
#include <vector>

namespace odata_writer
{

/**
 * @brief Lookup service over a service's $metadata.
 *
 * Answers the questions the writer asks the schema: which entity set a
 * caller-supplied collection name refers to, what type it holds, whether writes
 * to it need an If-Match precondition, and how an entity's key renders in a URL.
 * Collection and type names are matched through the name matcher, so "employee",
 * "Employees" and "EMPLOYEES" all find the Employees set.
 */
class ODataMetadata
{
public:
    explicit ODataMetadata(std::shared_ptr<const EdmModel> model,
                           std::shared_ptr<const ODataNameMatcher> name_matcher = std::make_shared<ODataNameMatcher>());

    // Parses an EDMX document
    static std::shared_ptr<ODataMetadata> FromXml(const std::string &metadata_xml);

    const EdmModel &Model() const { return *model; }
    const ODataNameMatcher &NameMatcher() const { return *name_matcher; }
    ODataVersion Version() const { return model->GetVersion(); }

    // Throws duckdb::InvalidInputException when no entity set matches
    EntitySet FindEntitySet(const std::string &collection_name) const;
    EntityType FindEntityType(const std::string &type_name) const;
    EntityType EntitySetType(const std::string &collection_name) const;

    // Entity sets whose element type matches type_name, in declaration order
    std::vector<EntitySet> FindEntitySetsByType(const std::string &type_name) const;

    // True when the set's type has a ConcurrencyMode="Fixed" property or the set
    // carries Core.OptimisticConcurrency, inline or in an Annotations block
    bool EntitySetTypeRequiresOptimisticConcurrencyCheck(const std::string &collection_name) const;

    // Key segment for the entity, e.g. (3) or (OrderId=1,Line=2). Throws
    // ODataSchemaMismatchException when a key value is missing or NULL.
    std::string ConvertKeyToUriLiteral(const EntityType &entity_type, const EntityData &data) const;

    bool NamesAreEqual(const std::string &actual_name, const std::string &requested_name) const;
    bool TypeNamesAreEqual(const std::string &actual_type_name, const std::string &requested_type_name) const;

private:
    std::shared_ptr<const EdmModel> model;
    std::shared_ptr<const ODataNameMatcher> name_matcher;
};

} // namespace odata_writer

#pragma once

#include "odata_edm.hpp"

#include <string>
#include <vector>

namespace odata_writer
{

/**
 * @brief Restricted view of one entity type for partial updates.
 *
 * Overlays a source model: FindType answers the restricted copy of the entity
 * type for any spelling of its qualified name and forwards every other lookup
 * to the source. The restricted type keeps only the structural and navigation
 * properties named in the keep list (inherited ones included, flattened, so
 * the copy has no base type). Navigation properties become one-directional:
 * their partner is dropped while target type, multiplicity, referential
 * constraints, on-delete action and containment are kept.
 *
 * The source model must outlive the view.
 */
class EdmDeltaModel : public EdmModel
{
public:
    EdmDeltaModel(const EdmModel &source, const EntityType &entity_type, const std::vector<std::string> &property_names);

    TypeVariant FindType(const std::string &type_name_or_url) const override;
    EntitySet FindEntitySet(const std::string &entity_set_name_or_url) const override;
    std::vector<EntitySet> FindEntitySets() const override;
    std::vector<Operation> FindBoundOperations(const std::string &binding_type_name) const override;
    std::vector<Annotation> FindAnnotations(const std::string &target) const override;
    std::string ResolveNamespace(const std::string &ns_or_alias) const override;
    ODataVersion GetVersion() const override;

    const EntityType &RestrictedType() const { return entity_type; }
    const EdmModel &Source() const { return source; }

private:
    bool IsRestrictedTypeName(const std::string &type_name_or_url) const;

    const EdmModel &source;
    EntityType entity_type;
};

} // namespace odata_writer

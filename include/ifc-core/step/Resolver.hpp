#pragma once

#include <memory>
#include <string>
#include <vector>
#include "AttributeValue.hpp"

namespace ifccore::step {

using EntityPtr = std::shared_ptr<const DecodedEntity>;

/**
 * @brief Read-only entity lookup shared by the spatial, property and
 * geometry layers
 *
 * Implementations must be safe to call concurrently.
 */
class EntityResolver {
public:
    virtual ~EntityResolver() = default;

    /**
     * @brief Decoded entity by id
     * @return ENTITY_NOT_FOUND for unknown ids, PARSE_ERROR if decoding fails
     */
    virtual Result<EntityPtr> get(EntityId id) const = 0;

    /**
     * @brief Ids of all entities of an exact (upper-case) type name, in file order
     */
    virtual const std::vector<EntityId>& findByTypeName(const std::string& typeName) const = 0;

    /**
     * @brief Dereference an EntityRef attribute
     * @return INVALID_ATTRIBUTE when the value is not a reference
     */
    Result<EntityPtr> resolveRef(const AttributeValue& value) const;

    /**
     * @brief Dereference attribute `index` of `entity`
     */
    Result<EntityPtr> resolveAttribute(const DecodedEntity& entity, size_t index) const;

    /**
     * @brief Decoded entity or nullptr, for optional lookups
     */
    EntityPtr find(EntityId id) const;
};

} // namespace ifccore::step

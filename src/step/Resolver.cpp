#include "ifc-core/step/Resolver.hpp"

namespace ifccore::step {

Result<EntityPtr> EntityResolver::resolveRef(const AttributeValue& value) const {
    auto id = value.asRef();
    if (!id) {
        return Result<EntityPtr>::error(ErrorCode::InvalidAttribute,
            "Expected entity reference, found " + value.toString());
    }
    return get(*id);
}

Result<EntityPtr> EntityResolver::resolveAttribute(const DecodedEntity& entity, size_t index) const {
    auto value = entity.get(index);
    if (!value || !value->isRef()) {
        auto r = Result<EntityPtr>::invalidAttribute(index,
            entity.typeName + " #" + std::to_string(entity.id) + " expects an entity reference");
        r.entityId = entity.id;
        return r;
    }
    return get(*value->asRef());
}

EntityPtr EntityResolver::find(EntityId id) const {
    auto result = get(id);
    return result ? result.value : nullptr;
}

} // namespace ifccore::step

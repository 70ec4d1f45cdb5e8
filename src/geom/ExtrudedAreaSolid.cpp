#include "ifc-core/geom/Processors.hpp"
#include "ifc-core/geom/Extrusion.hpp"
#include "ifc-core/geom/Profile.hpp"
#include "EntityGeometry.hpp"

namespace ifccore::geom {

Result<Mesh> ExtrudedAreaSolidProcessor::process(const step::DecodedEntity& entity,
                                                 const step::EntityResolver& resolver) const {
    // (SweptArea, Position, ExtrudedDirection, Depth)
    auto profileEntity = resolver.resolveAttribute(entity, 0);
    if (!profileEntity) {
        return Result<Mesh>::from(profileEntity).withEntity(entity.id);
    }
    auto profile = profileFromEntity(*profileEntity.value, resolver);
    if (!profile) {
        return Result<Mesh>::from(profile).withEntity(entity.id);
    }

    auto directionRef = entity.getRef(2);
    if (!directionRef) {
        return Result<Mesh>::invalidAttribute(2, "Missing ExtrudedDirection").withEntity(entity.id);
    }
    auto direction = detail::readDirection(*directionRef, resolver);
    if (!direction) {
        return Result<Mesh>::from(direction).withEntity(entity.id);
    }

    auto depth = detail::readPositive(entity, 3, "Depth");
    if (!depth) {
        return Result<Mesh>::from(depth).withEntity(entity.id);
    }

    auto mesh = extrudeProfile(profile.value, depth.value, direction.value);
    if (!mesh) {
        return mesh.withEntity(entity.id);
    }

    if (auto positionRef = entity.getRef(1)) {
        auto position = resolver.get(*positionRef);
        if (!position) {
            return Result<Mesh>::from(position).withEntity(entity.id);
        }
        auto placement = detail::readAxisPlacement(*position.value, resolver);
        if (!placement) {
            return Result<Mesh>::from(placement).withEntity(entity.id);
        }
        mesh.value.transform(placement.value);
    }
    return mesh;
}

} // namespace ifccore::geom

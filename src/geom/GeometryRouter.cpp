#include "ifc-core/geom/GeometryRouter.hpp"
#include "ifc-core/geom/Csg.hpp"
#include "EntityGeometry.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace ifccore::geom {

const char* toString(GeometryType type) {
    switch (type) {
        case GeometryType::ExtrudedAreaSolid: return "ExtrudedAreaSolid";
        case GeometryType::RevolvedAreaSolid: return "RevolvedAreaSolid";
        case GeometryType::SweptDiskSolid: return "SweptDiskSolid";
        case GeometryType::FacetedBrep: return "FacetedBrep";
        case GeometryType::TriangulatedFaceSet: return "TriangulatedFaceSet";
        case GeometryType::MappedItem: return "MappedItem";
        case GeometryType::Unsupported: return "Unsupported";
    }
    return "Unsupported";
}

GeometryRouter::GeometryRouter(GeometryOptions opts)
    : options(std::move(opts)),
      revolvedAreaSolid(options.revolveFullCircleSegments),
      sweptDiskSolid(options.sweptDiskSegments) {}

GeometryType GeometryRouter::classify(const std::string& typeName) {
    if (typeName == "IFCEXTRUDEDAREASOLID") return GeometryType::ExtrudedAreaSolid;
    if (typeName == "IFCREVOLVEDAREASOLID") return GeometryType::RevolvedAreaSolid;
    if (typeName == "IFCSWEPTDISKSOLID") return GeometryType::SweptDiskSolid;
    if (typeName == "IFCFACETEDBREP" || typeName == "IFCFACETEDBREPWITHVOIDS") return GeometryType::FacetedBrep;
    if (typeName == "IFCTRIANGULATEDFACESET") return GeometryType::TriangulatedFaceSet;
    if (typeName == "IFCMAPPEDITEM") return GeometryType::MappedItem;
    return GeometryType::Unsupported;
}

bool GeometryRouter::hasProcessor(const std::string& typeName) const {
    return classify(typeName) != GeometryType::Unsupported;
}

// ============================================================================
// Representation items
// ============================================================================

Result<Mesh> GeometryRouter::process(EntityId id, const step::EntityResolver& resolver) const {
    auto entity = resolver.get(id);
    if (!entity) {
        return Result<Mesh>::from(entity);
    }
    return processEntity(*entity.value, resolver);
}

Result<Mesh> GeometryRouter::processEntity(const step::DecodedEntity& entity,
                                           const step::EntityResolver& resolver) const {
    auto start = std::chrono::high_resolution_clock::now();
    auto result = processItem(entity, resolver, 0);
    if (result) {
        result.value.scale(options.unitScale);
    }
    auto end = std::chrono::high_resolution_clock::now();
    result.durationMs = std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}

Result<Mesh> GeometryRouter::processItem(const step::DecodedEntity& entity,
                                         const step::EntityResolver& resolver, int depth) const {
    switch (classify(entity.typeName)) {
        case GeometryType::ExtrudedAreaSolid:
            return extrudedAreaSolid.process(entity, resolver);
        case GeometryType::RevolvedAreaSolid:
            return revolvedAreaSolid.process(entity, resolver);
        case GeometryType::SweptDiskSolid:
            return sweptDiskSolid.process(entity, resolver);
        case GeometryType::FacetedBrep:
            return facetedBrep.process(entity, resolver);
        case GeometryType::TriangulatedFaceSet:
            return triangulatedFaceSet.process(entity, resolver);
        case GeometryType::MappedItem:
            return processMappedItem(entity, resolver, depth);
        case GeometryType::Unsupported:
            break;
    }
    auto r = Result<Mesh>::error(ErrorCode::UnsupportedType, "Unsupported geometry type " + entity.typeName);
    r.entityId = entity.id;
    return r;
}

Result<Mesh> GeometryRouter::processMappedItem(const step::DecodedEntity& entity,
                                               const step::EntityResolver& resolver, int depth) const {
    if (depth >= kMaxMappingDepth) {
        auto r = Result<Mesh>::error(ErrorCode::Geometry, "Mapped item nesting too deep");
        r.entityId = entity.id;
        return r;
    }

    // (MappingSource, MappingTarget); source = (MappingOrigin, MappedRepresentation)
    auto source = resolver.resolveAttribute(entity, 0);
    if (!source) {
        return Result<Mesh>::from(source).withEntity(entity.id);
    }
    const auto& map = *source.value;
    auto representationRef = map.getRef(1);
    if (!representationRef) {
        return Result<Mesh>::invalidAttribute(1, "Missing MappedRepresentation").withEntity(map.id);
    }

    Transform origin;
    if (auto originRef = map.getRef(0)) {
        auto originEntity = resolver.get(*originRef);
        if (!originEntity) {
            return Result<Mesh>::from(originEntity).withEntity(map.id);
        }
        auto t = detail::readAxisPlacement(*originEntity.value, resolver);
        if (!t) {
            return Result<Mesh>::from(t).withEntity(map.id);
        }
        origin = t.value;
    }

    Transform target;
    if (entity.getRef(1)) {
        auto targetEntity = resolver.resolveAttribute(entity, 1);
        if (!targetEntity) {
            return Result<Mesh>::from(targetEntity).withEntity(entity.id);
        }
        auto t = detail::readTransformationOperator(*targetEntity.value, resolver);
        if (!t) {
            return Result<Mesh>::from(t).withEntity(entity.id);
        }
        target = t.value;
    }

    Mesh mesh;
    bool cached = false;
    {
        std::lock_guard<std::mutex> lock(mappedMutex);
        auto it = mappedCache.find(*representationRef);
        if (it != mappedCache.end()) {
            mesh = it->second;
            cached = true;
        }
    }
    if (!cached) {
        auto representation = resolver.get(*representationRef);
        if (!representation) {
            return Result<Mesh>::from(representation).withEntity(map.id);
        }
        auto built = representationMesh(*representation.value, resolver, depth + 1);
        if (!built) {
            return built;
        }
        mesh = std::move(built.value);
        std::lock_guard<std::mutex> lock(mappedMutex);
        mappedCache.emplace(*representationRef, mesh);
    }

    mesh.transform(target * origin);
    auto result = Result<Mesh>::ok(std::move(mesh));
    result.wasCached = cached;
    return result;
}

Result<Mesh> GeometryRouter::representationMesh(const step::DecodedEntity& representation,
                                                const step::EntityResolver& resolver, int depth) const {
    // (ContextOfItems, RepresentationIdentifier, RepresentationType, Items)
    std::vector<EntityId> items = representation.getRefs(3);
    if (items.empty()) {
        auto r = Result<Mesh>::error(ErrorCode::Geometry, "Representation has no items");
        r.entityId = representation.id;
        return r;
    }

    Mesh merged;
    Result<Mesh> firstError;
    size_t meshed = 0;
    for (EntityId itemId : items) {
        Result<Mesh> itemMesh;
        auto item = resolver.get(itemId);
        if (item) {
            itemMesh = processItem(*item.value, resolver, depth);
        } else {
            itemMesh = Result<Mesh>::from(item);
        }

        if (!itemMesh) {
            if (options.verbose) {
                std::cerr << "Skipping item #" << itemId << " of representation #" << representation.id
                          << ": " << itemMesh.errorCode << " " << itemMesh.errorMessage << std::endl;
            }
            if (firstError.errorCode.empty()) {
                firstError = itemMesh;
            }
            continue;
        }
        merged.merge(itemMesh.value);
        ++meshed;
    }

    if (meshed == 0) {
        return firstError;
    }
    return Result<Mesh>::ok(std::move(merged));
}

// ============================================================================
// Products
// ============================================================================

bool GeometryRouter::acceptsIdentifier(const std::string& identifier) const {
    const auto& ids = options.representationIdentifiers;
    return ids.empty() || std::find(ids.begin(), ids.end(), identifier) != ids.end();
}

Result<Mesh> GeometryRouter::productMesh(const step::DecodedEntity& product,
                                         const step::EntityResolver& resolver) const {
    // IfcProduct: (..., ObjectPlacement 5, Representation 6)
    if (!product.getRef(6)) {
        auto r = Result<Mesh>::error(ErrorCode::Geometry, product.typeName + " has no representation");
        r.entityId = product.id;
        return r;
    }
    auto shape = resolver.resolveAttribute(product, 6);
    if (!shape) {
        return Result<Mesh>::from(shape).withEntity(product.id);
    }

    // IfcProductDefinitionShape: (Name, Description, Representations)
    Mesh merged;
    Result<Mesh> firstError;
    size_t used = 0;
    for (EntityId representationId : shape.value->getRefs(2)) {
        auto representation = resolver.get(representationId);
        if (!representation) {
            return Result<Mesh>::from(representation).withEntity(product.id);
        }
        auto identifier = representation.value->getString(1).value_or("");
        if (!acceptsIdentifier(identifier)) {
            continue;
        }
        auto mesh = representationMesh(*representation.value, resolver, 0);
        if (!mesh) {
            if (firstError.errorCode.empty()) {
                firstError = mesh;
            }
            continue;
        }
        merged.merge(mesh.value);
        ++used;
    }

    if (used == 0) {
        if (!firstError.errorCode.empty()) {
            return firstError.withEntity(product.id);
        }
        auto r = Result<Mesh>::error(ErrorCode::Geometry,
            product.typeName + " has no body representation");
        r.entityId = product.id;
        return r;
    }

    if (auto placementRef = product.getRef(5)) {
        auto placement = detail::readPlacement(*placementRef, resolver);
        if (!placement) {
            return Result<Mesh>::from(placement).withEntity(product.id);
        }
        merged.transform(placement.value);
    }
    return Result<Mesh>::ok(std::move(merged));
}

std::vector<EntityId> GeometryRouter::openingsOf(EntityId elementId,
                                                 const step::EntityResolver& resolver) const {
    // IfcRelVoidsElement: (..., RelatingBuildingElement 4, RelatedOpeningElement 5)
    std::vector<EntityId> openings;
    for (EntityId relId : resolver.findByTypeName("IFCRELVOIDSELEMENT")) {
        auto rel = resolver.find(relId);
        if (!rel) {
            continue;
        }
        if (rel->getRef(4) == elementId) {
            if (auto opening = rel->getRef(5)) {
                openings.push_back(*opening);
            }
        }
    }
    return openings;
}

Result<Mesh> GeometryRouter::processElement(EntityId elementId, const step::EntityResolver& resolver) const {
    auto start = std::chrono::high_resolution_clock::now();

    auto element = resolver.get(elementId);
    if (!element) {
        return Result<Mesh>::from(element);
    }
    auto result = productMesh(*element.value, resolver);
    if (!result) {
        return result;
    }

    if (options.subtractOpenings) {
        std::vector<Mesh> openings;
        for (EntityId openingId : openingsOf(elementId, resolver)) {
            auto opening = resolver.get(openingId);
            if (!opening) {
                continue;
            }
            auto openingMesh = productMesh(*opening.value, resolver);
            if (!openingMesh) {
                if (options.verbose) {
                    std::cerr << "Skipping opening #" << openingId << ": "
                              << openingMesh.errorCode << " " << openingMesh.errorMessage << std::endl;
                }
                continue;
            }
            openings.push_back(std::move(openingMesh.value));
        }
        if (!openings.empty()) {
            auto cut = subtractOpenings(result.value, openings);
            if (cut) {
                result.value = std::move(cut.value);
            } else if (options.verbose) {
                std::cerr << "Openings of #" << elementId << " not subtracted: "
                          << cut.errorCode << " " << cut.errorMessage << std::endl;
            }
        }
    }

    result.value.scale(options.unitScale);
    auto end = std::chrono::high_resolution_clock::now();
    result.durationMs = std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}

// ============================================================================
// Caches
// ============================================================================

size_t GeometryRouter::mappedCacheSize() const {
    std::lock_guard<std::mutex> lock(mappedMutex);
    return mappedCache.size();
}

void GeometryRouter::clearCaches() {
    std::lock_guard<std::mutex> lock(mappedMutex);
    mappedCache.clear();
}

} // namespace ifccore::geom

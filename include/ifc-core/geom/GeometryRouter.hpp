#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "../Types.hpp"
#include "../step/Resolver.hpp"
#include "Mesh.hpp"
#include "Processors.hpp"

namespace ifccore::geom {

/**
 * @brief Geometry configuration
 */
struct GeometryOptions {
    double unitScale = 1.0;                 // multiplies every output position
    size_t sweptDiskSegments = 12;
    size_t revolveFullCircleSegments = 24;
    std::vector<std::string> representationIdentifiers = {"Body", "Facetation"};
    bool subtractOpenings = false;          // needs the OCCT backend
    bool verbose = false;
};

/**
 * @brief Representation item kinds the router can mesh
 */
enum class GeometryType {
    ExtrudedAreaSolid,
    RevolvedAreaSolid,
    SweptDiskSolid,
    FacetedBrep,
    TriangulatedFaceSet,
    MappedItem,
    Unsupported
};

const char* toString(GeometryType type);

/**
 * @brief Dispatches representation items to their processor
 *
 * The set of processors is closed; any other item type fails with
 * UNSUPPORTED_TYPE. Calls for different entities are independent and may
 * run concurrently. The only shared state is the mapped representation
 * cache, which is guarded by a mutex.
 */
class GeometryRouter {
public:
    explicit GeometryRouter(GeometryOptions options = GeometryOptions());

    GeometryRouter(const GeometryRouter&) = delete;
    GeometryRouter& operator=(const GeometryRouter&) = delete;

    // ========================================================================
    // Representation items
    // ========================================================================

    /**
     * @brief Mesh one representation item by id, scaled by the unit scale
     * @return ENTITY_NOT_FOUND, UNSUPPORTED_TYPE or the processor's error
     */
    Result<Mesh> process(EntityId id, const step::EntityResolver& resolver) const;

    /**
     * @brief Mesh an already decoded representation item
     */
    Result<Mesh> processEntity(const step::DecodedEntity& entity,
                               const step::EntityResolver& resolver) const;

    // ========================================================================
    // Products
    // ========================================================================

    /**
     * @brief Mesh a product (wall, slab, ...) in world coordinates
     *
     * Follows Representation -> IfcProductDefinitionShape -> shape
     * representations whose identifier is listed in the options, merges
     * their items and applies the ObjectPlacement chain. Items that fail
     * are skipped; the element fails only if none can be meshed.
     */
    Result<Mesh> processElement(EntityId elementId, const step::EntityResolver& resolver) const;

    // ========================================================================
    // Dispatch
    // ========================================================================

    static GeometryType classify(const std::string& typeName);
    bool hasProcessor(const std::string& typeName) const;

    double getUnitScale() const { return options.unitScale; }
    void setUnitScale(double scale) { options.unitScale = scale; }
    const GeometryOptions& getOptions() const { return options; }

    size_t mappedCacheSize() const;
    void clearCaches();

private:
    static constexpr int kMaxMappingDepth = 8;

    // Unscaled variants; the unit scale is applied once at the public boundary
    Result<Mesh> processItem(const step::DecodedEntity& entity,
                             const step::EntityResolver& resolver, int depth) const;
    Result<Mesh> processMappedItem(const step::DecodedEntity& entity,
                                   const step::EntityResolver& resolver, int depth) const;
    Result<Mesh> representationMesh(const step::DecodedEntity& representation,
                                    const step::EntityResolver& resolver, int depth) const;
    Result<Mesh> productMesh(const step::DecodedEntity& product,
                             const step::EntityResolver& resolver) const;
    std::vector<EntityId> openingsOf(EntityId elementId, const step::EntityResolver& resolver) const;
    bool acceptsIdentifier(const std::string& identifier) const;

    GeometryOptions options;

    ExtrudedAreaSolidProcessor extrudedAreaSolid;
    RevolvedAreaSolidProcessor revolvedAreaSolid;
    SweptDiskSolidProcessor sweptDiskSolid;
    FacetedBrepProcessor facetedBrep;
    TriangulatedFaceSetProcessor triangulatedFaceSet;

    // Mapped representation id -> mesh in the map's own coordinates
    mutable std::mutex mappedMutex;
    mutable std::unordered_map<EntityId, Mesh> mappedCache;
};

} // namespace ifccore::geom

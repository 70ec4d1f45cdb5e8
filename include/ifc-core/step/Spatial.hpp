#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "Resolver.hpp"

namespace ifccore::step {

enum class SpatialNodeType {
    Project,
    Site,
    Building,
    Storey,
    Space,
    Facility,
    FacilityPart,
    Element
};

const char* toString(SpatialNodeType type);

/**
 * @brief Classify an IFC type name into a spatial node type
 */
SpatialNodeType spatialNodeTypeFor(const std::string& typeName);

/**
 * @brief Node of the project decomposition tree
 */
struct SpatialNode {
    EntityId id = 0;
    SpatialNodeType type = SpatialNodeType::Element;
    std::string entityType;             // e.g. "IFCWALL"
    std::string name;                   // IfcRoot.Name, empty when unset
    std::optional<double> elevation;    // storeys only
    bool hasGeometry = false;           // product has a Representation
    std::vector<EntityId> children;     // relation order
};

struct StoreyInfo {
    EntityId id = 0;
    std::string name;
    double elevation = 0.0;
    size_t elementCount = 0;
};

/**
 * @brief Project -> site -> building -> storey -> element hierarchy
 *
 * Built once from IFCRELAGGREGATES, IFCRELNESTS and
 * IFCRELCONTAINEDINSPATIALSTRUCTURE and read-only afterwards. Every node
 * has at most one parent: aggregation relations are observed before
 * containment relations, each in file order, and the first claim on a
 * child wins. Later conflicting claims are counted, not applied.
 */
class SpatialTree {
public:
    static SpatialTree build(const EntityResolver& resolver, bool verbose = false);

    std::optional<EntityId> root() const { return root_; }

    /**
     * @brief Node by id, nullptr when the entity takes no part in the tree
     */
    const SpatialNode* node(EntityId id) const;

    const std::vector<EntityId>& children(EntityId id) const;
    std::optional<EntityId> parent(EntityId id) const;

    /**
     * @brief All building storeys sorted by elevation
     */
    const std::vector<StoreyInfo>& storeys() const { return storeys_; }

    /**
     * @brief Elements below a storey, including those in its spaces
     */
    std::vector<EntityId> elementsInStorey(EntityId storeyId) const;

    /**
     * @brief Storey an element belongs to, following parents upward
     */
    std::optional<EntityId> containingStorey(EntityId elementId) const;

    /**
     * @brief Case-insensitive match on node name or entity type
     */
    std::vector<EntityId> search(const std::string& query) const;

    /**
     * @brief Depth-first node order from the root
     */
    std::vector<EntityId> depthFirst() const;

    size_t nodeCount() const { return nodes_.size(); }
    size_t duplicateParentClaims() const { return duplicateParentClaims_; }

private:
    SpatialNode* ensureNode(EntityId id, const EntityResolver& resolver);
    void link(EntityId parentId, EntityId childId, const EntityResolver& resolver, bool verbose);
    bool isAncestor(EntityId candidate, EntityId id) const;
    void collectElements(EntityId id, std::vector<EntityId>& out, std::vector<EntityId>& stack) const;

    std::optional<EntityId> root_;
    std::unordered_map<EntityId, SpatialNode> nodes_;
    std::unordered_map<EntityId, EntityId> parents_;
    std::vector<StoreyInfo> storeys_;
    size_t duplicateParentClaims_ = 0;
};

} // namespace ifccore::step

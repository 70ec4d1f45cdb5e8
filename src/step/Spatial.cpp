#include "ifc-core/step/Spatial.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <unordered_set>

namespace ifccore::step {

const char* toString(SpatialNodeType type) {
    switch (type) {
        case SpatialNodeType::Project: return "Project";
        case SpatialNodeType::Site: return "Site";
        case SpatialNodeType::Building: return "Building";
        case SpatialNodeType::Storey: return "Storey";
        case SpatialNodeType::Space: return "Space";
        case SpatialNodeType::Facility: return "Facility";
        case SpatialNodeType::FacilityPart: return "FacilityPart";
        case SpatialNodeType::Element: return "Element";
    }
    return "Element";
}

SpatialNodeType spatialNodeTypeFor(const std::string& typeName) {
    if (typeName == "IFCPROJECT") return SpatialNodeType::Project;
    if (typeName == "IFCSITE") return SpatialNodeType::Site;
    if (typeName == "IFCBUILDING") return SpatialNodeType::Building;
    if (typeName == "IFCBUILDINGSTOREY") return SpatialNodeType::Storey;
    if (typeName == "IFCSPACE") return SpatialNodeType::Space;
    if (typeName == "IFCFACILITY" || typeName == "IFCBRIDGE" ||
        typeName == "IFCROAD" || typeName == "IFCRAILWAY" ||
        typeName == "IFCMARINEFACILITY") {
        return SpatialNodeType::Facility;
    }
    if (typeName == "IFCFACILITYPART" || typeName == "IFCBRIDGEPART" ||
        typeName == "IFCROADPART" || typeName == "IFCRAILWAYPART") {
        return SpatialNodeType::FacilityPart;
    }
    return SpatialNodeType::Element;
}

namespace {

const std::vector<EntityId> kNoChildren;

// Relation type, index of the relating (parent) attribute, index of the
// related (children) attribute
struct RelationLayout {
    const char* typeName;
    size_t parentIndex;
    size_t childrenIndex;
};

const RelationLayout kRelations[] = {
    {"IFCRELAGGREGATES", 4, 5},
    {"IFCRELNESTS", 4, 5},
    {"IFCRELCONTAINEDINSPATIALSTRUCTURE", 5, 4},
};

constexpr size_t kMaxTreeDepth = 256;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

SpatialTree SpatialTree::build(const EntityResolver& resolver, bool verbose) {
    SpatialTree tree;

    const auto& projects = resolver.findByTypeName("IFCPROJECT");
    if (!projects.empty()) {
        if (tree.ensureNode(projects.front(), resolver)) {
            tree.root_ = projects.front();
        }
    }

    for (const auto& layout : kRelations) {
        for (EntityId relationId : resolver.findByTypeName(layout.typeName)) {
            auto relation = resolver.get(relationId);
            if (!relation) {
                if (verbose) {
                    std::cerr << "Warning: skipping relation #" << relationId << ": "
                              << relation.errorMessage << std::endl;
                }
                continue;
            }
            auto parentId = relation.value->getRef(layout.parentIndex);
            if (!parentId) {
                continue;
            }
            for (EntityId childId : relation.value->getRefs(layout.childrenIndex)) {
                tree.link(*parentId, childId, resolver, verbose);
            }
        }
    }

    for (EntityId storeyId : resolver.findByTypeName("IFCBUILDINGSTOREY")) {
        const SpatialNode* storey = tree.ensureNode(storeyId, resolver);
        if (!storey) {
            continue;
        }
        StoreyInfo info;
        info.id = storeyId;
        info.name = storey->name;
        info.elevation = storey->elevation.value_or(0.0);
        info.elementCount = tree.elementsInStorey(storeyId).size();
        tree.storeys_.push_back(std::move(info));
    }
    std::stable_sort(tree.storeys_.begin(), tree.storeys_.end(),
                     [](const StoreyInfo& a, const StoreyInfo& b) {
                         return a.elevation < b.elevation;
                     });

    if (verbose) {
        std::cout << "Spatial tree: " << tree.nodes_.size() << " nodes, "
                  << tree.storeys_.size() << " storeys";
        if (tree.duplicateParentClaims_ > 0) {
            std::cout << ", " << tree.duplicateParentClaims_ << " ignored parent claims";
        }
        std::cout << std::endl;
    }

    return tree;
}

SpatialNode* SpatialTree::ensureNode(EntityId id, const EntityResolver& resolver) {
    auto it = nodes_.find(id);
    if (it != nodes_.end()) {
        return &it->second;
    }

    auto entity = resolver.get(id);
    if (!entity) {
        return nullptr;
    }

    SpatialNode node;
    node.id = id;
    node.entityType = entity.value->typeName;
    node.type = spatialNodeTypeFor(node.entityType);
    // IfcRoot: (GlobalId, OwnerHistory, Name, ...)
    if (auto name = entity.value->getString(2)) {
        node.name = *name;
    }
    if (node.type == SpatialNodeType::Storey) {
        node.elevation = entity.value->getFloat(9);
    }
    // IfcProduct.Representation
    if (node.type != SpatialNodeType::Project) {
        node.hasGeometry = entity.value->getRef(6).has_value();
    }

    return &nodes_.emplace(id, std::move(node)).first->second;
}

bool SpatialTree::isAncestor(EntityId candidate, EntityId id) const {
    EntityId current = id;
    for (size_t depth = 0; depth < kMaxTreeDepth; ++depth) {
        if (current == candidate) {
            return true;
        }
        auto it = parents_.find(current);
        if (it == parents_.end()) {
            return false;
        }
        current = it->second;
    }
    return true;
}

void SpatialTree::link(EntityId parentId, EntityId childId, const EntityResolver& resolver, bool verbose) {
    if (parentId == childId) {
        return;
    }

    auto existing = parents_.find(childId);
    if (existing != parents_.end()) {
        if (existing->second != parentId) {
            ++duplicateParentClaims_;
            if (verbose) {
                std::cerr << "Warning: #" << childId << " already belongs to #"
                          << existing->second << ", ignoring claim by #" << parentId << std::endl;
            }
        }
        return;
    }

    // A link that would close a cycle is treated like a conflicting claim
    if (isAncestor(childId, parentId)) {
        ++duplicateParentClaims_;
        return;
    }

    if (!ensureNode(parentId, resolver)) {
        return;
    }
    if (!ensureNode(childId, resolver)) {
        if (verbose) {
            std::cerr << "Warning: relation references missing entity #" << childId << std::endl;
        }
        return;
    }
    nodes_.at(parentId).children.push_back(childId);
    parents_.emplace(childId, parentId);
}

const SpatialNode* SpatialTree::node(EntityId id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const std::vector<EntityId>& SpatialTree::children(EntityId id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? kNoChildren : it->second.children;
}

std::optional<EntityId> SpatialTree::parent(EntityId id) const {
    auto it = parents_.find(id);
    if (it == parents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SpatialTree::collectElements(EntityId id, std::vector<EntityId>& out,
                                  std::vector<EntityId>& stack) const {
    if (stack.size() > kMaxTreeDepth ||
        std::find(stack.begin(), stack.end(), id) != stack.end()) {
        return;
    }
    stack.push_back(id);
    for (EntityId childId : children(id)) {
        const SpatialNode* child = node(childId);
        if (!child) {
            continue;
        }
        // Nested storeys are reported on their own
        if (child->type == SpatialNodeType::Storey) {
            continue;
        }
        if (child->type == SpatialNodeType::Element) {
            out.push_back(childId);
        }
        collectElements(childId, out, stack);
    }
    stack.pop_back();
}

std::vector<EntityId> SpatialTree::elementsInStorey(EntityId storeyId) const {
    std::vector<EntityId> elements;
    std::vector<EntityId> stack;
    collectElements(storeyId, elements, stack);
    return elements;
}

std::optional<EntityId> SpatialTree::containingStorey(EntityId elementId) const {
    EntityId current = elementId;
    for (size_t depth = 0; depth < kMaxTreeDepth; ++depth) {
        auto it = parents_.find(current);
        if (it == parents_.end()) {
            return std::nullopt;
        }
        current = it->second;
        const SpatialNode* n = node(current);
        if (n && n->type == SpatialNodeType::Storey) {
            return current;
        }
    }
    return std::nullopt;
}

std::vector<EntityId> SpatialTree::search(const std::string& query) const {
    std::vector<EntityId> matches;
    if (query.empty()) {
        return matches;
    }
    std::string needle = toLower(query);
    for (const auto& entry : nodes_) {
        const SpatialNode& n = entry.second;
        if (toLower(n.name).find(needle) != std::string::npos ||
            toLower(n.entityType).find(needle) != std::string::npos) {
            matches.push_back(entry.first);
        }
    }
    std::sort(matches.begin(), matches.end());
    return matches;
}

std::vector<EntityId> SpatialTree::depthFirst() const {
    std::vector<EntityId> order;
    if (!root_) {
        return order;
    }
    std::unordered_set<EntityId> visited;
    std::vector<EntityId> pending{*root_};
    while (!pending.empty()) {
        EntityId id = pending.back();
        pending.pop_back();
        if (!visited.insert(id).second) {
            continue;
        }
        order.push_back(id);
        const auto& kids = children(id);
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
            pending.push_back(*it);
        }
    }
    return order;
}

} // namespace ifccore::step

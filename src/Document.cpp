#include "ifc-core/Document.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace ifccore {

// Constructor
Document::Document() : router(std::make_unique<geom::GeometryRouter>()) {}

// Destructor
Document::~Document() = default;

// ========================================
// Loading
// ========================================

bool Document::loadFile(const std::string& filepath) {
    return finishLoad(step::Model::parseFile(filepath, parseOptions, progress));
}

bool Document::loadFromBytes(const std::string& data) {
    return finishLoad(step::Model::parse(data, parseOptions, progress));
}

bool Document::finishLoad(Result<std::shared_ptr<step::Model>> result) {
    if (!result) {
        std::string message = result.errorMessage;
        if (result.byteOffset) {
            message += " (at byte " + std::to_string(*result.byteOffset) + ")";
        }
        setError(result.errorCode, message);
        if (parseOptions.verbose) {
            std::cerr << "Failed to load IFC: " << result.errorCode << " " << message << std::endl;
        }
        return false;
    }

    model = std::move(result.value);
    geometryOptions.unitScale = model->lengthUnitScale();
    router = std::make_unique<geom::GeometryRouter>(geometryOptions);
    currentMesh = MeshData();
    skippedCount = 0;
    lastError.clear();
    lastErrorCode.clear();

    if (parseOptions.verbose) {
        std::cout << "Loaded IFC model: " << model->header().schema() << std::endl;
        std::cout << "  Entities: " << model->entityCount() << std::endl;
        std::cout << "  Length unit: " << model->lengthUnitScale() << " m" << std::endl;
    }
    return true;
}

void Document::setError(const std::string& code, const std::string& message) {
    lastErrorCode = code;
    lastError = message;
}

void Document::setGeometryOptions(const geom::GeometryOptions& options) {
    geometryOptions = options;
    if (model) {
        geometryOptions.unitScale = model->lengthUnitScale();
    }
    router = std::make_unique<geom::GeometryRouter>(geometryOptions);
}

// ========================================
// Model
// ========================================

std::string Document::getSchema() const {
    if (!model) return "";
    return model->header().schema();
}

step::HeaderInfo Document::getHeader() const {
    if (!model) return step::HeaderInfo();
    return model->header();
}

size_t Document::getEntityCount() const {
    if (!model) return 0;
    return model->entityCount();
}

std::string Document::getEntityType(EntityId id) const {
    if (!model) return "";
    return model->typeName(id);
}

std::vector<EntityId> Document::findByType(const std::string& typeName) const {
    if (!model) return {};
    std::string upper = typeName;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return model->findByTypeName(upper);
}

double Document::getUnitScale() const {
    if (!model) return 1.0;
    return model->lengthUnitScale();
}

std::vector<step::ScanIssue> Document::getScanErrors() const {
    if (!model) return {};
    return model->scanErrors();
}

// ========================================
// Spatial structure
// ========================================

EntityId Document::getSpatialRoot() const {
    if (!model || !model->spatialTree()) return 0;
    return model->spatialTree()->root().value_or(0);
}

std::vector<EntityId> Document::getChildren(EntityId id) const {
    if (!model || !model->spatialTree()) return {};
    return model->spatialTree()->children(id);
}

std::string Document::getName(EntityId id) const {
    if (!model) return "";
    if (const auto* tree = model->spatialTree()) {
        if (const auto* node = tree->node(id)) {
            return node->name;
        }
    }
    auto entity = model->find(id);
    if (!entity) return "";
    return entity->getString(2).value_or("");
}

std::vector<EntityId> Document::search(const std::string& query) const {
    if (!model || !model->spatialTree()) return {};
    return model->spatialTree()->search(query);
}

std::vector<step::StoreyInfo> Document::getStoreys() const {
    if (!model || !model->spatialTree()) return {};
    return model->spatialTree()->storeys();
}

std::vector<EntityId> Document::getElementsInStorey(EntityId storeyId) const {
    if (!model || !model->spatialTree()) return {};
    return model->spatialTree()->elementsInStorey(storeyId);
}

// ========================================
// Properties
// ========================================

std::vector<step::PropertySet> Document::getPropertySets(EntityId elementId) const {
    std::vector<step::PropertySet> sets;
    if (!model || !model->properties()) return sets;
    for (const auto& set : model->properties()->propertySets(elementId)) {
        sets.push_back(*set);
    }
    return sets;
}

std::vector<PropertyRow> Document::getProperties(EntityId elementId) const {
    std::vector<PropertyRow> rows;
    if (!model || !model->properties()) return rows;
    for (const auto& set : model->properties()->propertySets(elementId)) {
        for (const auto& property : set->properties) {
            rows.push_back({set->name, property.name, property.displayValue, property.unit});
        }
        for (const auto& quantity : set->quantities) {
            rows.push_back({set->name, quantity.name,
                            step::formatValue(step::AttributeValue::real(quantity.value)),
                            quantity.unit});
        }
    }
    return rows;
}

step::ElementAttributes Document::getElementAttributes(EntityId elementId) const {
    if (!model) return step::ElementAttributes();
    auto entity = model->find(elementId);
    if (!entity) return step::ElementAttributes();
    return step::readElementAttributes(*entity);
}

// ========================================
// Geometry
// ========================================

Result<MeshData> Document::getElementMesh(EntityId elementId) const {
    if (!model) {
        return Result<MeshData>::error(ErrorCode::Io, "No model loaded");
    }
    auto mesh = router->processElement(elementId, *model);
    if (!mesh) {
        return Result<MeshData>::from(mesh);
    }
    auto result = Result<MeshData>::ok(mesh.value.toMeshData());
    result.durationMs = mesh.durationMs;
    return result;
}

bool Document::meshElement(EntityId elementId) {
    auto mesh = getElementMesh(elementId);
    if (!mesh) {
        setError(mesh.errorCode, mesh.errorMessage);
        currentMesh = MeshData();
        return false;
    }
    currentMesh = std::move(mesh.value);
    return true;
}

std::vector<EntityId> Document::getGeometryElements() const {
    std::vector<EntityId> elements;
    if (!model || !model->spatialTree()) return elements;
    const auto* tree = model->spatialTree();
    for (EntityId id : tree->depthFirst()) {
        const auto* node = tree->node(id);
        if (node && node->type == step::SpatialNodeType::Element && node->hasGeometry) {
            elements.push_back(id);
        }
    }
    return elements;
}

std::vector<ElementMesh> Document::getAllMeshes() {
    std::vector<ElementMesh> meshes;
    skippedCount = 0;
    if (!model) return meshes;

    for (EntityId id : getGeometryElements()) {
        auto mesh = getElementMesh(id);
        if (!mesh) {
            ++skippedCount;
            if (geometryOptions.verbose) {
                std::cerr << "Skipping #" << id << " (" << model->typeName(id) << "): "
                          << mesh.errorCode << " " << mesh.errorMessage << std::endl;
            }
            continue;
        }
        ElementMesh element;
        element.elementId = id;
        element.entityType = model->typeName(id);
        element.mesh = std::move(mesh.value);
        meshes.push_back(std::move(element));
    }

    if (geometryOptions.verbose) {
        std::cout << "Meshed " << meshes.size() << " elements, skipped " << skippedCount << std::endl;
    }
    return meshes;
}

} // namespace ifccore

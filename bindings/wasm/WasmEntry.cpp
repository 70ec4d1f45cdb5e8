#include <emscripten/bind.h>
#include <emscripten/val.h>
#include "ifc-core/Document.hpp"

using namespace emscripten;
using namespace ifccore;

// ========================================
// Typed Array Wrapper Functions
// ========================================

/**
 * @brief Positions of the current mesh as a Float32Array view (zero-copy)
 *
 * The view shares memory with the C++ buffer and is invalidated by the
 * next meshElement() call.
 */
val getPositionsJS(Document& self) {
    const auto& data = self.getCurrentMesh().positions;
    return val(typed_memory_view(data.size(), data.data()));
}

/**
 * @brief Normals of the current mesh as a Float32Array view (zero-copy)
 */
val getNormalsJS(Document& self) {
    const auto& data = self.getCurrentMesh().normals;
    return val(typed_memory_view(data.size(), data.data()));
}

/**
 * @brief Indices of the current mesh as a Uint32Array view (zero-copy)
 */
val getIndicesJS(Document& self) {
    const auto& data = self.getCurrentMesh().indices;
    return val(typed_memory_view(data.size(), data.data()));
}

val toArray(const std::vector<EntityId>& ids) {
    val array = val::array();
    for (size_t i = 0; i < ids.size(); ++i) {
        array.set(i, ids[i]);
    }
    return array;
}

val getChildrenJS(Document& self, EntityId id) {
    return toArray(self.getChildren(id));
}

val searchJS(Document& self, const std::string& query) {
    return toArray(self.search(query));
}

val findByTypeJS(Document& self, const std::string& typeName) {
    return toArray(self.findByType(typeName));
}

val getGeometryElementsJS(Document& self) {
    return toArray(self.getGeometryElements());
}

val getStoreysJS(Document& self) {
    val array = val::array();
    auto storeys = self.getStoreys();
    for (size_t i = 0; i < storeys.size(); ++i) {
        val storey = val::object();
        storey.set("id", storeys[i].id);
        storey.set("name", storeys[i].name);
        storey.set("elevation", storeys[i].elevation);
        storey.set("elementCount", static_cast<double>(storeys[i].elementCount));
        array.set(i, storey);
    }
    return array;
}

val getPropertiesJS(Document& self, EntityId id) {
    val array = val::array();
    auto rows = self.getProperties(id);
    for (size_t i = 0; i < rows.size(); ++i) {
        val row = val::object();
        row.set("set", rows[i].setName);
        row.set("name", rows[i].name);
        row.set("value", rows[i].value);
        row.set("unit", rows[i].unit);
        array.set(i, row);
    }
    return array;
}

EMSCRIPTEN_BINDINGS(ifc_core_module) {
    // Document class
    class_<Document>("Document")
        .constructor<>()
        .function("loadFromBytes", &Document::loadFromBytes)
        .function("isLoaded", &Document::isLoaded)
        .function("getLastError", &Document::getLastError)
        .function("getSchema", &Document::getSchema)
        .function("getEntityCount", &Document::getEntityCount)
        .function("getEntityType", &Document::getEntityType)
        .function("getUnitScale", &Document::getUnitScale)
        .function("getSpatialRoot", &Document::getSpatialRoot)
        .function("getName", &Document::getName)
        .function("meshElement", &Document::meshElement)
        // Arrays and typed views
        .function("getChildren", &getChildrenJS)
        .function("search", &searchJS)
        .function("findByType", &findByTypeJS)
        .function("getGeometryElements", &getGeometryElementsJS)
        .function("getStoreys", &getStoreysJS)
        .function("getProperties", &getPropertiesJS)
        .function("getPositions", &getPositionsJS)
        .function("getNormals", &getNormalsJS)
        .function("getIndices", &getIndicesJS);
}

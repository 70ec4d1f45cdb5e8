#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include "ifc-core/Document.hpp"

namespace py = pybind11;

PYBIND11_MODULE(ifc_core_py, m) {
    m.doc() = "ifc-core: IFC parsing and tessellation library";

    // MeshData struct
    py::class_<ifccore::MeshData>(m, "MeshData")
        .def(py::init<>())
        .def_readonly("positions", &ifccore::MeshData::positions,
                      "Flat [x, y, z, ...] vertex positions in metres")
        .def_readonly("normals", &ifccore::MeshData::normals,
                      "Flat [nx, ny, nz, ...] vertex normals")
        .def_readonly("indices", &ifccore::MeshData::indices,
                      "Triangle vertex indices, CCW, stride 3")
        .def("vertex_count", &ifccore::MeshData::vertexCount)
        .def("triangle_count", &ifccore::MeshData::triangleCount)
        .def("__repr__", [](const ifccore::MeshData& mesh) {
            return "MeshData(vertices=" + std::to_string(mesh.vertexCount()) +
                   ", triangles=" + std::to_string(mesh.triangleCount()) + ")";
        });

    py::class_<ifccore::ElementMesh>(m, "ElementMesh")
        .def_readonly("element_id", &ifccore::ElementMesh::elementId)
        .def_readonly("entity_type", &ifccore::ElementMesh::entityType)
        .def_readonly("mesh", &ifccore::ElementMesh::mesh);

    py::class_<ifccore::PropertyRow>(m, "PropertyRow")
        .def_readonly("set_name", &ifccore::PropertyRow::setName)
        .def_readonly("name", &ifccore::PropertyRow::name)
        .def_readonly("value", &ifccore::PropertyRow::value)
        .def_readonly("unit", &ifccore::PropertyRow::unit)
        .def("__repr__", [](const ifccore::PropertyRow& row) {
            return "PropertyRow(" + row.setName + "." + row.name + "=" + row.value +
                   (row.unit.empty() ? "" : " " + row.unit) + ")";
        });

    py::class_<ifccore::step::StoreyInfo>(m, "StoreyInfo")
        .def_readonly("id", &ifccore::step::StoreyInfo::id)
        .def_readonly("name", &ifccore::step::StoreyInfo::name)
        .def_readonly("elevation", &ifccore::step::StoreyInfo::elevation)
        .def_readonly("element_count", &ifccore::step::StoreyInfo::elementCount);

    py::class_<ifccore::step::ElementAttributes>(m, "ElementAttributes")
        .def_readonly("global_id", &ifccore::step::ElementAttributes::globalId)
        .def_readonly("name", &ifccore::step::ElementAttributes::name)
        .def_readonly("description", &ifccore::step::ElementAttributes::description)
        .def_readonly("object_type", &ifccore::step::ElementAttributes::objectType)
        .def_readonly("tag", &ifccore::step::ElementAttributes::tag);

    py::class_<ifccore::step::ParseOptions>(m, "ParseOptions")
        .def(py::init<>())
        .def_readwrite("strict", &ifccore::step::ParseOptions::strict)
        .def_readwrite("build_spatial_tree", &ifccore::step::ParseOptions::buildSpatialTree)
        .def_readwrite("extract_properties", &ifccore::step::ParseOptions::extractProperties)
        .def_readwrite("verbose", &ifccore::step::ParseOptions::verbose);

    py::class_<ifccore::geom::GeometryOptions>(m, "GeometryOptions")
        .def(py::init<>())
        .def_readwrite("swept_disk_segments", &ifccore::geom::GeometryOptions::sweptDiskSegments)
        .def_readwrite("revolve_full_circle_segments", &ifccore::geom::GeometryOptions::revolveFullCircleSegments)
        .def_readwrite("representation_identifiers", &ifccore::geom::GeometryOptions::representationIdentifiers)
        .def_readwrite("subtract_openings", &ifccore::geom::GeometryOptions::subtractOpenings)
        .def_readwrite("verbose", &ifccore::geom::GeometryOptions::verbose);

    // Document class
    py::class_<ifccore::Document>(m, "Document")
        .def(py::init<>())

        // Loading
        .def("load_file", &ifccore::Document::loadFile,
             "Parse an IFC file from disk",
             py::arg("filepath"))
        .def("load_from_bytes", [](ifccore::Document& self, py::bytes data) {
                 return self.loadFromBytes(std::string(data));
             },
             "Parse IFC content held in memory",
             py::arg("data"))
        .def("is_loaded", &ifccore::Document::isLoaded)
        .def("get_last_error", &ifccore::Document::getLastError)
        .def("get_last_error_code", &ifccore::Document::getLastErrorCode)
        .def("set_parse_options", &ifccore::Document::setParseOptions, py::arg("options"))
        .def("set_geometry_options", &ifccore::Document::setGeometryOptions, py::arg("options"))
        .def("set_progress_callback", &ifccore::Document::setProgressCallback,
             "Callable(phase: str, fraction: float) invoked while parsing",
             py::arg("callback"))

        // Model
        .def("get_schema", &ifccore::Document::getSchema)
        .def("get_entity_count", &ifccore::Document::getEntityCount)
        .def("get_entity_type", &ifccore::Document::getEntityType, py::arg("id"))
        .def("find_by_type", &ifccore::Document::findByType, py::arg("type_name"))
        .def("get_unit_scale", &ifccore::Document::getUnitScale,
             "Metres per file length unit")

        // Spatial structure
        .def("get_spatial_root", &ifccore::Document::getSpatialRoot)
        .def("get_children", &ifccore::Document::getChildren, py::arg("id"))
        .def("get_name", &ifccore::Document::getName, py::arg("id"))
        .def("search", &ifccore::Document::search, py::arg("query"))
        .def("get_storeys", &ifccore::Document::getStoreys)
        .def("get_elements_in_storey", &ifccore::Document::getElementsInStorey, py::arg("storey_id"))

        // Properties
        .def("get_properties", &ifccore::Document::getProperties, py::arg("element_id"))
        .def("get_element_attributes", &ifccore::Document::getElementAttributes, py::arg("element_id"))

        // Geometry
        .def("get_element_mesh", [](const ifccore::Document& self, ifccore::EntityId id) {
                 auto result = self.getElementMesh(id);
                 if (!result) {
                     throw std::runtime_error(result.errorCode + ": " + result.errorMessage);
                 }
                 return result.value;
             },
             "World-space mesh of one element in metres",
             py::arg("element_id"))
        .def("get_all_meshes", &ifccore::Document::getAllMeshes,
             "Mesh every element with geometry, skipping failures")
        .def("get_skipped_count", &ifccore::Document::getSkippedCount)
        .def("get_geometry_elements", &ifccore::Document::getGeometryElements);
}

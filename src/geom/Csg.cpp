#include "ifc-core/geom/Csg.hpp"

#ifdef IC_USE_OCCT
#include <BRepAlgoAPI_Cut.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <BRepBuilderAPI_MakeSolid.hxx>
#include <BRepBuilderAPI_Sewing.hxx>
#include <BRepLib.hxx>
#include <BRepMesh_IncrementalMesh.hxx>
#include <BRep_Tool.hxx>
#include <Poly_Triangulation.hxx>
#include <Standard_Failure.hxx>
#include <TopExp_Explorer.hxx>
#include <TopLoc_Location.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Face.hxx>
#include <TopoDS_Shape.hxx>
#include <TopoDS_Solid.hxx>
#include <gp_Pnt.hxx>
#endif

#include <chrono>
#include <exception>
#include <string>

namespace ifccore::geom {

#ifdef IC_USE_OCCT

namespace {

gp_Pnt toPoint(const Vector3& v) {
    return gp_Pnt(v.x, v.y, v.z);
}

/**
 * @brief Sew mesh triangles into a closed, outward-oriented solid
 */
bool buildSolid(const Mesh& mesh, TopoDS_Shape& out) {
    BRepBuilderAPI_Sewing sewing(1e-6);
    const auto& positions = mesh.getPositions();
    const auto& indices = mesh.getIndices();
    int faces = 0;
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        BRepBuilderAPI_MakePolygon polygon(toPoint(positions[indices[i]]),
                                           toPoint(positions[indices[i + 1]]),
                                           toPoint(positions[indices[i + 2]]),
                                           Standard_True);
        if (!polygon.IsDone()) {
            continue;
        }
        BRepBuilderAPI_MakeFace face(polygon.Wire(), Standard_True);
        if (face.IsDone()) {
            sewing.Add(face.Face());
            ++faces;
        }
    }
    if (faces == 0) {
        return false;
    }
    sewing.Perform();

    BRepBuilderAPI_MakeSolid solidMaker;
    int shells = 0;
    for (TopExp_Explorer exp(sewing.SewedShape(), TopAbs_SHELL); exp.More(); exp.Next()) {
        solidMaker.Add(TopoDS::Shell(exp.Current()));
        ++shells;
    }
    if (shells == 0 || !solidMaker.IsDone()) {
        return false;
    }
    TopoDS_Solid solid = solidMaker.Solid();
    BRepLib::OrientClosedSolid(solid);
    out = solid;
    return true;
}

/**
 * @brief Tessellate a shape and append its triangles with flat normals
 */
bool extractMesh(const TopoDS_Shape& shape, double linearDeflection, Mesh& outMesh) {
    BRepMesh_IncrementalMesh mesher(shape, linearDeflection, Standard_False, 0.5, Standard_True);
    if (!mesher.IsDone()) {
        return false;
    }

    for (TopExp_Explorer faceExp(shape, TopAbs_FACE); faceExp.More(); faceExp.Next()) {
        const TopoDS_Face& face = TopoDS::Face(faceExp.Current());

        TopLoc_Location loc;
        Handle(Poly_Triangulation) triangulation = BRep_Tool::Triangulation(face, loc);
        if (triangulation.IsNull()) {
            continue;
        }

        gp_Trsf transform = loc.Transformation();
        std::vector<Vector3> nodes;
        nodes.reserve(static_cast<size_t>(triangulation->NbNodes()));
        for (Standard_Integer i = 1; i <= triangulation->NbNodes(); i++) {
            gp_Pnt pt = triangulation->Node(i);
            pt.Transform(transform);
            nodes.emplace_back(pt.X(), pt.Y(), pt.Z());
        }

        bool reversed = (face.Orientation() == TopAbs_REVERSED);
        for (Standard_Integer i = 1; i <= triangulation->NbTriangles(); i++) {
            Standard_Integer n1, n2, n3;
            triangulation->Triangle(i).Get(n1, n2, n3);
            const Vector3& a = nodes[static_cast<size_t>(n1 - 1)];
            const Vector3& b = nodes[static_cast<size_t>(n2 - 1)];
            const Vector3& c = nodes[static_cast<size_t>(n3 - 1)];
            if (reversed) {
                outMesh.addFlatTriangle(a, c, b);
            } else {
                outMesh.addFlatTriangle(a, b, c);
            }
        }
    }
    return !outMesh.isEmpty();
}

} // anonymous namespace

bool csgAvailable() {
    return true;
}

Result<Mesh> subtractOpenings(const Mesh& host, const std::vector<Mesh>& openings,
                              double linearDeflection) {
    auto start = std::chrono::high_resolution_clock::now();
    if (openings.empty()) {
        return Result<Mesh>::ok(host);
    }

    try {
        TopoDS_Shape result;
        if (!buildSolid(host, result)) {
            return Result<Mesh>::error(ErrorCode::Csg, "Host mesh could not be sewn into a solid");
        }

        for (size_t i = 0; i < openings.size(); ++i) {
            TopoDS_Shape tool;
            if (!buildSolid(openings[i], tool)) {
                return Result<Mesh>::error(ErrorCode::Csg,
                    "Opening " + std::to_string(i) + " could not be sewn into a solid");
            }
            BRepAlgoAPI_Cut cut(result, tool);
            if (!cut.IsDone()) {
                return Result<Mesh>::error(ErrorCode::Csg,
                    "Subtract operation failed with opening " + std::to_string(i));
            }
            result = cut.Shape();
        }

        Mesh mesh;
        if (!extractMesh(result, linearDeflection, mesh)) {
            return Result<Mesh>::error(ErrorCode::Csg, "Boolean result has no triangles");
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto res = Result<Mesh>::ok(std::move(mesh));
        res.durationMs = std::chrono::duration<double, std::milli>(end - start).count();
        return res;

    } catch (const Standard_Failure& e) {
        return Result<Mesh>::error(ErrorCode::Csg, e.GetMessageString());
    } catch (const std::exception& e) {
        return Result<Mesh>::error(ErrorCode::Csg, e.what());
    }
}

#else

bool csgAvailable() {
    return false;
}

Result<Mesh> subtractOpenings(const Mesh& host, const std::vector<Mesh>& openings,
                              double linearDeflection) {
    (void)linearDeflection;
    if (openings.empty()) {
        return Result<Mesh>::ok(host);
    }
    return Result<Mesh>::error(ErrorCode::Csg,
        "Opening subtraction requires OCCT support; rebuild with -DIC_USE_OCCT=ON");
}

#endif

} // namespace ifccore::geom

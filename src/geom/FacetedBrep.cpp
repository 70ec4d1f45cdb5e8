#include "ifc-core/geom/Processors.hpp"
#include "ifc-core/geom/Triangulation.hpp"
#include "EntityGeometry.hpp"
#include <algorithm>

namespace ifccore::geom {

namespace {

struct FaceLoops {
    std::vector<Vector3> outer;
    std::vector<std::vector<Vector3>> holes;
};

/**
 * @brief Points of an IfcFaceBound, reversed when Orientation is .F.
 */
Result<std::vector<Vector3>> readBound(const step::DecodedEntity& bound, const step::EntityResolver& resolver) {
    // (Bound, Orientation)
    auto loop = resolver.resolveAttribute(bound, 0);
    if (!loop) {
        return Result<std::vector<Vector3>>::from(loop).withEntity(bound.id);
    }
    if (loop.value->typeName != "IFCPOLYLOOP") {
        auto r = Result<std::vector<Vector3>>::error(ErrorCode::UnsupportedType,
            "Unsupported face loop type " + loop.value->typeName);
        r.entityId = loop.value->id;
        return r;
    }
    std::vector<Vector3> points;
    for (EntityId pointId : loop.value->getRefs(0)) {
        auto point = detail::readCartesianPoint(pointId, resolver);
        if (!point) {
            return Result<std::vector<Vector3>>::from(point).withEntity(loop.value->id);
        }
        points.push_back(point.value);
    }
    if (bound.getBool(1) == false) {
        std::reverse(points.begin(), points.end());
    }
    return Result<std::vector<Vector3>>::ok(std::move(points));
}

Result<FaceLoops> readFace(const step::DecodedEntity& face, const step::EntityResolver& resolver) {
    // (Bounds); the IfcFaceOuterBound is the outer loop, else the first bound
    std::vector<std::vector<Vector3>> bounds;
    size_t outerIndex = 0;
    bool haveOuterBound = false;
    for (EntityId boundId : face.getRefs(0)) {
        auto bound = resolver.get(boundId);
        if (!bound) {
            return Result<FaceLoops>::from(bound).withEntity(face.id);
        }
        auto points = readBound(*bound.value, resolver);
        if (!points) {
            return Result<FaceLoops>::from(points);
        }
        if (!haveOuterBound && bound.value->typeName == "IFCFACEOUTERBOUND") {
            outerIndex = bounds.size();
            haveOuterBound = true;
        }
        bounds.push_back(std::move(points.value));
    }

    FaceLoops loops;
    for (size_t i = 0; i < bounds.size(); ++i) {
        if (i == outerIndex) {
            loops.outer = std::move(bounds[i]);
        } else {
            loops.holes.push_back(std::move(bounds[i]));
        }
    }
    return Result<FaceLoops>::ok(std::move(loops));
}

/**
 * @brief Append the faces of an IfcClosedShell or IfcOpenShell
 * @return Number of faces that produced triangles
 */
Result<size_t> addShell(Mesh& mesh, EntityId shellId, const step::EntityResolver& resolver) {
    auto shell = resolver.get(shellId);
    if (!shell) {
        return Result<size_t>::from(shell);
    }
    const auto* faces = shell.value->getList(0);
    if (!faces) {
        return Result<size_t>::invalidAttribute(0, "Missing CfsFaces").withEntity(shellId);
    }

    size_t meshed = 0;
    for (EntityId faceId : shell.value->getRefs(0)) {
        auto face = resolver.get(faceId);
        if (!face) {
            return Result<size_t>::from(face).withEntity(shellId);
        }
        auto loops = readFace(*face.value, resolver);
        if (!loops) {
            return Result<size_t>::from(loops);
        }
        const auto& outer = loops.value.outer;
        auto indices = triangulatePolygon3D(outer, loops.value.holes);
        if (!indices) {
            // Collinear or repeated points
            continue;
        }

        std::vector<Vector3> points = outer;
        for (const auto& hole : loops.value.holes) {
            points.insert(points.end(), hole.begin(), hole.end());
        }
        Vector3 normal = calculatePolygonNormal(outer);
        auto base = static_cast<uint32_t>(mesh.getVertexCount());
        for (const auto& p : points) {
            mesh.addVertex(p, normal);
        }
        const auto& idx = indices.value;
        for (size_t i = 0; i + 2 < idx.size(); i += 3) {
            mesh.addTriangle(base + idx[i], base + idx[i + 1], base + idx[i + 2]);
        }
        ++meshed;
    }
    return Result<size_t>::ok(meshed);
}

} // anonymous namespace

Result<Mesh> FacetedBrepProcessor::process(const step::DecodedEntity& entity,
                                           const step::EntityResolver& resolver) const {
    // (Outer [, Voids])
    auto outerRef = entity.getRef(0);
    if (!outerRef) {
        return Result<Mesh>::invalidAttribute(0, "Missing Outer shell").withEntity(entity.id);
    }

    Mesh mesh;
    auto meshed = addShell(mesh, *outerRef, resolver);
    if (!meshed) {
        return Result<Mesh>::from(meshed).withEntity(entity.id);
    }
    size_t total = meshed.value;

    if (entity.typeName == "IFCFACETEDBREPWITHVOIDS") {
        for (EntityId voidRef : entity.getRefs(1)) {
            auto voidFaces = addShell(mesh, voidRef, resolver);
            if (!voidFaces) {
                return Result<Mesh>::from(voidFaces).withEntity(entity.id);
            }
            total += voidFaces.value;
        }
    }

    if (total == 0) {
        auto r = Result<Mesh>::error(ErrorCode::Geometry, "Brep has no faces that can be triangulated");
        r.entityId = entity.id;
        return r;
    }
    return Result<Mesh>::ok(std::move(mesh));
}

} // namespace ifccore::geom

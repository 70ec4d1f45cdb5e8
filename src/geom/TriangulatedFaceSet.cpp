#include "ifc-core/geom/Processors.hpp"
#include "EntityGeometry.hpp"

namespace ifccore::geom {

namespace {

/**
 * @brief List of numeric tuples, e.g. CoordIndex or Normals
 * @return false if any element is not a list of numbers
 */
template<typename T, typename Read>
bool readTuples(const step::AttributeList& rows, std::vector<std::vector<T>>& out, Read read) {
    out.reserve(rows.size());
    for (const auto& row : rows) {
        const auto* values = row.asList();
        if (!values) {
            return false;
        }
        std::vector<T> tuple;
        tuple.reserve(values->size());
        for (const auto& v : *values) {
            auto value = read(v);
            if (!value) {
                return false;
            }
            tuple.push_back(*value);
        }
        out.push_back(std::move(tuple));
    }
    return true;
}

} // anonymous namespace

Result<Mesh> TriangulatedFaceSetProcessor::process(const step::DecodedEntity& entity,
                                                   const step::EntityResolver& resolver) const {
    // (Coordinates, Normals, Closed, CoordIndex, PnIndex)
    auto coordinates = resolver.resolveAttribute(entity, 0);
    if (!coordinates) {
        return Result<Mesh>::from(coordinates).withEntity(entity.id);
    }
    auto points = detail::readPointList(*coordinates.value);
    if (!points) {
        return Result<Mesh>::from(points).withEntity(entity.id);
    }

    const auto* coordIndex = entity.getList(3);
    if (!coordIndex) {
        return Result<Mesh>::invalidAttribute(3, "Missing CoordIndex").withEntity(entity.id);
    }
    std::vector<std::vector<int64_t>> triangles;
    if (!readTuples<int64_t>(*coordIndex, triangles,
                             [](const step::AttributeValue& v) { return v.asInteger(); })) {
        return Result<Mesh>::invalidAttribute(3, "CoordIndex must be a list of integer triples")
            .withEntity(entity.id);
    }

    // PnIndex remaps CoordIndex values to point list positions
    std::vector<int64_t> pnIndex;
    if (const auto* pn = entity.getList(4)) {
        for (const auto& v : *pn) {
            auto index = v.asInteger();
            if (!index || *index < 1 || static_cast<size_t>(*index) > points.value.size()) {
                return Result<Mesh>::invalidAttribute(4, "PnIndex value out of range")
                    .withEntity(entity.id);
            }
            pnIndex.push_back(*index);
        }
    }
    const size_t vertexCount = pnIndex.empty() ? points.value.size() : pnIndex.size();

    std::vector<std::vector<double>> normals;
    if (const auto* normalList = entity.getList(1)) {
        if (!readTuples<double>(*normalList, normals,
                                [](const step::AttributeValue& v) { return v.asFloat(); })) {
            return Result<Mesh>::invalidAttribute(1, "Normals must be a list of numeric triples")
                .withEntity(entity.id);
        }
    }
    bool useNormals = normals.size() == vertexCount;

    Mesh mesh;
    mesh.reserve(vertexCount, triangles.size());
    for (size_t i = 0; i < vertexCount; ++i) {
        const Vector3& p = pnIndex.empty()
            ? points.value[i]
            : points.value[static_cast<size_t>(pnIndex[i] - 1)];
        Vector3 n;
        if (useNormals && normals[i].size() == 3) {
            n = Vector3(normals[i][0], normals[i][1], normals[i][2]).normalized();
        }
        mesh.addVertex(p, n);
    }

    for (size_t t = 0; t < triangles.size(); ++t) {
        const auto& tri = triangles[t];
        if (tri.size() != 3) {
            return Result<Mesh>::invalidAttribute(3,
                "Face " + std::to_string(t) + " does not have 3 indices").withEntity(entity.id);
        }
        uint32_t idx[3];
        for (size_t k = 0; k < 3; ++k) {
            if (tri[k] < 1 || static_cast<size_t>(tri[k]) > vertexCount) {
                return Result<Mesh>::invalidAttribute(3,
                    "Index " + std::to_string(tri[k]) + " out of range 1.." +
                    std::to_string(vertexCount)).withEntity(entity.id);
            }
            idx[k] = static_cast<uint32_t>(tri[k] - 1);
        }
        mesh.addTriangle(idx[0], idx[1], idx[2]);
    }

    if (mesh.isEmpty()) {
        return Result<Mesh>::invalidAttribute(3, "Face set has no triangles").withEntity(entity.id);
    }
    if (!useNormals) {
        mesh.computeNormals();
    }
    return Result<Mesh>::ok(std::move(mesh));
}

} // namespace ifccore::geom

#include "ifc-core/geom/Mesh.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <utility>

namespace ifccore::geom {

namespace {

constexpr double kDegenerateArea = 1e-14;

} // anonymous namespace

uint32_t Mesh::addVertex(const Vector3& position, const Vector3& normal) {
    positions.push_back(position);
    normals.push_back(normal);
    return static_cast<uint32_t>(positions.size() - 1);
}

void Mesh::addTriangle(uint32_t a, uint32_t b, uint32_t c) {
    indices.push_back(a);
    indices.push_back(b);
    indices.push_back(c);
}

void Mesh::addFlatTriangle(const Vector3& a, const Vector3& b, const Vector3& c) {
    Vector3 n = (b - a) % (c - a);
    if (n.length() < kDegenerateArea) {
        return;
    }
    n = n.normalized();
    uint32_t i0 = addVertex(a, n);
    uint32_t i1 = addVertex(b, n);
    uint32_t i2 = addVertex(c, n);
    addTriangle(i0, i1, i2);
}

void Mesh::addFlatQuad(const Vector3& a, const Vector3& b, const Vector3& c, const Vector3& d) {
    Vector3 n = ((b - a) % (c - a)) + ((c - a) % (d - a));
    if (n.length() < kDegenerateArea) {
        return;
    }
    n = n.normalized();
    uint32_t i0 = addVertex(a, n);
    uint32_t i1 = addVertex(b, n);
    uint32_t i2 = addVertex(c, n);
    uint32_t i3 = addVertex(d, n);
    addTriangle(i0, i1, i2);
    addTriangle(i0, i2, i3);
}

void Mesh::reserve(size_t vertexCount, size_t triangleCount) {
    positions.reserve(vertexCount);
    normals.reserve(vertexCount);
    indices.reserve(triangleCount * 3);
}

void Mesh::merge(const Mesh& other) {
    auto offset = static_cast<uint32_t>(positions.size());
    positions.insert(positions.end(), other.positions.begin(), other.positions.end());
    normals.insert(normals.end(), other.normals.begin(), other.normals.end());
    indices.reserve(indices.size() + other.indices.size());
    for (uint32_t index : other.indices) {
        indices.push_back(index + offset);
    }
}

void Mesh::transform(const Transform& t) {
    // Inverse transpose via the cofactor matrix; its scale is irrelevant
    // because normals are renormalized
    const auto& m = t.linear.m;
    Matrix3 cofactor(
        m[1][1] * m[2][2] - m[1][2] * m[2][1],
        m[1][2] * m[2][0] - m[1][0] * m[2][2],
        m[1][0] * m[2][1] - m[1][1] * m[2][0],
        m[0][2] * m[2][1] - m[0][1] * m[2][2],
        m[0][0] * m[2][2] - m[0][2] * m[2][0],
        m[0][1] * m[2][0] - m[0][0] * m[2][1],
        m[0][1] * m[1][2] - m[0][2] * m[1][1],
        m[0][2] * m[1][0] - m[0][0] * m[1][2],
        m[0][0] * m[1][1] - m[0][1] * m[1][0]
    );
    bool flips = t.flipsOrientation();

    for (auto& p : positions) {
        p = t.applyToPoint(p);
    }
    for (auto& n : normals) {
        Vector3 transformed = (cofactor * n).normalized();
        // cofactor = det * inverse transpose; undo the sign of det
        n = flips ? -transformed : transformed;
    }
    if (flips) {
        for (size_t i = 0; i + 2 < indices.size(); i += 3) {
            std::swap(indices[i + 1], indices[i + 2]);
        }
    }
}

void Mesh::scale(double factor) {
    if (factor == 1.0) {
        return;
    }
    for (auto& p : positions) {
        p = p * factor;
    }
    if (factor < 0.0) {
        flipWinding();
    }
}

void Mesh::flipWinding() {
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        std::swap(indices[i + 1], indices[i + 2]);
    }
    for (auto& n : normals) {
        n = -n;
    }
}

void Mesh::computeNormals() {
    std::vector<Vector3> accumulated(positions.size());
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        const Vector3& p0 = positions[indices[i]];
        const Vector3& p1 = positions[indices[i + 1]];
        const Vector3& p2 = positions[indices[i + 2]];
        // Unnormalized cross product weights by area
        Vector3 faceNormal = (p1 - p0) % (p2 - p0);
        accumulated[indices[i]] += faceNormal;
        accumulated[indices[i + 1]] += faceNormal;
        accumulated[indices[i + 2]] += faceNormal;
    }
    for (size_t i = 0; i < accumulated.size(); ++i) {
        normals[i] = accumulated[i].normalized();
    }
}

double Mesh::getSignedVolume() const {
    if (indices.empty()) {
        return 0.0;
    }

    double volume = 0.0;

    // For each triangle, calculate signed tetrahedron volume
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        const Vector3& p1 = positions[indices[i]];
        const Vector3& p2 = positions[indices[i + 1]];
        const Vector3& p3 = positions[indices[i + 2]];

        volume += p1 * (p2 % p3);
    }

    return volume / 6.0;
}

double Mesh::getVolume() const {
    return std::abs(getSignedVolume());
}

double Mesh::getSurfaceArea() const {
    double area = 0.0;
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        const Vector3& p0 = positions[indices[i]];
        const Vector3& p1 = positions[indices[i + 1]];
        const Vector3& p2 = positions[indices[i + 2]];
        area += ((p1 - p0) % (p2 - p0)).length() * 0.5;
    }
    return area;
}

bool Mesh::isWatertight() const {
    if (indices.empty()) {
        return false;
    }

    // Weld coincident positions: vertex -> canonical index
    std::map<Vector3, uint32_t> vertexMap;
    std::vector<uint32_t> canonical(positions.size());
    for (size_t i = 0; i < positions.size(); ++i) {
        auto it = vertexMap.find(positions[i]);
        if (it != vertexMap.end()) {
            canonical[i] = it->second;
        } else {
            vertexMap.emplace(positions[i], static_cast<uint32_t>(i));
            canonical[i] = static_cast<uint32_t>(i);
        }
    }

    // Edge map: (vertex_i, vertex_j) -> count, smaller index first
    std::map<std::pair<uint32_t, uint32_t>, int> edgeCount;

    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        uint32_t tri[3] = {
            canonical[indices[i]],
            canonical[indices[i + 1]],
            canonical[indices[i + 2]]
        };
        for (int e = 0; e < 3; ++e) {
            uint32_t a = tri[e];
            uint32_t b = tri[(e + 1) % 3];
            if (a == b) {
                continue;
            }
            edgeCount[a < b ? std::make_pair(a, b) : std::make_pair(b, a)]++;
        }
    }

    // Check if all edges have exactly 2 faces
    for (const auto& entry : edgeCount) {
        if (entry.second != 2) {
            return false;
        }
    }

    return true;
}

BoundingBox Mesh::getBoundingBox() const {
    BoundingBox box;
    if (positions.empty()) {
        return box;
    }

    double minX = std::numeric_limits<double>::max();
    double minY = std::numeric_limits<double>::max();
    double minZ = std::numeric_limits<double>::max();
    double maxX = std::numeric_limits<double>::lowest();
    double maxY = std::numeric_limits<double>::lowest();
    double maxZ = std::numeric_limits<double>::lowest();

    for (const auto& p : positions) {
        minX = std::min(minX, p.x);
        minY = std::min(minY, p.y);
        minZ = std::min(minZ, p.z);
        maxX = std::max(maxX, p.x);
        maxY = std::max(maxY, p.y);
        maxZ = std::max(maxZ, p.z);
    }

    box.min = Vector3(minX, minY, minZ);
    box.max = Vector3(maxX, maxY, maxZ);
    return box;
}

void Mesh::clear() {
    positions.clear();
    normals.clear();
    indices.clear();
}

MeshData Mesh::toMeshData() const {
    MeshData data;
    data.positions.reserve(positions.size() * 3);
    data.normals.reserve(normals.size() * 3);
    for (size_t i = 0; i < positions.size(); ++i) {
        const Vector3& p = positions[i];
        const Vector3& n = normals[i];
        data.positions.push_back(static_cast<float>(p.x));
        data.positions.push_back(static_cast<float>(p.y));
        data.positions.push_back(static_cast<float>(p.z));
        data.normals.push_back(static_cast<float>(n.x));
        data.normals.push_back(static_cast<float>(n.y));
        data.normals.push_back(static_cast<float>(n.z));
    }
    data.indices = indices;
    return data;
}

} // namespace ifccore::geom

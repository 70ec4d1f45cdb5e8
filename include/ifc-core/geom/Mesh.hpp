#pragma once
#include "../Types.hpp"
#include "../Vector3.hpp"
#include <cstdint>
#include <vector>

namespace ifccore::geom {

/**
 * @brief Indexed triangle mesh in double precision
 *
 * Positions and normals are parallel arrays; indices hold CCW triangles
 * (outward normals by the right-hand rule). Converted to float buffers
 * only at the API boundary via toMeshData().
 */
class Mesh {
public:
    Mesh() = default;
    ~Mesh() = default;

    /**
     * @brief Append a vertex
     * @return Index of the new vertex
     */
    uint32_t addVertex(const Vector3& position, const Vector3& normal = Vector3());

    void addTriangle(uint32_t a, uint32_t b, uint32_t c);

    /**
     * @brief Append a triangle with its own three vertices and a flat normal
     *
     * Degenerate (zero-area) triangles are dropped.
     */
    void addFlatTriangle(const Vector3& a, const Vector3& b, const Vector3& c);

    /**
     * @brief Append quad a-b-c-d as two flat triangles (a,b,c) and (a,c,d)
     */
    void addFlatQuad(const Vector3& a, const Vector3& b, const Vector3& c, const Vector3& d);

    void reserve(size_t vertexCount, size_t triangleCount);

    /**
     * @brief Append another mesh, offsetting its indices
     */
    void merge(const Mesh& other);

    /**
     * @brief Apply an affine transform to positions and normals
     *
     * Normals go through the inverse transpose of the linear part and are
     * renormalized. Mirroring transforms reverse triangle winding so faces
     * stay outward.
     */
    void transform(const Transform& t);

    void scale(double factor);

    /**
     * @brief Reverse every triangle and negate normals
     */
    void flipWinding();

    /**
     * @brief Recompute per-vertex normals as area-weighted face normals
     */
    void computeNormals();

    /**
     * @brief Calculate the volume of the mesh using signed tetrahedron method
     * @return Absolute volume in cubic file units
     *
     * Formula: For each triangle (p1, p2, p3), compute:
     *   V += (1/6) * dot(p1, cross(p2, p3))
     */
    double getVolume() const;

    /**
     * @brief Signed variant of getVolume(); positive for outward winding
     */
    double getSignedVolume() const;

    double getSurfaceArea() const;

    /**
     * @brief Check if every edge is shared by exactly 2 triangles
     *
     * Coincident positions are welded first, since flat-shaded meshes
     * duplicate vertices per face.
     */
    bool isWatertight() const;

    BoundingBox getBoundingBox() const;

    size_t getVertexCount() const { return positions.size(); }
    size_t getTriangleCount() const { return indices.size() / 3; }
    bool isEmpty() const { return indices.empty(); }

    void clear();

    const std::vector<Vector3>& getPositions() const { return positions; }
    const std::vector<Vector3>& getNormals() const { return normals; }
    const std::vector<uint32_t>& getIndices() const { return indices; }

    /**
     * @brief Convert to float buffers for rendering
     */
    MeshData toMeshData() const;

private:
    std::vector<Vector3> positions;
    std::vector<Vector3> normals;
    std::vector<uint32_t> indices;
};

} // namespace ifccore::geom

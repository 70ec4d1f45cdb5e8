#include <gtest/gtest.h>
#include <cmath>
#include "ifc-core/geom/Mesh.hpp"

using namespace ifccore;
using namespace ifccore::geom;

namespace {

// Outward-wound tetrahedron with volume 1/6
Mesh tetrahedron() {
    Mesh mesh;
    Vector3 o(0, 0, 0), x(1, 0, 0), y(0, 1, 0), z(0, 0, 1);
    mesh.addFlatTriangle(o, y, x);
    mesh.addFlatTriangle(o, x, z);
    mesh.addFlatTriangle(o, z, y);
    mesh.addFlatTriangle(x, y, z);
    return mesh;
}

} // namespace

TEST(Mesh, FlatTrianglesCarryFaceNormals) {
    Mesh mesh;
    mesh.addFlatTriangle(Vector3(0, 0, 0), Vector3(1, 0, 0), Vector3(0, 1, 0));
    ASSERT_EQ(mesh.getVertexCount(), 3u);
    ASSERT_EQ(mesh.getTriangleCount(), 1u);
    for (const auto& n : mesh.getNormals()) {
        EXPECT_EQ(n, Vector3(0, 0, 1));
    }

    // Collinear and repeated points are dropped
    mesh.addFlatTriangle(Vector3(0, 0, 0), Vector3(1, 0, 0), Vector3(2, 0, 0));
    mesh.addFlatTriangle(Vector3(1, 1, 1), Vector3(1, 1, 1), Vector3(0, 1, 0));
    EXPECT_EQ(mesh.getTriangleCount(), 1u);
    EXPECT_NEAR(mesh.getSurfaceArea(), 0.5, 1e-12);
}

TEST(Mesh, QuadSplitsIntoTwoTriangles) {
    Mesh mesh;
    mesh.addFlatQuad(Vector3(0, 0, 0), Vector3(2, 0, 0), Vector3(2, 3, 0), Vector3(0, 3, 0));
    EXPECT_EQ(mesh.getVertexCount(), 4u);
    EXPECT_EQ(mesh.getTriangleCount(), 2u);
    EXPECT_NEAR(mesh.getSurfaceArea(), 6.0, 1e-12);
    EXPECT_EQ(mesh.getIndices(), (std::vector<uint32_t>{0, 1, 2, 0, 2, 3}));
}

TEST(Mesh, VolumeAndWatertightness) {
    Mesh mesh = tetrahedron();
    EXPECT_TRUE(mesh.isWatertight());
    EXPECT_NEAR(mesh.getSignedVolume(), 1.0 / 6.0, 1e-12);
    EXPECT_NEAR(mesh.getVolume(), 1.0 / 6.0, 1e-12);

    Mesh open;
    open.addFlatTriangle(Vector3(0, 0, 0), Vector3(1, 0, 0), Vector3(0, 1, 0));
    EXPECT_FALSE(open.isWatertight());
    EXPECT_FALSE(Mesh().isWatertight());
    EXPECT_DOUBLE_EQ(Mesh().getSignedVolume(), 0.0);
}

TEST(Mesh, FlipWindingNegatesVolumeAndNormals) {
    Mesh mesh = tetrahedron();
    Vector3 before = mesh.getNormals()[0];
    mesh.flipWinding();
    EXPECT_NEAR(mesh.getSignedVolume(), -1.0 / 6.0, 1e-12);
    EXPECT_EQ(mesh.getNormals()[0], -before);
    EXPECT_TRUE(mesh.isWatertight());
}

TEST(Mesh, MergeOffsetsIndices) {
    Mesh a = tetrahedron();
    Mesh b = tetrahedron();
    b.transform(Transform::translate(Vector3(5, 0, 0)));

    a.merge(b);
    EXPECT_EQ(a.getVertexCount(), 24u);
    EXPECT_EQ(a.getTriangleCount(), 8u);
    EXPECT_EQ(a.getIndices()[12], 12u);
    EXPECT_NEAR(a.getSignedVolume(), 2.0 / 6.0, 1e-12);
    EXPECT_NEAR(a.getBoundingBox().max.x, 6.0, 1e-12);
}

TEST(Mesh, TransformMovesPointsAndRotatesNormals) {
    Mesh mesh;
    mesh.addFlatTriangle(Vector3(0, 0, 0), Vector3(1, 0, 0), Vector3(0, 1, 0));

    // 90 degrees about X: +Z normal becomes -Y
    Transform t(Matrix3::rotation(Vector3(1, 0, 0), 3.14159265358979323846 / 2.0), Vector3(0, 0, 10));
    mesh.transform(t);

    const Vector3& n = mesh.getNormals()[0];
    EXPECT_NEAR(n.x, 0.0, 1e-12);
    EXPECT_NEAR(std::abs(n.y), 1.0, 1e-12);
    EXPECT_NEAR(n.z, 0.0, 1e-12);
    EXPECT_NEAR(mesh.getPositions()[0].z, 10.0, 1e-12);
}

TEST(Mesh, MirrorKeepsOutwardWinding) {
    Mesh mesh = tetrahedron();
    Transform mirror(Matrix3(-1, 0, 0, 0, 1, 0, 0, 0, 1), Vector3());
    ASSERT_TRUE(mirror.flipsOrientation());

    mesh.transform(mirror);
    EXPECT_NEAR(mesh.getSignedVolume(), 1.0 / 6.0, 1e-12);
    // Face on the x = 0 side keeps pointing away from the solid
    EXPECT_NEAR(mesh.getNormals()[6].x, 1.0, 1e-12);
}

TEST(Mesh, NonUniformScaleKeepsNormalsPerpendicular) {
    Mesh mesh;
    mesh.addFlatTriangle(Vector3(1, 0, 0), Vector3(0, 1, 0), Vector3(0, 0, 1));
    mesh.transform(Transform(Matrix3(4, 0, 0, 0, 1, 0, 0, 0, 1), Vector3()));

    const auto& p = mesh.getPositions();
    const Vector3& n = mesh.getNormals()[0];
    EXPECT_NEAR((p[1] - p[0]) * n, 0.0, 1e-12);
    EXPECT_NEAR((p[2] - p[0]) * n, 0.0, 1e-12);
    EXPECT_NEAR(n.length(), 1.0, 1e-12);
}

TEST(Mesh, ScaleMultipliesVolume) {
    Mesh mesh = tetrahedron();
    mesh.scale(2.0);
    EXPECT_NEAR(mesh.getSignedVolume(), 8.0 / 6.0, 1e-12);
    EXPECT_EQ(mesh.getBoundingBox().max, Vector3(2, 2, 2));
}

TEST(Mesh, ComputeNormalsAveragesFaces) {
    Mesh mesh;
    uint32_t a = mesh.addVertex(Vector3(0, 0, 0));
    uint32_t b = mesh.addVertex(Vector3(1, 0, 0));
    uint32_t c = mesh.addVertex(Vector3(0, 1, 0));
    uint32_t d = mesh.addVertex(Vector3(0, 0, 1));
    mesh.addTriangle(a, c, b);
    mesh.addTriangle(a, b, d);
    mesh.computeNormals();

    const Vector3& shared = mesh.getNormals()[a];
    EXPECT_NEAR(shared.length(), 1.0, 1e-12);
    EXPECT_NEAR(shared.y, -std::sqrt(0.5), 1e-12);
    EXPECT_NEAR(shared.z, -std::sqrt(0.5), 1e-12);
    EXPECT_EQ(mesh.getNormals()[c], Vector3(0, 0, -1));
}

TEST(Mesh, BoundingBox) {
    Mesh mesh = tetrahedron();
    BoundingBox box = mesh.getBoundingBox();
    EXPECT_EQ(box.min, Vector3(0, 0, 0));
    EXPECT_EQ(box.max, Vector3(1, 1, 1));
    EXPECT_EQ(box.center(), Vector3(0.5, 0.5, 0.5));
    EXPECT_DOUBLE_EQ(box.volume(), 1.0);

    BoundingBox empty = Mesh().getBoundingBox();
    EXPECT_DOUBLE_EQ(empty.volume(), 0.0);
}

TEST(Mesh, ToMeshDataConvertsToFloatBuffers) {
    Mesh mesh = tetrahedron();
    MeshData data = mesh.toMeshData();
    EXPECT_EQ(data.vertexCount(), 12u);
    EXPECT_EQ(data.triangleCount(), 4u);
    EXPECT_EQ(data.normals.size(), data.positions.size());
    EXPECT_EQ(data.indices, mesh.getIndices());
    EXPECT_EQ(data.byteSize(), 36 * sizeof(float) * 2 + 12 * sizeof(uint32_t));

    MeshData twice = data;
    twice.merge(data);
    EXPECT_EQ(twice.vertexCount(), 24u);
    EXPECT_EQ(twice.indices.back(), data.indices.back() + 12u);

    mesh.clear();
    EXPECT_TRUE(mesh.isEmpty());
    EXPECT_TRUE(mesh.toMeshData().isEmpty());
}

#include <gtest/gtest.h>
#include <cmath>
#include "ifc-core/geom/Triangulation.hpp"

using namespace ifccore;
using namespace ifccore::geom;

namespace {

std::vector<Vector2> concat(const std::vector<Vector2>& outer, const std::vector<std::vector<Vector2>>& holes) {
    std::vector<Vector2> points = outer;
    for (const auto& hole : holes) {
        points.insert(points.end(), hole.begin(), hole.end());
    }
    return points;
}

double triangleArea(const Vector2& a, const Vector2& b, const Vector2& c) {
    return 0.5 * ((b.x - a.x) * (c.y - a.y) - (c.x - a.x) * (b.y - a.y));
}

/**
 * @brief Sum of signed triangle areas; every triangle must be CCW
 */
double totalArea(const std::vector<Vector2>& points, const std::vector<uint32_t>& indices) {
    double total = 0.0;
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        double a = triangleArea(points[indices[i]], points[indices[i + 1]], points[indices[i + 2]]);
        EXPECT_GT(a, 0.0) << "triangle " << i / 3 << " is not CCW";
        total += a;
    }
    return total;
}

std::vector<Vector2> square(double x0, double y0, double size) {
    return {Vector2(x0, y0), Vector2(x0 + size, y0), Vector2(x0 + size, y0 + size), Vector2(x0, y0 + size)};
}

} // namespace

TEST(Triangulation, SignedAreaFollowsOrientation) {
    auto ccw = square(0, 0, 2);
    EXPECT_DOUBLE_EQ(signedArea(ccw), 4.0);
    std::vector<Vector2> cw(ccw.rbegin(), ccw.rend());
    EXPECT_DOUBLE_EQ(signedArea(cw), -4.0);
}

TEST(Triangulation, SquareGivesTwoTriangles) {
    auto points = square(0, 0, 1);
    auto result = triangulatePolygon(points);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(result.value.size(), 6u);
    EXPECT_NEAR(totalArea(points, result.value), 1.0, 1e-12);
}

TEST(Triangulation, ClockwiseInputStillProducesCcwTriangles) {
    auto ccw = square(0, 0, 3);
    std::vector<Vector2> cw(ccw.rbegin(), ccw.rend());
    auto result = triangulatePolygon(cw);
    ASSERT_TRUE(result.success);
    EXPECT_NEAR(totalArea(cw, result.value), 9.0, 1e-12);
}

TEST(Triangulation, ConcavePolygon) {
    // L shape, area 3
    std::vector<Vector2> points = {
        Vector2(0, 0), Vector2(2, 0), Vector2(2, 1), Vector2(1, 1), Vector2(1, 2), Vector2(0, 2)
    };
    auto result = triangulatePolygon(points);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value.size(), 3u * (points.size() - 2));
    EXPECT_NEAR(totalArea(points, result.value), 3.0, 1e-12);
}

TEST(Triangulation, HoleAreaIsExcluded) {
    auto outer = square(0, 0, 4);
    std::vector<std::vector<Vector2>> holes = {square(1, 1, 2)};

    auto result = triangulatePolygonWithHoles(outer, holes);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_NEAR(totalArea(concat(outer, holes), result.value), 16.0 - 4.0, 1e-9);
}

TEST(Triangulation, MultipleHolesInAnyOrientation) {
    auto outer = square(0, 0, 10);
    auto second = square(6, 6, 2);
    std::vector<std::vector<Vector2>> holes = {
        square(1, 1, 2),
        std::vector<Vector2>(second.rbegin(), second.rend())
    };

    auto result = triangulatePolygonWithHoles(outer, holes);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_NEAR(totalArea(concat(outer, holes), result.value), 100.0 - 8.0, 1e-9);
}

TEST(Triangulation, DegenerateInputFails) {
    auto tooFew = triangulatePolygon({Vector2(0, 0), Vector2(1, 0)});
    EXPECT_FALSE(tooFew.success);
    EXPECT_EQ(tooFew.errorCode, ErrorCode::Triangulation);

    auto collinear = triangulatePolygon({Vector2(0, 0), Vector2(1, 0), Vector2(2, 0), Vector2(3, 0)});
    EXPECT_FALSE(collinear.success);
    EXPECT_EQ(collinear.errorCode, ErrorCode::Triangulation);
    EXPECT_TRUE(collinear.value.empty());
}

TEST(Triangulation, NewellNormal) {
    std::vector<Vector3> ccw = {Vector3(0, 0, 0), Vector3(1, 0, 0), Vector3(1, 1, 0), Vector3(0, 1, 0)};
    Vector3 n = calculatePolygonNormal(ccw);
    EXPECT_NEAR(n.x, 0.0, 1e-12);
    EXPECT_NEAR(n.y, 0.0, 1e-12);
    EXPECT_NEAR(n.z, 1.0, 1e-12);

    std::vector<Vector3> line = {Vector3(0, 0, 0), Vector3(1, 1, 1), Vector3(2, 2, 2)};
    EXPECT_NEAR(calculatePolygonNormal(line).length(), 0.0, 1e-12);
}

TEST(Triangulation, ProjectionKeepsOrientation) {
    std::vector<Vector3> face = {Vector3(0, 0, 0), Vector3(0, 2, 0), Vector3(0, 2, 2), Vector3(0, 0, 2)};
    Vector3 normal = calculatePolygonNormal(face);
    EXPECT_NEAR(normal.x, 1.0, 1e-12);

    auto projected = projectTo2D(face, normal);
    ASSERT_EQ(projected.size(), 4u);
    EXPECT_NEAR(signedArea(projected), 4.0, 1e-12);
}

TEST(Triangulation, PlanarFaceIn3D) {
    // Square in the XZ plane facing -Y
    std::vector<Vector3> outer = {Vector3(0, 0, 0), Vector3(1, 0, 0), Vector3(1, 0, 1), Vector3(0, 0, 1)};
    auto result = triangulatePolygon3D(outer);
    ASSERT_TRUE(result.success) << result.errorMessage;
    ASSERT_EQ(result.value.size(), 6u);

    Vector3 normal = calculatePolygonNormal(outer);
    for (size_t i = 0; i < result.value.size(); i += 3) {
        const Vector3& a = outer[result.value[i]];
        const Vector3& b = outer[result.value[i + 1]];
        const Vector3& c = outer[result.value[i + 2]];
        EXPECT_GT(((b - a) % (c - a)) * normal, 0.0);
    }
}

TEST(Triangulation, PlanarFaceWithHoleIn3D) {
    std::vector<Vector3> outer = {Vector3(0, 0, 5), Vector3(4, 0, 5), Vector3(4, 4, 5), Vector3(0, 4, 5)};
    std::vector<std::vector<Vector3>> holes = {
        {Vector3(1, 1, 5), Vector3(1, 3, 5), Vector3(3, 3, 5), Vector3(3, 1, 5)}
    };
    auto result = triangulatePolygon3D(outer, holes);
    ASSERT_TRUE(result.success) << result.errorMessage;

    std::vector<Vector3> all = outer;
    all.insert(all.end(), holes[0].begin(), holes[0].end());
    double area = 0.0;
    for (size_t i = 0; i + 2 < result.value.size(); i += 3) {
        const Vector3& a = all[result.value[i]];
        const Vector3& b = all[result.value[i + 1]];
        const Vector3& c = all[result.value[i + 2]];
        area += 0.5 * ((b - a) % (c - a)).z;
    }
    EXPECT_NEAR(area, 12.0, 1e-9);
}

TEST(Triangulation, DegenerateFaceIn3DFails) {
    std::vector<Vector3> line = {Vector3(0, 0, 0), Vector3(1, 0, 0), Vector3(2, 0, 0)};
    auto result = triangulatePolygon3D(line);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::Triangulation);
}

#pragma once

#include <cstdint>
#include <vector>
#include "../Types.hpp"
#include "../Vector3.hpp"

namespace ifccore::geom {

/**
 * @brief Signed area of a 2D polygon; positive for CCW
 */
double signedArea(const std::vector<Vector2>& polygon);

/**
 * @brief Triangulate a simple polygon
 * @return CCW triangle indices into `polygon`, or TRIANGULATION_ERROR for
 * fewer than 3 points or zero area
 */
Result<std::vector<uint32_t>> triangulatePolygon(const std::vector<Vector2>& polygon);

/**
 * @brief Triangulate a polygon with holes by ear clipping
 *
 * Holes are bridged into the outer ring first. Input orientation is
 * arbitrary. Returned indices address the concatenation of `outer`
 * followed by each hole in order, and every triangle is CCW in the plane.
 */
Result<std::vector<uint32_t>> triangulatePolygonWithHoles(
    const std::vector<Vector2>& outer,
    const std::vector<std::vector<Vector2>>& holes);

/**
 * @brief Polygon normal by Newell's method
 * @return Unit normal, or the zero vector for degenerate input
 */
Vector3 calculatePolygonNormal(const std::vector<Vector3>& points);

/**
 * @brief Orthonormal in-plane basis for a plane normal
 */
struct PlaneBasis {
    Vector3 origin;
    Vector3 uAxis;
    Vector3 vAxis;
    Vector3 normal;
};

/**
 * @brief Basis whose u x v equals `normal`, anchored at `origin`
 *
 * The reference axis is the world axis least aligned with the normal.
 */
PlaneBasis makePlaneBasis(const Vector3& normal, const Vector3& origin);

/**
 * @brief Project points onto the plane through points[0] with the given normal
 *
 * CCW around the normal in 3D maps to CCW in 2D.
 */
std::vector<Vector2> projectTo2D(const std::vector<Vector3>& points, const Vector3& normal,
                                 PlaneBasis* basisOut = nullptr);

/**
 * @brief Project with an existing basis (e.g. holes of the same face)
 */
std::vector<Vector2> projectTo2DWithBasis(const std::vector<Vector3>& points, const PlaneBasis& basis);

/**
 * @brief Triangulate a planar 3D face with optional holes
 *
 * Triangles are CCW around the Newell normal of `outer`.
 */
Result<std::vector<uint32_t>> triangulatePolygon3D(
    const std::vector<Vector3>& outer,
    const std::vector<std::vector<Vector3>>& holes = {});

} // namespace ifccore::geom

#pragma once

#include "../Types.hpp"
#include "../Vector3.hpp"
#include "Mesh.hpp"
#include "Profile.hpp"

namespace ifccore::geom {

/**
 * @brief Sweep a profile in the XY plane along a direction
 *
 * The bottom cap lies in the profile plane, the top cap is the profile
 * translated by depth * direction. Cap vertices are shared within a cap;
 * every side quad has its own four vertices with a flat normal. All
 * triangles are CCW seen from outside the solid.
 *
 * @param profile Outer loop with optional holes (any orientation)
 * @param depth Sweep length along the normalized direction
 * @param direction Extrusion direction, must not lie in the profile plane
 * @return PROFILE_ERROR for depth <= 0 or a degenerate profile,
 * GEOMETRY_ERROR for a direction parallel to the profile plane
 */
Result<Mesh> extrudeProfile(const Profile2D& profile, double depth,
                            const Vector3& direction = Vector3(0, 0, 1));

/**
 * @brief Extrude with openings cut out of the solid
 *
 * Through voids become holes of both caps. A partial void is a hole only in
 * the cap it touches (if any); its side walls span depthStart..depthEnd
 * and internal caps close it off inside the solid.
 *
 * @return CSG_ERROR for a void with fewer than 3 points or a depth range
 * outside [0, depth]
 */
Result<Mesh> extrudeProfileWithVoids(const Profile2DWithVoids& profile, double depth,
                                     const Vector3& direction = Vector3(0, 0, 1));

} // namespace ifccore::geom

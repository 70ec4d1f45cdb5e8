#pragma once

#include <vector>
#include "ifc-core/Types.hpp"
#include "ifc-core/Vector3.hpp"
#include "ifc-core/step/Resolver.hpp"

namespace ifccore::geom::detail {

// ===========================================================================
// Readers for IFC geometric resource entities
// ===========================================================================

/**
 * @brief IFCCARTESIANPOINT coordinates (2D points get z = 0)
 */
Result<Vector3> readCartesianPoint(EntityId id, const step::EntityResolver& resolver);

/**
 * @brief IFCDIRECTION as a unit vector
 * @return GEOMETRY_ERROR for a zero direction
 */
Result<Vector3> readDirection(EntityId id, const step::EntityResolver& resolver);

/**
 * @brief IFCAXIS2PLACEMENT3D or IFCAXIS2PLACEMENT2D as a rigid transform
 */
Result<Transform> readAxisPlacement(const step::DecodedEntity& placement,
                                    const step::EntityResolver& resolver);

/**
 * @brief Any object placement, following IFCLOCALPLACEMENT chains to the root
 */
Result<Transform> readPlacement(EntityId id, const step::EntityResolver& resolver);

/**
 * @brief IFCCARTESIANTRANSFORMATIONOPERATOR2D/3D (uniform or non-uniform)
 */
Result<Transform> readTransformationOperator(const step::DecodedEntity& op,
                                             const step::EntityResolver& resolver);

/**
 * @brief Sample a curve into points
 *
 * Supports IFCPOLYLINE, IFCINDEXEDPOLYCURVE (line and arc segments),
 * IFCCOMPOSITECURVE and IFCCIRCLE. Closing points are kept.
 */
Result<std::vector<Vector3>> readCurvePoints(EntityId curveId, const step::EntityResolver& resolver);

/**
 * @brief Coordinates of IFCCARTESIANPOINTLIST2D/3D
 */
Result<std::vector<Vector3>> readPointList(const step::DecodedEntity& list);

/**
 * @brief Points on the circular arc from a through b to c, inclusive
 */
std::vector<Vector3> arcThroughPoints(const Vector3& a, const Vector3& b, const Vector3& c);

/**
 * @brief Required positive numeric attribute
 * @return INVALID_ATTRIBUTE when missing, `code` when not positive
 */
Result<double> readPositive(const step::DecodedEntity& entity, size_t index, const char* what,
                            const char* code = ErrorCode::Profile);

} // namespace ifccore::geom::detail

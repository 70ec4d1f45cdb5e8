#pragma once

#include <vector>
#include "../Types.hpp"
#include "Mesh.hpp"

namespace ifccore::geom {

/**
 * @brief True when built with the Open CASCADE backend (IC_USE_OCCT)
 */
bool csgAvailable();

/**
 * @brief Cut opening solids out of a host solid
 *
 * Both host and openings must be closed, outward-wound triangle meshes.
 * They are sewn into B-rep solids, the openings are subtracted one by one
 * and the result is tessellated again.
 *
 * @param linearDeflection Tessellation tolerance in mesh units
 * @return CSG_ERROR when the backend is missing or a boolean fails
 */
Result<Mesh> subtractOpenings(const Mesh& host, const std::vector<Mesh>& openings,
                              double linearDeflection = 0.01);

} // namespace ifccore::geom

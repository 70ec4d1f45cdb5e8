#pragma once

#include <optional>
#include <string>
#include "Resolver.hpp"

namespace ifccore::step {

/**
 * @brief Multiplier of an IfcSIPrefix enumeration (EXA..ATTO)
 */
std::optional<double> siPrefixScale(const std::string& prefix);

/**
 * @brief Metres per file length unit
 *
 * Follows IFCPROJECT.UnitsInContext to the LENGTHUNIT of its
 * IFCUNITASSIGNMENT. Supports IFCSIUNIT with prefix and
 * IFCCONVERSIONBASEDUNIT (feet, inches). Returns 1.0 when no length unit
 * is declared. An unrecognised length unit also yields 1.0 and, when
 * `verbose` is set, a warning on std::cerr.
 */
double extractLengthUnitScale(const EntityResolver& resolver, bool verbose = false);

/**
 * @brief Short label for a unit entity, e.g. "mm", "m²", "kg", "ft"
 *
 * Empty when the entity is not a recognised unit.
 */
std::string formatUnit(const DecodedEntity& unit, const EntityResolver& resolver);

} // namespace ifccore::step

#include "ifc-core/step/Units.hpp"
#include <iostream>
#include <map>

namespace ifccore::step {

std::optional<double> siPrefixScale(const std::string& prefix) {
    static const std::map<std::string, double> prefixes = {
        {"EXA", 1e18}, {"PETA", 1e15}, {"TERA", 1e12}, {"GIGA", 1e9},
        {"MEGA", 1e6}, {"KILO", 1e3}, {"HECTO", 1e2}, {"DECA", 1e1},
        {"DECI", 1e-1}, {"CENTI", 1e-2}, {"MILLI", 1e-3}, {"MICRO", 1e-6},
        {"NANO", 1e-9}, {"PICO", 1e-12}, {"FEMTO", 1e-15}, {"ATTO", 1e-18}
    };
    auto it = prefixes.find(prefix);
    if (it == prefixes.end()) {
        return std::nullopt;
    }
    return it->second;
}

namespace {

constexpr int kMaxUnitDepth = 8;

/**
 * @brief Metres per unit for a length unit entity
 */
std::optional<double> lengthScaleOf(const DecodedEntity& unit, const EntityResolver& resolver, int depth) {
    if (depth > kMaxUnitDepth) {
        return std::nullopt;
    }

    if (unit.typeName == "IFCSIUNIT") {
        // (Dimensions, UnitType, Prefix, Name)
        auto name = unit.getEnum(3);
        if (!name || *name != "METRE") {
            return std::nullopt;
        }
        auto prefix = unit.getEnum(2);
        if (!prefix) {
            return 1.0;
        }
        auto scale = siPrefixScale(*prefix);
        return scale ? *scale : 1.0;
    }

    if (unit.typeName == "IFCCONVERSIONBASEDUNIT" ||
        unit.typeName == "IFCCONVERSIONBASEDUNITWITHOFFSET") {
        // (Dimensions, UnitType, Name, ConversionFactor)
        auto factorRef = unit.getRef(3);
        if (!factorRef) {
            return std::nullopt;
        }
        auto factor = resolver.get(*factorRef);
        if (!factor || factor.value->typeName != "IFCMEASUREWITHUNIT") {
            return std::nullopt;
        }
        // (ValueComponent, UnitComponent)
        auto value = factor.value->getFloat(0);
        if (!value) {
            return std::nullopt;
        }
        double baseScale = 1.0;
        if (auto baseRef = factor.value->getRef(1)) {
            if (auto base = resolver.find(*baseRef)) {
                if (auto nested = lengthScaleOf(*base, resolver, depth + 1)) {
                    baseScale = *nested;
                }
            }
        }
        return *value * baseScale;
    }

    return std::nullopt;
}

std::string prefixSymbol(const std::string& prefix) {
    static const std::map<std::string, std::string> symbols = {
        {"KILO", "k"}, {"CENTI", "c"}, {"MILLI", "m"}, {"MICRO", "µ"},
        {"DECI", "d"}, {"MEGA", "M"}, {"GIGA", "G"}, {"NANO", "n"}
    };
    auto it = symbols.find(prefix);
    return it == symbols.end() ? std::string() : it->second;
}

std::string siSymbol(const std::string& name) {
    static const std::map<std::string, std::string> symbols = {
        {"METRE", "m"}, {"SQUARE_METRE", "m²"}, {"CUBIC_METRE", "m³"},
        {"GRAM", "g"}, {"SECOND", "s"}, {"KELVIN", "K"},
        {"DEGREE_CELSIUS", "°C"}, {"RADIAN", "rad"}, {"STERADIAN", "sr"},
        {"NEWTON", "N"}, {"PASCAL", "Pa"}, {"JOULE", "J"}, {"WATT", "W"},
        {"HERTZ", "Hz"}, {"AMPERE", "A"}, {"VOLT", "V"}, {"OHM", "Ω"},
        {"LUMEN", "lm"}, {"LUX", "lx"}, {"CANDELA", "cd"}, {"MOLE", "mol"}
    };
    auto it = symbols.find(name);
    return it == symbols.end() ? name : it->second;
}

} // anonymous namespace

double extractLengthUnitScale(const EntityResolver& resolver, bool verbose) {
    const auto& projects = resolver.findByTypeName("IFCPROJECT");
    if (projects.empty()) {
        return 1.0;
    }

    auto project = resolver.find(projects.front());
    if (!project) {
        return 1.0;
    }

    // IfcProject.UnitsInContext
    auto assignmentRef = project->getRef(8);
    if (!assignmentRef) {
        return 1.0;
    }
    auto assignment = resolver.find(*assignmentRef);
    if (!assignment || assignment->typeName != "IFCUNITASSIGNMENT") {
        return 1.0;
    }

    for (EntityId unitId : assignment->getRefs(0)) {
        auto unit = resolver.find(unitId);
        if (!unit) {
            continue;
        }
        auto unitType = unit->getEnum(1);
        if (!unitType || *unitType != "LENGTHUNIT") {
            continue;
        }
        if (auto scale = lengthScaleOf(*unit, resolver, 0)) {
            return *scale;
        }
        if (verbose) {
            std::cerr << "Warning: unsupported length unit " << unit->typeName
                      << " #" << unit->id << ", assuming metres" << std::endl;
        }
        return 1.0;
    }

    return 1.0;
}

std::string formatUnit(const DecodedEntity& unit, const EntityResolver& resolver) {
    if (unit.typeName == "IFCSIUNIT") {
        auto name = unit.getEnum(3);
        if (!name) {
            return std::string();
        }
        std::string prefix = unit.getEnum(2) ? prefixSymbol(*unit.getEnum(2)) : std::string();
        return prefix + siSymbol(*name);
    }
    if (unit.typeName == "IFCCONVERSIONBASEDUNIT" ||
        unit.typeName == "IFCCONVERSIONBASEDUNITWITHOFFSET") {
        auto name = unit.getString(2);
        if (!name) {
            return std::string();
        }
        static const std::map<std::string, std::string> known = {
            {"FOOT", "ft"}, {"INCH", "in"}, {"YARD", "yd"}, {"MILE", "mi"},
            {"SQUARE FOOT", "ft²"}, {"CUBIC FOOT", "ft³"}, {"DEGREE", "°"},
            {"POUND", "lb"}
        };
        auto it = known.find(*name);
        return it == known.end() ? *name : it->second;
    }
    if (unit.typeName == "IFCDERIVEDUNIT") {
        // (Elements, UnitType, UserDefinedType)
        std::string label;
        for (EntityId elementId : unit.getRefs(0)) {
            auto element = resolver.find(elementId);
            if (!element) {
                continue;
            }
            // IfcDerivedUnitElement (Unit, Exponent)
            auto base = element->getRef(0) ? resolver.find(*element->getRef(0)) : nullptr;
            if (!base) {
                continue;
            }
            if (!label.empty()) label += "·";
            label += formatUnit(*base, resolver);
            auto exponent = element->getInteger(1);
            if (exponent && *exponent != 1) {
                label += "^" + std::to_string(*exponent);
            }
        }
        return label;
    }
    return std::string();
}

} // namespace ifccore::step

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "Resolver.hpp"

namespace ifccore::step {

enum class QuantityKind {
    Length,
    Area,
    Volume,
    Count,
    Weight,
    Time,
    Untyped
};

const char* toString(QuantityKind kind);

struct PropertyValue {
    std::string name;
    std::string entityType;        // IFCPROPERTYSINGLEVALUE, ...
    AttributeValue value;          // nominal value, list, or bounds as a list
    std::string displayValue;      // formatted for UIs
    std::string unit;              // empty when none is declared
};

struct QuantityValue {
    std::string name;
    std::string entityType;        // IFCQUANTITYLENGTH, ...
    QuantityKind kind = QuantityKind::Untyped;
    double value = 0.0;
    std::string unit;
};

/**
 * @brief IfcPropertySet or IfcElementQuantity attached to an element
 */
struct PropertySet {
    EntityId id = 0;
    std::string name;
    bool isQuantitySet = false;
    std::vector<PropertyValue> properties;
    std::vector<QuantityValue> quantities;

    const PropertyValue* findProperty(const std::string& propertyName) const;
    const QuantityValue* findQuantity(const std::string& quantityName) const;
};

using PropertySetPtr = std::shared_ptr<const PropertySet>;

/**
 * @brief Direct IfcRoot attributes of an element
 */
struct ElementAttributes {
    std::string globalId;
    std::string name;
    std::string description;
    std::string objectType;
    std::string tag;
};

ElementAttributes readElementAttributes(const DecodedEntity& element);

/**
 * @brief Render an attribute value for display ("2.5", "TRUE", "a, b")
 */
std::string formatValue(const AttributeValue& value);

/**
 * @brief Element id -> property sets, from IFCRELDEFINESBYPROPERTIES
 *
 * Built once and never mutated. A set shared by several elements is
 * decoded once and shared.
 */
class PropertyIndex {
public:
    static PropertyIndex build(const EntityResolver& resolver, bool verbose = false);

    /**
     * @brief Sets attached to an element, in relation order
     */
    const std::vector<PropertySetPtr>& propertySets(EntityId elementId) const;

    /**
     * @brief Look up one property by set and property name
     */
    const PropertyValue* findProperty(EntityId elementId, const std::string& setName,
                                      const std::string& propertyName) const;

    size_t elementCount() const { return byElement_.size(); }
    size_t setCount() const { return setCount_; }

    /**
     * @brief Decode a single IFCPROPERTYSET or IFCELEMENTQUANTITY
     *
     * Members that do not resolve are left out of the set and reported on
     * std::cerr when `verbose` is set.
     * @return INVALID_ATTRIBUTE for other entity types
     */
    static Result<PropertySet> readPropertySet(const DecodedEntity& definition,
                                               const EntityResolver& resolver,
                                               bool verbose = false);

private:
    std::unordered_map<EntityId, std::vector<PropertySetPtr>> byElement_;
    size_t setCount_ = 0;
};

} // namespace ifccore::step

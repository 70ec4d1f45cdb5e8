#include "ifc-core/step/Properties.hpp"
#include "ifc-core/step/Units.hpp"
#include <cstdio>
#include <iostream>

namespace ifccore::step {

const char* toString(QuantityKind kind) {
    switch (kind) {
        case QuantityKind::Length: return "Length";
        case QuantityKind::Area: return "Area";
        case QuantityKind::Volume: return "Volume";
        case QuantityKind::Count: return "Count";
        case QuantityKind::Weight: return "Weight";
        case QuantityKind::Time: return "Time";
        case QuantityKind::Untyped: return "Untyped";
    }
    return "Untyped";
}

const PropertyValue* PropertySet::findProperty(const std::string& propertyName) const {
    for (const auto& property : properties) {
        if (property.name == propertyName) {
            return &property;
        }
    }
    return nullptr;
}

const QuantityValue* PropertySet::findQuantity(const std::string& quantityName) const {
    for (const auto& quantity : quantities) {
        if (quantity.name == quantityName) {
            return &quantity;
        }
    }
    return nullptr;
}

ElementAttributes readElementAttributes(const DecodedEntity& element) {
    ElementAttributes attributes;
    attributes.globalId = element.getString(0).value_or("");
    attributes.name = element.getString(2).value_or("");
    attributes.description = element.getString(3).value_or("");
    attributes.objectType = element.getString(4).value_or("");
    attributes.tag = element.getString(7).value_or("");
    return attributes;
}

std::string formatValue(const AttributeValue& value) {
    if (value.isNull() || value.isDerived()) {
        return std::string();
    }
    if (auto typed = value.asTypedValue()) {
        if (typed->args.size() == 1) {
            return formatValue(typed->args.front());
        }
        return value.toString();
    }
    if (auto s = std::get_if<std::string>(&value.data)) {
        return *s;
    }
    if (auto i = std::get_if<int64_t>(&value.data)) {
        return std::to_string(*i);
    }
    if (auto d = std::get_if<double>(&value.data)) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.6g", *d);
        return buffer;
    }
    if (auto b = value.asBool()) {
        return *b ? "TRUE" : "FALSE";
    }
    if (auto e = value.asEnum()) {
        return *e;
    }
    if (auto ref = value.asRef()) {
        return "#" + std::to_string(*ref);
    }
    if (auto list = value.asList()) {
        std::string joined;
        for (const auto& item : *list) {
            if (!joined.empty()) joined += ", ";
            joined += formatValue(item);
        }
        return joined;
    }
    return value.toString();
}

namespace {

const std::vector<PropertySetPtr> kNoSets;

constexpr int kMaxComplexDepth = 8;

std::string unitLabel(const DecodedEntity& property, size_t index, const EntityResolver& resolver) {
    auto unitRef = property.getRef(index);
    if (!unitRef) {
        return std::string();
    }
    auto unit = resolver.find(*unitRef);
    return unit ? formatUnit(*unit, resolver) : std::string();
}

void readProperty(const DecodedEntity& property, const EntityResolver& resolver,
                  const std::string& prefix, int depth, std::vector<PropertyValue>& out) {
    PropertyValue value;
    value.name = prefix + property.getString(0).value_or("");
    value.entityType = property.typeName;

    const std::string& type = property.typeName;
    if (type == "IFCPROPERTYSINGLEVALUE") {
        // (Name, Description, NominalValue, Unit)
        if (auto nominal = property.get(2)) {
            value.value = *nominal;
        }
        value.unit = unitLabel(property, 3, resolver);
    } else if (type == "IFCPROPERTYENUMERATEDVALUE") {
        // (Name, Description, EnumerationValues, EnumerationReference)
        if (auto values = property.get(2)) {
            value.value = *values;
        }
    } else if (type == "IFCPROPERTYBOUNDEDVALUE") {
        // (Name, Description, UpperBoundValue, LowerBoundValue, Unit, SetPointValue)
        AttributeList bounds;
        bounds.push_back(property.get(3) ? *property.get(3) : AttributeValue::null());
        bounds.push_back(property.get(2) ? *property.get(2) : AttributeValue::null());
        value.value = AttributeValue::list(std::move(bounds));
        value.unit = unitLabel(property, 4, resolver);
        value.displayValue = formatValue(value.value.asList()->at(0)) + " .. " +
                             formatValue(value.value.asList()->at(1));
    } else if (type == "IFCPROPERTYLISTVALUE") {
        // (Name, Description, ListValues, Unit)
        if (auto values = property.get(2)) {
            value.value = *values;
        }
        value.unit = unitLabel(property, 3, resolver);
    } else if (type == "IFCPROPERTYREFERENCEVALUE") {
        // (Name, Description, UsageName, PropertyReference)
        if (auto reference = property.get(3)) {
            value.value = *reference;
        }
    } else if (type == "IFCCOMPLEXPROPERTY") {
        // (Name, Description, UsageName, HasProperties): flattened as "Name.Child"
        if (depth >= kMaxComplexDepth) {
            return;
        }
        for (EntityId childId : property.getRefs(3)) {
            if (auto child = resolver.find(childId)) {
                readProperty(*child, resolver, value.name + ".", depth + 1, out);
            }
        }
        return;
    } else {
        return;
    }

    if (value.displayValue.empty()) {
        value.displayValue = formatValue(value.value);
    }
    out.push_back(std::move(value));
}

QuantityValue readQuantity(const DecodedEntity& quantity, const EntityResolver& resolver) {
    struct Layout {
        const char* typeName;
        QuantityKind kind;
        const char* defaultUnit;
    };
    static const Layout layouts[] = {
        {"IFCQUANTITYLENGTH", QuantityKind::Length, "m"},
        {"IFCQUANTITYAREA", QuantityKind::Area, "m²"},
        {"IFCQUANTITYVOLUME", QuantityKind::Volume, "m³"},
        {"IFCQUANTITYCOUNT", QuantityKind::Count, ""},
        {"IFCQUANTITYWEIGHT", QuantityKind::Weight, "kg"},
        {"IFCQUANTITYTIME", QuantityKind::Time, "s"},
    };

    QuantityValue result;
    // (Name, Description, Unit, Value, Formula)
    result.name = quantity.getString(0).value_or("");
    result.entityType = quantity.typeName;

    for (const auto& layout : layouts) {
        if (quantity.typeName == layout.typeName) {
            result.kind = layout.kind;
            result.value = quantity.getFloat(3).value_or(0.0);
            result.unit = unitLabel(quantity, 2, resolver);
            if (result.unit.empty()) {
                result.unit = layout.defaultUnit;
            }
            return result;
        }
    }

    result.kind = QuantityKind::Untyped;
    for (size_t i = 3; i < quantity.size(); ++i) {
        if (auto number = quantity.getFloat(i)) {
            result.value = *number;
            break;
        }
    }
    return result;
}

} // anonymous namespace

Result<PropertySet> PropertyIndex::readPropertySet(const DecodedEntity& definition,
                                                   const EntityResolver& resolver,
                                                   bool verbose) {
    PropertySet set;
    set.id = definition.id;
    set.name = definition.getString(2).value_or("");

    if (definition.typeName == "IFCPROPERTYSET") {
        // (GlobalId, OwnerHistory, Name, Description, HasProperties)
        for (EntityId propertyId : definition.getRefs(4)) {
            auto property = resolver.get(propertyId);
            if (!property) {
                if (verbose) {
                    std::cerr << "Warning: property set #" << definition.id
                              << " skips member: " << property.errorMessage << std::endl;
                }
                continue;
            }
            readProperty(*property.value, resolver, std::string(), 0, set.properties);
        }
        return Result<PropertySet>::ok(std::move(set));
    }

    if (definition.typeName == "IFCELEMENTQUANTITY") {
        // (GlobalId, OwnerHistory, Name, Description, MethodOfMeasurement, Quantities)
        set.isQuantitySet = true;
        for (EntityId quantityId : definition.getRefs(5)) {
            auto quantity = resolver.get(quantityId);
            if (!quantity) {
                if (verbose) {
                    std::cerr << "Warning: quantity set #" << definition.id
                              << " skips member: " << quantity.errorMessage << std::endl;
                }
                continue;
            }
            set.quantities.push_back(readQuantity(*quantity.value, resolver));
        }
        return Result<PropertySet>::ok(std::move(set));
    }

    auto r = Result<PropertySet>::error(ErrorCode::InvalidAttribute,
        definition.typeName + " #" + std::to_string(definition.id) + " is not a property set");
    r.entityId = definition.id;
    return r;
}

PropertyIndex PropertyIndex::build(const EntityResolver& resolver, bool verbose) {
    PropertyIndex index;
    std::unordered_map<EntityId, PropertySetPtr> decodedSets;
    size_t skipped = 0;

    for (EntityId relationId : resolver.findByTypeName("IFCRELDEFINESBYPROPERTIES")) {
        auto relation = resolver.get(relationId);
        if (!relation) {
            ++skipped;
            continue;
        }
        // (GlobalId, OwnerHistory, Name, Description, RelatedObjects, RelatingPropertyDefinition)
        for (EntityId definitionId : relation.value->getRefs(5)) {
            PropertySetPtr set;
            auto cached = decodedSets.find(definitionId);
            if (cached != decodedSets.end()) {
                set = cached->second;
            } else {
                auto definition = resolver.get(definitionId);
                if (!definition) {
                    ++skipped;
                    continue;
                }
                auto parsed = readPropertySet(*definition.value, resolver, verbose);
                if (!parsed) {
                    // Other property definitions (e.g. predefined sets) are not indexed
                    if (parsed.errorCode != ErrorCode::InvalidAttribute) {
                        ++skipped;
                        if (verbose) {
                            std::cerr << "Warning: skipping property set #" << definitionId
                                      << ": " << parsed.errorMessage << std::endl;
                        }
                    }
                    continue;
                }
                set = std::make_shared<const PropertySet>(std::move(parsed.value));
                decodedSets.emplace(definitionId, set);
            }
            for (EntityId elementId : relation.value->getRefs(4)) {
                index.byElement_[elementId].push_back(set);
            }
        }
    }

    index.setCount_ = decodedSets.size();

    if (verbose) {
        std::cout << "Properties: " << index.setCount_ << " sets on "
                  << index.byElement_.size() << " elements";
        if (skipped > 0) {
            std::cout << " (" << skipped << " skipped)";
        }
        std::cout << std::endl;
    }

    return index;
}

const std::vector<PropertySetPtr>& PropertyIndex::propertySets(EntityId elementId) const {
    auto it = byElement_.find(elementId);
    return it == byElement_.end() ? kNoSets : it->second;
}

const PropertyValue* PropertyIndex::findProperty(EntityId elementId, const std::string& setName,
                                                 const std::string& propertyName) const {
    for (const auto& set : propertySets(elementId)) {
        if (set->name == setName) {
            if (auto property = set->findProperty(propertyName)) {
                return property;
            }
        }
    }
    return nullptr;
}

} // namespace ifccore::step

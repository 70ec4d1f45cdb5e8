#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "../Types.hpp"

namespace ifccore::step {

struct AttributeValue;
using AttributeList = std::vector<AttributeValue>;

// ===========================================================================
// Variant Alternatives
// ===========================================================================

struct NullValue {};      // $
struct DerivedValue {};   // *

struct EntityRef {
    EntityId id = 0;
};

struct EnumValue {
    std::string name;     // without the surrounding dots
};

/**
 * @brief Typed value such as IFCLABEL('Wall') or IFCLENGTHMEASURE(2.5)
 */
struct TypedValue {
    std::string name;
    AttributeList args;
};

inline bool operator==(const NullValue&, const NullValue&) { return true; }
inline bool operator==(const DerivedValue&, const DerivedValue&) { return true; }
inline bool operator==(const EntityRef& a, const EntityRef& b) { return a.id == b.id; }
inline bool operator==(const EnumValue& a, const EnumValue& b) { return a.name == b.name; }
bool operator==(const TypedValue& a, const TypedValue& b);

/**
 * @brief One decoded STEP attribute
 *
 * A closed variant set. References are stored as ids only, never as
 * pointers to other decoded entities, so reference cycles in the file stay
 * plain data.
 */
struct AttributeValue {
    using Storage = std::variant<
        NullValue,
        DerivedValue,
        EntityRef,
        std::string,
        int64_t,
        double,
        EnumValue,
        AttributeList,
        TypedValue
    >;

    Storage data;

    AttributeValue() = default;
    AttributeValue(Storage value) : data(std::move(value)) {}

    static AttributeValue null() { return AttributeValue(); }
    static AttributeValue derived() { return AttributeValue(DerivedValue{}); }
    static AttributeValue ref(EntityId id) { return AttributeValue(EntityRef{id}); }
    static AttributeValue string(std::string s) { return AttributeValue(Storage(std::move(s))); }
    static AttributeValue integer(int64_t v) { return AttributeValue(Storage(v)); }
    static AttributeValue real(double v) { return AttributeValue(Storage(v)); }
    static AttributeValue enumeration(std::string name) { return AttributeValue(EnumValue{std::move(name)}); }
    static AttributeValue list(AttributeList items) { return AttributeValue(Storage(std::move(items))); }
    static AttributeValue typed(std::string name, AttributeList args) {
        return AttributeValue(TypedValue{std::move(name), std::move(args)});
    }

    bool isNull() const { return std::holds_alternative<NullValue>(data); }
    bool isDerived() const { return std::holds_alternative<DerivedValue>(data); }
    bool isRef() const { return std::holds_alternative<EntityRef>(data); }
    bool isString() const { return std::holds_alternative<std::string>(data); }
    bool isInteger() const { return std::holds_alternative<int64_t>(data); }
    bool isFloat() const { return std::holds_alternative<double>(data); }
    bool isEnum() const { return std::holds_alternative<EnumValue>(data); }
    bool isList() const { return std::holds_alternative<AttributeList>(data); }
    bool isTypedValue() const { return std::holds_alternative<TypedValue>(data); }

    std::optional<EntityId> asRef() const;

    /**
     * @brief String payload, also unwrapping a typed value's first argument
     */
    const std::string* asString() const;

    /**
     * @brief Numeric payload: Float, Integer, or a typed value's first argument
     */
    std::optional<double> asFloat() const;

    std::optional<int64_t> asInteger() const;
    const std::string* asEnum() const;

    /**
     * @brief Logical payload from .T./.F. (also TRUE/FALSE), unwrapping typed values
     */
    std::optional<bool> asBool() const;

    const AttributeList* asList() const;
    const TypedValue* asTypedValue() const;

    /**
     * @brief Render back to STEP-like text (for diagnostics and display)
     */
    std::string toString() const;

    bool operator==(const AttributeValue& other) const;
    bool operator!=(const AttributeValue& other) const { return !(*this == other); }
};

/**
 * @brief Entity after lazy decode: id, type name and ordered attributes
 *
 * Shared read-only between all callers once cached by the model.
 */
struct DecodedEntity {
    EntityId id = 0;
    std::string typeName;
    AttributeList attributes;

    size_t size() const { return attributes.size(); }

    /**
     * @brief Attribute at index, nullptr when out of range
     */
    const AttributeValue* get(size_t index) const;

    std::optional<EntityId> getRef(size_t index) const;
    std::vector<EntityId> getRefs(size_t index) const;
    std::optional<std::string> getString(size_t index) const;
    std::optional<double> getFloat(size_t index) const;
    std::optional<int64_t> getInteger(size_t index) const;
    std::optional<std::string> getEnum(size_t index) const;
    std::optional<bool> getBool(size_t index) const;
    const AttributeList* getList(size_t index) const;

    bool isNull(size_t index) const;

    bool operator==(const DecodedEntity& other) const {
        return id == other.id && typeName == other.typeName && attributes == other.attributes;
    }
};

} // namespace ifccore::step

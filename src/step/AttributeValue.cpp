#include "ifc-core/step/AttributeValue.hpp"
#include <cstdio>
#include <sstream>

namespace ifccore::step {

bool operator==(const TypedValue& a, const TypedValue& b) {
    return a.name == b.name && a.args == b.args;
}

bool AttributeValue::operator==(const AttributeValue& other) const {
    return data == other.data;
}

std::optional<EntityId> AttributeValue::asRef() const {
    if (auto ref = std::get_if<EntityRef>(&data)) {
        return ref->id;
    }
    return std::nullopt;
}

const std::string* AttributeValue::asString() const {
    if (auto s = std::get_if<std::string>(&data)) {
        return s;
    }
    if (auto typed = std::get_if<TypedValue>(&data)) {
        if (!typed->args.empty()) {
            return typed->args.front().asString();
        }
    }
    return nullptr;
}

std::optional<double> AttributeValue::asFloat() const {
    if (auto d = std::get_if<double>(&data)) {
        return *d;
    }
    if (auto i = std::get_if<int64_t>(&data)) {
        return static_cast<double>(*i);
    }
    if (auto typed = std::get_if<TypedValue>(&data)) {
        if (!typed->args.empty()) {
            return typed->args.front().asFloat();
        }
    }
    return std::nullopt;
}

std::optional<int64_t> AttributeValue::asInteger() const {
    if (auto i = std::get_if<int64_t>(&data)) {
        return *i;
    }
    if (auto typed = std::get_if<TypedValue>(&data)) {
        if (!typed->args.empty()) {
            return typed->args.front().asInteger();
        }
    }
    return std::nullopt;
}

const std::string* AttributeValue::asEnum() const {
    if (auto e = std::get_if<EnumValue>(&data)) {
        return &e->name;
    }
    return nullptr;
}

std::optional<bool> AttributeValue::asBool() const {
    if (auto e = std::get_if<EnumValue>(&data)) {
        if (e->name == "T" || e->name == "TRUE") return true;
        if (e->name == "F" || e->name == "FALSE") return false;
        return std::nullopt;
    }
    if (auto typed = std::get_if<TypedValue>(&data)) {
        if (!typed->args.empty()) {
            return typed->args.front().asBool();
        }
    }
    return std::nullopt;
}

const AttributeList* AttributeValue::asList() const {
    return std::get_if<AttributeList>(&data);
}

const TypedValue* AttributeValue::asTypedValue() const {
    return std::get_if<TypedValue>(&data);
}

namespace {

std::string formatReal(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.10g", value);
    std::string text(buffer);
    // STEP reals always carry a decimal point
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".";
    }
    return text;
}

void appendList(std::ostringstream& out, const AttributeList& items) {
    out << '(';
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out << ',';
        out << items[i].toString();
    }
    out << ')';
}

} // anonymous namespace

std::string AttributeValue::toString() const {
    std::ostringstream out;
    if (isNull()) {
        out << '$';
    } else if (isDerived()) {
        out << '*';
    } else if (auto ref = std::get_if<EntityRef>(&data)) {
        out << '#' << ref->id;
    } else if (auto s = std::get_if<std::string>(&data)) {
        out << '\'';
        for (char c : *s) {
            if (c == '\'') out << '\'';
            out << c;
        }
        out << '\'';
    } else if (auto i = std::get_if<int64_t>(&data)) {
        out << *i;
    } else if (auto d = std::get_if<double>(&data)) {
        out << formatReal(*d);
    } else if (auto e = std::get_if<EnumValue>(&data)) {
        out << '.' << e->name << '.';
    } else if (auto list = std::get_if<AttributeList>(&data)) {
        appendList(out, *list);
    } else if (auto typed = std::get_if<TypedValue>(&data)) {
        out << typed->name;
        appendList(out, typed->args);
    }
    return out.str();
}

// ===========================================================================
// DecodedEntity accessors
// ===========================================================================

const AttributeValue* DecodedEntity::get(size_t index) const {
    if (index >= attributes.size()) {
        return nullptr;
    }
    return &attributes[index];
}

std::optional<EntityId> DecodedEntity::getRef(size_t index) const {
    auto value = get(index);
    return value ? value->asRef() : std::nullopt;
}

std::vector<EntityId> DecodedEntity::getRefs(size_t index) const {
    std::vector<EntityId> ids;
    auto value = get(index);
    if (!value) {
        return ids;
    }
    if (auto list = value->asList()) {
        ids.reserve(list->size());
        for (const auto& item : *list) {
            if (auto id = item.asRef()) {
                ids.push_back(*id);
            }
        }
    } else if (auto id = value->asRef()) {
        ids.push_back(*id);
    }
    return ids;
}

std::optional<std::string> DecodedEntity::getString(size_t index) const {
    auto value = get(index);
    if (!value) return std::nullopt;
    auto s = value->asString();
    if (!s) return std::nullopt;
    return *s;
}

std::optional<double> DecodedEntity::getFloat(size_t index) const {
    auto value = get(index);
    return value ? value->asFloat() : std::nullopt;
}

std::optional<int64_t> DecodedEntity::getInteger(size_t index) const {
    auto value = get(index);
    return value ? value->asInteger() : std::nullopt;
}

std::optional<std::string> DecodedEntity::getEnum(size_t index) const {
    auto value = get(index);
    if (!value) return std::nullopt;
    auto e = value->asEnum();
    if (!e) return std::nullopt;
    return *e;
}

std::optional<bool> DecodedEntity::getBool(size_t index) const {
    auto value = get(index);
    return value ? value->asBool() : std::nullopt;
}

const AttributeList* DecodedEntity::getList(size_t index) const {
    auto value = get(index);
    return value ? value->asList() : nullptr;
}

bool DecodedEntity::isNull(size_t index) const {
    auto value = get(index);
    return !value || value->isNull();
}

} // namespace ifccore::step

#include "ifc-core/step/Decoder.hpp"

namespace ifccore::step {

std::string unescapeString(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        result.push_back(text[i]);
        if (text[i] == '\'' && i + 1 < text.size() && text[i + 1] == '\'') {
            ++i;
        }
    }
    return result;
}

AttributeValue toAttributeValue(const Token& token) {
    switch (token.kind) {
        case TokenKind::EntityRef:
            return AttributeValue::ref(token.ref);
        case TokenKind::String:
            return AttributeValue::string(unescapeString(token.text));
        case TokenKind::Integer:
            return AttributeValue::integer(token.integer);
        case TokenKind::Float:
            return AttributeValue::real(token.real);
        case TokenKind::Enum:
            return AttributeValue::enumeration(std::string(token.text));
        case TokenKind::List: {
            AttributeList items;
            items.reserve(token.children.size());
            for (const auto& child : token.children) {
                items.push_back(toAttributeValue(child));
            }
            return AttributeValue::list(std::move(items));
        }
        case TokenKind::TypedValue: {
            AttributeList args;
            args.reserve(token.children.size());
            for (const auto& child : token.children) {
                args.push_back(toAttributeValue(child));
            }
            return AttributeValue::typed(std::string(token.text), std::move(args));
        }
        case TokenKind::Derived:
            return AttributeValue::derived();
        case TokenKind::Null:
            break;
    }
    return AttributeValue::null();
}

Result<DecodedEntity> decodeEntity(const RawEntity& raw) {
    auto tokens = tokenizeArguments(raw.arguments, raw.argumentsOffset);
    if (!tokens) {
        auto r = Result<DecodedEntity>::from(tokens);
        r.errorMessage = "Entity #" + std::to_string(raw.id) + ": " + r.errorMessage;
        r.entityId = raw.id;
        return r;
    }

    DecodedEntity entity;
    entity.id = raw.id;
    entity.typeName = std::string(raw.typeName);
    entity.attributes.reserve(tokens.value.size());
    for (const auto& token : tokens.value) {
        entity.attributes.push_back(toAttributeValue(token));
    }
    return Result<DecodedEntity>::ok(std::move(entity));
}

} // namespace ifccore::step

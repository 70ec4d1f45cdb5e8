#pragma once

#include <cstdint>
#include <string_view>
#include <vector>
#include "../Types.hpp"

namespace ifccore::step {

enum class TokenKind {
    EntityRef,   // #123
    String,      // 'text'
    Integer,     // 42
    Float,       // 1.5, -2.E-3
    Enum,        // .ELEMENT.
    List,        // ( ... )
    TypedValue,  // IFCLABEL('x')
    Null,        // $
    Derived      // *
};

/**
 * @brief Lexical token of an entity argument list
 *
 * Text views reference the tokenized buffer. Strings keep their ''
 * escapes; the decoder unescapes them.
 */
struct Token {
    TokenKind kind = TokenKind::Null;
    std::string_view text;        // string contents, enum name or typed value name
    EntityId ref = 0;
    int64_t integer = 0;
    double real = 0.0;
    std::vector<Token> children;  // list items or typed value arguments
    size_t offset = 0;            // byte offset in the source file
};

/**
 * @brief Tokenize a parenthesized STEP argument list
 *
 * Pure function of its input. Recognition order: reference, string,
 * null, derived, enumeration, number, nested list, typed value. A bare
 * identifier followed by '(' is always a typed value.
 *
 * @param arguments Text starting with '(' and ending with the matching ')'
 * @param baseOffset File offset of arguments[0], used in error reports
 * @return Top-level argument tokens, or PARSE_ERROR with byteOffset set
 */
Result<std::vector<Token>> tokenizeArguments(std::string_view arguments, size_t baseOffset = 0);

} // namespace ifccore::step

#include "ifc-core/step/Tokenizer.hpp"
#include <cctype>
#include <charconv>
#include <string>

namespace ifccore::step {

namespace {

constexpr int kMaxNesting = 256;

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

/**
 * @brief Recursive-descent reader over one argument list
 */
class TokenReader {
public:
    TokenReader(std::string_view text, size_t baseOffset)
        : text_(text), base_(baseOffset) {}

    bool readTopLevel(std::vector<Token>& out) {
        skipSpace();
        if (!readList(out, 0)) {
            return false;
        }
        skipSpace();
        if (pos_ < text_.size()) {
            return fail(pos_, "Unexpected trailing characters after argument list");
        }
        return true;
    }

    const std::string& error() const { return error_; }
    size_t errorOffset() const { return errorOffset_; }

private:
    bool fail(size_t localPos, const std::string& message) {
        if (error_.empty()) {
            error_ = message;
            errorOffset_ = base_ + localPos;
        }
        return false;
    }

    void skipSpace() {
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
                ++pos_;
            } else if (c == '/' && pos_ + 1 < text_.size() && text_[pos_ + 1] == '*') {
                size_t close = text_.find("*/", pos_ + 2);
                pos_ = (close == std::string_view::npos) ? text_.size() : close + 2;
            } else {
                break;
            }
        }
    }

    // '(' [value {',' value}] ')'
    bool readList(std::vector<Token>& items, int depth) {
        if (depth > kMaxNesting) {
            return fail(pos_, "Argument nesting too deep");
        }
        if (pos_ >= text_.size() || text_[pos_] != '(') {
            return fail(pos_, "Expected '('");
        }
        ++pos_;
        skipSpace();
        if (pos_ < text_.size() && text_[pos_] == ')') {
            ++pos_;
            return true;
        }
        while (true) {
            Token token;
            if (!readValue(token, depth)) {
                return false;
            }
            items.push_back(std::move(token));
            skipSpace();
            if (pos_ >= text_.size()) {
                return fail(pos_, "Unterminated argument list");
            }
            char c = text_[pos_];
            if (c == ',') {
                ++pos_;
                skipSpace();
                continue;
            }
            if (c == ')') {
                ++pos_;
                return true;
            }
            return fail(pos_, std::string("Expected ',' or ')' but found '") + c + "'");
        }
    }

    bool readValue(Token& token, int depth) {
        skipSpace();
        if (pos_ >= text_.size()) {
            return fail(pos_, "Unexpected end of arguments");
        }
        token.offset = base_ + pos_;
        char c = text_[pos_];

        if (c == '#') {
            return readRef(token);
        }
        if (c == '\'') {
            return readString(token);
        }
        if (c == '$') {
            token.kind = TokenKind::Null;
            ++pos_;
            return true;
        }
        if (c == '*') {
            token.kind = TokenKind::Derived;
            ++pos_;
            return true;
        }
        if (c == '.') {
            return readEnum(token);
        }
        if (c == '-' || c == '+' || isDigit(c)) {
            return readNumber(token);
        }
        if (c == '(') {
            token.kind = TokenKind::List;
            return readList(token.children, depth + 1);
        }
        if (isIdentStart(c)) {
            return readTyped(token, depth);
        }
        if (c == '"') {
            // Binary literal, kept as raw text
            size_t close = text_.find('"', pos_ + 1);
            if (close == std::string_view::npos) {
                return fail(pos_, "Unterminated binary literal");
            }
            token.kind = TokenKind::String;
            token.text = text_.substr(pos_ + 1, close - pos_ - 1);
            pos_ = close + 1;
            return true;
        }
        return fail(pos_, std::string("Unexpected character '") + c + "'");
    }

    bool readRef(Token& token) {
        size_t start = pos_;
        ++pos_;
        size_t digits = pos_;
        while (pos_ < text_.size() && isDigit(text_[pos_])) {
            ++pos_;
        }
        if (pos_ == digits) {
            return fail(start, "Expected digits after '#'");
        }
        EntityId id = 0;
        auto parsed = std::from_chars(text_.data() + digits, text_.data() + pos_, id);
        if (parsed.ec != std::errc()) {
            return fail(start, "Entity reference out of range");
        }
        token.kind = TokenKind::EntityRef;
        token.ref = id;
        token.text = text_.substr(start, pos_ - start);
        return true;
    }

    bool readString(Token& token) {
        size_t start = pos_;
        ++pos_;
        size_t contentStart = pos_;
        while (true) {
            size_t quote = text_.find('\'', pos_);
            if (quote == std::string_view::npos) {
                return fail(start, "Unterminated string literal");
            }
            if (quote + 1 < text_.size() && text_[quote + 1] == '\'') {
                pos_ = quote + 2;
                continue;
            }
            token.kind = TokenKind::String;
            token.text = text_.substr(contentStart, quote - contentStart);
            pos_ = quote + 1;
            return true;
        }
    }

    bool readEnum(Token& token) {
        size_t start = pos_;
        ++pos_;
        size_t nameStart = pos_;
        while (pos_ < text_.size() && isIdentChar(text_[pos_])) {
            ++pos_;
        }
        if (pos_ == nameStart || pos_ >= text_.size() || text_[pos_] != '.') {
            return fail(start, "Malformed enumeration value");
        }
        token.kind = TokenKind::Enum;
        token.text = text_.substr(nameStart, pos_ - nameStart);
        ++pos_;
        return true;
    }

    bool readNumber(Token& token) {
        size_t start = pos_;
        if (text_[pos_] == '-' || text_[pos_] == '+') {
            ++pos_;
        }
        size_t intStart = pos_;
        while (pos_ < text_.size() && isDigit(text_[pos_])) {
            ++pos_;
        }
        if (pos_ == intStart) {
            return fail(start, "Malformed number");
        }
        bool isReal = false;
        if (pos_ < text_.size() && text_[pos_] == '.') {
            isReal = true;
            ++pos_;
            while (pos_ < text_.size() && isDigit(text_[pos_])) {
                ++pos_;
            }
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            size_t expPos = pos_;
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '-' || text_[pos_] == '+')) {
                ++pos_;
            }
            size_t expDigits = pos_;
            while (pos_ < text_.size() && isDigit(text_[pos_])) {
                ++pos_;
            }
            if (pos_ == expDigits) {
                return fail(expPos, "Malformed exponent");
            }
            isReal = true;
        }

        token.text = text_.substr(start, pos_ - start);
        // from_chars rejects a leading '+'
        std::string_view digits = token.text;
        if (!digits.empty() && digits.front() == '+') {
            digits.remove_prefix(1);
        }

        if (!isReal) {
            int64_t value = 0;
            auto parsed = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if (parsed.ec == std::errc()) {
                token.kind = TokenKind::Integer;
                token.integer = value;
                return true;
            }
            // Too large for int64: keep it as a real
        }

        // Locale-independent; accepts "1." and exponent forms
        double value = 0.0;
        auto parsed = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (parsed.ec != std::errc() || parsed.ptr != digits.data() + digits.size()) {
            return fail(start, "Malformed real number");
        }
        token.kind = TokenKind::Float;
        token.real = value;
        return true;
    }

    bool readTyped(Token& token, int depth) {
        size_t start = pos_;
        while (pos_ < text_.size() && isIdentChar(text_[pos_])) {
            ++pos_;
        }
        token.text = text_.substr(start, pos_ - start);
        skipSpace();
        if (pos_ >= text_.size() || text_[pos_] != '(') {
            return fail(start, "Bare identifier '" + std::string(token.text) + "' is not a value");
        }
        token.kind = TokenKind::TypedValue;
        return readList(token.children, depth + 1);
    }

    std::string_view text_;
    size_t base_ = 0;
    size_t pos_ = 0;
    std::string error_;
    size_t errorOffset_ = 0;
};

} // anonymous namespace

Result<std::vector<Token>> tokenizeArguments(std::string_view arguments, size_t baseOffset) {
    TokenReader reader(arguments, baseOffset);
    std::vector<Token> tokens;
    if (!reader.readTopLevel(tokens)) {
        auto r = Result<std::vector<Token>>::error(ErrorCode::ParseError,
            reader.error() + " at byte " + std::to_string(reader.errorOffset()));
        r.byteOffset = reader.errorOffset();
        return r;
    }
    return Result<std::vector<Token>>::ok(std::move(tokens));
}

} // namespace ifccore::step

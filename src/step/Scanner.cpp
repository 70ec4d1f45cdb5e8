#include "ifc-core/step/Scanner.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace ifccore::step {

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // anonymous namespace

size_t findRecordEnd(std::string_view text, size_t from) {
    size_t p = from;
    while (true) {
        p = text.find_first_of("';/", p);
        if (p == std::string_view::npos) {
            return p;
        }
        char c = text[p];
        if (c == ';') {
            return p;
        }
        if (c == '\'') {
            // String literal; '' is an escaped quote
            ++p;
            while (true) {
                p = text.find('\'', p);
                if (p == std::string_view::npos) {
                    return p;
                }
                if (p + 1 < text.size() && text[p + 1] == '\'') {
                    p += 2;
                    continue;
                }
                ++p;
                break;
            }
        } else if (p + 1 < text.size() && text[p + 1] == '*') {
            size_t close = text.find("*/", p + 2);
            if (close == std::string_view::npos) {
                return close;
            }
            p = close + 2;
        } else {
            ++p;
        }
    }
}

size_t findStatement(std::string_view text, std::string_view keyword, size_t from) {
    size_t p = from;
    while (p < text.size()) {
        // Leading blanks and comments
        while (p < text.size()) {
            if (isSpace(text[p])) {
                ++p;
            } else if (text.compare(p, 2, "/*") == 0) {
                size_t close = text.find("*/", p + 2);
                if (close == std::string_view::npos) {
                    return close;
                }
                p = close + 2;
            } else {
                break;
            }
        }
        if (text.compare(p, keyword.size(), keyword) == 0) {
            size_t after = p + keyword.size();
            if (after >= text.size() || text[after] == ';' || text[after] == '(' ||
                text[after] == '/' || isSpace(text[after])) {
                return p;
            }
        }
        size_t end = findRecordEnd(text, p);
        if (end == std::string_view::npos) {
            return end;
        }
        p = end + 1;
    }
    return std::string_view::npos;
}

Scanner::Scanner(std::string_view content)
    : content_(content) {
    size_t data = findStatement(content_, "DATA", 0);
    size_t dataEnd = (data == std::string_view::npos) ? data : findRecordEnd(content_, data);
    pos_ = (dataEnd == std::string_view::npos) ? 0 : dataEnd + 1;
    start_ = pos_;
    end_ = content_.size();
    nextReport_ = start_;
}

void Scanner::setProgressCallback(ProgressCallback callback, size_t chunkBytes) {
    progress_ = std::move(callback);
    chunkBytes_ = std::max<size_t>(chunkBytes, 1);
    nextReport_ = pos_ + chunkBytes_;
}

double Scanner::fraction() const {
    if (end_ <= start_) {
        return 1.0;
    }
    double f = static_cast<double>(pos_ - start_) / static_cast<double>(end_ - start_);
    return std::min(1.0, std::max(0.0, f));
}

bool Scanner::startsWith(std::string_view token) const {
    return content_.compare(pos_, token.size(), token) == 0;
}

void Scanner::skipWhitespaceAndComments() {
    while (pos_ < end_) {
        char c = content_[pos_];
        if (isSpace(c)) {
            ++pos_;
        } else if (c == '/' && pos_ + 1 < end_ && content_[pos_ + 1] == '*') {
            size_t close = content_.find("*/", pos_ + 2);
            pos_ = (close == std::string_view::npos) ? end_ : close + 2;
        } else {
            break;
        }
    }
}

void Scanner::resync() {
    // Next '#' that begins a record: preceded only by blanks after a line
    // break or a ';'
    size_t p = pos_ + 1;
    while (p < end_) {
        p = content_.find_first_of("#E", p);
        if (p == std::string_view::npos) {
            break;
        }
        size_t q = p;
        while (q > 0 && (content_[q - 1] == ' ' || content_[q - 1] == '\t')) {
            --q;
        }
        bool atRecordStart = q == 0 || content_[q - 1] == '\n' ||
                             content_[q - 1] == '\r' || content_[q - 1] == ';';
        if (atRecordStart &&
            (content_[p] == '#' || content_.compare(p, 6, "ENDSEC") == 0)) {
            pos_ = p;
            return;
        }
        ++p;
    }
    pos_ = end_;
}

void Scanner::reportProgress() {
    if (progress_ && pos_ >= nextReport_ && !finished_) {
        progress_("scanning", fraction());
        nextReport_ = pos_ + chunkBytes_;
    }
}

void Scanner::finish() {
    pos_ = end_;
    if (progress_ && !finished_) {
        finished_ = true;
        progress_("scanning", 1.0);
    }
    finished_ = true;
}

Result<RawEntity> Scanner::fail(size_t offset, const std::string& message) {
    auto r = Result<RawEntity>::error(ErrorCode::ParseError,
        message + " at byte " + std::to_string(offset));
    r.byteOffset = offset;

    // Step over the malformed record's own terminator before looking for
    // the next record start
    size_t terminator = findRecordEnd(content_, offset);
    if (terminator == std::string_view::npos || terminator >= end_) {
        pos_ = end_;
        return r;
    }
    pos_ = terminator;
    resync();
    return r;
}

bool Scanner::next(Result<RawEntity>& out) {
    skipWhitespaceAndComments();
    reportProgress();

    if (pos_ >= end_ || finished_) {
        finish();
        return false;
    }

    if (content_[pos_] != '#') {
        if (startsWith("ENDSEC")) {
            finish();
            return false;
        }
        out = fail(pos_, "Unexpected text outside entity record");
        return true;
    }

    const size_t recordStart = pos_;
    ++pos_;

    // Entity id
    size_t digitsStart = pos_;
    while (pos_ < end_ && std::isdigit(static_cast<unsigned char>(content_[pos_]))) {
        ++pos_;
    }
    if (pos_ == digitsStart) {
        out = fail(recordStart, "Expected entity id after '#'");
        return true;
    }
    EntityId id = 0;
    auto parsed = std::from_chars(content_.data() + digitsStart, content_.data() + pos_, id);
    if (parsed.ec != std::errc()) {
        out = fail(recordStart, "Entity id out of range");
        return true;
    }

    skipWhitespaceAndComments();
    if (pos_ >= end_ || content_[pos_] != '=') {
        out = fail(recordStart, "Expected '=' after #" + std::to_string(id));
        return true;
    }
    ++pos_;
    skipWhitespaceAndComments();

    // Type name
    size_t typeStart = pos_;
    if (pos_ >= end_ || !std::isalpha(static_cast<unsigned char>(content_[pos_]))) {
        out = fail(recordStart, "Expected entity type name for #" + std::to_string(id));
        return true;
    }
    while (pos_ < end_ && isIdentChar(content_[pos_])) {
        ++pos_;
    }
    std::string_view typeName = content_.substr(typeStart, pos_ - typeStart);

    skipWhitespaceAndComments();
    if (pos_ >= end_ || content_[pos_] != '(') {
        out = fail(recordStart, "Expected '(' after type name of #" + std::to_string(id));
        return true;
    }

    size_t argsStart = pos_;
    size_t semicolon = findRecordEnd(content_, argsStart);
    if (semicolon == std::string_view::npos || semicolon >= end_) {
        auto r = Result<RawEntity>::error(ErrorCode::ParseError,
            "Unterminated entity record #" + std::to_string(id) +
            " at byte " + std::to_string(recordStart));
        r.byteOffset = recordStart;
        r.entityId = id;
        out = r;
        pos_ = end_;
        return true;
    }

    size_t argsEnd = semicolon;
    while (argsEnd > argsStart && isSpace(content_[argsEnd - 1])) {
        --argsEnd;
    }

    RawEntity raw;
    raw.id = id;
    raw.typeName = typeName;
    raw.arguments = content_.substr(argsStart, argsEnd - argsStart);
    raw.offset = recordStart;
    raw.argumentsOffset = argsStart;

    pos_ = semicolon + 1;
    out = Result<RawEntity>::ok(std::move(raw));
    return true;
}

} // namespace ifccore::step

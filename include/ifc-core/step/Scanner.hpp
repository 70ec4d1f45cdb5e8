#pragma once

#include <cstddef>
#include <string_view>
#include "../Types.hpp"

namespace ifccore::step {

/**
 * @brief Undecoded entity record located by the scanner
 *
 * Views point into the model's owned content buffer and stay valid for the
 * model's lifetime.
 */
struct RawEntity {
    EntityId id = 0;
    std::string_view typeName;    // e.g. "IFCWALL"
    std::string_view arguments;   // "(...)" text up to, not including, ';'
    size_t offset = 0;            // byte offset of the leading '#'
    size_t argumentsOffset = 0;   // byte offset of arguments[0]
};

/**
 * @brief Find the ';' terminating a record starting at `from`
 *
 * Skips string literals (with '' escapes) and comments.
 * @return Position of the ';' or std::string_view::npos
 */
size_t findRecordEnd(std::string_view text, size_t from);

/**
 * @brief Find the statement beginning with `keyword` (e.g. "DATA", "ENDSEC")
 *
 * Walks statement by statement from `from`, so keywords quoted inside
 * string literals or comments never match.
 * @return Offset of the keyword or std::string_view::npos
 */
size_t findStatement(std::string_view text, std::string_view keyword, size_t from = 0);

/**
 * @brief Single-pass scanner over the DATA section of a STEP file
 *
 * Produces RawEntity records in file order without decoding arguments.
 * Malformed records are reported as PARSE_ERROR results carrying the byte
 * offset of the record, after which scanning resynchronizes at the next
 * record start. Not restartable.
 */
class Scanner {
public:
    explicit Scanner(std::string_view content);

    /**
     * @brief Advance to the next record
     * @param out Receives either the next record or a PARSE_ERROR
     * @return false once the DATA section is exhausted
     */
    bool next(Result<RawEntity>& out);

    /**
     * @brief Report progress every `chunkBytes` consumed, and once at the end
     */
    void setProgressCallback(ProgressCallback callback, size_t chunkBytes);

    size_t position() const { return pos_; }
    double fraction() const;

private:
    void skipWhitespaceAndComments();
    bool startsWith(std::string_view token) const;
    void resync();
    void reportProgress();
    void finish();

    Result<RawEntity> fail(size_t offset, const std::string& message);

    std::string_view content_;
    size_t start_ = 0;
    size_t pos_ = 0;
    size_t end_ = 0;

    ProgressCallback progress_;
    size_t chunkBytes_ = 1 << 20;
    size_t nextReport_ = 0;
    bool finished_ = false;
};

} // namespace ifccore::step

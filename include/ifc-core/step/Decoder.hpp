#pragma once

#include <string>
#include <string_view>
#include "AttributeValue.hpp"
#include "Scanner.hpp"
#include "Tokenizer.hpp"

namespace ifccore::step {

/**
 * @brief Replace the STEP '' escape with a single quote
 */
std::string unescapeString(std::string_view text);

/**
 * @brief Convert a token tree into attribute values
 */
AttributeValue toAttributeValue(const Token& token);

/**
 * @brief Tokenize and convert one raw record
 * @return Decoded entity, or PARSE_ERROR carrying the entity id and byte offset
 */
Result<DecodedEntity> decodeEntity(const RawEntity& raw);

} // namespace ifccore::step

#include "ifc-core/step/Header.hpp"
#include "ifc-core/step/Decoder.hpp"
#include "ifc-core/step/Scanner.hpp"
#include "ifc-core/step/Tokenizer.hpp"
#include <iostream>

namespace ifccore::step {

namespace {

/**
 * @brief Decoded arguments of the header record `keyword`, empty if absent
 */
AttributeList readRecord(std::string_view header, std::string_view keyword, bool verbose) {
    size_t pos = findStatement(header, keyword);
    if (pos == std::string_view::npos) {
        return {};
    }
    size_t open = header.find('(', pos + keyword.size());
    size_t end = findRecordEnd(header, pos);
    if (open == std::string_view::npos || end == std::string_view::npos || open > end) {
        return {};
    }
    size_t close = end;
    while (close > open && header[close - 1] != ')') {
        --close;
    }
    auto tokens = tokenizeArguments(header.substr(open, close - open));
    if (!tokens) {
        if (verbose) {
            std::cerr << "Warning: malformed " << keyword << " header record: "
                      << tokens.errorMessage << std::endl;
        }
        return {};
    }
    AttributeList values;
    for (const auto& token : tokens.value) {
        values.push_back(toAttributeValue(token));
    }
    return values;
}

std::string stringAt(const AttributeList& values, size_t index) {
    if (index >= values.size()) return std::string();
    auto s = values[index].asString();
    return s ? *s : std::string();
}

std::vector<std::string> stringsAt(const AttributeList& values, size_t index) {
    std::vector<std::string> result;
    if (index >= values.size()) return result;
    if (auto list = values[index].asList()) {
        for (const auto& item : *list) {
            if (auto s = item.asString()) {
                result.push_back(*s);
            }
        }
    } else if (auto s = values[index].asString()) {
        result.push_back(*s);
    }
    return result;
}

} // anonymous namespace

HeaderInfo parseHeader(std::string_view content, bool verbose) {
    HeaderInfo info;

    size_t begin = findStatement(content, "HEADER");
    size_t headerEnd = (begin == std::string_view::npos) ? begin : findRecordEnd(content, begin);
    if (headerEnd == std::string_view::npos) {
        return info;
    }
    size_t start = headerEnd + 1;
    size_t end = findStatement(content, "ENDSEC", start);
    if (end == std::string_view::npos) {
        end = content.size();
    }
    std::string_view header = content.substr(start, end - start);

    auto description = readRecord(header, "FILE_DESCRIPTION", verbose);
    info.description = stringsAt(description, 0);
    info.implementationLevel = stringAt(description, 1);

    auto name = readRecord(header, "FILE_NAME", verbose);
    info.fileName = stringAt(name, 0);
    info.timestamp = stringAt(name, 1);
    info.authors = stringsAt(name, 2);
    info.organizations = stringsAt(name, 3);
    info.preprocessorVersion = stringAt(name, 4);
    info.originatingSystem = stringAt(name, 5);
    info.authorization = stringAt(name, 6);

    auto schema = readRecord(header, "FILE_SCHEMA", verbose);
    info.schemas = stringsAt(schema, 0);

    return info;
}

} // namespace ifccore::step

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ifccore::step {

/**
 * @brief Contents of the STEP HEADER section
 */
struct HeaderInfo {
    std::vector<std::string> description;      // FILE_DESCRIPTION
    std::string implementationLevel;
    std::string fileName;                      // FILE_NAME
    std::string timestamp;
    std::vector<std::string> authors;
    std::vector<std::string> organizations;
    std::string preprocessorVersion;
    std::string originatingSystem;
    std::string authorization;
    std::vector<std::string> schemas;          // FILE_SCHEMA

    /**
     * @brief First declared schema (e.g. "IFC4"), empty when absent
     */
    std::string schema() const {
        return schemas.empty() ? std::string() : schemas.front();
    }
};

/**
 * @brief Parse the HEADER section; missing records leave fields empty
 * @param verbose Report malformed header records on std::cerr
 */
HeaderInfo parseHeader(std::string_view content, bool verbose = false);

} // namespace ifccore::step

/**
 * @file ManifestReader.hpp
 * @brief Loads the analyzer's file manifest.
 */

#pragma once

#include "domain/SourceFile.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace batchplanner::infrastructure {

/**
 * @struct Manifest
 * @brief Files in manifest order, plus entries that could not be read.
 */
struct Manifest {
    std::string projectRoot;                ///< Empty when the manifest does not name one.
    std::vector<domain::SourceFileRef> files;
    std::vector<std::string> errors;        ///< One message per unusable entry.
};

/**
 * @class ManifestReader
 * @brief Accepts a bare array of entries or an object with "projectRoot" and "files".
 *
 * Entry keys: path (or filePath/relativePath), tokenCount (or tokenEstimate/tokens,
 * any estimator shape), size, language, structuralSummary (or codeStructure).
 */
class ManifestReader {
public:
    /// @throws std::runtime_error when the file cannot be opened or is not JSON.
    static Manifest ReadFile(const std::string& path);

    static Manifest Parse(const nlohmann::json& document);
};

} // namespace batchplanner::infrastructure

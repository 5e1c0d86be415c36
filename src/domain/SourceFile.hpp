/**
 * @file SourceFile.hpp
 * @brief Analyzed source file handed to the planner.
 */

#pragma once

#include "domain/TokenEstimate.hpp"

#include <optional>
#include <string>
#include <vector>

namespace batchplanner::domain {

/**
 * @struct CodeSymbol
 * @brief Named declaration with 1-based line span (0 when unknown).
 */
struct CodeSymbol {
    std::string name;
    int startLine = 0;
    int endLine = 0;
};

struct DependencyLists {
    std::vector<std::string> internal;  ///< Project-relative imports.
    std::vector<std::string> external;  ///< Package imports.
};

/**
 * @struct StructuralSummary
 * @brief Language analyzer output for one file.
 */
struct StructuralSummary {
    std::string language;
    std::vector<std::string> imports;
    std::vector<std::string> exports;
    std::vector<CodeSymbol> functions;
    std::vector<CodeSymbol> classes;
    std::vector<CodeSymbol> interfaces;
    int nestingDepth = 0;
    double complexityScore = 0.0;
    int totalLines = 0;
    DependencyLists dependencies;
};

/**
 * @struct SourceFileRef
 * @brief One analyzed file. The path is unique within a planning run.
 */
struct SourceFileRef {
    std::string path;
    TokenEstimate tokenEstimate;
    long long sizeBytes = 0;
    std::string language;
    std::optional<StructuralSummary> structuralSummary;
};

/**
 * @struct PlannedFile
 * @brief A file paired with its position in the planner's input.
 */
struct PlannedFile {
    SourceFileRef ref;
    int originalIndex = 0;

    long long tokens() const { return ExtractTokenCount(ref.tokenEstimate); }
};

} // namespace batchplanner::domain

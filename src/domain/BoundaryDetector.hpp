/**
 * @file BoundaryDetector.hpp
 * @brief Contract for splitting one large file at code-semantic boundaries.
 */

#pragma once

#include "domain/SourceFile.hpp"

#include <optional>
#include <string>
#include <vector>

namespace batchplanner::domain {

/**
 * @enum BoundaryType
 * @brief Kinds of cut points, ordered by how safe it is to cut after them.
 */
enum class BoundaryType {
    None,
    Arbitrary,
    BlankLine,
    BlockEnd,
    FunctionEnd,
    InterfaceEnd,
    ClassEnd
};

inline int BoundaryPriority(BoundaryType type) {
    switch (type) {
        case BoundaryType::ClassEnd: return 10;
        case BoundaryType::InterfaceEnd: return 9;
        case BoundaryType::FunctionEnd: return 8;
        case BoundaryType::BlockEnd: return 6;
        case BoundaryType::BlankLine: return 4;
        case BoundaryType::Arbitrary: return 1;
        case BoundaryType::None: return 0;
    }
    return 0;
}

inline std::string BoundaryTypeToString(BoundaryType type) {
    switch (type) {
        case BoundaryType::ClassEnd: return "class";
        case BoundaryType::InterfaceEnd: return "interface";
        case BoundaryType::FunctionEnd: return "function";
        case BoundaryType::BlockEnd: return "module";
        case BoundaryType::BlankLine: return "blank";
        case BoundaryType::Arbitrary: return "arbitrary";
        case BoundaryType::None: return "none";
    }
    return "none";
}

/**
 * @struct Boundary
 * @brief A cut point after the given 1-based line.
 */
struct Boundary {
    int line = 0;
    BoundaryType type = BoundaryType::None;
    int priority = 0;
};

/**
 * @struct DetectedChunk
 * @brief One contiguous line range of the file.
 */
struct DetectedChunk {
    int startLine = 0;                  ///< 1-based inclusive.
    int endLine = 0;
    std::string content;                ///< Marker, carried imports, then the lines.
    long long estimatedTokens = 0;      ///< Share of the file total for the line range only.
    long long carriedContextTokens = 0;
    std::string type;                   ///< class-focused, function-focused, ..., mixed.
    std::vector<Boundary> boundaries;   ///< Boundaries inside the range.
    bool hasCarriedImports = false;
    bool hasChunkMarker = false;
    bool hasComments = false;
    bool hasImports = false;
};

struct DetectionResult {
    bool success = false;
    std::string language;
    std::vector<DetectedChunk> chunks;
    std::optional<std::string> error;
};

/**
 * @class BoundaryDetector
 * @brief Proposes chunks near a token target, cutting at structural boundaries.
 *
 * Implementations never throw on malformed code. success is false only when no
 * segmentation is possible at all. When fileTokens is positive the chunk
 * estimates sum to exactly fileTokens; otherwise they come from the content.
 */
class BoundaryDetector {
public:
    virtual ~BoundaryDetector() = default;

    virtual DetectionResult detect(const std::string& path,
                                   const std::string& content,
                                   const std::optional<StructuralSummary>& summary,
                                   long long targetTokens,
                                   long long fileTokens) const = 0;
};

} // namespace batchplanner::domain

/**
 * @file Batch.hpp
 * @brief Unified unit of work produced by every batching strategy.
 */

#pragma once

#include "domain/TokenEstimate.hpp"

#include <optional>
#include <string>
#include <vector>

namespace batchplanner::domain {

/**
 * @enum BatchKind
 * @brief Which strategy shape a batch has.
 */
enum class BatchKind {
    Combined,   ///< Several small files.
    Single,     ///< One medium file.
    Chunk       ///< One slice of a large file.
};

inline std::string BatchKindToString(BatchKind kind) {
    switch (kind) {
        case BatchKind::Combined: return "combined_batch";
        case BatchKind::Single: return "single_batch";
        case BatchKind::Chunk: return "large_file_chunk";
    }
    return "combined_batch";
}

/// Strategy tag a batch of the given kind must carry.
inline std::string StrategyTagFor(BatchKind kind) {
    switch (kind) {
        case BatchKind::Combined: return "combined";
        case BatchKind::Single: return "single";
        case BatchKind::Chunk: return "largeMulti";
    }
    return "combined";
}

struct BatchMember {
    std::string path;
    TokenEstimate tokenEstimate;
    long long sizeBytes = 0;
    std::string language;
    int originalIndex = 0;
    double priority = 0.0;
};

/**
 * @struct IntegrationPoint
 * @brief Structural boundary inside a chunk the consumer may stitch on.
 */
struct IntegrationPoint {
    int line = 0;
    std::string type;
    int priority = 0;
};

struct ReconstructionInfo {
    int position = 0;
    int total = 0;
    bool needsContextFromPrevious = false;
    bool providesContextForNext = false;
    bool hasOverlap = false;
    std::vector<IntegrationPoint> integrationPoints;
};

/**
 * @struct ChunkInfo
 * @brief Slice description for Chunk batches.
 */
struct ChunkInfo {
    int chunkIndex = 1;                 ///< 1-based.
    int totalChunks = 1;
    int startLine = 0;                  ///< 1-based inclusive, 0 when content was unavailable.
    int endLine = 0;
    std::string content;
    std::string splitType;
    long long estimatedTokens = 0;
    long long carriedContextTokens = 0; ///< Tokens of carried-forward imports, outside the line range.
    int splitQuality = 0;               ///< 0-100.
    bool isFallback = false;
    int processingOrder = 0;
    ReconstructionInfo reconstruction;
};

struct ParentFileRef {
    std::string path;
    long long totalTokens = 0;
    int originalIndex = 0;
};

/**
 * @struct ProcessingHints
 * @brief Advice for the downstream generator. Fields unused by a kind stay empty.
 */
struct ProcessingHints {
    std::string analysisDepth;
    std::vector<std::string> focusAreas;
    std::vector<std::string> specialHandling;
    std::vector<std::string> specialInstructions;
    std::string documentationStyle;
    bool contextAware = true;
    bool crossFileReferences = false;
    bool preserveRelationships = false;
    bool requiresIntegration = false;
    bool isFirstChunk = false;
    bool isLastChunk = false;
    long long avgTokensPerFile = 0;
    std::vector<std::string> directories;
    std::vector<std::string> extensions;
    std::vector<std::string> modules;
};

/**
 * @struct FileInsights
 * @brief Scores attached to Single batches.
 */
struct FileInsights {
    int importance = 0;
    int complexity = 0;
    int qualityScore = 0;
    std::string sizeCategory;
    std::string projectContext;
    std::string moduleContext;
    std::string architecturalRole;
    std::vector<std::string> relatedFiles;
};

struct BatchMetadata {
    std::string description;
    int efficiency = 0;                 ///< 0-100.
    ProcessingHints processingHints;
    std::optional<FileInsights> fileInsights;
};

/**
 * @struct Batch
 * @brief One unit of downstream work.
 *
 * Single and Chunk batches hold exactly one member. Chunk batches also carry
 * chunkInfo and parentFileRef.
 */
struct Batch {
    std::string id;
    BatchKind kind = BatchKind::Combined;
    std::string strategyTag;
    long long estimatedTokens = 0;
    std::vector<BatchMember> members;
    BatchMetadata metadata;
    int batchIndex = 0;
    int totalBatches = 0;
    std::optional<ChunkInfo> chunkInfo;
    std::optional<ParentFileRef> parentFileRef;
};

struct BatchValidationReport {
    bool isValid = true;
    std::vector<std::string> errors;
};

/// Structural check: required fields, member count per kind, chunk fields.
bool ValidateBatch(const Batch& batch);

/**
 * @brief Full check including tag consistency, token conservation and chunk ranges.
 * @param maxMembers Member cap for Combined batches, 0 to skip.
 */
BatchValidationReport ValidateBatchDetailed(const Batch& batch, int maxMembers = 0);

/// Throws std::logic_error listing the problems when the batch is invalid.
void EnsureValidBatch(const Batch& batch, int maxMembers = 0);

} // namespace batchplanner::domain

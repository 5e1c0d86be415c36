/**
 * @file PlannerConfig.hpp
 * @brief Planning thresholds and heuristic weights.
 *
 * Built once (defaults or ConfigLoader) and passed by value to every
 * strategy. Nothing mutates it during a run.
 */

#pragma once

#include <string>
#include <vector>

namespace batchplanner::domain {

/**
 * @struct RelationshipWeights
 * @brief Score contributions when deciding which small files belong together.
 */
struct RelationshipWeights {
    int sameDirectory = 5;
    int similarName = 3;
    int sameExtension = 2;
    int importDependency = 8;
    int sameModule = 6;
    int similarSize = 1;
    double nameSimilarityThreshold = 0.6;   ///< Normalized edit-distance similarity.
    double sizeRatioThreshold = 0.7;        ///< min/max token ratio.
};

/**
 * @struct SplitQualityWeights
 * @brief Weights of the five chunk-quality components. They sum to 1.
 */
struct SplitQualityWeights {
    double structuralIntegrity = 0.30;
    double contextPreservation = 0.25;
    double sizeBalance = 0.20;
    double dependencyHandling = 0.15;
    double readability = 0.10;
    int fallbackScore = 30;
};

struct PlannerConfig {
    // Size buckets
    long long smallFileMaxTokens = 15000;
    long long mediumFileMaxTokens = 20000;

    // Combined batches
    long long targetBatchSize = 18000;
    long long maxBatchSize = 22000;
    long long minBatchSize = 8000;
    int maxFilesPerBatch = 12;
    bool enableSmartGrouping = true;
    RelationshipWeights relationshipWeights;

    // Single-file batches
    long long singleBasicBandMax = 16000;           ///< Below: basic analysis.
    long long singleComprehensiveBandMax = 18000;   ///< Below: comprehensive, else detailed.
    bool addContextInfo = true;

    // Large-file chunks
    long long targetChunkSize = 18000;
    long long chunkOverlapTokens = 500;
    double boundaryTolerance = 0.05;
    double minChunkFillRatio = 0.5;
    bool carryForwardImports = true;
    int maxConcurrentReads = 4;
    SplitQualityWeights splitQualityWeights;

    // Intake
    long long maxPlausibleTokens = 5000000;

    /// Human-readable list of inconsistent settings; empty when usable.
    std::vector<std::string> validate() const;
};

} // namespace batchplanner::domain

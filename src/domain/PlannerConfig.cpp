#include "domain/PlannerConfig.hpp"

#include <cmath>

namespace batchplanner::domain {

std::vector<std::string> PlannerConfig::validate() const {
    std::vector<std::string> problems;

    if (smallFileMaxTokens <= 0) problems.push_back("smallFileMaxTokens must be positive");
    if (mediumFileMaxTokens <= smallFileMaxTokens) {
        problems.push_back("mediumFileMaxTokens must be greater than smallFileMaxTokens");
    }
    if (minBatchSize < 0) problems.push_back("minBatchSize must not be negative");
    if (minBatchSize > targetBatchSize) problems.push_back("minBatchSize must not exceed targetBatchSize");
    if (targetBatchSize <= 0) problems.push_back("targetBatchSize must be positive");
    if (targetBatchSize > maxBatchSize) problems.push_back("targetBatchSize must not exceed maxBatchSize");
    if (maxFilesPerBatch < 1) problems.push_back("maxFilesPerBatch must be at least 1");

    if (singleBasicBandMax > singleComprehensiveBandMax) {
        problems.push_back("singleBasicBandMax must not exceed singleComprehensiveBandMax");
    }

    if (targetChunkSize <= 0) problems.push_back("targetChunkSize must be positive");
    if (chunkOverlapTokens < 0) problems.push_back("chunkOverlapTokens must not be negative");
    if (chunkOverlapTokens >= targetChunkSize) {
        problems.push_back("chunkOverlapTokens must be smaller than targetChunkSize");
    }
    if (boundaryTolerance < 0.0 || boundaryTolerance > 1.0) {
        problems.push_back("boundaryTolerance must be within [0, 1]");
    }
    if (minChunkFillRatio < 0.0 || minChunkFillRatio > 1.0) {
        problems.push_back("minChunkFillRatio must be within [0, 1]");
    }
    if (maxConcurrentReads < 1) problems.push_back("maxConcurrentReads must be at least 1");
    if (maxPlausibleTokens <= mediumFileMaxTokens) {
        problems.push_back("maxPlausibleTokens must be greater than mediumFileMaxTokens");
    }

    const auto& w = splitQualityWeights;
    double weightSum = w.structuralIntegrity + w.contextPreservation + w.sizeBalance +
                       w.dependencyHandling + w.readability;
    if (std::fabs(weightSum - 1.0) > 1e-6) {
        problems.push_back("splitQualityWeights must sum to 1");
    }
    if (w.fallbackScore < 0 || w.fallbackScore > 100) {
        problems.push_back("splitQualityWeights.fallbackScore must be within [0, 100]");
    }

    return problems;
}

} // namespace batchplanner::domain

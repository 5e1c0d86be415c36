/**
 * @file LargeFileMultiBatchStrategy.hpp
 * @brief Splits large files into ordered chunk batches.
 */

#pragma once

#include "application/StrategyResult.hpp"
#include "domain/BoundaryDetector.hpp"
#include "domain/Cancellation.hpp"
#include "domain/ContentReader.hpp"
#include "domain/PlannerConfig.hpp"
#include "domain/SourceFile.hpp"

#include <memory>
#include <vector>

namespace batchplanner::application {

/**
 * @struct SplitQuality
 * @brief Component scores (0-100) of one chunk and their weighted total.
 */
struct SplitQuality {
    int structuralIntegrity = 0;
    int contextPreservation = 0;
    int sizeBalance = 0;
    int dependencyHandling = 0;
    int readability = 0;
    int overall = 0;
};

/**
 * @class LargeFileMultiBatchStrategy
 * @brief Reads each large file, cuts it at structural boundaries and scores the cuts.
 *
 * Files are processed concurrently (at most maxConcurrentReads at a time), each
 * into its own slot, and merged in input order. Unreadable files and files the
 * detector cannot segment fall back to equal line ranges.
 */
class LargeFileMultiBatchStrategy {
public:
    LargeFileMultiBatchStrategy(domain::PlannerConfig config,
                                std::shared_ptr<domain::BoundaryDetector> detector,
                                std::shared_ptr<domain::ContentReader> reader);

    /**
     * @brief Chunks every file at or above mediumFileMaxTokens.
     * @param cancellation Checked before each wave of files; may be null.
     * @throws domain::PlanningCancelledError
     */
    StrategyResult generateBatches(const std::vector<domain::PlannedFile>& files,
                                   const domain::CancellationToken* cancellation = nullptr) const;

    SplitQuality scoreChunk(const domain::DetectedChunk& chunk) const;

private:
    std::vector<domain::Batch> processFile(const domain::PlannedFile& file, int fileOrdinal) const;

    std::vector<domain::Batch> buildChunkBatches(const domain::PlannedFile& file, int fileOrdinal,
                                                 const domain::DetectionResult& detection) const;

    /// Equal line ranges; content is null when the file could not be read.
    std::vector<domain::Batch> buildFallbackBatches(const domain::PlannedFile& file, int fileOrdinal,
                                                    const std::string* content) const;

    domain::PlannerConfig m_config;
    std::shared_ptr<domain::BoundaryDetector> m_detector;
    std::shared_ptr<domain::ContentReader> m_reader;
};

} // namespace batchplanner::application

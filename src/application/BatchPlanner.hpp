/**
 * @file BatchPlanner.hpp
 * @brief Routes analyzed files to the batching strategies and assembles the plan.
 */

#pragma once

#include "application/CombinedFileBatchStrategy.hpp"
#include "application/LargeFileMultiBatchStrategy.hpp"
#include "application/SingleFileBatchStrategy.hpp"
#include "domain/Cancellation.hpp"
#include "domain/Task.hpp"

#include <memory>
#include <vector>

namespace batchplanner::application {

struct PlanSummary {
    int totalFiles = 0;
    int smallFiles = 0;
    int mediumFiles = 0;
    int largeFiles = 0;
    int rejectedFiles = 0;
    int combinedBatches = 0;
    int singleBatches = 0;
    int chunkBatches = 0;
    int fallbackChunks = 0;
    long long totalTokens = 0;      ///< Tokens across all batches.
    int averageEfficiency = 0;
};

/**
 * @struct PlanResult
 * @brief Ordered batches (Combined, then Single, then Chunk) and the files left out.
 */
struct PlanResult {
    std::vector<domain::Batch> batches;
    std::vector<domain::FileRejection> rejections;
    PlanSummary summary;
};

/**
 * @class BatchPlanner
 * @brief Pure planning pass from analyzed files to batches.
 *
 * Every input file ends up in exactly one batch, one chunk family, or one
 * rejection. A file a strategy refuses is re-routed once to the strategy
 * its size points to; if that one refuses too it is reported unplannable.
 */
class BatchPlanner {
public:
    BatchPlanner(domain::PlannerConfig config,
                 std::shared_ptr<domain::BoundaryDetector> detector,
                 std::shared_ptr<domain::ContentReader> reader);

    /**
     * @brief Builds the plan.
     * @param cancellation Checked between files and strategies; may be null.
     * @throws domain::PlanningCancelledError when cancelled. No partial plan is returned.
     */
    PlanResult plan(const std::vector<domain::SourceFileRef>& files,
                    const domain::CancellationToken* cancellation = nullptr) const;

    /// Wraps each batch into a Pending task named task_1..N.
    static std::vector<domain::Task> ToTasks(const PlanResult& plan);

    const domain::PlannerConfig& getConfig() const { return m_config; }

private:
    void verifyCoverage(const std::vector<domain::SourceFileRef>& files, const PlanResult& plan) const;

    domain::PlannerConfig m_config;
    CombinedFileBatchStrategy m_combined;
    SingleFileBatchStrategy m_single;
    LargeFileMultiBatchStrategy m_large;
};

} // namespace batchplanner::application

/**
 * @file CombinedFileBatchStrategy.hpp
 * @brief Packs small related files into shared batches.
 */

#pragma once

#include "application/StrategyResult.hpp"
#include "domain/PlannerConfig.hpp"
#include "domain/SourceFile.hpp"

#include <vector>

namespace batchplanner::application {

/**
 * @struct BatchArena
 * @brief Batches as indices over an immutable file list.
 *
 * Files never move in memory, only their entry in the assignment array changes.
 */
struct BatchArena {
    std::vector<long long> fileTokens;
    std::vector<int> assignment;        ///< file -> batch, -1 until packed
    std::vector<int> sequence;          ///< member order inside a batch
    std::vector<long long> batchTokens;
    std::vector<int> batchCounts;
    int nextSequence = 0;

    int addFile(long long tokens);
    int newBatch();
    void assign(int file, int batch);
    std::vector<int> membersOf(int batch) const;
};

/**
 * @class CombinedFileBatchStrategy
 * @brief Groups small files by relationship, bin-packs each group, then rebalances.
 *
 * Every batch stays within maxBatchSize and maxFilesPerBatch unless a single
 * file alone exceeds the token cap, in which case it is emitted on its own.
 */
class CombinedFileBatchStrategy {
public:
    explicit CombinedFileBatchStrategy(domain::PlannerConfig config);

    /**
     * @brief Builds Combined batches from files below smallFileMaxTokens.
     * @param files Input files with their planner positions.
     * @return Batches numbered combined_batch_1..N, plus rejections for files out of range.
     */
    StrategyResult generateBatches(const std::vector<domain::PlannedFile>& files) const;

    /**
     * @brief Merges under-filled batches into their successor, then moves the
     * smallest files out of batches above maxBatchSize.
     *
     * Packing never overfills a batch of several files, so migration only acts
     * on arenas built by other means. Batches may be left empty.
     */
    void rebalance(BatchArena& arena) const;

    /// Sum of the configured weights for every relationship the two files share.
    int relationshipScore(const domain::PlannedFile& a, const domain::PlannedFile& b) const;

    /// Entry points and configs first, then larger files (up to +5).
    static double FilePriority(const domain::PlannedFile& file);

private:
    domain::PlannerConfig m_config;
};

} // namespace batchplanner::application

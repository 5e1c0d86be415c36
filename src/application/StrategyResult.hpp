/**
 * @file StrategyResult.hpp
 * @brief Output shared by the batching strategies.
 */

#pragma once

#include "domain/Batch.hpp"
#include "domain/Rejection.hpp"

#include <vector>

namespace batchplanner::application {

struct StrategyResult {
    std::vector<domain::Batch> batches;
    std::vector<domain::FileRejection> rejections;  ///< Files outside the strategy's size range.
};

} // namespace batchplanner::application

/**
 * @file PlanJsonCodec.hpp
 * @brief JSON conversion of planner inputs and outputs.
 */

#pragma once

#include "domain/Batch.hpp"
#include "domain/Rejection.hpp"
#include "domain/SourceFile.hpp"
#include "domain/Task.hpp"

#include <nlohmann/json_fwd.hpp>

namespace batchplanner::infrastructure {

/**
 * @class PlanJsonCodec
 * @brief Reads analyzer output and writes plan documents.
 *
 * Readers are lenient about shape (estimators report counts as plain numbers
 * or as objects) and strict about types inside a recognized shape.
 */
class PlanJsonCodec {
public:
    /**
     * @brief Token count from any estimator shape.
     *
     * Numbers are read directly (negatives as 0). Objects yield totalTokens,
     * then safeTokenCount, then estimatedTokens, looking into "details" too.
     * Anything else is 0.
     */
    static long long ExtractTokenCount(const nlohmann::json& value);

    static domain::TokenEstimate TokenEstimateFromJson(const nlohmann::json& value);
    static domain::StructuralSummary StructuralSummaryFromJson(const nlohmann::json& value);

    static nlohmann::json ToJson(const domain::TokenEstimate& estimate);
    static nlohmann::json ToJson(const domain::Batch& batch);
    static nlohmann::json ToJson(const domain::Task& task);
    static nlohmann::json ToJson(const domain::FileRejection& rejection);
};

} // namespace batchplanner::infrastructure

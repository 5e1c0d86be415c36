/**
 * @file PlanExportService.hpp
 * @brief Turns a plan into the JSON document handed to the generator.
 */

#pragma once

#include "application/BatchPlanner.hpp"

#include <nlohmann/json_fwd.hpp>
#include <vector>

namespace batchplanner::application {

class PlanExportService {
public:
    /**
     * @brief Builds {summary, batches, rejections} and, when given, tasks.
     */
    static nlohmann::json ToJson(const PlanResult& plan, const std::vector<domain::Task>* tasks = nullptr);

    static nlohmann::json SummaryToJson(const PlanSummary& summary);
};

} // namespace batchplanner::application

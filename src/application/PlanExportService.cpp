#include "application/PlanExportService.hpp"
#include "infrastructure/PlanJsonCodec.hpp"

#include <nlohmann/json.hpp>

namespace batchplanner::application {

using json = nlohmann::json;
using infrastructure::PlanJsonCodec;

json PlanExportService::SummaryToJson(const PlanSummary& summary) {
    return json{
        {"totalFiles", summary.totalFiles},
        {"smallFiles", summary.smallFiles},
        {"mediumFiles", summary.mediumFiles},
        {"largeFiles", summary.largeFiles},
        {"rejectedFiles", summary.rejectedFiles},
        {"combinedBatches", summary.combinedBatches},
        {"singleBatches", summary.singleBatches},
        {"chunkBatches", summary.chunkBatches},
        {"fallbackChunks", summary.fallbackChunks},
        {"totalTokens", summary.totalTokens},
        {"averageEfficiency", summary.averageEfficiency},
    };
}

json PlanExportService::ToJson(const PlanResult& plan, const std::vector<domain::Task>* tasks) {
    json batches = json::array();
    for (const auto& batch : plan.batches) {
        batches.push_back(PlanJsonCodec::ToJson(batch));
    }

    json rejections = json::array();
    for (const auto& rejection : plan.rejections) {
        rejections.push_back(PlanJsonCodec::ToJson(rejection));
    }

    json document{
        {"summary", SummaryToJson(plan.summary)},
        {"batches", batches},
        {"rejections", rejections},
    };

    if (tasks != nullptr) {
        json taskList = json::array();
        for (const auto& task : *tasks) {
            taskList.push_back(PlanJsonCodec::ToJson(task));
        }
        document["tasks"] = taskList;
    }
    return document;
}

} // namespace batchplanner::application

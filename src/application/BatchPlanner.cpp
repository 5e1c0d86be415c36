/**
 * @file BatchPlanner.cpp
 * @brief Implementation of BatchPlanner.
 */

#include "application/BatchPlanner.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

namespace batchplanner::application {

namespace {

const char* kPlannerTag = "planner";

void Append(std::vector<domain::Batch>& into, std::vector<domain::Batch>& from) {
    for (auto& batch : from) into.push_back(std::move(batch));
}

domain::FileRejection Unplannable(const domain::FileRejection& second) {
    domain::FileRejection rejection = second;
    rejection.reason = domain::RejectionReason::Unplannable;
    rejection.detail = "re-routed after single-file rejection, then " +
                       domain::RejectionReasonToString(second.reason) + " for " + second.strategy + ": " +
                       second.detail;
    return rejection;
}

} // namespace

BatchPlanner::BatchPlanner(domain::PlannerConfig config,
                           std::shared_ptr<domain::BoundaryDetector> detector,
                           std::shared_ptr<domain::ContentReader> reader)
    : m_config(config),
      m_combined(config),
      m_single(config),
      m_large(config, std::move(detector), std::move(reader)) {}

PlanResult BatchPlanner::plan(const std::vector<domain::SourceFileRef>& files,
                              const domain::CancellationToken* cancellation) const {
    auto checkCancelled = [cancellation](const char* where) {
        if (cancellation != nullptr) cancellation->throwIfCancelled(where);
    };

    PlanResult result;
    result.summary.totalFiles = static_cast<int>(files.size());

    std::set<std::string> seen;
    std::vector<domain::PlannedFile> small;
    std::vector<domain::PlannedFile> medium;
    std::vector<domain::PlannedFile> large;

    for (size_t i = 0; i < files.size(); ++i) {
        checkCancelled("intake");
        const domain::SourceFileRef& ref = files[i];
        const int index = static_cast<int>(i);
        const long long tokens = domain::ExtractTokenCount(ref.tokenEstimate);

        if (!seen.insert(ref.path).second) {
            std::cerr << "[BatchPlanner] Duplicate path " << ref.path << " at position " << index << std::endl;
            result.rejections.push_back({ref.path, index, tokens, domain::RejectionReason::DuplicatePath,
                                         "path already listed earlier in the input", kPlannerTag});
            continue;
        }
        if (ref.tokenEstimate.hasError()) {
            std::cerr << "[BatchPlanner] Token estimation failed for " << ref.path << ": "
                      << *ref.tokenEstimate.metadata->error << std::endl;
            result.rejections.push_back({ref.path, index, 0, domain::RejectionReason::EstimationError,
                                         *ref.tokenEstimate.metadata->error, kPlannerTag});
            continue;
        }
        if (tokens > m_config.maxPlausibleTokens) {
            std::cerr << "[BatchPlanner] Implausible token count for " << ref.path << ": " << tokens << std::endl;
            result.rejections.push_back({ref.path, index, tokens, domain::RejectionReason::SizeMismatch,
                                         "token count above maxPlausibleTokens (" +
                                             std::to_string(m_config.maxPlausibleTokens) + ")",
                                         kPlannerTag});
            continue;
        }

        domain::PlannedFile planned{ref, index};
        if (tokens < m_config.smallFileMaxTokens) {
            small.push_back(std::move(planned));
        } else if (tokens < m_config.mediumFileMaxTokens) {
            medium.push_back(std::move(planned));
        } else {
            large.push_back(std::move(planned));
        }
    }

    result.summary.smallFiles = static_cast<int>(small.size());
    result.summary.mediumFiles = static_cast<int>(medium.size());
    result.summary.largeFiles = static_cast<int>(large.size());

    checkCancelled("single-file batching");
    StrategyResult single = m_single.generateBatches(medium);

    std::set<int> rerouted;
    for (const auto& rejection : single.rejections) {
        auto it = std::find_if(medium.begin(), medium.end(), [&rejection](const domain::PlannedFile& f) {
            return f.originalIndex == rejection.originalIndex;
        });
        if (it == medium.end()) {
            result.rejections.push_back(rejection);
            continue;
        }
        rerouted.insert(it->originalIndex);
        if (rejection.reason == domain::RejectionReason::TooSmall) {
            small.push_back(*it);
        } else {
            large.push_back(*it);
        }
    }

    auto orderByIndex = [](const domain::PlannedFile& a, const domain::PlannedFile& b) {
        return a.originalIndex < b.originalIndex;
    };
    std::sort(small.begin(), small.end(), orderByIndex);
    std::sort(large.begin(), large.end(), orderByIndex);

    checkCancelled("combined batching");
    StrategyResult combined = m_combined.generateBatches(small);

    checkCancelled("large-file chunking");
    StrategyResult chunked = m_large.generateBatches(large, cancellation);

    for (const auto* secondPass : {&combined.rejections, &chunked.rejections}) {
        for (const auto& rejection : *secondPass) {
            if (rerouted.count(rejection.originalIndex)) {
                std::cerr << "[BatchPlanner] " << rejection.path << " fits no strategy" << std::endl;
                result.rejections.push_back(Unplannable(rejection));
            } else {
                result.rejections.push_back(rejection);
            }
        }
    }

    Append(result.batches, combined.batches);
    Append(result.batches, single.batches);
    Append(result.batches, chunked.batches);

    std::stable_sort(result.rejections.begin(), result.rejections.end(),
                     [](const domain::FileRejection& a, const domain::FileRejection& b) {
                         return a.originalIndex < b.originalIndex;
                     });

    int efficiencySum = 0;
    for (const auto& batch : result.batches) {
        domain::EnsureValidBatch(batch, m_config.maxFilesPerBatch);
        result.summary.totalTokens += batch.estimatedTokens;
        efficiencySum += batch.metadata.efficiency;
        switch (batch.kind) {
            case domain::BatchKind::Combined: ++result.summary.combinedBatches; break;
            case domain::BatchKind::Single: ++result.summary.singleBatches; break;
            case domain::BatchKind::Chunk:
                ++result.summary.chunkBatches;
                if (batch.chunkInfo->isFallback) ++result.summary.fallbackChunks;
                break;
        }
    }
    result.summary.rejectedFiles = static_cast<int>(result.rejections.size());
    if (!result.batches.empty()) {
        result.summary.averageEfficiency = efficiencySum / static_cast<int>(result.batches.size());
    }

    verifyCoverage(files, result);

    std::cout << "[BatchPlanner] Planned " << result.summary.totalFiles << " files into " << result.batches.size()
              << " batches (" << result.summary.combinedBatches << " combined, " << result.summary.singleBatches
              << " single, " << result.summary.chunkBatches << " chunks), " << result.summary.rejectedFiles
              << " rejected" << std::endl;
    return result;
}

void BatchPlanner::verifyCoverage(const std::vector<domain::SourceFileRef>& files, const PlanResult& plan) const {
    std::map<std::string, int> occurrences;
    for (const auto& batch : plan.batches) {
        if (batch.kind == domain::BatchKind::Chunk) {
            if (batch.chunkInfo->chunkIndex == 1) ++occurrences[batch.parentFileRef->path];
        } else {
            for (const auto& member : batch.members) ++occurrences[member.path];
        }
    }
    for (const auto& rejection : plan.rejections) {
        if (rejection.reason != domain::RejectionReason::DuplicatePath) ++occurrences[rejection.path];
    }

    std::set<std::string> checked;
    for (const auto& file : files) {
        if (!checked.insert(file.path).second) continue;
        int count = occurrences[file.path];
        if (count != 1) {
            throw std::logic_error("Plan accounts for " + file.path + " " + std::to_string(count) +
                                   " times instead of once");
        }
    }
}

std::vector<domain::Task> BatchPlanner::ToTasks(const PlanResult& plan) {
    std::vector<domain::Task> tasks;
    tasks.reserve(plan.batches.size());
    for (size_t i = 0; i < plan.batches.size(); ++i) {
        tasks.push_back(domain::Task::FromBatch("task_" + std::to_string(i + 1), plan.batches[i]));
    }
    return tasks;
}

} // namespace batchplanner::application

#undef NDEBUG
#include <cassert>
#include <iostream>
#include <map>
#include <memory>

#include <nlohmann/json.hpp>

#include "application/BatchPlanner.hpp"
#include "application/PlanExportService.hpp"

using namespace batchplanner;
using application::BatchPlanner;

class MockContentReader : public domain::ContentReader {
public:
    std::string read(const std::string& path) const override {
        if (path == "src/engine.cpp") {
            std::string content;
            for (int i = 0; i < 100; ++i) content += "step();\n";
            return content;
        }
        throw domain::ContentReadError(path, "not in fixture");
    }
};

// Always cuts a file in two halves of fixed size.
class MockBoundaryDetector : public domain::BoundaryDetector {
public:
    domain::DetectionResult detect(const std::string&, const std::string&,
                                   const std::optional<domain::StructuralSummary>&, long long,
                                   long long) const override {
        domain::DetectionResult result;
        result.success = true;
        result.language = "cpp";

        domain::DetectedChunk first;
        first.startLine = 1;
        first.endLine = 50;
        first.estimatedTokens = 12000;
        first.type = "function-focused";
        first.hasChunkMarker = true;
        first.boundaries.push_back({50, domain::BoundaryType::FunctionEnd, 8});

        domain::DetectedChunk second = first;
        second.startLine = 51;
        second.endLine = 100;
        second.estimatedTokens = 13000;
        second.boundaries = {{100, domain::BoundaryType::FunctionEnd, 8}};

        result.chunks = {first, second};
        return result;
    }
};

static domain::SourceFileRef Ref(const std::string& path, long long tokens) {
    domain::SourceFileRef ref;
    ref.path = path;
    ref.tokenEstimate = domain::MakeTokenEstimate(tokens);
    ref.language = "typescript";
    return ref;
}

static std::vector<domain::SourceFileRef> MixedInput() {
    return {
        Ref("src/util/a.ts", 3000),
        Ref("src/services/order.service.ts", 17000),
        Ref("src/util/b.ts", 4000),
        Ref("src/engine.cpp", 25000),
        Ref("src/util/a.ts", 3000),
        [] {
            domain::SourceFileRef broken;
            broken.path = "src/broken.ts";
            broken.tokenEstimate = domain::MakeErrorTokenEstimate("src/broken.ts", "tokenizer crashed");
            return broken;
        }(),
        Ref("dist/bundle.js", 6000000),
    };
}

static BatchPlanner MakePlanner() {
    return BatchPlanner(domain::PlannerConfig{}, std::make_shared<MockBoundaryDetector>(),
                        std::make_shared<MockContentReader>());
}

static void TestMixedPlan() {
    std::cout << "[Test] Mixed input plan..." << std::endl;
    BatchPlanner planner = MakePlanner();
    auto plan = planner.plan(MixedInput());

    assert(plan.batches.size() == 4);
    assert(plan.batches[0].id == "combined_batch_1");
    assert(plan.batches[0].members.size() == 2);
    assert(plan.batches[1].id == "single_batch_1");
    assert(plan.batches[1].members[0].originalIndex == 1);
    assert(plan.batches[2].id == "large_file_1_1");
    assert(plan.batches[3].id == "large_file_1_2");
    assert(plan.batches[3].parentFileRef->originalIndex == 3);

    assert(plan.rejections.size() == 3);
    assert(plan.rejections[0].reason == domain::RejectionReason::DuplicatePath);
    assert(plan.rejections[0].originalIndex == 4);
    assert(plan.rejections[1].reason == domain::RejectionReason::EstimationError);
    assert(plan.rejections[1].detail == "tokenizer crashed");
    assert(plan.rejections[2].reason == domain::RejectionReason::SizeMismatch);
    assert(plan.rejections[2].strategy == "planner");

    const auto& summary = plan.summary;
    assert(summary.totalFiles == 7);
    assert(summary.smallFiles == 2);
    assert(summary.mediumFiles == 1);
    assert(summary.largeFiles == 1);
    assert(summary.rejectedFiles == 3);
    assert(summary.combinedBatches == 1);
    assert(summary.singleBatches == 1);
    assert(summary.chunkBatches == 2);
    assert(summary.fallbackChunks == 0);
    assert(summary.totalTokens == 7000 + 17000 + 25000);
    std::cout << "[PASS] Mixed input plan" << std::endl;
}

static void TestCoverageAndDeterminism() {
    std::cout << "[Test] Coverage and determinism..." << std::endl;
    BatchPlanner planner = MakePlanner();

    std::vector<domain::SourceFileRef> files;
    for (int i = 0; i < 25; ++i) {
        std::string dir = i % 2 == 0 ? "src/ui/" : "src/data/";
        files.push_back(Ref(dir + "part" + std::to_string(i) + ".ts", 700 + i * 431));
    }
    files.push_back(Ref("src/engine.cpp", 25000));
    files.push_back(Ref("src/other.cpp", 30000));   // unreadable, falls back

    auto first = planner.plan(files);
    auto second = planner.plan(files);

    std::map<std::string, int> seen;
    for (const auto& batch : first.batches) {
        if (batch.kind == domain::BatchKind::Chunk) {
            if (batch.chunkInfo->chunkIndex == 1) ++seen[batch.parentFileRef->path];
        } else {
            for (const auto& member : batch.members) ++seen[member.path];
        }
    }
    for (const auto& rejection : first.rejections) ++seen[rejection.path];
    for (const auto& file : files) assert(seen[file.path] == 1);

    assert(first.summary.fallbackChunks == 2);

    assert(first.batches.size() == second.batches.size());
    for (size_t i = 0; i < first.batches.size(); ++i) {
        assert(first.batches[i].id == second.batches[i].id);
        assert(first.batches[i].estimatedTokens == second.batches[i].estimatedTokens);
        assert(first.batches[i].members.size() == second.batches[i].members.size());
        for (size_t m = 0; m < first.batches[i].members.size(); ++m) {
            assert(first.batches[i].members[m].path == second.batches[i].members[m].path);
        }
    }

    // Kind order: Combined, then Single, then Chunk.
    int lastRank = 0;
    for (const auto& batch : first.batches) {
        int rank = static_cast<int>(batch.kind);
        assert(rank >= lastRank);
        lastRank = rank;
    }
    std::cout << "[PASS] Coverage and determinism" << std::endl;
}

static void TestEmptyInput() {
    std::cout << "[Test] Empty input..." << std::endl;
    BatchPlanner planner = MakePlanner();
    auto plan = planner.plan({});
    assert(plan.batches.empty());
    assert(plan.rejections.empty());
    assert(plan.summary.totalFiles == 0);
    assert(plan.summary.averageEfficiency == 0);
    std::cout << "[PASS] Empty input" << std::endl;
}

static void TestCancellation() {
    std::cout << "[Test] Cancelled planning..." << std::endl;
    BatchPlanner planner = MakePlanner();
    domain::CancellationToken token;
    token.cancel();

    bool threw = false;
    try {
        planner.plan(MixedInput(), &token);
    } catch (const domain::PlanningCancelledError& e) {
        threw = true;
        assert(std::string(e.what()) == "Planning cancelled during intake");
    }
    assert(threw);
    std::cout << "[PASS] Cancelled planning" << std::endl;
}

static void TestTasksAndExport() {
    std::cout << "[Test] Tasks and JSON export..." << std::endl;
    BatchPlanner planner = MakePlanner();
    auto plan = planner.plan(MixedInput());

    auto tasks = BatchPlanner::ToTasks(plan);
    assert(tasks.size() == plan.batches.size());
    assert(tasks[0].getId() == "task_1");
    assert(tasks[0].getType() == domain::TaskType::FileBatch);
    assert(tasks[1].getType() == domain::TaskType::SingleFile);
    assert(tasks[2].getType() == domain::TaskType::LargeFileChunk);
    assert(tasks[3].chunkProgressDescription().value() == "2/2");
    for (const auto& task : tasks) assert(task.getStatus() == domain::TaskStatus::Pending);

    nlohmann::json document = application::PlanExportService::ToJson(plan, &tasks);
    assert(document.at("summary").at("totalFiles") == 7);
    assert(document.at("batches").size() == 4);
    assert(document.at("rejections").size() == 3);
    assert(document.at("rejections")[0].at("reason") == "duplicate_path");
    assert(document.at("tasks").size() == 4);

    nlohmann::json withoutTasks = application::PlanExportService::ToJson(plan);
    assert(!withoutTasks.contains("tasks"));
    std::cout << "[PASS] Tasks and JSON export" << std::endl;
}

int main() {
    TestMixedPlan();
    TestCoverageAndDeterminism();
    TestEmptyInput();
    TestCancellation();
    TestTasksAndExport();
    std::cout << "[Test] All planner tests passed." << std::endl;
    return 0;
}

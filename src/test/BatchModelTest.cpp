#undef NDEBUG
#include <cassert>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "domain/Batch.hpp"
#include "domain/Task.hpp"
#include "infrastructure/PlanJsonCodec.hpp"

using namespace batchplanner::domain;

static BatchMember Member(const std::string& path, long long tokens, int index) {
    BatchMember member;
    member.path = path;
    member.tokenEstimate = MakeTokenEstimate(tokens);
    member.originalIndex = index;
    return member;
}

static Batch CombinedBatch() {
    Batch batch;
    batch.id = "combined_batch_1";
    batch.kind = BatchKind::Combined;
    batch.strategyTag = StrategyTagFor(BatchKind::Combined);
    batch.members = {Member("src/a.ts", 3000, 0), Member("src/b.ts", 4000, 1)};
    batch.estimatedTokens = 7000;
    batch.metadata.efficiency = 39;
    return batch;
}

static Batch ChunkBatch(int index, int total) {
    Batch batch;
    batch.id = "large_file_1_" + std::to_string(index);
    batch.kind = BatchKind::Chunk;
    batch.strategyTag = StrategyTagFor(BatchKind::Chunk);
    batch.members = {Member("src/huge.cpp", 45000, 4)};
    batch.estimatedTokens = 15000;

    ChunkInfo info;
    info.chunkIndex = index;
    info.totalChunks = total;
    info.startLine = 1;
    info.endLine = 1500;
    info.splitQuality = 80;
    batch.chunkInfo = info;
    batch.parentFileRef = ParentFileRef{"src/huge.cpp", 45000, 4};
    return batch;
}

static void TestValidation() {
    std::cout << "[Test] Batch validation..." << std::endl;

    Batch good = CombinedBatch();
    assert(ValidateBatch(good));
    assert(ValidateBatchDetailed(good, 12).isValid);
    EnsureValidBatch(good, 12);

    Batch drift = good;
    drift.estimatedTokens = 6999;
    auto report = ValidateBatchDetailed(drift);
    assert(!report.isValid);
    assert(report.errors.size() == 1);

    Batch tooMany = good;
    assert(!ValidateBatchDetailed(tooMany, 1).isValid);

    Batch wrongTag = good;
    wrongTag.strategyTag = "single";
    assert(!ValidateBatchDetailed(wrongTag).isValid);

    Batch singleWithTwo = good;
    singleWithTwo.kind = BatchKind::Single;
    singleWithTwo.strategyTag = "single";
    assert(!ValidateBatch(singleWithTwo));

    assert(ValidateBatchDetailed(ChunkBatch(2, 3)).isValid);
    assert(!ValidateBatchDetailed(ChunkBatch(4, 3)).isValid);

    Batch orphan = ChunkBatch(1, 3);
    orphan.parentFileRef.reset();
    assert(!ValidateBatch(orphan));

    bool threw = false;
    try {
        EnsureValidBatch(drift);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Batch validation" << std::endl;
}

static void TestTaskLifecycle() {
    std::cout << "[Test] Task lifecycle..." << std::endl;

    Task task = Task::FromBatch("task_1", CombinedBatch());
    assert(task.getStatus() == TaskStatus::Pending);
    assert(task.getType() == TaskType::FileBatch);
    assert(!task.isTerminal());
    assert(task.getTiming().estimatedDurationMs == 30000 + 14000 + 5000);

    task.start();
    assert(task.getStatus() == TaskStatus::InProgress);
    assert(task.getTiming().startedAt.has_value());
    assert(task.progressDescription() == "Processing batch of 2 files");

    task.fail("generator timed out");
    assert(task.isTerminal());
    assert(task.getErrorMessage().value() == "generator timed out");

    bool threw = false;
    try {
        task.start();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        task.cancel();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    Task pending = Task::FromBatch("task_2", ChunkBatch(2, 3));
    assert(pending.getType() == TaskType::LargeFileChunk);
    assert(pending.chunkProgressDescription().value() == "2/3");
    pending.cancel();
    assert(pending.getStatus() == TaskStatus::Cancelled);

    threw = false;
    try {
        Task::FromBatch("", CombinedBatch());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Task lifecycle" << std::endl;
}

static void TestBatchJson() {
    std::cout << "[Test] Batch JSON..." << std::endl;
    using batchplanner::infrastructure::PlanJsonCodec;

    nlohmann::json combined = PlanJsonCodec::ToJson(CombinedBatch());
    assert(combined.at("type") == "combined_batch");
    assert(combined.at("strategy") == "combined");
    assert(combined.at("fileCount") == 2);
    assert(combined.at("files").size() == 2);
    assert(!combined.contains("chunkInfo"));

    nlohmann::json chunk = PlanJsonCodec::ToJson(ChunkBatch(1, 3));
    assert(chunk.at("type") == "large_file_chunk");
    assert(chunk.at("chunkInfo").at("chunkIndex") == 1);
    assert(chunk.at("parentFileInfo").at("path") == "src/huge.cpp");

    Task task = Task::FromBatch("task_7", ChunkBatch(3, 3));
    nlohmann::json taskJson = PlanJsonCodec::ToJson(task);
    assert(taskJson.at("id") == "task_7");
    assert(taskJson.at("status") == "pending");
    std::cout << "[PASS] Batch JSON" << std::endl;
}

int main() {
    TestValidation();
    TestTaskLifecycle();
    TestBatchJson();
    std::cout << "[Test] All batch model tests passed." << std::endl;
    return 0;
}

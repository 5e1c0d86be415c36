#undef NDEBUG
#include <cassert>
#include <iostream>
#include <set>
#include <vector>

#include "application/CombinedFileBatchStrategy.hpp"

using namespace batchplanner;
using application::CombinedFileBatchStrategy;

static domain::PlannedFile File(const std::string& path, long long tokens, int index) {
    domain::PlannedFile file;
    file.ref.path = path;
    file.ref.tokenEstimate = domain::MakeTokenEstimate(tokens);
    file.ref.language = "typescript";
    file.originalIndex = index;
    return file;
}

static void CheckInvariants(const std::vector<domain::PlannedFile>& files,
                            const application::StrategyResult& result,
                            const domain::PlannerConfig& config) {
    std::set<int> seen;
    long long inputTokens = 0;
    for (const auto& file : files) inputTokens += file.tokens();

    long long batchTokens = 0;
    for (const auto& batch : result.batches) {
        assert(batch.kind == domain::BatchKind::Combined);
        assert(batch.strategyTag == "combined");
        assert(static_cast<int>(batch.members.size()) <= config.maxFilesPerBatch);
        assert(batch.members.size() == 1 || batch.estimatedTokens <= config.maxBatchSize);

        long long sum = 0;
        for (const auto& member : batch.members) {
            assert(seen.insert(member.originalIndex).second);
            sum += domain::ExtractTokenCount(member.tokenEstimate);
        }
        assert(sum == batch.estimatedTokens);
        batchTokens += sum;
    }
    assert(seen.size() == files.size());
    assert(batchTokens == inputTokens);
}

static void TestSameDirectoryScenario() {
    std::cout << "[Test] Three related small files..." << std::endl;
    domain::PlannerConfig config;
    CombinedFileBatchStrategy strategy(config);

    std::vector<domain::PlannedFile> files = {
        File("src/util/a.ts", 3000, 0),
        File("src/util/b.ts", 4000, 1),
        File("src/util/c.ts", 5000, 2),
    };
    auto result = strategy.generateBatches(files);
    assert(result.rejections.empty());
    assert(result.batches.size() == 1);

    const auto& batch = result.batches.front();
    assert(batch.id == "combined_batch_1");
    assert(batch.estimatedTokens == 12000);
    assert(batch.members.size() == 3);
    assert(batch.members[0].path == "src/util/a.ts");
    assert(batch.members[2].path == "src/util/c.ts");
    assert(batch.metadata.efficiency == 67);
    assert(batch.metadata.description == "Combined batch of 3 files (12,000 tokens): a.ts, b.ts, c.ts");
    assert(batch.metadata.processingHints.analysisDepth == "comprehensive");
    assert(batch.metadata.processingHints.crossFileReferences);
    assert(batch.metadata.processingHints.avgTokensPerFile == 4000);
    assert(batch.metadata.processingHints.directories.size() == 1);
    assert(batch.batchIndex == 1 && batch.totalBatches == 1);
    CheckInvariants(files, result, config);
    std::cout << "[PASS] Three related small files" << std::endl;
}

static void TestCapacityAcrossDirectories() {
    std::cout << "[Test] Capacity with many files..." << std::endl;
    domain::PlannerConfig config;
    CombinedFileBatchStrategy strategy(config);

    const std::vector<std::string> dirs = {"src/api", "src/models", "lib/core", "tests"};
    std::vector<domain::PlannedFile> files;
    for (int i = 0; i < 40; ++i) {
        long long tokens = 500 + (i * 977) % 9000;
        files.push_back(File(dirs[i % dirs.size()] + "/file" + std::to_string(i) + ".ts", tokens, i));
    }

    auto result = strategy.generateBatches(files);
    assert(result.rejections.empty());
    assert(!result.batches.empty());
    CheckInvariants(files, result, config);

    for (size_t i = 0; i < result.batches.size(); ++i) {
        assert(result.batches[i].id == "combined_batch_" + std::to_string(i + 1));
        assert(result.batches[i].totalBatches == static_cast<int>(result.batches.size()));
    }

    // Same input, same plan.
    auto again = strategy.generateBatches(files);
    assert(again.batches.size() == result.batches.size());
    for (size_t i = 0; i < again.batches.size(); ++i) {
        assert(again.batches[i].members.size() == result.batches[i].members.size());
        for (size_t m = 0; m < again.batches[i].members.size(); ++m) {
            assert(again.batches[i].members[m].path == result.batches[i].members[m].path);
        }
    }
    std::cout << "[PASS] Capacity with many files" << std::endl;
}

static void TestFileCap() {
    std::cout << "[Test] Member count cap..." << std::endl;
    domain::PlannerConfig config;
    CombinedFileBatchStrategy strategy(config);

    std::vector<domain::PlannedFile> files;
    for (int i = 0; i < 20; ++i) {
        files.push_back(File("src/icons/icon" + std::to_string(i) + ".ts", 100, i));
    }
    auto result = strategy.generateBatches(files);
    assert(result.batches.size() == 2);
    assert(result.batches[0].members.size() == 12);
    assert(result.batches[1].members.size() == 8);
    CheckInvariants(files, result, config);

    config.enableSmartGrouping = false;
    CombinedFileBatchStrategy flat(config);
    auto flatResult = flat.generateBatches(files);
    CheckInvariants(files, flatResult, config);
    std::cout << "[PASS] Member count cap" << std::endl;
}

static void TestRejectionsAndOversize() {
    std::cout << "[Test] Out-of-range files..." << std::endl;
    domain::PlannerConfig config;
    CombinedFileBatchStrategy strategy(config);

    auto result = strategy.generateBatches({File("src/big.ts", 15000, 0), File("src/small.ts", 800, 1)});
    assert(result.batches.size() == 1);
    assert(result.rejections.size() == 1);
    assert(result.rejections[0].reason == domain::RejectionReason::TooLarge);
    assert(result.rejections[0].originalIndex == 0);

    auto empty = strategy.generateBatches({});
    assert(empty.batches.empty() && empty.rejections.empty());

    // A file alone above the token cap still gets a batch of its own.
    domain::PlannerConfig tight;
    tight.maxBatchSize = 10000;
    tight.targetBatchSize = 9000;
    tight.minBatchSize = 1000;
    CombinedFileBatchStrategy tightStrategy(tight);
    std::vector<domain::PlannedFile> files = {File("src/x/huge.ts", 12000, 0), File("src/x/tiny.ts", 500, 1)};
    auto oversize = tightStrategy.generateBatches(files);
    CheckInvariants(files, oversize, tight);
    bool foundAlone = false;
    for (const auto& batch : oversize.batches) {
        if (batch.estimatedTokens == 12000) {
            assert(batch.members.size() == 1);
            foundAlone = true;
        }
    }
    assert(foundAlone);
    std::cout << "[PASS] Out-of-range files" << std::endl;
}

static void TestUnderfilledMerge() {
    std::cout << "[Test] Under-filled batches merge..." << std::endl;
    domain::PlannerConfig config;
    CombinedFileBatchStrategy strategy(config);

    // Unrelated files land in separate groups, then the first batch absorbs the second.
    std::vector<domain::PlannedFile> files = {File("a/b/x.py", 3000, 0), File("c/d/y.md", 1000, 1)};
    assert(strategy.relationshipScore(files[0], files[1]) == 0);
    auto merged = strategy.generateBatches(files);
    assert(merged.batches.size() == 1);
    assert(merged.batches[0].estimatedTokens == 4000);
    assert(merged.batches[0].members[0].path == "a/b/x.py");
    assert(merged.batches[0].members[1].path == "c/d/y.md");
    CheckInvariants(files, merged, config);

    // Merging would pass maxBatchSize.
    std::vector<domain::PlannedFile> heavy = {
        File("a/b/x.py", 7000, 0), File("c/d/y.md", 14000, 1), File("c/d/z.md", 2000, 2)};
    auto tokenCapped = strategy.generateBatches(heavy);
    assert(tokenCapped.batches.size() == 2);
    assert(tokenCapped.batches[0].estimatedTokens == 7000);
    assert(tokenCapped.batches[1].estimatedTokens == 16000);
    CheckInvariants(heavy, tokenCapped, config);

    // Merging would pass maxFilesPerBatch.
    domain::PlannerConfig fewFiles;
    fewFiles.maxFilesPerBatch = 3;
    CombinedFileBatchStrategy capped(fewFiles);
    std::vector<domain::PlannedFile> many = {
        File("a/b/x.py", 500, 0), File("c/d/y1.md", 2000, 1), File("c/d/y2.md", 2000, 2),
        File("c/d/y3.md", 2000, 3)};
    auto countCapped = capped.generateBatches(many);
    assert(countCapped.batches.size() == 2);
    assert(countCapped.batches[0].members.size() == 3);
    assert(countCapped.batches[0].estimatedTokens == 6000);
    assert(countCapped.batches[1].members.size() == 1);
    CheckInvariants(many, countCapped, fewFiles);
    std::cout << "[PASS] Under-filled batches merge" << std::endl;
}

static void TestOverCapMigration() {
    std::cout << "[Test] Over-cap batches shed their smallest files..." << std::endl;
    domain::PlannerConfig config;
    CombinedFileBatchStrategy strategy(config);

    application::BatchArena arena;
    for (long long tokens : {9000, 9000, 6000, 2000, 5000}) arena.addFile(tokens);
    int crowded = arena.newBatch();
    int spare = arena.newBatch();
    for (int f = 0; f < 4; ++f) arena.assign(f, crowded);
    arena.assign(4, spare);
    assert(arena.batchTokens[crowded] == 26000);

    strategy.rebalance(arena);
    assert(arena.batchTokens[crowded] == 18000);
    assert(arena.batchCounts[crowded] == 2);
    assert(arena.batchTokens[spare] == 13000);
    assert(arena.membersOf(spare) == std::vector<int>({4, 3, 2}));

    // Nowhere to move: the batch stays as it is.
    application::BatchArena lonely;
    lonely.addFile(15000);
    lonely.addFile(10000);
    int only = lonely.newBatch();
    lonely.assign(0, only);
    lonely.assign(1, only);
    strategy.rebalance(lonely);
    assert(lonely.batchTokens[only] == 25000);
    assert(lonely.batchCounts[only] == 2);
    std::cout << "[PASS] Over-cap batches shed their smallest files" << std::endl;
}

static void TestRelationshipScore() {
    std::cout << "[Test] Relationship scoring..." << std::endl;
    domain::PlannerConfig config;
    CombinedFileBatchStrategy strategy(config);

    auto user = File("src/api/user.ts", 2000, 0);
    auto users = File("src/api/users.ts", 2000, 1);
    assert(strategy.relationshipScore(user, users) == 5 + 3 + 2 + 6 + 1);

    domain::StructuralSummary summary;
    summary.imports = {"./users"};
    user.ref.structuralSummary = summary;
    assert(strategy.relationshipScore(user, users) == 5 + 3 + 2 + 6 + 1 + 8);

    auto unrelated = File("docs/guide/readme.md", 100, 2);
    auto script = File("lib/x.py", 1000, 3);
    assert(strategy.relationshipScore(unrelated, script) == 0);

    assert(CombinedFileBatchStrategy::FilePriority(File("src/index.ts", 2000, 0)) == 7.0);
    assert(CombinedFileBatchStrategy::FilePriority(File("src/app.config.ts", 9000, 0)) == 8.0);
    std::cout << "[PASS] Relationship scoring" << std::endl;
}

int main() {
    TestSameDirectoryScenario();
    TestCapacityAcrossDirectories();
    TestFileCap();
    TestRejectionsAndOversize();
    TestUnderfilledMerge();
    TestOverCapMigration();
    TestRelationshipScore();
    std::cout << "[Test] All combined strategy tests passed." << std::endl;
    return 0;
}

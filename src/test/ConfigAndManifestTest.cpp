#undef NDEBUG
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

#include "application/BatchPlanner.hpp"
#include "infrastructure/CharRatioTokenEstimator.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileContentReader.hpp"
#include "infrastructure/HeuristicBoundaryDetector.hpp"
#include "infrastructure/ManifestReader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PlanWriter.hpp"

namespace fs = std::filesystem;
using namespace batchplanner;
using namespace batchplanner::infrastructure;
using json = nlohmann::json;

static fs::path TestRoot() {
    return fs::temp_directory_path() / "batchplanner_config_manifest_test";
}

static std::string Slurp(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

static void TestConfigRoundTrip() {
    std::cout << "[Test] Config save and load..." << std::endl;
    fs::path path = TestRoot() / "nested" / "planner.json";

    domain::PlannerConfig config;
    config.targetBatchSize = 16000;
    config.maxFilesPerBatch = 8;
    config.enableSmartGrouping = false;
    config.relationshipWeights.importDependency = 11;
    config.splitQualityWeights.fallbackScore = 25;
    assert(ConfigLoader::SaveToFile(path.string(), config));

    auto loaded = ConfigLoader::LoadFromFile(path.string());
    assert(loaded.has_value());
    assert(loaded->targetBatchSize == 16000);
    assert(loaded->maxFilesPerBatch == 8);
    assert(!loaded->enableSmartGrouping);
    assert(loaded->relationshipWeights.importDependency == 11);
    assert(loaded->splitQualityWeights.fallbackScore == 25);
    assert(loaded->smallFileMaxTokens == 15000);
    assert(loaded->validate().empty());
    std::cout << "[PASS] Config save and load" << std::endl;
}

static void TestConfigOverlayAndErrors() {
    std::cout << "[Test] Config overlay and errors..." << std::endl;

    auto partial = ConfigLoader::FromJson(json{{"targetChunkSize", 12000}, {"carryForwardImports", false}});
    assert(partial.targetChunkSize == 12000);
    assert(!partial.carryForwardImports);
    assert(partial.maxBatchSize == 22000);

    bool threw = false;
    try {
        ConfigLoader::FromJson(json::array());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    assert(!ConfigLoader::LoadFromFile((TestRoot() / "absent.json").string()).has_value());

    fs::path broken = TestRoot() / "broken.json";
    std::ofstream(broken) << "{ \"targetBatchSize\": ";
    assert(!ConfigLoader::LoadFromFile(broken.string()).has_value());

    fs::path wrongType = TestRoot() / "wrong_type.json";
    std::ofstream(wrongType) << "{ \"maxFilesPerBatch\": \"twelve\" }";
    assert(!ConfigLoader::LoadFromFile(wrongType.string()).has_value());

    domain::PlannerConfig inverted;
    inverted.minBatchSize = 30000;
    inverted.chunkOverlapTokens = 20000;
    auto problems = inverted.validate();
    assert(problems.size() == 2);

    domain::PlannerConfig unbalanced;
    unbalanced.splitQualityWeights.readability = 0.5;
    assert(unbalanced.validate().size() == 1);
    std::cout << "[PASS] Config overlay and errors" << std::endl;
}

static void TestDefaultConfigPath() {
    std::cout << "[Test] Default config location..." << std::endl;
    setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    assert(PathUtils::GetDefaultConfigPath() == fs::path("/tmp/xdg-test/BatchPlanner/planner.json"));
    unsetenv("XDG_CONFIG_HOME");
    std::cout << "[PASS] Default config location" << std::endl;
}

static void TestManifestShapes() {
    std::cout << "[Test] Manifest parsing..." << std::endl;

    json bare = json::parse(R"([
        {"path": "src/a.ts", "tokenCount": 3000, "size": 12000},
        {"filePath": "src/b.py", "tokenCount": {"totalTokens": 0, "safeTokenCount": 900}},
        {"path": "src/c.rs", "tokenCount": {"totalTokens": 0, "metadata": {"error": "timeout"}}},
        {"path": "src/d.ts"},
        {"tokenCount": 10},
        42
    ])");
    Manifest manifest = ManifestReader::Parse(bare);
    assert(manifest.projectRoot.empty());
    assert(manifest.files.size() == 4);
    assert(manifest.errors.size() == 2);

    assert(manifest.files[0].path == "src/a.ts");
    assert(manifest.files[0].sizeBytes == 12000);
    assert(manifest.files[0].language == "typescript");
    assert(domain::ExtractTokenCount(manifest.files[0].tokenEstimate) == 3000);
    assert(manifest.files[1].language == "python");
    assert(domain::ExtractTokenCount(manifest.files[1].tokenEstimate) == 900);
    assert(manifest.files[2].tokenEstimate.hasError());
    assert(manifest.files[3].tokenEstimate.hasError());

    json wrapped = json::parse(R"({
        "projectRoot": "/work/shop",
        "files": [{
            "path": "src/cart.ts",
            "tokenCount": 17000,
            "language": "typescript",
            "codeStructure": {
                "structure": {
                    "functions": [{"name": "add", "startLine": 3, "endLine": 20}, "remove"],
                    "classes": [{"name": "Cart", "line": 1, "endLine": 90}],
                    "imports": [{"source": "./price"}, "lodash"],
                    "maxNesting": 4,
                    "complexity": 12
                }
            }
        }]
    })");
    Manifest rooted = ManifestReader::Parse(wrapped);
    assert(rooted.projectRoot == "/work/shop");
    assert(rooted.files.size() == 1);
    const auto& summary = *rooted.files[0].structuralSummary;
    assert(summary.language == "typescript");
    assert(summary.functions.size() == 2);
    assert(summary.functions[0].endLine == 20);
    assert(summary.functions[1].name == "remove");
    assert(summary.classes[0].startLine == 1);
    assert(summary.imports.size() == 2);
    assert(summary.imports[0] == "./price");
    assert(summary.nestingDepth == 4);
    assert(summary.complexityScore == 12.0);

    bool threw = false;
    try {
        ManifestReader::Parse(json{{"projectRoot", "/x"}});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ManifestReader::ReadFile((TestRoot() / "missing_manifest.json").string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Manifest parsing" << std::endl;
}

static void TestMalformedEntriesReachThePlan() {
    std::cout << "[Test] Malformed manifest entries become rejections..." << std::endl;

    json document = json::parse(R"([
        {"path": "src/sized.ts", "tokenCount": 3000, "size": "12"},
        {"path": "src/confident.ts", "tokenCount": {"totalTokens": 900, "confidence": "high"}},
        {"path": "src/complex.ts", "tokenCount": 1200, "codeStructure": {"complexityScore": "high"}},
        {"path": "src/huge.ts", "tokenCount": 1e300},
        {"path": "src/fine.ts", "tokenCount": 2000}
    ])");
    Manifest manifest = ManifestReader::Parse(document);
    assert(manifest.errors.empty());
    assert(manifest.files.size() == 5);
    for (int i = 0; i < 3; ++i) {
        assert(manifest.files[i].tokenEstimate.hasError());
        assert(manifest.files[i].language == "typescript");
        assert(!manifest.files[i].structuralSummary.has_value());
    }
    assert(domain::ExtractTokenCount(manifest.files[3].tokenEstimate) == std::numeric_limits<long long>::max());

    auto estimator = std::make_shared<CharRatioTokenEstimator>();
    application::BatchPlanner planner(domain::PlannerConfig{},
                                      std::make_shared<HeuristicBoundaryDetector>(estimator),
                                      std::make_shared<FileContentReader>(TestRoot().string()));
    auto plan = planner.plan(manifest.files);

    assert(plan.batches.size() == 1);
    assert(plan.batches[0].members[0].path == "src/fine.ts");
    assert(plan.rejections.size() == 4);
    for (int i = 0; i < 3; ++i) {
        assert(plan.rejections[i].path == manifest.files[i].path);
        assert(plan.rejections[i].reason == domain::RejectionReason::EstimationError);
        assert(plan.rejections[i].detail.rfind("malformed manifest entry: ", 0) == 0);
    }
    assert(plan.rejections[3].path == "src/huge.ts");
    assert(plan.rejections[3].reason == domain::RejectionReason::SizeMismatch);
    std::cout << "[PASS] Malformed manifest entries become rejections" << std::endl;
}

static void TestFileContentReader() {
    std::cout << "[Test] File content reader..." << std::endl;
    fs::create_directories(TestRoot() / "project" / "src");
    std::ofstream(TestRoot() / "project" / "src" / "main.cpp") << "int main() {}\n";
    {
        std::ofstream binary(TestRoot() / "project" / "src" / "blob.bin", std::ios::binary);
        binary.write("ab\0cd", 5);
    }

    FileContentReader reader((TestRoot() / "project").string());
    assert(reader.read("src/main.cpp") == "int main() {}\n");

    for (const std::string path : {"src/blob.bin", "src/none.cpp", "src"}) {
        bool threw = false;
        try {
            reader.read(path);
        } catch (const domain::ContentReadError& e) {
            threw = true;
            assert(e.path() == path);
        }
        assert(threw);
    }
    std::cout << "[PASS] File content reader" << std::endl;
}

static void TestPlanWriter() {
    std::cout << "[Test] Atomic plan writes..." << std::endl;
    fs::path target = TestRoot() / "out" / "plan.json";

    assert(PlanWriter::WriteAtomically(target.string(), "{\"batches\": []}\n"));
    assert(Slurp(target) == "{\"batches\": []}\n");

    assert(PlanWriter::WriteAtomically(target.string(), "{}\n"));
    assert(Slurp(target) == "{}\n");

    int leftovers = 0;
    for (const auto& entry : fs::directory_iterator(target.parent_path())) {
        if (entry.path().extension() == ".tmp") ++leftovers;
    }
    assert(leftovers == 0);
    std::cout << "[PASS] Atomic plan writes" << std::endl;
}

int main() {
    fs::remove_all(TestRoot());
    fs::create_directories(TestRoot());

    TestConfigRoundTrip();
    TestConfigOverlayAndErrors();
    TestDefaultConfigPath();
    TestManifestShapes();
    TestMalformedEntriesReachThePlan();
    TestFileContentReader();
    TestPlanWriter();

    fs::remove_all(TestRoot());
    std::cout << "[Test] All config and manifest tests passed." << std::endl;
    return 0;
}

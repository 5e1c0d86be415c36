#undef NDEBUG
#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>

#include "domain/services/TextLines.hpp"
#include "infrastructure/HeuristicBoundaryDetector.hpp"

using namespace batchplanner;
using domain::BoundaryType;
using infrastructure::HeuristicBoundaryDetector;
using infrastructure::LanguageRules;

// Every line costs the same, so chunk sizes follow line counts.
class FixedLineEstimator : public domain::TokenEstimator {
public:
    long long estimate(const std::string& text) const override {
        return text.empty() ? 0 : 10;
    }
};

static std::shared_ptr<domain::TokenEstimator> Estimator() {
    return std::make_shared<FixedLineEstimator>();
}

// count functions of five lines each.
static std::string Functions(int count) {
    std::ostringstream out;
    for (int i = 0; i < count; ++i) {
        out << "int f" << i << "() {\n"
            << "    int a = 1;\n"
            << "    int b = 2;\n"
            << "    return a + b;\n"
            << "}\n";
    }
    return out.str();
}

static void TestBraceBoundaries() {
    std::cout << "[Test] Brace language boundaries..." << std::endl;
    HeuristicBoundaryDetector detector(Estimator());

    std::vector<std::string> lines = {
        "namespace app {",
        "class Foo {",
        "public:",
        "    void run() {",
        "        if (ready) {",
        "        }",
        "    }",
        "};",
        "",
        "int helper(int a) {",
        "    return a; // \"}\" inside a comment",
        "}",
        "} // namespace app",
    };
    auto boundaries = detector.classifyLines(lines, LanguageRules::For("cpp"), std::nullopt);
    assert(boundaries.size() == lines.size());
    assert(boundaries[5] == BoundaryType::None);
    assert(boundaries[6] == BoundaryType::FunctionEnd);
    assert(boundaries[7] == BoundaryType::ClassEnd);
    assert(boundaries[8] == BoundaryType::BlankLine);
    assert(boundaries[10] == BoundaryType::None);
    assert(boundaries[11] == BoundaryType::FunctionEnd);
    assert(boundaries[12] == BoundaryType::BlockEnd);
    std::cout << "[PASS] Brace language boundaries" << std::endl;
}

static void TestPythonBoundaries() {
    std::cout << "[Test] Indentation language boundaries..." << std::endl;
    HeuristicBoundaryDetector detector(Estimator());

    std::vector<std::string> lines = {
        "import os",
        "",
        "class Service:",
        "    def run(self):",
        "        return 1",
        "",
        "    def stop(self):",
        "        return 0",
        "",
        "def main():",
        "    print(Service())",
    };
    auto boundaries = detector.classifyLines(lines, LanguageRules::For("python"), std::nullopt);
    assert(boundaries[1] == BoundaryType::BlankLine);
    assert(boundaries[4] == BoundaryType::FunctionEnd);
    assert(boundaries[5] == BoundaryType::None);
    assert(boundaries[7] == BoundaryType::ClassEnd);
    assert(boundaries[8] == BoundaryType::None);
    assert(boundaries[10] == BoundaryType::FunctionEnd);
    std::cout << "[PASS] Indentation language boundaries" << std::endl;
}

static void TestSummaryOverridesScan() {
    std::cout << "[Test] Structural summary end lines..." << std::endl;
    HeuristicBoundaryDetector detector(Estimator());

    std::vector<std::string> lines(10, "x = compute()");
    domain::StructuralSummary summary;
    summary.language = "python";
    summary.functions.push_back({"compute", 1, 5});
    summary.classes.push_back({"Model", 6, 40});    // past the end, ignored

    auto boundaries = detector.classifyLines(lines, LanguageRules::For("python"), summary);
    assert(boundaries[4] == BoundaryType::FunctionEnd);
    assert(boundaries[9] == BoundaryType::None);
    std::cout << "[PASS] Structural summary end lines" << std::endl;
}

static void TestSegmentationNearTarget() {
    std::cout << "[Test] Segmentation within tolerance..." << std::endl;
    HeuristicBoundaryDetector detector(Estimator());

    auto result = detector.detect("src/gen.cpp", Functions(20), std::nullopt, 300, 0);
    assert(result.success);
    assert(result.language == "cpp");
    assert(result.chunks.size() == 4);

    long long sum = 0;
    int expectedStart = 1;
    for (size_t k = 0; k < result.chunks.size(); ++k) {
        const auto& chunk = result.chunks[k];
        assert(chunk.startLine == expectedStart);
        assert(chunk.estimatedTokens <= 315);
        assert(chunk.type == "function-focused");
        assert(chunk.hasChunkMarker);
        assert(!chunk.boundaries.empty());
        expectedStart = chunk.endLine + 1;
        sum += chunk.estimatedTokens;
    }
    assert(expectedStart == 101);
    assert(sum == 1000);
    assert(result.chunks[0].endLine == 30);
    assert(result.chunks[0].content.rfind("// Chunk 1/4 of src/gen.cpp (lines 1-30, function-focused)\n", 0) == 0);
    std::cout << "[PASS] Segmentation within tolerance" << std::endl;
}

static void TestChunksFollowFileTotal() {
    std::cout << "[Test] Chunk estimates follow the file total..." << std::endl;
    HeuristicBoundaryDetector detector(Estimator());

    // Content estimates 1000 tokens; the file is known to be twice that.
    auto doubled = detector.detect("src/gen.cpp", Functions(20), std::nullopt, 300, 2000);
    assert(doubled.success);
    assert(doubled.chunks.size() == 7);
    assert(doubled.chunks[0].endLine == 15);
    assert(doubled.chunks[0].estimatedTokens == 300);
    long long sum = 0;
    for (const auto& chunk : doubled.chunks) sum += chunk.estimatedTokens;
    assert(sum == 2000);

    // Totals that do not divide evenly still add up exactly.
    auto odd = detector.detect("src/gen.cpp", Functions(20), std::nullopt, 300, 1001);
    sum = 0;
    int expectedStart = 1;
    for (const auto& chunk : odd.chunks) {
        assert(chunk.startLine == expectedStart);
        expectedStart = chunk.endLine + 1;
        sum += chunk.estimatedTokens;
    }
    assert(expectedStart == 101);
    assert(sum == 1001);

    auto weights = detector.lineTokens({"a", "bb", "ccc"}, 7);
    assert(weights[0] + weights[1] + weights[2] == 7);
    std::cout << "[PASS] Chunk estimates follow the file total" << std::endl;
}

static void TestForcedCut() {
    std::cout << "[Test] Forced cut without boundaries..." << std::endl;
    HeuristicBoundaryDetector detector(Estimator());

    std::string content = "void big() {\n";
    for (int i = 0; i < 98; ++i) content += "    call();\n";
    content += "}\n";

    auto result = detector.detect("src/big.cpp", content, std::nullopt, 300, 0);
    assert(result.success);
    assert(result.chunks.front().type == "mixed");
    assert(result.chunks.front().startLine == 1);
    assert(result.chunks.front().endLine == 31);
    assert(result.chunks.back().endLine == 100);
    std::cout << "[PASS] Forced cut without boundaries" << std::endl;
}

static void TestCarriedImports() {
    std::cout << "[Test] Carried-forward imports..." << std::endl;
    std::string content = "#include <string>\n#include <vector>\n\n" + Functions(20);

    HeuristicBoundaryDetector detector(Estimator());
    auto result = detector.detect("src/lib.cpp", content, std::nullopt, 300, 0);
    assert(result.success);
    assert(result.chunks.size() > 1);

    assert(result.chunks[0].hasImports);
    assert(!result.chunks[0].hasCarriedImports);
    assert(result.chunks[0].carriedContextTokens == 0);
    for (size_t k = 1; k < result.chunks.size(); ++k) {
        const auto& chunk = result.chunks[k];
        assert(chunk.hasCarriedImports);
        assert(chunk.carriedContextTokens == 20);
        assert(chunk.content.find("// Required imports\n#include <string>\n#include <vector>\n"
                                  "// End of required imports\n") != std::string::npos);
        assert(chunk.startLine == result.chunks[k - 1].endLine + 1);
    }

    // Budget for one import line only.
    infrastructure::DetectorSettings tight;
    tight.chunkOverlapTokens = 15;
    HeuristicBoundaryDetector tightDetector(Estimator(), tight);
    auto capped = tightDetector.detect("src/lib.cpp", content, std::nullopt, 300, 0);
    assert(capped.chunks[1].carriedContextTokens == 10);
    assert(capped.chunks[1].content.find("#include <vector>") == std::string::npos);

    infrastructure::DetectorSettings off;
    off.carryForwardImports = false;
    HeuristicBoundaryDetector plainDetector(Estimator(), off);
    auto plain = plainDetector.detect("src/lib.cpp", content, std::nullopt, 300, 0);
    assert(!plain.chunks[1].hasCarriedImports);
    std::cout << "[PASS] Carried-forward imports" << std::endl;
}

static void TestFailures() {
    std::cout << "[Test] Detection failures..." << std::endl;
    HeuristicBoundaryDetector detector(Estimator());

    auto empty = detector.detect("src/empty.ts", "", std::nullopt, 300, 0);
    assert(!empty.success);
    assert(empty.error.has_value());
    assert(empty.chunks.empty());

    auto badTarget = detector.detect("src/gen.cpp", Functions(2), std::nullopt, 0, 0);
    assert(!badTarget.success);

    auto lines = domain::services::TextLines::Split("a\r\nb\n\nc\r\n");
    assert(lines.size() == 4);
    assert(lines[0] == "a");
    assert(lines[2].empty());
    assert(lines[3] == "c");
    std::cout << "[PASS] Detection failures" << std::endl;
}

int main() {
    TestBraceBoundaries();
    TestPythonBoundaries();
    TestSummaryOverridesScan();
    TestSegmentationNearTarget();
    TestChunksFollowFileTotal();
    TestForcedCut();
    TestCarriedImports();
    TestFailures();
    std::cout << "[Test] All boundary detector tests passed." << std::endl;
    return 0;
}

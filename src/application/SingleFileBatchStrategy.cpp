/**
 * @file SingleFileBatchStrategy.cpp
 * @brief Implementation of SingleFileBatchStrategy.
 */

#include "application/SingleFileBatchStrategy.hpp"
#include "domain/services/PathHeuristics.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace batchplanner::application {

using domain::services::PathHeuristics;

namespace {

constexpr int kImportanceBase = 50;
constexpr int kStructureBonusCap = 30;

struct KeywordBonus {
    std::vector<std::string> keywords;
    int bonus;
};

std::string ProjectContext(const std::string& segmentPath) {
    if (PathHeuristics::Contains(segmentPath, "/api/")) return "API service";
    if (PathHeuristics::Contains(segmentPath, "/components/")) return "frontend application";
    if (PathHeuristics::ContainsAny(segmentPath, {"/server/", "/backend/"})) return "backend service";
    if (PathHeuristics::ContainsAny(segmentPath, {"/lib/", "/utils/", "/shared/"})) return "shared library";
    return "general project";
}

std::string ArchitecturalRole(const std::string& name) {
    if (PathHeuristics::Contains(name, "controller")) return "controller layer";
    if (PathHeuristics::ContainsAny(name, {"router", "route"})) return "routing layer";
    if (PathHeuristics::Contains(name, "service")) return "service layer";
    if (PathHeuristics::ContainsAny(name, {"model", "entity", "schema"})) return "data layer";
    if (PathHeuristics::ContainsAny(name, {"util", "helper"})) return "utility layer";
    if (PathHeuristics::Contains(name, "config")) return "configuration";
    if (PathHeuristics::ContainsAny(name, {"index.", "main.", "app."})) return "entry point";
    return "component";
}

std::vector<std::string> RelatedFiles(const std::string& path) {
    std::string directory = PathHeuristics::Directory(path);
    std::string prefix = directory.empty() ? "" : directory + "/";
    std::string base = PathHeuristics::BaseName(path);
    std::string extension = PathHeuristics::Extension(path);

    std::vector<std::string> related = {
        prefix + base + ".test" + extension,
        prefix + base + ".spec" + extension,
    };
    if (PathHeuristics::ToLower(base) != "index") {
        related.push_back(prefix + "index" + extension);
    }
    return related;
}

} // namespace

SingleFileBatchStrategy::SingleFileBatchStrategy(domain::PlannerConfig config)
    : m_config(std::move(config)) {}

int SingleFileBatchStrategy::CalculateImportance(const domain::SourceFileRef& file) {
    static const std::vector<KeywordBonus> nameBonuses = {
        {{"index."}, 20}, {{"main."}, 18}, {{"app."}, 15}, {{"server."}, 15}, {{"config"}, 12},
        {{"router", "route"}, 10}, {{"controller"}, 10}, {{"service"}, 8}, {{"util", "helper"}, 5},
        {{"test", "spec"}, -10},
    };
    static const std::vector<KeywordBonus> pathBonuses = {
        {{"/src/", "/lib/"}, 8}, {{"/server/", "/backend/"}, 6}, {{"/api/"}, 6}, {{"/components/"}, 5},
        {{"/test/", "/tests/"}, -5},
    };

    int importance = kImportanceBase;

    std::string name = PathHeuristics::ToLower(PathHeuristics::FileName(file.path));
    for (const auto& rule : nameBonuses) {
        if (PathHeuristics::ContainsAny(name, rule.keywords)) importance += rule.bonus;
    }

    std::string segmentPath = PathHeuristics::SegmentPath(file.path);
    for (const auto& rule : pathBonuses) {
        if (PathHeuristics::ContainsAny(segmentPath, rule.keywords)) importance += rule.bonus;
    }

    if (file.structuralSummary.has_value()) {
        const auto& summary = *file.structuralSummary;
        int structure = static_cast<int>(summary.exports.size()) * 3 +
                        static_cast<int>(summary.classes.size()) * 4 +
                        static_cast<int>(summary.functions.size()) * 2 +
                        static_cast<int>(summary.interfaces.size()) * 3;
        importance += std::min(structure, kStructureBonusCap);
    }

    return std::clamp(importance, 0, 100);
}

int SingleFileBatchStrategy::CalculateComplexity(const domain::SourceFileRef& file, long long tokens) {
    double complexity = 10.0 + std::min(static_cast<double>(tokens) / 1000.0, 20.0);
    if (file.structuralSummary.has_value()) {
        const auto& summary = *file.structuralSummary;
        complexity += static_cast<double>(summary.functions.size()) * 2.0;
        complexity += static_cast<double>(summary.classes.size()) * 4.0;
        complexity += static_cast<double>(summary.interfaces.size()) * 3.0;
        complexity += summary.complexityScore * 0.1;
        complexity += static_cast<double>(summary.nestingDepth) * 3.0;
    }
    return std::clamp(static_cast<int>(std::lround(complexity)), 0, 100);
}

std::vector<std::string> SingleFileBatchStrategy::DetermineFocusAreas(const std::string& path) {
    std::string lower = PathHeuristics::ToLower(path);
    std::vector<std::string> areas;
    if (PathHeuristics::ContainsAny(lower, {"api", "router", "controller"})) {
        areas.push_back("api");
        areas.push_back("endpoint-documentation");
    }
    if (PathHeuristics::ContainsAny(lower, {"service", "business"})) {
        areas.push_back("business-logic");
        areas.push_back("service-patterns");
    }
    if (PathHeuristics::ContainsAny(lower, {"model", "entity"})) {
        areas.push_back("data-model");
        areas.push_back("relationships");
    }
    if (PathHeuristics::ContainsAny(lower, {"util", "helper"})) {
        areas.push_back("utility");
        areas.push_back("reusability");
    }
    if (PathHeuristics::Contains(lower, "config")) {
        areas.push_back("configuration");
        areas.push_back("environment-settings");
    }
    if (PathHeuristics::Contains(lower, "test")) {
        areas.push_back("test");
        areas.push_back("test-patterns");
    }
    if (areas.empty()) areas.push_back("general");
    return areas;
}

std::vector<std::string> SingleFileBatchStrategy::DetermineSpecialHandling(const domain::SourceFileRef& file,
                                                                           long long tokens) {
    std::vector<std::string> handling;
    if (file.structuralSummary.has_value()) {
        const auto& summary = *file.structuralSummary;
        if (summary.complexityScore > 15) handling.push_back("high_complexity");
        if (summary.functions.size() > 20) handling.push_back("many_functions");
        if (summary.classes.size() > 5) handling.push_back("many_classes");
        if (summary.dependencies.external.size() > 10) handling.push_back("many_dependencies");
    }
    if (tokens > 19000) handling.push_back("large_file");
    return handling;
}

std::string SingleFileBatchStrategy::DetermineDocumentationStyle(const std::string& path) {
    std::string lower = PathHeuristics::ToLower(path);
    if (PathHeuristics::ContainsAny(lower, {"api", "router", "controller"})) return "api_focused";
    if (PathHeuristics::Contains(lower, "test")) return "test_focused";
    if (PathHeuristics::Contains(lower, "config")) return "configuration_focused";
    if (PathHeuristics::ContainsAny(lower, {"util", "helper"})) return "utility_focused";
    return "comprehensive";
}

std::string SingleFileBatchStrategy::analysisDepthFor(long long tokens) const {
    if (tokens < m_config.singleBasicBandMax) return "basic";
    if (tokens < m_config.singleComprehensiveBandMax) return "comprehensive";
    return "detailed";
}

std::string SingleFileBatchStrategy::sizeCategoryFor(long long tokens) const {
    if (tokens < m_config.singleBasicBandMax) return "tiny";
    if (tokens < m_config.singleComprehensiveBandMax) return "medium";
    return "large";
}

int SingleFileBatchStrategy::qualityScoreFor(const domain::SourceFileRef& file, long long tokens) const {
    int score = 70;
    if (tokens >= m_config.singleBasicBandMax && tokens <= m_config.singleComprehensiveBandMax) score += 10;
    if (file.structuralSummary.has_value()) {
        const auto& summary = *file.structuralSummary;
        if (!summary.functions.empty()) score += 5;
        if (!summary.classes.empty()) score += 5;
        if (!summary.exports.empty()) score += 5;
        if (!summary.imports.empty()) score += 3;
    }
    return std::min(score, 100);
}

domain::Batch SingleFileBatchStrategy::buildBatch(const domain::PlannedFile& file) const {
    const domain::SourceFileRef& ref = file.ref;
    const long long tokens = file.tokens();

    domain::Batch batch;
    batch.kind = domain::BatchKind::Single;
    batch.strategyTag = domain::StrategyTagFor(batch.kind);
    batch.estimatedTokens = tokens;

    domain::FileInsights insights;
    insights.importance = CalculateImportance(ref);
    insights.complexity = CalculateComplexity(ref, tokens);
    insights.qualityScore = qualityScoreFor(ref, tokens);
    insights.sizeCategory = sizeCategoryFor(tokens);
    if (m_config.addContextInfo) {
        insights.projectContext = ProjectContext(PathHeuristics::SegmentPath(ref.path));
        std::string directoryName = PathHeuristics::DirectoryName(ref.path);
        insights.moduleContext = directoryName.empty() ? "root" : directoryName;
        insights.architecturalRole = ArchitecturalRole(PathHeuristics::ToLower(PathHeuristics::FileName(ref.path)));
        insights.relatedFiles = RelatedFiles(ref.path);
    }

    batch.members.push_back({ref.path, ref.tokenEstimate, ref.sizeBytes, ref.language, file.originalIndex,
                             static_cast<double>(insights.importance)});

    auto& hints = batch.metadata.processingHints;
    hints.analysisDepth = analysisDepthFor(tokens);
    hints.focusAreas = DetermineFocusAreas(ref.path);
    hints.specialHandling = DetermineSpecialHandling(ref, tokens);
    hints.documentationStyle = DetermineDocumentationStyle(ref.path);
    hints.contextAware = m_config.addContextInfo;

    double fill = static_cast<double>(tokens) / static_cast<double>(m_config.targetBatchSize);
    batch.metadata.efficiency = static_cast<int>(std::lround(std::min(fill, 1.0) * 100.0));

    std::string description = "Single-file batch: " + PathHeuristics::FileName(ref.path) + " (" +
                              PathHeuristics::FormatThousands(tokens) + " tokens)";
    if (ref.structuralSummary.has_value()) {
        size_t classes = ref.structuralSummary->classes.size();
        size_t functions = ref.structuralSummary->functions.size();
        if (classes > 0 || functions > 0) {
            description += " - " + std::to_string(classes) + " classes, " + std::to_string(functions) + " functions";
        }
    }
    batch.metadata.description = description;
    batch.metadata.fileInsights = std::move(insights);
    return batch;
}

StrategyResult SingleFileBatchStrategy::generateBatches(const std::vector<domain::PlannedFile>& files) const {
    StrategyResult result;

    for (const auto& file : files) {
        long long tokens = file.tokens();
        if (tokens < m_config.smallFileMaxTokens || tokens >= m_config.mediumFileMaxTokens) {
            bool tooSmall = tokens < m_config.smallFileMaxTokens;
            std::cerr << "[SingleFileBatchStrategy] Rejecting " << file.ref.path << ": " << tokens << " tokens is "
                      << (tooSmall ? "below" : "above") << " the single-file range [" << m_config.smallFileMaxTokens
                      << ", " << m_config.mediumFileMaxTokens << ")" << std::endl;
            result.rejections.push_back({file.ref.path, file.originalIndex, tokens,
                                         tooSmall ? domain::RejectionReason::TooSmall
                                                  : domain::RejectionReason::TooLarge,
                                         tooSmall ? "below smallFileMaxTokens" : "at or above mediumFileMaxTokens",
                                         domain::StrategyTagFor(domain::BatchKind::Single)});
            continue;
        }
        result.batches.push_back(buildBatch(file));
    }

    std::stable_sort(result.batches.begin(), result.batches.end(),
                     [](const domain::Batch& a, const domain::Batch& b) {
                         return a.metadata.fileInsights->importance > b.metadata.fileInsights->importance;
                     });

    const int total = static_cast<int>(result.batches.size());
    for (int i = 0; i < total; ++i) {
        auto& batch = result.batches[i];
        batch.id = "single_batch_" + std::to_string(i + 1);
        batch.batchIndex = i + 1;
        batch.totalBatches = total;
        domain::EnsureValidBatch(batch);
    }

    std::cout << "[SingleFileBatchStrategy] Created " << total << " single-file batches, rejected "
              << result.rejections.size() << std::endl;
    return result;
}

} // namespace batchplanner::application

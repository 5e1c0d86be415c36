/**
 * @file PlanJsonCodec.cpp
 * @brief Implementation of PlanJsonCodec.
 */

#include "infrastructure/PlanJsonCodec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <initializer_list>
#include <limits>

namespace batchplanner::infrastructure {

using json = nlohmann::json;

namespace {

// Out-of-range numbers saturate so absurd counts surface as size mismatches.
long long NumberOf(const json& value) {
    constexpr long long kMax = std::numeric_limits<long long>::max();
    if (value.is_number_unsigned()) {
        auto raw = value.get<unsigned long long>();
        return raw > static_cast<unsigned long long>(kMax) ? kMax : static_cast<long long>(raw);
    }
    if (value.is_number_integer()) return value.get<long long>();
    if (value.is_number_float()) {
        double raw = std::floor(value.get<double>());
        if (std::isnan(raw)) return 0;
        if (raw >= static_cast<double>(kMax)) return kMax;
        if (raw <= static_cast<double>(std::numeric_limits<long long>::min())) return std::numeric_limits<long long>::min();
        return static_cast<long long>(raw);
    }
    return 0;
}

long long FirstPositive(const json& object, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (object.contains(key)) {
            long long count = NumberOf(object.at(key));
            if (count > 0) return count;
        }
    }
    return 0;
}

std::vector<std::string> StringList(const json& value) {
    std::vector<std::string> out;
    if (!value.is_array()) return out;
    for (const auto& item : value) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else if (item.is_object()) {
            for (const char* key : {"source", "path", "name", "module"}) {
                if (item.contains(key) && item.at(key).is_string()) {
                    out.push_back(item.at(key).get<std::string>());
                    break;
                }
            }
        }
    }
    return out;
}

std::vector<domain::CodeSymbol> SymbolList(const json& value) {
    std::vector<domain::CodeSymbol> out;
    if (!value.is_array()) return out;
    for (const auto& item : value) {
        domain::CodeSymbol symbol;
        if (item.is_string()) {
            symbol.name = item.get<std::string>();
        } else if (item.is_object()) {
            symbol.name = item.value("name", std::string());
            symbol.startLine = static_cast<int>(NumberOf(item.contains("startLine") ? item.at("startLine")
                                                                                     : item.value("line", json())));
            symbol.endLine = static_cast<int>(NumberOf(item.value("endLine", json())));
        } else {
            continue;
        }
        out.push_back(std::move(symbol));
    }
    return out;
}

json HintsToJson(const domain::ProcessingHints& hints) {
    json j{
        {"analysisDepth", hints.analysisDepth},
        {"contextAware", hints.contextAware},
    };
    if (!hints.focusAreas.empty()) j["focusAreas"] = hints.focusAreas;
    if (!hints.specialHandling.empty()) j["specialHandling"] = hints.specialHandling;
    if (!hints.specialInstructions.empty()) j["specialInstructions"] = hints.specialInstructions;
    if (!hints.documentationStyle.empty()) j["documentationStyle"] = hints.documentationStyle;
    if (hints.crossFileReferences) j["crossFileReferences"] = true;
    if (hints.preserveRelationships) j["preserveRelationships"] = true;
    if (hints.requiresIntegration) j["requiresIntegration"] = true;
    if (hints.isFirstChunk) j["isFirstChunk"] = true;
    if (hints.isLastChunk) j["isLastChunk"] = true;
    if (hints.avgTokensPerFile > 0) j["avgTokensPerFile"] = hints.avgTokensPerFile;
    if (!hints.directories.empty()) j["directories"] = hints.directories;
    if (!hints.extensions.empty()) j["extensions"] = hints.extensions;
    if (!hints.modules.empty()) j["modules"] = hints.modules;
    return j;
}

long long EpochMillis(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

} // namespace

long long PlanJsonCodec::ExtractTokenCount(const json& value) {
    if (value.is_number()) {
        return std::max(0LL, NumberOf(value));
    }
    if (!value.is_object()) {
        return 0;
    }

    long long count = FirstPositive(value, {"totalTokens", "safeTokenCount", "estimatedTokens"});
    if (count == 0 && value.contains("details") && value.at("details").is_object()) {
        count = FirstPositive(value.at("details"), {"safeTokenCount", "estimatedTokens"});
    }
    return count;
}

domain::TokenEstimate PlanJsonCodec::TokenEstimateFromJson(const json& value) {
    long long total = ExtractTokenCount(value);
    if (!value.is_object()) {
        return domain::MakeTokenEstimate(total);
    }

    std::optional<domain::TokenDetails> details;
    const json& d = value.contains("details") && value.at("details").is_object() ? value.at("details") : value;
    if (d.contains("safeTokenCount") || d.contains("estimatedTokens") || d.contains("confidence")) {
        domain::TokenDetails parsed;
        parsed.estimatedTokens = d.contains("estimatedTokens") ? NumberOf(d.at("estimatedTokens")) : total;
        parsed.safeTokenCount = d.contains("safeTokenCount") ? NumberOf(d.at("safeTokenCount"))
                                                             : (total / 10) * 9 + (total % 10) * 9 / 10;
        parsed.confidence = d.value("confidence", 0.8);
        if (d.contains("breakdown") && d.at("breakdown").is_object()) {
            const json& b = d.at("breakdown");
            parsed.breakdown.totalChars = NumberOf(b.value("totalChars", json()));
            parsed.breakdown.codeTokens = NumberOf(b.value("codeTokens", json()));
            parsed.breakdown.commentTokens = NumberOf(b.value("commentTokens", json()));
            parsed.breakdown.stringTokens = NumberOf(b.value("stringTokens", json()));
        }
        details = parsed;
    }

    std::optional<domain::TokenMetadata> metadata;
    const json& m = value.contains("metadata") && value.at("metadata").is_object() ? value.at("metadata") : value;
    if (m.contains("estimationMethod") || m.contains("error") || m.contains("fromCache") || m.contains("filePath")) {
        domain::TokenMetadata parsed;
        parsed.filePath = m.value("filePath", std::string("unknown"));
        parsed.language = m.value("language", std::string("unknown"));
        parsed.estimationMethod = m.value("estimationMethod", std::string(domain::estimation_method::Standard));
        parsed.timestamp = m.value("timestamp", std::string());
        parsed.fromCache = m.value("fromCache", false);
        if (m.contains("error") && !m.at("error").is_null()) {
            const json& error = m.at("error");
            parsed.error = error.is_string() ? error.get<std::string>() : error.dump();
        }
        metadata = parsed;
    }

    return domain::MakeTokenEstimate(total, details, metadata);
}

domain::StructuralSummary PlanJsonCodec::StructuralSummaryFromJson(const json& value) {
    domain::StructuralSummary summary;
    if (!value.is_object()) return summary;

    summary.language = value.value("language", std::string());
    summary.imports = StringList(value.value("imports", json::array()));
    summary.exports = StringList(value.value("exports", json::array()));
    summary.functions = SymbolList(value.value("functions", json::array()));
    summary.classes = SymbolList(value.value("classes", json::array()));
    summary.interfaces = SymbolList(value.value("interfaces", json::array()));
    summary.nestingDepth = static_cast<int>(NumberOf(value.contains("nestingDepth") ? value.at("nestingDepth")
                                                                                    : value.value("maxNesting", json())));
    if (value.contains("complexityScore")) {
        summary.complexityScore = value.at("complexityScore").get<double>();
    } else if (value.contains("complexity") && value.at("complexity").is_number()) {
        summary.complexityScore = value.at("complexity").get<double>();
    }
    summary.totalLines = static_cast<int>(NumberOf(value.value("totalLines", json())));

    if (value.contains("dependencies") && value.at("dependencies").is_object()) {
        const json& deps = value.at("dependencies");
        summary.dependencies.internal = StringList(deps.value("internal", json::array()));
        summary.dependencies.external = StringList(deps.value("external", json::array()));
    }
    return summary;
}

json PlanJsonCodec::ToJson(const domain::TokenEstimate& estimate) {
    json j{{"totalTokens", estimate.totalTokens}};
    if (estimate.details.has_value()) {
        const auto& d = *estimate.details;
        j["details"] = {
            {"estimatedTokens", d.estimatedTokens},
            {"safeTokenCount", d.safeTokenCount},
            {"confidence", d.confidence},
            {"breakdown", {
                {"totalChars", d.breakdown.totalChars},
                {"codeTokens", d.breakdown.codeTokens},
                {"commentTokens", d.breakdown.commentTokens},
                {"stringTokens", d.breakdown.stringTokens},
            }},
        };
    }
    if (estimate.metadata.has_value()) {
        const auto& m = *estimate.metadata;
        j["metadata"] = {
            {"filePath", m.filePath},
            {"language", m.language},
            {"estimationMethod", m.estimationMethod},
            {"fromCache", m.fromCache},
            {"error", m.error.has_value() ? json(*m.error) : json(nullptr)},
        };
        if (!m.timestamp.empty()) j["metadata"]["timestamp"] = m.timestamp;
    }
    return j;
}

json PlanJsonCodec::ToJson(const domain::Batch& batch) {
    json members = json::array();
    for (const auto& member : batch.members) {
        members.push_back({
            {"path", member.path},
            {"tokens", domain::ExtractTokenCount(member.tokenEstimate)},
            {"size", member.sizeBytes},
            {"language", member.language},
            {"originalIndex", member.originalIndex},
            {"priority", member.priority},
        });
    }

    json metadata{
        {"description", batch.metadata.description},
        {"efficiency", batch.metadata.efficiency},
        {"processingHints", HintsToJson(batch.metadata.processingHints)},
    };
    if (batch.metadata.fileInsights.has_value()) {
        const auto& insights = *batch.metadata.fileInsights;
        metadata["importance"] = insights.importance;
        metadata["complexity"] = insights.complexity;
        metadata["qualityScore"] = insights.qualityScore;
        metadata["sizeCategory"] = insights.sizeCategory;
        if (!insights.projectContext.empty()) {
            metadata["contextInfo"] = {
                {"projectContext", insights.projectContext},
                {"moduleContext", insights.moduleContext},
                {"architecturalRole", insights.architecturalRole},
                {"relatedFiles", insights.relatedFiles},
            };
        }
    }

    json j{
        {"id", batch.id},
        {"type", domain::BatchKindToString(batch.kind)},
        {"strategy", batch.strategyTag},
        {"estimatedTokens", batch.estimatedTokens},
        {"fileCount", batch.members.size()},
        {"files", members},
        {"metadata", metadata},
        {"batchIndex", batch.batchIndex},
        {"totalBatches", batch.totalBatches},
    };

    if (batch.chunkInfo.has_value()) {
        const auto& chunk = *batch.chunkInfo;
        json points = json::array();
        for (const auto& point : chunk.reconstruction.integrationPoints) {
            points.push_back({{"line", point.line}, {"type", point.type}, {"priority", point.priority}});
        }
        j["chunkInfo"] = {
            {"chunkIndex", chunk.chunkIndex},
            {"totalChunks", chunk.totalChunks},
            {"startLine", chunk.startLine},
            {"endLine", chunk.endLine},
            {"content", chunk.content},
            {"splitType", chunk.splitType},
            {"estimatedTokens", chunk.estimatedTokens},
            {"carriedContextTokens", chunk.carriedContextTokens},
            {"splitQuality", chunk.splitQuality},
            {"isFallback", chunk.isFallback},
            {"processingOrder", chunk.processingOrder},
            {"reconstructionInfo", {
                {"position", chunk.reconstruction.position},
                {"total", chunk.reconstruction.total},
                {"needsContextFromPrevious", chunk.reconstruction.needsContextFromPrevious},
                {"providesContextForNext", chunk.reconstruction.providesContextForNext},
                {"hasOverlap", chunk.reconstruction.hasOverlap},
                {"integrationPoints", points},
            }},
        };
    }
    if (batch.parentFileRef.has_value()) {
        j["parentFileInfo"] = {
            {"path", batch.parentFileRef->path},
            {"totalTokens", batch.parentFileRef->totalTokens},
            {"originalIndex", batch.parentFileRef->originalIndex},
        };
    }
    return j;
}

json PlanJsonCodec::ToJson(const domain::Task& task) {
    const auto& timing = task.getTiming();
    json j{
        {"id", task.getId()},
        {"type", domain::TaskTypeToString(task.getType())},
        {"status", domain::TaskStatusToString(task.getStatus())},
        {"batchId", task.getBatch().id},
        {"progress", task.progressDescription()},
        {"timing", {
            {"createdAtMs", EpochMillis(timing.createdAt)},
            {"estimatedDurationMs", timing.estimatedDurationMs},
        }},
    };
    if (timing.startedAt.has_value()) j["timing"]["startedAtMs"] = EpochMillis(*timing.startedAt);
    if (timing.completedAt.has_value()) j["timing"]["completedAtMs"] = EpochMillis(*timing.completedAt);
    if (auto chunkProgress = task.chunkProgressDescription()) j["chunkProgress"] = *chunkProgress;
    if (task.getErrorMessage().has_value()) j["error"] = *task.getErrorMessage();
    return j;
}

json PlanJsonCodec::ToJson(const domain::FileRejection& rejection) {
    return json{
        {"path", rejection.path},
        {"originalIndex", rejection.originalIndex},
        {"tokens", rejection.tokens},
        {"reason", domain::RejectionReasonToString(rejection.reason)},
        {"detail", rejection.detail},
        {"strategy", rejection.strategy},
    };
}

} // namespace batchplanner::infrastructure

/**
 * @file LargeFileMultiBatchStrategy.cpp
 * @brief Implementation of LargeFileMultiBatchStrategy.
 */

#include "application/LargeFileMultiBatchStrategy.hpp"
#include "domain/services/PathHeuristics.hpp"
#include "domain/services/TextLines.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>

namespace batchplanner::application {

using domain::services::PathHeuristics;
using domain::services::TextLines;

namespace {

int StructuralBonus(const std::string& chunkType) {
    if (chunkType == "class-focused") return 25;
    if (chunkType == "interface-focused") return 20;
    if (chunkType == "function-focused") return 18;
    if (chunkType == "module-focused") return 15;
    return 5;
}

std::string AnalysisDepthFor(const std::string& chunkType, long long tokens) {
    if (chunkType == "class-focused") return "detailed";
    if (chunkType == "function-focused" || chunkType == "interface-focused") return "comprehensive";
    return tokens > 15000 ? "detailed" : "comprehensive";
}

std::vector<std::string> FocusAreasFor(const std::string& chunkType, bool first, bool last) {
    std::vector<std::string> areas;
    if (chunkType == "class-focused") {
        areas = {"class_structure", "methods", "inheritance"};
    } else if (chunkType == "function-focused") {
        areas = {"function_logic", "parameters", "return_values"};
    } else if (chunkType == "interface-focused") {
        areas = {"contracts", "type_definitions"};
    } else if (chunkType == "module-focused") {
        areas = {"module_structure", "exports"};
    } else {
        areas = {"general_analysis"};
    }
    if (first) areas.push_back("imports_and_setup");
    if (last) areas.push_back("exports_and_summary");
    return areas;
}

std::vector<std::string> SpecialInstructionsFor(int position, int total, int splitQuality) {
    std::vector<std::string> instructions;
    if (total > 1) {
        if (position == 1) {
            instructions.push_back("Part 1 of " + std::to_string(total) +
                                   ": document the overall purpose of the file and its imports");
        } else if (position == total) {
            instructions.push_back("Final part: summarize the exports and connect the earlier parts");
        } else {
            instructions.push_back("Part " + std::to_string(position) + " of " + std::to_string(total) +
                                   ": continue from the previous part");
        }
    }
    if (total > 3) {
        instructions.push_back("File is split into many parts: keep terminology consistent across them");
    }
    if (splitQuality < 70) {
        instructions.push_back("Low split quality: declarations may be cut at part boundaries");
    }
    return instructions;
}

int Percent(double value) {
    return std::clamp(static_cast<int>(std::lround(value)), 0, 100);
}

} // namespace

LargeFileMultiBatchStrategy::LargeFileMultiBatchStrategy(domain::PlannerConfig config,
                                                         std::shared_ptr<domain::BoundaryDetector> detector,
                                                         std::shared_ptr<domain::ContentReader> reader)
    : m_config(std::move(config)), m_detector(std::move(detector)), m_reader(std::move(reader)) {}

SplitQuality LargeFileMultiBatchStrategy::scoreChunk(const domain::DetectedChunk& chunk) const {
    SplitQuality quality;

    int structural = 50 + StructuralBonus(chunk.type);
    if (!chunk.boundaries.empty()) structural += 20;
    quality.structuralIntegrity = std::min(structural, 100);

    int highPriority = static_cast<int>(std::count_if(chunk.boundaries.begin(), chunk.boundaries.end(),
                                                      [](const domain::Boundary& b) { return b.priority >= 7; }));
    int context = 60 + std::min(highPriority * 5, 15);
    if (chunk.hasImports) context += 15;
    if (chunk.hasComments) context += 10;
    quality.contextPreservation = std::min(context, 100);

    long long target = m_config.targetChunkSize;
    long long larger = std::max(chunk.estimatedTokens, target);
    double balance = larger > 0 ? static_cast<double>(std::min(chunk.estimatedTokens, target)) / larger : 0.0;
    quality.sizeBalance = Percent(balance * 100.0);

    int dependency = 70;
    if (chunk.hasCarriedImports) dependency += 20;
    if (chunk.endLine > chunk.startLine) dependency += 10;
    quality.dependencyHandling = std::min(dependency, 100);

    int lineCount = chunk.endLine - chunk.startLine + 1;
    int readability = 75;
    if (chunk.hasChunkMarker) readability += 15;
    if (lineCount >= 10 && lineCount <= 500) readability += 10;
    quality.readability = std::min(readability, 100);

    const auto& w = m_config.splitQualityWeights;
    quality.overall = Percent(quality.structuralIntegrity * w.structuralIntegrity +
                              quality.contextPreservation * w.contextPreservation +
                              quality.sizeBalance * w.sizeBalance +
                              quality.dependencyHandling * w.dependencyHandling +
                              quality.readability * w.readability);
    return quality;
}

std::vector<domain::Batch> LargeFileMultiBatchStrategy::buildChunkBatches(
    const domain::PlannedFile& file, int fileOrdinal, const domain::DetectionResult& detection) const {
    std::vector<domain::Batch> batches;
    const int total = static_cast<int>(detection.chunks.size());
    const std::string fileName = PathHeuristics::FileName(file.ref.path);

    for (int k = 0; k < total; ++k) {
        const domain::DetectedChunk& chunk = detection.chunks[k];
        const int position = k + 1;
        SplitQuality quality = scoreChunk(chunk);

        domain::ChunkInfo info;
        info.chunkIndex = position;
        info.totalChunks = total;
        info.startLine = chunk.startLine;
        info.endLine = chunk.endLine;
        info.content = chunk.content;
        info.splitType = chunk.type;
        info.estimatedTokens = chunk.estimatedTokens;
        info.carriedContextTokens = chunk.carriedContextTokens;
        info.splitQuality = quality.overall;
        info.isFallback = false;
        info.reconstruction.position = position;
        info.reconstruction.total = total;
        info.reconstruction.needsContextFromPrevious = k > 0;
        info.reconstruction.providesContextForNext = k < total - 1;
        info.reconstruction.hasOverlap = chunk.hasCarriedImports;
        for (const auto& boundary : chunk.boundaries) {
            info.reconstruction.integrationPoints.push_back(
                {boundary.line, domain::BoundaryTypeToString(boundary.type), boundary.priority});
        }

        domain::Batch batch;
        batch.id = "large_file_" + std::to_string(fileOrdinal) + "_" + std::to_string(position);
        batch.kind = domain::BatchKind::Chunk;
        batch.strategyTag = domain::StrategyTagFor(batch.kind);
        batch.estimatedTokens = chunk.estimatedTokens;
        batch.members.push_back({file.ref.path, domain::MakeTokenEstimate(chunk.estimatedTokens),
                                 static_cast<long long>(chunk.content.size()),
                                 file.ref.language.empty() ? detection.language : file.ref.language,
                                 file.originalIndex, 0.0});
        batch.parentFileRef = domain::ParentFileRef{file.ref.path, file.tokens(), file.originalIndex};

        auto& hints = batch.metadata.processingHints;
        hints.isFirstChunk = k == 0;
        hints.isLastChunk = k == total - 1;
        hints.analysisDepth = AnalysisDepthFor(chunk.type, chunk.estimatedTokens);
        hints.focusAreas = FocusAreasFor(chunk.type, hints.isFirstChunk, hints.isLastChunk);
        hints.specialInstructions = SpecialInstructionsFor(position, total, quality.overall);
        hints.requiresIntegration = total > 1;
        hints.contextAware = true;

        double fill = static_cast<double>(chunk.estimatedTokens) / static_cast<double>(m_config.targetChunkSize);
        batch.metadata.efficiency = Percent(std::min(fill, 1.0) * 100.0);
        batch.metadata.description = "Large file chunk " + std::to_string(position) + "/" + std::to_string(total) +
                                     " - " + fileName + " (" +
                                     PathHeuristics::FormatThousands(chunk.estimatedTokens) + " tokens, lines " +
                                     std::to_string(chunk.startLine) + "-" + std::to_string(chunk.endLine) +
                                     ") - " + chunk.type;
        batch.chunkInfo = std::move(info);
        batches.push_back(std::move(batch));
    }
    return batches;
}

std::vector<domain::Batch> LargeFileMultiBatchStrategy::buildFallbackBatches(const domain::PlannedFile& file,
                                                                             int fileOrdinal,
                                                                             const std::string* content) const {
    const long long totalTokens = file.tokens();
    long long count = std::max(1LL, (totalTokens + m_config.targetChunkSize - 1) / m_config.targetChunkSize);

    std::vector<std::string> lines;
    if (content != nullptr) lines = TextLines::Split(*content);
    const long long lineCount = static_cast<long long>(lines.size());
    if (lineCount > 0) count = std::min(count, lineCount);

    const int total = static_cast<int>(count);
    const long long share = totalTokens / count;
    const long long remainder = totalTokens % count;
    const std::string fileName = PathHeuristics::FileName(file.ref.path);
    const std::string comment = PathHeuristics::LanguageForExtension(PathHeuristics::Extension(file.ref.path)) == "python"
                                    ? "#"
                                    : "//";

    std::vector<domain::Batch> batches;
    for (int k = 0; k < total; ++k) {
        const int position = k + 1;
        const long long tokens = share + (k < remainder ? 1 : 0);

        domain::ChunkInfo info;
        info.chunkIndex = position;
        info.totalChunks = total;
        info.splitType = "fallback";
        info.estimatedTokens = tokens;
        info.splitQuality = m_config.splitQualityWeights.fallbackScore;
        info.isFallback = true;
        info.reconstruction.position = position;
        info.reconstruction.total = total;
        info.reconstruction.needsContextFromPrevious = k > 0;
        info.reconstruction.providesContextForNext = k < total - 1;

        if (lineCount > 0) {
            long long first = (k * lineCount) / count;
            long long last = ((k + 1) * lineCount) / count - 1;
            info.startLine = static_cast<int>(first + 1);
            info.endLine = static_cast<int>(last + 1);
            std::string body = comment + " Chunk " + std::to_string(position) + "/" + std::to_string(total) + " of " +
                               file.ref.path + " (lines " + std::to_string(info.startLine) + "-" +
                               std::to_string(info.endLine) + ", fallback)\n";
            for (long long line = first; line <= last; ++line) {
                body += lines[line];
                body += '\n';
            }
            info.content = std::move(body);
        }

        domain::Batch batch;
        batch.id = "large_file_" + std::to_string(fileOrdinal) + "_" + std::to_string(position);
        batch.kind = domain::BatchKind::Chunk;
        batch.strategyTag = domain::StrategyTagFor(batch.kind);
        batch.estimatedTokens = tokens;
        batch.members.push_back({file.ref.path, domain::MakeTokenEstimate(tokens),
                                 static_cast<long long>(info.content.size()), file.ref.language,
                                 file.originalIndex, 0.0});
        batch.parentFileRef = domain::ParentFileRef{file.ref.path, totalTokens, file.originalIndex};

        auto& hints = batch.metadata.processingHints;
        hints.isFirstChunk = k == 0;
        hints.isLastChunk = k == total - 1;
        hints.analysisDepth = "comprehensive";
        hints.focusAreas = FocusAreasFor("fallback", hints.isFirstChunk, hints.isLastChunk);
        hints.specialInstructions = SpecialInstructionsFor(position, total, info.splitQuality);
        hints.requiresIntegration = total > 1;
        hints.contextAware = true;

        double fill = static_cast<double>(tokens) / static_cast<double>(m_config.targetChunkSize);
        batch.metadata.efficiency = Percent(std::min(fill, 1.0) * 100.0);
        batch.metadata.description = "Large file chunk " + std::to_string(position) + "/" + std::to_string(total) +
                                     " - " + fileName + " (" + PathHeuristics::FormatThousands(tokens) +
                                     " tokens) - equal-line fallback";
        batch.chunkInfo = std::move(info);
        batches.push_back(std::move(batch));
    }
    return batches;
}

std::vector<domain::Batch> LargeFileMultiBatchStrategy::processFile(const domain::PlannedFile& file,
                                                                    int fileOrdinal) const {
    std::string content;
    try {
        content = m_reader->read(file.ref.path);
    } catch (const domain::ContentReadError& e) {
        std::cerr << "[LargeFileMultiBatchStrategy] " << e.what() << "; using equal-line fallback" << std::endl;
        return buildFallbackBatches(file, fileOrdinal, nullptr);
    }

    domain::DetectionResult detection =
        m_detector->detect(file.ref.path, content, file.ref.structuralSummary, m_config.targetChunkSize,
                           file.tokens());
    if (!detection.success || detection.chunks.empty()) {
        std::cerr << "[LargeFileMultiBatchStrategy] Boundary detection failed for " << file.ref.path << ": "
                  << detection.error.value_or("no chunks produced") << "; using equal-line fallback" << std::endl;
        return buildFallbackBatches(file, fileOrdinal, &content);
    }
    return buildChunkBatches(file, fileOrdinal, detection);
}

StrategyResult LargeFileMultiBatchStrategy::generateBatches(const std::vector<domain::PlannedFile>& files,
                                                            const domain::CancellationToken* cancellation) const {
    StrategyResult result;

    std::vector<const domain::PlannedFile*> accepted;
    for (const auto& file : files) {
        long long tokens = file.tokens();
        if (tokens < m_config.mediumFileMaxTokens) {
            std::cerr << "[LargeFileMultiBatchStrategy] Rejecting " << file.ref.path << ": " << tokens
                      << " tokens is below the large-file threshold " << m_config.mediumFileMaxTokens << std::endl;
            result.rejections.push_back({file.ref.path, file.originalIndex, tokens, domain::RejectionReason::TooSmall,
                                         "below mediumFileMaxTokens",
                                         domain::StrategyTagFor(domain::BatchKind::Chunk)});
            continue;
        }
        accepted.push_back(&file);
    }

    // One slot per file so concurrent work never shares output.
    std::vector<std::vector<domain::Batch>> slots(accepted.size());
    const size_t window = static_cast<size_t>(std::max(1, m_config.maxConcurrentReads));
    for (size_t next = 0; next < accepted.size();) {
        if (cancellation != nullptr) cancellation->throwIfCancelled("large-file chunking");

        size_t end = std::min(next + window, accepted.size());
        std::vector<std::future<std::vector<domain::Batch>>> inFlight;
        for (size_t i = next; i < end; ++i) {
            const domain::PlannedFile* file = accepted[i];
            int ordinal = static_cast<int>(i) + 1;
            inFlight.push_back(std::async(std::launch::async,
                                          [this, file, ordinal]() { return processFile(*file, ordinal); }));
        }
        for (size_t i = next; i < end; ++i) {
            slots[i] = inFlight[i - next].get();
        }
        next = end;
    }

    for (auto& slot : slots) {
        for (auto& batch : slot) result.batches.push_back(std::move(batch));
    }

    std::stable_sort(result.batches.begin(), result.batches.end(),
                     [](const domain::Batch& a, const domain::Batch& b) {
                         if (a.parentFileRef->originalIndex != b.parentFileRef->originalIndex) {
                             return a.parentFileRef->originalIndex < b.parentFileRef->originalIndex;
                         }
                         return a.chunkInfo->chunkIndex < b.chunkInfo->chunkIndex;
                     });

    const int total = static_cast<int>(result.batches.size());
    int fallbackCount = 0;
    for (int i = 0; i < total; ++i) {
        auto& batch = result.batches[i];
        batch.batchIndex = i + 1;
        batch.totalBatches = total;
        batch.chunkInfo->processingOrder = i + 1;
        if (batch.chunkInfo->isFallback) ++fallbackCount;
        domain::EnsureValidBatch(batch);
    }

    std::cout << "[LargeFileMultiBatchStrategy] Split " << accepted.size() << " large files into " << total
              << " chunks (" << fallbackCount << " fallback)" << std::endl;
    return result;
}

} // namespace batchplanner::application

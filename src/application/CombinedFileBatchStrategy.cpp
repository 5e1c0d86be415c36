/**
 * @file CombinedFileBatchStrategy.cpp
 * @brief Implementation of CombinedFileBatchStrategy.
 */

#include "application/CombinedFileBatchStrategy.hpp"
#include "domain/services/PathHeuristics.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>

namespace batchplanner::application {

using domain::services::PathHeuristics;

namespace {

struct FileProfile {
    const domain::PlannedFile* file = nullptr;
    long long tokens = 0;
    std::string directory;
    std::string baseName;
    std::string extension;
    std::string module;
    std::vector<std::string> references;
    double priority = 0.0;
};

FileProfile BuildProfile(const domain::PlannedFile& file) {
    FileProfile profile;
    profile.file = &file;
    profile.tokens = file.tokens();
    profile.directory = PathHeuristics::Directory(file.ref.path);
    profile.baseName = PathHeuristics::BaseName(file.ref.path);
    profile.extension = PathHeuristics::Extension(file.ref.path);
    profile.module = PathHeuristics::Module(file.ref.path);
    if (file.ref.structuralSummary.has_value()) {
        const auto& summary = *file.ref.structuralSummary;
        profile.references = summary.dependencies.internal;
        profile.references.insert(profile.references.end(), summary.imports.begin(), summary.imports.end());
    }
    profile.priority = CombinedFileBatchStrategy::FilePriority(file);
    return profile;
}

bool References(const FileProfile& from, const FileProfile& to) {
    if (to.baseName.empty()) return false;
    for (const auto& reference : from.references) {
        if (PathHeuristics::Contains(reference, to.baseName)) return true;
    }
    return false;
}

int Score(const FileProfile& a, const FileProfile& b, const domain::RelationshipWeights& weights) {
    int score = 0;
    if (a.directory == b.directory) score += weights.sameDirectory;
    if (PathHeuristics::NameSimilarity(a.baseName, b.baseName) > weights.nameSimilarityThreshold) {
        score += weights.similarName;
    }
    if (!a.extension.empty() && a.extension == b.extension) score += weights.sameExtension;
    if (References(a, b) || References(b, a)) score += weights.importDependency;
    if (a.module == b.module) score += weights.sameModule;

    long long larger = std::max(a.tokens, b.tokens);
    if (larger > 0) {
        double ratio = static_cast<double>(std::min(a.tokens, b.tokens)) / static_cast<double>(larger);
        if (ratio > weights.sizeRatioThreshold) score += weights.similarSize;
    }
    return score;
}

std::string JoinNames(const std::vector<std::string>& names, size_t limit) {
    std::string joined;
    for (size_t i = 0; i < names.size() && i < limit; ++i) {
        if (i > 0) joined += ", ";
        joined += names[i];
    }
    if (names.size() > limit) {
        joined += " and " + std::to_string(names.size() - limit) + " more";
    }
    return joined;
}

void AddUnique(std::vector<std::string>& values, const std::string& value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

} // namespace

int BatchArena::addFile(long long tokens) {
    fileTokens.push_back(tokens);
    assignment.push_back(-1);
    sequence.push_back(0);
    return static_cast<int>(fileTokens.size()) - 1;
}

int BatchArena::newBatch() {
    batchTokens.push_back(0);
    batchCounts.push_back(0);
    return static_cast<int>(batchTokens.size()) - 1;
}

void BatchArena::assign(int file, int batch) {
    int previous = assignment[file];
    if (previous >= 0) {
        batchTokens[previous] -= fileTokens[file];
        batchCounts[previous] -= 1;
    }
    assignment[file] = batch;
    sequence[file] = nextSequence++;
    batchTokens[batch] += fileTokens[file];
    batchCounts[batch] += 1;
}

std::vector<int> BatchArena::membersOf(int batch) const {
    std::vector<int> members;
    for (int f = 0; f < static_cast<int>(fileTokens.size()); ++f) {
        if (assignment[f] == batch) members.push_back(f);
    }
    std::sort(members.begin(), members.end(), [this](int a, int b) { return sequence[a] < sequence[b]; });
    return members;
}

CombinedFileBatchStrategy::CombinedFileBatchStrategy(domain::PlannerConfig config)
    : m_config(std::move(config)) {}

double CombinedFileBatchStrategy::FilePriority(const domain::PlannedFile& file) {
    std::string name = PathHeuristics::ToLower(PathHeuristics::FileName(file.ref.path));
    double priority = 0.0;
    if (PathHeuristics::Contains(name, "index.")) priority += 5;
    if (PathHeuristics::Contains(name, "main.")) priority += 4;
    if (PathHeuristics::Contains(name, "config")) priority += 3;
    if (PathHeuristics::Contains(name, "test")) priority += 1;
    priority += std::min(static_cast<double>(file.tokens()) / 1000.0, 5.0);
    return priority;
}

int CombinedFileBatchStrategy::relationshipScore(const domain::PlannedFile& a, const domain::PlannedFile& b) const {
    return Score(BuildProfile(a), BuildProfile(b), m_config.relationshipWeights);
}

void CombinedFileBatchStrategy::rebalance(BatchArena& arena) const {
    // Merge under-filled batches into their successor while both caps hold.
    const int packedCount = static_cast<int>(arena.batchTokens.size());
    for (int b = 0; b + 1 < packedCount;) {
        int next = b + 1;
        bool underFilled = arena.batchTokens[b] < m_config.minBatchSize;
        bool fits = arena.batchTokens[b] + arena.batchTokens[next] <= m_config.maxBatchSize &&
                    arena.batchCounts[b] + arena.batchCounts[next] <= m_config.maxFilesPerBatch;
        if (underFilled && fits) {
            for (int f : arena.membersOf(next)) arena.assign(f, b);
            b += 2;
        } else {
            ++b;
        }
    }

    // Move the smallest files out of batches over the token cap.
    for (int b = 0; b < packedCount; ++b) {
        while (arena.batchTokens[b] > m_config.maxBatchSize && arena.batchCounts[b] > 1) {
            std::vector<int> members = arena.membersOf(b);
            int smallest = *std::min_element(members.begin(), members.end(), [&arena](int x, int y) {
                return arena.fileTokens[x] < arena.fileTokens[y];
            });

            int receiver = -1;
            for (int r = 0; r < packedCount; ++r) {
                if (r == b || arena.batchCounts[r] == 0) continue;
                if (arena.batchTokens[r] + arena.fileTokens[smallest] <= m_config.maxBatchSize &&
                    arena.batchCounts[r] < m_config.maxFilesPerBatch) {
                    receiver = r;
                    break;
                }
            }
            if (receiver < 0) break;
            arena.assign(smallest, receiver);
        }
    }
}

StrategyResult CombinedFileBatchStrategy::generateBatches(const std::vector<domain::PlannedFile>& files) const {
    StrategyResult result;

    std::vector<FileProfile> profiles;
    BatchArena arena;
    for (const auto& file : files) {
        long long tokens = file.tokens();
        if (tokens >= m_config.smallFileMaxTokens) {
            std::cerr << "[CombinedFileBatchStrategy] Rejecting " << file.ref.path << ": " << tokens
                      << " tokens is not a small file" << std::endl;
            result.rejections.push_back({file.ref.path, file.originalIndex, tokens, domain::RejectionReason::TooLarge,
                                         "at or above smallFileMaxTokens (" +
                                             std::to_string(m_config.smallFileMaxTokens) + ")",
                                         domain::StrategyTagFor(domain::BatchKind::Combined)});
            continue;
        }
        profiles.push_back(BuildProfile(file));
        arena.addFile(profiles.back().tokens);
    }

    const int fileCount = static_cast<int>(profiles.size());
    if (fileCount == 0) {
        return result;
    }

    // Priority order, stable on input position.
    std::vector<int> byPriority(fileCount);
    for (int i = 0; i < fileCount; ++i) byPriority[i] = i;
    std::sort(byPriority.begin(), byPriority.end(), [&profiles](int a, int b) {
        const auto& fa = profiles[a];
        const auto& fb = profiles[b];
        if (fa.priority != fb.priority) return fa.priority > fb.priority;
        return fa.file->originalIndex < fb.file->originalIndex;
    });

    std::vector<std::vector<int>> groups;
    if (m_config.enableSmartGrouping) {
        std::vector<bool> grouped(fileCount, false);
        for (int seed : byPriority) {
            if (grouped[seed]) continue;
            grouped[seed] = true;
            std::vector<int> group{seed};
            long long groupTokens = profiles[seed].tokens;

            std::vector<std::pair<int, int>> candidates;
            for (int other : byPriority) {
                if (grouped[other]) continue;
                int score = Score(profiles[seed], profiles[other], m_config.relationshipWeights);
                if (score > 0) candidates.push_back({score, other});
            }
            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const auto& a, const auto& b) { return a.first > b.first; });

            for (const auto& candidate : candidates) {
                if (static_cast<int>(group.size()) >= m_config.maxFilesPerBatch) break;
                int other = candidate.second;
                if (groupTokens + profiles[other].tokens > m_config.maxBatchSize) continue;
                grouped[other] = true;
                group.push_back(other);
                groupTokens += profiles[other].tokens;
            }
            groups.push_back(std::move(group));
        }
    } else {
        groups.push_back(byPriority);
    }

    // Bin-pack each group, smallest files first.
    for (auto& group : groups) {
        std::sort(group.begin(), group.end(), [&profiles](int a, int b) {
            const auto& fa = profiles[a];
            const auto& fb = profiles[b];
            if (fa.tokens != fb.tokens) return fa.tokens < fb.tokens;
            return fa.file->originalIndex < fb.file->originalIndex;
        });

        int current = -1;
        for (int f : group) {
            bool fits = current >= 0 &&
                        arena.batchTokens[current] + arena.fileTokens[f] <= m_config.maxBatchSize &&
                        arena.batchCounts[current] < m_config.maxFilesPerBatch;
            if (!fits) current = arena.newBatch();
            arena.assign(f, current);
        }
    }

    rebalance(arena);

    const int packedCount = static_cast<int>(arena.batchTokens.size());
    for (int b = 0; b < packedCount; ++b) {
        std::vector<int> members = arena.membersOf(b);
        if (members.empty()) continue;

        domain::Batch batch;
        batch.kind = domain::BatchKind::Combined;
        batch.strategyTag = domain::StrategyTagFor(batch.kind);

        std::vector<std::string> names;
        auto& hints = batch.metadata.processingHints;
        for (int f : members) {
            const FileProfile& profile = profiles[f];
            const domain::SourceFileRef& ref = profile.file->ref;
            batch.members.push_back({ref.path, ref.tokenEstimate, ref.sizeBytes, ref.language,
                                     profile.file->originalIndex, profile.priority});
            batch.estimatedTokens += profile.tokens;
            names.push_back(PathHeuristics::FileName(ref.path));
            AddUnique(hints.directories, profile.directory);
            if (!profile.extension.empty()) AddUnique(hints.extensions, profile.extension);
            AddUnique(hints.modules, profile.module);
        }

        hints.analysisDepth = "comprehensive";
        hints.contextAware = true;
        hints.crossFileReferences = true;
        hints.preserveRelationships = true;
        hints.avgTokensPerFile = batch.estimatedTokens / static_cast<long long>(members.size());

        double fill = static_cast<double>(batch.estimatedTokens) / static_cast<double>(m_config.targetBatchSize);
        batch.metadata.efficiency = static_cast<int>(std::lround(std::min(fill, 1.0) * 100.0));
        batch.metadata.description = "Combined batch of " + std::to_string(members.size()) + " files (" +
                                     PathHeuristics::FormatThousands(batch.estimatedTokens) +
                                     " tokens): " + JoinNames(names, 5);
        result.batches.push_back(std::move(batch));
    }

    const int total = static_cast<int>(result.batches.size());
    int efficiencySum = 0;
    for (int i = 0; i < total; ++i) {
        auto& batch = result.batches[i];
        batch.id = "combined_batch_" + std::to_string(i + 1);
        batch.batchIndex = i + 1;
        batch.totalBatches = total;
        efficiencySum += batch.metadata.efficiency;
        if (batch.estimatedTokens > m_config.maxBatchSize) {
            std::cerr << "[CombinedFileBatchStrategy] " << batch.id << " holds a single file above maxBatchSize ("
                      << batch.estimatedTokens << " tokens)" << std::endl;
        }
        domain::EnsureValidBatch(batch, m_config.maxFilesPerBatch);
    }

    std::cout << "[CombinedFileBatchStrategy] Created " << total << " batches from " << fileCount
              << " files (average efficiency " << (total > 0 ? efficiencySum / total : 0) << "%)" << std::endl;
    return result;
}

} // namespace batchplanner::application

/**
 * @file Batch.cpp
 * @brief Batch validation.
 */

#include "domain/Batch.hpp"

#include <stdexcept>

namespace batchplanner::domain {

namespace {

void CheckStructure(const Batch& batch, std::vector<std::string>& errors) {
    if (batch.id.empty()) errors.push_back("missing id");
    if (batch.strategyTag.empty()) errors.push_back("missing strategy tag");
    if (batch.members.empty()) errors.push_back("batch has no members");

    if (batch.kind != BatchKind::Combined && batch.members.size() > 1) {
        errors.push_back(BatchKindToString(batch.kind) + " must hold exactly one member");
    }

    if (batch.kind == BatchKind::Chunk) {
        if (!batch.chunkInfo.has_value()) errors.push_back("chunk batch without chunkInfo");
        if (!batch.parentFileRef.has_value()) errors.push_back("chunk batch without parentFileRef");
    } else {
        if (batch.chunkInfo.has_value()) errors.push_back("chunkInfo on a non-chunk batch");
    }

    for (const auto& member : batch.members) {
        if (member.path.empty()) {
            errors.push_back("member without path");
            break;
        }
    }
}

} // namespace

bool ValidateBatch(const Batch& batch) {
    std::vector<std::string> errors;
    CheckStructure(batch, errors);
    return errors.empty();
}

BatchValidationReport ValidateBatchDetailed(const Batch& batch, int maxMembers) {
    BatchValidationReport report;
    CheckStructure(batch, report.errors);

    if (!batch.strategyTag.empty() && batch.strategyTag != StrategyTagFor(batch.kind)) {
        report.errors.push_back("strategy tag '" + batch.strategyTag + "' does not match kind " +
                                BatchKindToString(batch.kind));
    }

    if (batch.estimatedTokens < 0) {
        report.errors.push_back("negative token estimate");
    }

    if (batch.kind == BatchKind::Combined || batch.kind == BatchKind::Single) {
        long long sum = 0;
        for (const auto& member : batch.members) {
            sum += ExtractTokenCount(member.tokenEstimate);
        }
        if (sum != batch.estimatedTokens) {
            report.errors.push_back("estimatedTokens " + std::to_string(batch.estimatedTokens) +
                                    " differs from member sum " + std::to_string(sum));
        }
    }

    if (batch.kind == BatchKind::Combined && maxMembers > 0 &&
        static_cast<int>(batch.members.size()) > maxMembers) {
        report.errors.push_back("combined batch exceeds " + std::to_string(maxMembers) + " members");
    }

    if (batch.chunkInfo.has_value()) {
        const auto& chunk = *batch.chunkInfo;
        if (chunk.totalChunks < 1 || chunk.chunkIndex < 1 || chunk.chunkIndex > chunk.totalChunks) {
            report.errors.push_back("chunk index " + std::to_string(chunk.chunkIndex) + " outside 1.." +
                                    std::to_string(chunk.totalChunks));
        }
        if (chunk.endLine < chunk.startLine) {
            report.errors.push_back("chunk line range is inverted");
        }
        if (chunk.splitQuality < 0 || chunk.splitQuality > 100) {
            report.errors.push_back("split quality outside 0..100");
        }
    }

    if (batch.metadata.efficiency < 0 || batch.metadata.efficiency > 100) {
        report.errors.push_back("efficiency outside 0..100");
    }

    report.isValid = report.errors.empty();
    return report;
}

void EnsureValidBatch(const Batch& batch, int maxMembers) {
    BatchValidationReport report = ValidateBatchDetailed(batch, maxMembers);
    if (report.isValid) return;

    std::string message = "Invalid batch '" + batch.id + "':";
    for (const auto& error : report.errors) {
        message += " " + error + ";";
    }
    throw std::logic_error(message);
}

} // namespace batchplanner::domain

/**
 * @file TokenEstimate.cpp
 * @brief Implementation of TokenEstimate helpers.
 */

#include "domain/TokenEstimate.hpp"

#include <algorithm>

namespace batchplanner::domain {

long long TokenEstimate::safeTokenCount() const {
    if (details.has_value()) {
        return std::min(details->safeTokenCount, totalTokens);
    }
    return (totalTokens / 10) * 9 + (totalTokens % 10) * 9 / 10;
}

double TokenEstimate::confidence() const {
    if (details.has_value()) {
        return details->confidence;
    }
    return 0.8;
}

TokenEstimate MakeTokenEstimate(long long totalTokens,
                                std::optional<TokenDetails> details,
                                std::optional<TokenMetadata> metadata) {
    TokenEstimate estimate;
    estimate.totalTokens = std::max(0LL, totalTokens);

    if (details.has_value()) {
        TokenDetails d = *details;
        d.estimatedTokens = std::max(0LL, d.estimatedTokens);
        d.safeTokenCount = std::clamp(d.safeTokenCount, 0LL, estimate.totalTokens);
        d.confidence = std::clamp(d.confidence, 0.0, 1.0);
        if (d.breakdown.totalChars == 0 && d.breakdown.codeTokens == 0) {
            d.breakdown = BasicBreakdown(estimate.totalTokens);
        }
        estimate.details = d;
    }

    estimate.metadata = std::move(metadata);
    return estimate;
}

TokenEstimate MakeErrorTokenEstimate(const std::string& filePath, const std::string& message) {
    TokenMetadata metadata;
    metadata.filePath = filePath;
    metadata.estimationMethod = estimation_method::Error;
    metadata.error = message;

    TokenDetails details;
    details.confidence = 0.0;
    return MakeTokenEstimate(0, details, metadata);
}

TokenBreakdown BasicBreakdown(long long totalTokens) {
    const long long total = std::max(0LL, totalTokens);
    TokenBreakdown breakdown;
    breakdown.totalChars = total * 4;
    breakdown.codeTokens = static_cast<long long>(total * 0.7);
    breakdown.commentTokens = static_cast<long long>(total * 0.2);
    breakdown.stringTokens = static_cast<long long>(total * 0.1);
    return breakdown;
}

long long ExtractTokenCount(long long rawCount) {
    return std::max(0LL, rawCount);
}

long long ExtractTokenCount(const TokenEstimate& estimate) {
    if (estimate.totalTokens > 0) {
        return estimate.totalTokens;
    }
    if (estimate.details.has_value()) {
        if (estimate.details->safeTokenCount > 0) return estimate.details->safeTokenCount;
        if (estimate.details->estimatedTokens > 0) return estimate.details->estimatedTokens;
    }
    return 0;
}

long long SumTokenCounts(const std::vector<TokenEstimate>& estimates) {
    long long sum = 0;
    for (const auto& estimate : estimates) {
        sum += ExtractTokenCount(estimate);
    }
    return sum;
}

bool IsValidTokenEstimate(const TokenEstimate& estimate) {
    if (estimate.totalTokens < 0) return false;
    if (estimate.details.has_value()) {
        const auto& d = *estimate.details;
        if (d.confidence < 0.0 || d.confidence > 1.0) return false;
        if (d.safeTokenCount < 0 || d.safeTokenCount > estimate.totalTokens) return false;
    }
    return true;
}

std::vector<long long> DistributeTokens(const std::vector<long long>& weights, long long total) {
    std::vector<long long> shares(weights.size(), 0);
    if (weights.empty() || total <= 0) return shares;

    long long weightSum = 0;
    for (long long weight : weights) weightSum += std::max(0LL, weight);
    const bool even = weightSum == 0;
    if (even) weightSum = static_cast<long long>(weights.size());

    // floor(total * prefix / weightSum) with total split as quotient * weightSum + rest.
    const long long quotient = total / weightSum;
    const long long rest = total % weightSum;
    long long prefix = 0;
    long long previous = 0;
    for (size_t i = 0; i < weights.size(); ++i) {
        prefix += even ? 1 : std::max(0LL, weights[i]);
        long long cumulative = quotient * prefix + (rest * prefix) / weightSum;
        shares[i] = cumulative - previous;
        previous = cumulative;
    }
    return shares;
}

} // namespace batchplanner::domain

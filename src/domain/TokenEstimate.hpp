/**
 * @file TokenEstimate.hpp
 * @brief Token count of a file as reported by an estimator, plus optional details.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace batchplanner::domain {

/// Names of the estimation methods reported in TokenMetadata::estimationMethod.
namespace estimation_method {
inline constexpr const char* Precise = "precise_tiktoken";
inline constexpr const char* EstimatedChars = "estimated_chars";
inline constexpr const char* BasicCount = "basic_count";
inline constexpr const char* Cached = "cached_result";
inline constexpr const char* Error = "error";
inline constexpr const char* Fallback = "fallback";
inline constexpr const char* Standard = "standard";
} // namespace estimation_method

/**
 * @struct TokenBreakdown
 * @brief Split of the total between code, comments and string literals.
 */
struct TokenBreakdown {
    long long totalChars = 0;
    long long codeTokens = 0;
    long long commentTokens = 0;
    long long stringTokens = 0;
};

/**
 * @struct TokenDetails
 * @brief Optional estimator details.
 */
struct TokenDetails {
    long long estimatedTokens = 0;
    long long safeTokenCount = 0;       ///< Buffered lower bound, never above the total.
    TokenBreakdown breakdown;
    double confidence = 0.8;            ///< In [0, 1].
};

/**
 * @struct TokenMetadata
 * @brief Provenance of an estimate.
 */
struct TokenMetadata {
    std::string filePath = "unknown";
    std::string language = "unknown";
    std::string estimationMethod = estimation_method::Standard;
    std::string timestamp;
    bool fromCache = false;
    std::optional<std::string> error;   ///< Set when the estimate is unusable.
};

/**
 * @struct TokenEstimate
 * @brief Canonical token count of one file.
 *
 * totalTokens is the only value planning logic reads. When metadata carries an
 * error the total is conventionally 0 and the file must not be treated as empty.
 */
struct TokenEstimate {
    long long totalTokens = 0;
    std::optional<TokenDetails> details;
    std::optional<TokenMetadata> metadata;

    bool hasError() const { return metadata.has_value() && metadata->error.has_value(); }
    bool isFromCache() const { return metadata.has_value() && metadata->fromCache; }
    long long safeTokenCount() const;
    double confidence() const;
};

/// Confidence levels estimators commonly report.
namespace confidence_level {
inline constexpr double High = 0.9;
inline constexpr double Medium = 0.7;
inline constexpr double Low = 0.5;
inline constexpr double VeryLow = 0.3;
} // namespace confidence_level

/**
 * @brief Builds a normalized estimate.
 *
 * Negative totals clamp to 0, confidence clamps to [0, 1] and safeTokenCount is
 * capped at the total.
 */
TokenEstimate MakeTokenEstimate(long long totalTokens,
                                std::optional<TokenDetails> details = std::nullopt,
                                std::optional<TokenMetadata> metadata = std::nullopt);

/// Zero-token estimate flagged with an error message.
TokenEstimate MakeErrorTokenEstimate(const std::string& filePath, const std::string& message);

/// Approximate breakdown derived from a total alone (4 chars per token, 70/20/10 split).
TokenBreakdown BasicBreakdown(long long totalTokens);

/// Raw counts: negative values read as 0.
long long ExtractTokenCount(long long rawCount);

/// totalTokens, then safeTokenCount, then estimatedTokens, first positive value wins.
long long ExtractTokenCount(const TokenEstimate& estimate);

long long SumTokenCounts(const std::vector<TokenEstimate>& estimates);

bool IsValidTokenEstimate(const TokenEstimate& estimate);

/**
 * @brief Spreads total across slots in proportion to weights.
 *
 * Cumulative rounding: the result sums to exactly total and each share is
 * within one token of its exact proportion. All-zero weights spread evenly.
 */
std::vector<long long> DistributeTokens(const std::vector<long long>& weights, long long total);

} // namespace batchplanner::domain

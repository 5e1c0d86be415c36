/**
 * @file HeuristicBoundaryDetector.hpp
 * @brief Line-scanning BoundaryDetector for brace and indentation languages.
 */

#pragma once

#include "domain/BoundaryDetector.hpp"
#include "domain/PlannerConfig.hpp"
#include "domain/TokenEstimator.hpp"

#include <memory>
#include <string>
#include <vector>

namespace batchplanner::infrastructure {

/**
 * @struct LanguageRules
 * @brief Per-language lexical facts the scanners need.
 */
struct LanguageRules {
    std::string name;
    std::string lineComment = "//";
    bool indentationScoped = false;         ///< Python-style blocks.
    std::vector<std::string> importPrefixes;

    static LanguageRules For(const std::string& language);
};

struct DetectorSettings {
    double boundaryTolerance = 0.05;
    double minChunkFillRatio = 0.5;
    long long chunkOverlapTokens = 500;
    bool carryForwardImports = true;

    static DetectorSettings FromConfig(const domain::PlannerConfig& config);
};

/**
 * @class HeuristicBoundaryDetector
 * @brief Ranks cut lines by structure and cuts greedily near the token target.
 *
 * Brace languages are scanned with a block stack that skips strings and
 * comments; namespace-like blocks are transparent. Python is scanned by
 * indentation. Symbol end lines from the structural summary override the scan.
 */
class HeuristicBoundaryDetector : public domain::BoundaryDetector {
public:
    HeuristicBoundaryDetector(std::shared_ptr<domain::TokenEstimator> estimator, DetectorSettings settings = {});

    domain::DetectionResult detect(const std::string& path,
                                   const std::string& content,
                                   const std::optional<domain::StructuralSummary>& summary,
                                   long long targetTokens,
                                   long long fileTokens) const override;

    /// Boundary after each line (index 0 is line 1).
    std::vector<domain::BoundaryType> classifyLines(const std::vector<std::string>& lines,
                                                    const LanguageRules& rules,
                                                    const std::optional<domain::StructuralSummary>& summary) const;

    /// Per-line token weights; rescaled to fileTokens when it is positive.
    std::vector<long long> lineTokens(const std::vector<std::string>& lines, long long fileTokens) const;

private:
    struct LineRange {
        int first = 0;      ///< 0-based inclusive.
        int last = 0;
        bool forced = false;
    };

    std::vector<LineRange> segment(const std::vector<long long>& tokens,
                                   const std::vector<domain::BoundaryType>& boundaries,
                                   long long targetTokens) const;

    std::shared_ptr<domain::TokenEstimator> m_estimator;
    DetectorSettings m_settings;
};

} // namespace batchplanner::infrastructure

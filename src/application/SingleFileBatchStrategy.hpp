/**
 * @file SingleFileBatchStrategy.hpp
 * @brief One batch per medium-sized file, annotated with importance and complexity.
 */

#pragma once

#include "application/StrategyResult.hpp"
#include "domain/PlannerConfig.hpp"
#include "domain/SourceFile.hpp"

#include <string>
#include <vector>

namespace batchplanner::application {

class SingleFileBatchStrategy {
public:
    explicit SingleFileBatchStrategy(domain::PlannerConfig config);

    /**
     * @brief Wraps each file in [smallFileMaxTokens, mediumFileMaxTokens) into a Single batch.
     *
     * Output is ordered by descending importance; ties keep input order.
     */
    StrategyResult generateBatches(const std::vector<domain::PlannedFile>& files) const;

    /// 0-100: base 50, adjusted by name, path and structure.
    static int CalculateImportance(const domain::SourceFileRef& file);

    /// 0-100 from size, declarations, complexity score and nesting.
    static int CalculateComplexity(const domain::SourceFileRef& file, long long tokens);

    static std::vector<std::string> DetermineFocusAreas(const std::string& path);
    static std::vector<std::string> DetermineSpecialHandling(const domain::SourceFileRef& file, long long tokens);
    static std::string DetermineDocumentationStyle(const std::string& path);

    /// basic, comprehensive or detailed by position inside the medium band.
    std::string analysisDepthFor(long long tokens) const;
    std::string sizeCategoryFor(long long tokens) const;
    int qualityScoreFor(const domain::SourceFileRef& file, long long tokens) const;

private:
    domain::Batch buildBatch(const domain::PlannedFile& file) const;

    domain::PlannerConfig m_config;
};

} // namespace batchplanner::application

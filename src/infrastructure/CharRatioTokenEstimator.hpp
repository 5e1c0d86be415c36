/**
 * @file CharRatioTokenEstimator.hpp
 * @brief Character-ratio token estimation.
 */

#pragma once

#include "domain/TokenEstimator.hpp"

namespace batchplanner::infrastructure {

/**
 * @class CharRatioTokenEstimator
 * @brief ceil(codePoints * 0.25), or * 0.6 when CJK ideographs are present.
 */
class CharRatioTokenEstimator : public domain::TokenEstimator {
public:
    CharRatioTokenEstimator(double latinRatio = 0.25, double cjkRatio = 0.6);

    long long estimate(const std::string& text) const override;

    static bool ContainsCjk(const std::string& text);
    static long long CountCodePoints(const std::string& text);

private:
    double m_latinRatio;
    double m_cjkRatio;
};

} // namespace batchplanner::infrastructure

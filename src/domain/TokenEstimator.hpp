/**
 * @file TokenEstimator.hpp
 * @brief Pluggable token counting.
 */

#pragma once

#include <string>

namespace batchplanner::domain {

class TokenEstimator {
public:
    virtual ~TokenEstimator() = default;

    /// Estimated tokens for the text. Never negative.
    virtual long long estimate(const std::string& text) const = 0;
};

} // namespace batchplanner::domain

/**
 * @file Rejection.hpp
 * @brief Files the planner could not place in any batch.
 */

#pragma once

#include <string>

namespace batchplanner::domain {

enum class RejectionReason {
    EstimationError,    ///< Token estimate carried an error.
    SizeMismatch,       ///< Token count is implausible.
    TooSmall,           ///< Below the strategy's range.
    TooLarge,           ///< Above the strategy's range.
    DuplicatePath,      ///< Path already seen earlier in the input.
    Unplannable         ///< Rejected again after re-routing.
};

inline std::string RejectionReasonToString(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::EstimationError: return "estimation_error";
        case RejectionReason::SizeMismatch: return "size_mismatch";
        case RejectionReason::TooSmall: return "too_small";
        case RejectionReason::TooLarge: return "too_large";
        case RejectionReason::DuplicatePath: return "duplicate_path";
        case RejectionReason::Unplannable: return "unplannable";
    }
    return "unplannable";
}

struct FileRejection {
    std::string path;
    int originalIndex = 0;
    long long tokens = 0;
    RejectionReason reason = RejectionReason::Unplannable;
    std::string detail;
    std::string strategy;   ///< Tag of the rejecting strategy, "planner" for intake.
};

} // namespace batchplanner::domain

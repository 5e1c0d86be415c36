/**
 * @file Cancellation.hpp
 * @brief Coarse cancellation checked at file boundaries.
 */

#pragma once

#include <atomic>
#include <stdexcept>
#include <string>

namespace batchplanner::domain {

/**
 * @class PlanningCancelledError
 * @brief Raised when a run is cancelled. No partial plan is returned.
 */
class PlanningCancelledError : public std::runtime_error {
public:
    explicit PlanningCancelledError(const std::string& where)
        : std::runtime_error("Planning cancelled during " + where) {}
};

/**
 * @class CancellationToken
 * @brief Shared flag, safe to set from any thread.
 */
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }

    void throwIfCancelled(const std::string& where) const {
        if (isCancelled()) {
            throw PlanningCancelledError(where);
        }
    }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace batchplanner::domain

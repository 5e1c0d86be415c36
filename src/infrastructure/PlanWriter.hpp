/**
 * @file PlanWriter.hpp
 * @brief Writes plan documents to disk without leaving partial files behind.
 */

#pragma once

#include <string>

namespace batchplanner::infrastructure {

/**
 * @class PlanWriter
 * @brief Writes to a temp file next to the target, then renames it into place.
 */
class PlanWriter {
public:
    /**
     * @brief Atomically replaces the file's content.
     * @return false on failure (logged); the previous file, if any, is untouched.
     */
    static bool WriteAtomically(const std::string& filename, const std::string& content);
};

} // namespace batchplanner::infrastructure

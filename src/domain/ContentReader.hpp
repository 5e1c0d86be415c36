/**
 * @file ContentReader.hpp
 * @brief Access to file contents for chunking.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace batchplanner::domain {

/**
 * @class ContentReadError
 * @brief File missing, unreadable or not valid text.
 */
class ContentReadError : public std::runtime_error {
public:
    ContentReadError(const std::string& path, const std::string& reason)
        : std::runtime_error("Cannot read " + path + ": " + reason), m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

/**
 * @class ContentReader
 * @brief Reads a file by its planner path. Must be safe to call concurrently.
 */
class ContentReader {
public:
    virtual ~ContentReader() = default;

    /// @throws ContentReadError
    virtual std::string read(const std::string& path) const = 0;
};

} // namespace batchplanner::domain

/**
 * @file FileContentReader.hpp
 * @brief Filesystem implementation of ContentReader.
 */

#pragma once

#include "domain/ContentReader.hpp"

#include <string>

namespace batchplanner::infrastructure {

/**
 * @class FileContentReader
 * @brief Reads planner paths relative to a project root. Absolute paths are used as is.
 */
class FileContentReader : public domain::ContentReader {
public:
    explicit FileContentReader(const std::string& projectRoot);

    /** @brief Reads the whole file. @see domain::ContentReader::read */
    std::string read(const std::string& path) const override;

private:
    std::string m_projectRoot; ///< Base for relative paths.
};

} // namespace batchplanner::infrastructure

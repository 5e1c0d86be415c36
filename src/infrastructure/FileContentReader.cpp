/**
 * @file FileContentReader.cpp
 * @brief Implementation of the FileContentReader class.
 */
#include "infrastructure/FileContentReader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace batchplanner::infrastructure {

FileContentReader::FileContentReader(const std::string& projectRoot)
    : m_projectRoot(projectRoot) {}

std::string FileContentReader::read(const std::string& path) const {
    fs::path target = fs::path(path);
    if (target.is_relative() && !m_projectRoot.empty()) {
        target = fs::path(m_projectRoot) / target;
    }

    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        throw domain::ContentReadError(path, ec ? ec.message() : "not a regular file");
    }

    std::ifstream file(target, std::ios::binary);
    if (!file.is_open()) {
        throw domain::ContentReadError(path, "failed to open");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw domain::ContentReadError(path, "read failed");
    }

    std::string content = buffer.str();
    if (content.find('\0') != std::string::npos) {
        throw domain::ContentReadError(path, "binary content");
    }
    return content;
}

} // namespace batchplanner::infrastructure

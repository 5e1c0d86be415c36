/**
 * @file PlanWriter.cpp
 * @brief Implementation of PlanWriter.
 */

#include "infrastructure/PlanWriter.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace batchplanner::infrastructure {

namespace fs = std::filesystem;

namespace {

void RemoveQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[PlanWriter] Could not remove temp file " << path << ": " << ec.message() << std::endl;
    }
}

} // namespace

bool PlanWriter::WriteAtomically(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // filename.<timestamp>.tmp, unique per call
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[PlanWriter] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[PlanWriter] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PlanWriter] Write failed: " << tempPath << std::endl;
            ofs.close();
            RemoveQuietly(tempPath);
            return false;
        }
    }

    try {
        fs::rename(tempPath, finalPath);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[PlanWriter] Rename failed: " << e.what() << std::endl;
        RemoveQuietly(tempPath);
        return false;
    }
    return true;
}

} // namespace batchplanner::infrastructure

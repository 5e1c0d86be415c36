// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace batchplanner::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetDefaultConfigPath();
};

} // namespace batchplanner::infrastructure

/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving planner configuration (planner.json).
 *
 * Keys mirror the PlannerConfig field names. Missing keys keep their defaults,
 * so a file only needs the settings it changes.
 */

#pragma once

#include "domain/PlannerConfig.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace batchplanner::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads a planner.json file.
     * @param path File to read.
     * @return The config, or nullopt when the file is missing or malformed (logged).
     */
    static std::optional<domain::PlannerConfig> LoadFromFile(const std::string& path);

    /**
     * @brief Overlays the keys present in the object onto the defaults.
     * @throws nlohmann::json::exception when a key has the wrong type.
     */
    static domain::PlannerConfig FromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::PlannerConfig& config);

    /// Writes every setting. Returns false on I/O failure (logged).
    static bool SaveToFile(const std::string& path, const domain::PlannerConfig& config);
};

} // namespace batchplanner::infrastructure

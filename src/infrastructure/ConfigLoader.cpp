/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

namespace batchplanner::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

template <typename T>
void Read(const json& j, const char* key, T& field) {
    if (j.contains(key)) {
        field = j.at(key).get<T>();
    }
}

} // namespace

domain::PlannerConfig ConfigLoader::FromJson(const json& j) {
    domain::PlannerConfig config;
    if (!j.is_object()) {
        throw std::invalid_argument("planner configuration must be a JSON object");
    }

    Read(j, "smallFileMaxTokens", config.smallFileMaxTokens);
    Read(j, "mediumFileMaxTokens", config.mediumFileMaxTokens);
    Read(j, "targetBatchSize", config.targetBatchSize);
    Read(j, "maxBatchSize", config.maxBatchSize);
    Read(j, "minBatchSize", config.minBatchSize);
    Read(j, "maxFilesPerBatch", config.maxFilesPerBatch);
    Read(j, "enableSmartGrouping", config.enableSmartGrouping);
    Read(j, "singleBasicBandMax", config.singleBasicBandMax);
    Read(j, "singleComprehensiveBandMax", config.singleComprehensiveBandMax);
    Read(j, "addContextInfo", config.addContextInfo);
    Read(j, "targetChunkSize", config.targetChunkSize);
    Read(j, "chunkOverlapTokens", config.chunkOverlapTokens);
    Read(j, "boundaryTolerance", config.boundaryTolerance);
    Read(j, "minChunkFillRatio", config.minChunkFillRatio);
    Read(j, "carryForwardImports", config.carryForwardImports);
    Read(j, "maxConcurrentReads", config.maxConcurrentReads);
    Read(j, "maxPlausibleTokens", config.maxPlausibleTokens);

    if (j.contains("relationshipWeights")) {
        const json& w = j.at("relationshipWeights");
        auto& weights = config.relationshipWeights;
        Read(w, "sameDirectory", weights.sameDirectory);
        Read(w, "similarName", weights.similarName);
        Read(w, "sameExtension", weights.sameExtension);
        Read(w, "importDependency", weights.importDependency);
        Read(w, "sameModule", weights.sameModule);
        Read(w, "similarSize", weights.similarSize);
        Read(w, "nameSimilarityThreshold", weights.nameSimilarityThreshold);
        Read(w, "sizeRatioThreshold", weights.sizeRatioThreshold);
    }

    if (j.contains("splitQualityWeights")) {
        const json& w = j.at("splitQualityWeights");
        auto& weights = config.splitQualityWeights;
        Read(w, "structuralIntegrity", weights.structuralIntegrity);
        Read(w, "contextPreservation", weights.contextPreservation);
        Read(w, "sizeBalance", weights.sizeBalance);
        Read(w, "dependencyHandling", weights.dependencyHandling);
        Read(w, "readability", weights.readability);
        Read(w, "fallbackScore", weights.fallbackScore);
    }

    return config;
}

json ConfigLoader::ToJson(const domain::PlannerConfig& config) {
    const auto& rw = config.relationshipWeights;
    const auto& qw = config.splitQualityWeights;
    return json{
        {"smallFileMaxTokens", config.smallFileMaxTokens},
        {"mediumFileMaxTokens", config.mediumFileMaxTokens},
        {"targetBatchSize", config.targetBatchSize},
        {"maxBatchSize", config.maxBatchSize},
        {"minBatchSize", config.minBatchSize},
        {"maxFilesPerBatch", config.maxFilesPerBatch},
        {"enableSmartGrouping", config.enableSmartGrouping},
        {"singleBasicBandMax", config.singleBasicBandMax},
        {"singleComprehensiveBandMax", config.singleComprehensiveBandMax},
        {"addContextInfo", config.addContextInfo},
        {"targetChunkSize", config.targetChunkSize},
        {"chunkOverlapTokens", config.chunkOverlapTokens},
        {"boundaryTolerance", config.boundaryTolerance},
        {"minChunkFillRatio", config.minChunkFillRatio},
        {"carryForwardImports", config.carryForwardImports},
        {"maxConcurrentReads", config.maxConcurrentReads},
        {"maxPlausibleTokens", config.maxPlausibleTokens},
        {"relationshipWeights", {
            {"sameDirectory", rw.sameDirectory},
            {"similarName", rw.similarName},
            {"sameExtension", rw.sameExtension},
            {"importDependency", rw.importDependency},
            {"sameModule", rw.sameModule},
            {"similarSize", rw.similarSize},
            {"nameSimilarityThreshold", rw.nameSimilarityThreshold},
            {"sizeRatioThreshold", rw.sizeRatioThreshold},
        }},
        {"splitQualityWeights", {
            {"structuralIntegrity", qw.structuralIntegrity},
            {"contextPreservation", qw.contextPreservation},
            {"sizeBalance", qw.sizeBalance},
            {"dependencyHandling", qw.dependencyHandling},
            {"readability", qw.readability},
            {"fallbackScore", qw.fallbackScore},
        }},
    };
}

std::optional<domain::PlannerConfig> ConfigLoader::LoadFromFile(const std::string& path) {
    if (!fs::exists(path)) {
        return std::nullopt;
    }

    try {
        std::ifstream f(path);
        json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }

    return std::nullopt;
}

bool ConfigLoader::SaveToFile(const std::string& path, const domain::PlannerConfig& config) {
    fs::path configPath(path);
    try {
        if (configPath.has_parent_path() && !fs::exists(configPath.parent_path())) {
            fs::create_directories(configPath.parent_path());
        }
        std::ofstream f(configPath);
        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Cannot open " << path << " for writing" << std::endl;
            return false;
        }
        f << ToJson(config).dump(4) << std::endl;
        return !f.fail();
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << path << ": " << e.what() << std::endl;
    }
    return false;
}

} // namespace batchplanner::infrastructure

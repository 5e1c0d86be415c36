/**
 * @file ManifestReader.cpp
 * @brief Implementation of ManifestReader.
 */

#include "infrastructure/ManifestReader.hpp"
#include "domain/services/PathHeuristics.hpp"
#include "infrastructure/PlanJsonCodec.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace batchplanner::infrastructure {

using json = nlohmann::json;
using domain::services::PathHeuristics;

namespace {

const json* FirstKey(const json& entry, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (entry.contains(key) && !entry.at(key).is_null()) return &entry.at(key);
    }
    return nullptr;
}

std::string EntryPath(const json& entry) {
    if (!entry.is_object()) {
        throw std::invalid_argument("entry is not an object");
    }
    const json* path = FirstKey(entry, {"path", "filePath", "relativePath"});
    if (path == nullptr || !path->is_string() || path->get<std::string>().empty()) {
        throw std::invalid_argument("entry has no path");
    }
    return path->get<std::string>();
}

// Throws json::exception when a field has the wrong type.
void ParseFields(const json& entry, domain::SourceFileRef& ref) {
    const json* tokens = FirstKey(entry, {"tokenCount", "tokenEstimate", "tokens"});
    ref.tokenEstimate = tokens != nullptr ? PlanJsonCodec::TokenEstimateFromJson(*tokens)
                                          : domain::MakeErrorTokenEstimate(ref.path, "no token count in manifest");

    if (const json* size = FirstKey(entry, {"size", "sizeBytes"})) {
        ref.sizeBytes = size->get<long long>();
    }

    ref.language = entry.value("language", std::string());

    const json* summary = FirstKey(entry, {"structuralSummary", "codeStructure"});
    if (summary != nullptr && summary->is_object()) {
        const json& body = summary->contains("structure") ? summary->at("structure") : *summary;
        ref.structuralSummary = PlanJsonCodec::StructuralSummaryFromJson(body);
    }
}

} // namespace

Manifest ManifestReader::Parse(const json& document) {
    Manifest manifest;

    const json* entries = &document;
    if (document.is_object()) {
        manifest.projectRoot = document.value("projectRoot", std::string());
        if (!document.contains("files")) {
            throw std::runtime_error("manifest object has no \"files\" array");
        }
        entries = &document.at("files");
    }
    if (!entries->is_array()) {
        throw std::runtime_error("manifest files must be a JSON array");
    }

    int position = 0;
    for (const auto& entry : *entries) {
        domain::SourceFileRef ref;
        try {
            ref.path = EntryPath(entry);
        } catch (const std::invalid_argument& e) {
            std::string message = "entry " + std::to_string(position) + ": " + e.what();
            std::cerr << "[ManifestReader] Skipping " << message << std::endl;
            manifest.errors.push_back(message);
            ++position;
            continue;
        }

        try {
            ParseFields(entry, ref);
        } catch (const json::exception& e) {
            // Keep the file so the plan reports it as an estimation error.
            std::cerr << "[ManifestReader] Entry " << position << " (" << ref.path << ") is malformed: " << e.what()
                      << std::endl;
            ref.tokenEstimate = domain::MakeErrorTokenEstimate(ref.path, std::string("malformed manifest entry: ") + e.what());
            ref.sizeBytes = 0;
            ref.structuralSummary.reset();
        }

        if (ref.language.empty()) {
            ref.language = PathHeuristics::LanguageForExtension(PathHeuristics::Extension(ref.path));
        }
        if (ref.structuralSummary.has_value() && ref.structuralSummary->language.empty()) {
            ref.structuralSummary->language = ref.language;
        }
        manifest.files.push_back(std::move(ref));
        ++position;
    }
    return manifest;
}

Manifest ManifestReader::ReadFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open manifest " + path);
    }

    json document;
    try {
        f >> document;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Manifest " + path + " is not valid JSON: " + e.what());
    }

    Manifest manifest = Parse(document);
    std::cout << "[ManifestReader] Loaded " << manifest.files.size() << " files from " << path << std::endl;
    return manifest;
}

} // namespace batchplanner::infrastructure

/**
 * @file BatchPlannerCli.cpp
 * @brief Implementation of BatchPlannerCli.
 */

#include "app/BatchPlannerCli.hpp"
#include "application/BatchPlanner.hpp"
#include "application/PlanExportService.hpp"
#include "infrastructure/CharRatioTokenEstimator.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileContentReader.hpp"
#include "infrastructure/HeuristicBoundaryDetector.hpp"
#include "infrastructure/ManifestReader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PlanWriter.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <streambuf>

namespace batchplanner::app {

namespace fs = std::filesystem;
using namespace batchplanner::infrastructure;

namespace {

std::optional<domain::PlannerConfig> ResolveConfig(const CliOptions& options) {
    if (!options.configPath.empty()) {
        return ConfigLoader::LoadFromFile(options.configPath);
    }

    fs::path defaultPath = PathUtils::GetDefaultConfigPath();
    std::error_code ec;
    if (fs::exists(defaultPath, ec)) {
        return ConfigLoader::LoadFromFile(defaultPath.string());
    }
    return domain::PlannerConfig{};
}

std::string ResolveProjectRoot(const CliOptions& options, const Manifest& manifest) {
    if (!options.projectRoot.empty()) return options.projectRoot;

    fs::path manifestDir = fs::path(options.manifestPath).parent_path();
    if (manifest.projectRoot.empty()) return manifestDir.string();

    fs::path root = manifest.projectRoot;
    if (root.is_relative()) root = manifestDir / root;
    return root.string();
}

// Routes std::cout to stderr while alive so stdout carries only the plan document.
class ScopedLogRedirect {
public:
    explicit ScopedLogRedirect(bool active) : m_previous(active ? std::cout.rdbuf(std::cerr.rdbuf()) : nullptr) {}
    ~ScopedLogRedirect() {
        if (m_previous) std::cout.rdbuf(m_previous);
    }
    ScopedLogRedirect(const ScopedLogRedirect&) = delete;
    ScopedLogRedirect& operator=(const ScopedLogRedirect&) = delete;

private:
    std::streambuf* m_previous;
};

} // namespace

std::string BatchPlannerCli::Usage() {
    return "usage:\n"
           "  batchplanner plan <manifest.json> [--config path] [--root dir] [--out file] [--tasks] [--concurrency N]\n"
           "  batchplanner default-config <path>\n";
}

CliOptions BatchPlannerCli::ParseArguments(int argc, char** argv) {
    if (argc < 2) {
        throw std::invalid_argument("missing command");
    }

    CliOptions options;
    options.command = argv[1];
    int i = 2;

    if (options.command == "default-config") {
        if (i >= argc) throw std::invalid_argument("default-config needs a destination path");
        options.targetPath = argv[i++];
        if (i < argc) throw std::invalid_argument(std::string("unexpected argument: ") + argv[i]);
        return options;
    }
    if (options.command != "plan") {
        throw std::invalid_argument("unknown command: " + options.command);
    }
    if (i >= argc) throw std::invalid_argument("plan needs a manifest path");
    options.manifestPath = argv[i++];

    while (i < argc) {
        std::string flag = argv[i++];
        auto next = [&](std::string& dst) {
            if (i >= argc) throw std::invalid_argument("missing value after " + flag);
            dst = argv[i++];
        };

        if (flag == "--config") next(options.configPath);
        else if (flag == "--root") next(options.projectRoot);
        else if (flag == "--out") next(options.outputPath);
        else if (flag == "--tasks") options.emitTasks = true;
        else if (flag == "--concurrency") {
            std::string value;
            next(value);
            try {
                options.concurrency = std::stoi(value);
            } catch (const std::exception&) {
                throw std::invalid_argument("--concurrency expects a number, got " + value);
            }
            if (options.concurrency < 1) {
                throw std::invalid_argument("--concurrency must be at least 1");
            }
        }
        else throw std::invalid_argument("unknown flag: " + flag);
    }
    return options;
}

int BatchPlannerCli::Run(int argc, char** argv) {
    CliOptions options;
    try {
        options = ParseArguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[BatchPlannerCli] " << e.what() << "\n" << Usage();
        return 2;
    }

    try {
        if (options.command == "default-config") {
            return RunDefaultConfig(options);
        }
        return RunPlan(options);
    } catch (const domain::PlanningCancelledError& e) {
        std::cerr << "[BatchPlannerCli] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[BatchPlannerCli] Error: " << e.what() << std::endl;
        return 1;
    }
}

int BatchPlannerCli::RunDefaultConfig(const CliOptions& options) {
    if (!ConfigLoader::SaveToFile(options.targetPath, domain::PlannerConfig{})) {
        return 1;
    }
    std::cout << "[BatchPlannerCli] Wrote default configuration to " << options.targetPath << std::endl;
    return 0;
}

int BatchPlannerCli::RunPlan(const CliOptions& options) {
    auto loaded = ResolveConfig(options);
    if (!loaded) {
        std::cerr << "[BatchPlannerCli] Could not load configuration" << std::endl;
        return 2;
    }
    domain::PlannerConfig config = *loaded;
    if (options.concurrency > 0) {
        config.maxConcurrentReads = options.concurrency;
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "[BatchPlannerCli] Invalid configuration: " << problem << std::endl;
        }
        return 2;
    }

    std::optional<ScopedLogRedirect> redirect;
    redirect.emplace(options.outputPath.empty());

    Manifest manifest = ManifestReader::ReadFile(options.manifestPath);
    for (const auto& error : manifest.errors) {
        std::cerr << "[BatchPlannerCli] Manifest " << error << std::endl;
    }

    std::string root = ResolveProjectRoot(options, manifest);
    std::cout << "[BatchPlannerCli] Project root: " << (root.empty() ? "." : root) << std::endl;

    auto estimator = std::make_shared<CharRatioTokenEstimator>();
    auto detector = std::make_shared<HeuristicBoundaryDetector>(estimator, DetectorSettings::FromConfig(config));
    auto reader = std::make_shared<FileContentReader>(root);

    application::BatchPlanner planner(config, detector, reader);
    application::PlanResult plan = planner.plan(manifest.files);

    nlohmann::json document;
    if (options.emitTasks) {
        std::vector<domain::Task> tasks = application::BatchPlanner::ToTasks(plan);
        document = application::PlanExportService::ToJson(plan, &tasks);
    } else {
        document = application::PlanExportService::ToJson(plan);
    }

    const std::string text = document.dump(2);
    redirect.reset();
    if (options.outputPath.empty()) {
        std::cout << text << std::endl;
        return 0;
    }

    if (!PlanWriter::WriteAtomically(options.outputPath, text + "\n")) {
        std::cerr << "[BatchPlannerCli] Could not write plan to " << options.outputPath << std::endl;
        return 1;
    }
    std::cout << "[BatchPlannerCli] Wrote " << plan.batches.size() << " batches to "
              << options.outputPath << std::endl;
    return 0;
}

} // namespace batchplanner::app

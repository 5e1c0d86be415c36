/**
 * @file BatchPlannerCli.hpp
 * @brief Command-line front end: manifest in, plan JSON out.
 */

#pragma once

#include <string>

namespace batchplanner::app {

/**
 * @struct CliOptions
 * @brief Parsed command line.
 */
struct CliOptions {
    std::string command;        ///< "plan" or "default-config".
    std::string manifestPath;
    std::string configPath;
    std::string projectRoot;
    std::string outputPath;     ///< Empty: print to stdout.
    std::string targetPath;     ///< default-config destination.
    bool emitTasks = false;
    int concurrency = 0;        ///< 0: keep the configured value.
};

/**
 * @class BatchPlannerCli
 * @brief Wires config, manifest, planner and writer together.
 */
class BatchPlannerCli {
public:
    /// @return 0 on success, 1 on runtime failure, 2 on usage or config errors.
    static int Run(int argc, char** argv);

    /// @throws std::invalid_argument on unknown flags or missing values.
    static CliOptions ParseArguments(int argc, char** argv);

    static std::string Usage();

private:
    static int RunPlan(const CliOptions& options);
    static int RunDefaultConfig(const CliOptions& options);
};

} // namespace batchplanner::app

#pragma once

/**
 * @file npm.hpp
 * @brief Dependency tree acquisition via `npm ls --all --json`
 */

#include "wormscan/common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wormscan::npm {

struct TreeOptions
{
    /// Pre-recorded `npm ls --json` output; relative paths resolve against working_dir
    std::optional<std::filesystem::path> override_path;
    std::filesystem::path working_dir = std::filesystem::current_path();
    std::string npm_command = "npm";
};

struct ProcessOutput
{
    int exit_status = 0;
    std::string out;
    std::string err;
};

/**
 * Run a program and capture stdout and stderr.
 *
 * @param argv Program and arguments; argv[0] is looked up on PATH
 * @param cwd Working directory for the child
 * @return Captured output, or SpawnFailed when the program cannot start
 */
[[nodiscard]] wormscan::Result<ProcessOutput> run_process(const std::vector<std::string>& argv,
                                                          const std::filesystem::path& cwd);

/**
 * Acquire the resolved dependency tree.
 *
 * Reads the override file when set, otherwise runs `npm ls --all --json`.
 * npm's exit status is ignored: it exits non-zero for extraneous or invalid
 * packages while still printing a usable tree. Empty output is NpmFailed.
 */
[[nodiscard]] wormscan::Result<nlohmann::json> read_dependency_tree(const TreeOptions& options);

}  // namespace wormscan::npm

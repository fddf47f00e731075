/**
 * @file test_npm.cpp
 * @brief Tests for subprocess capture and dependency tree acquisition
 */

#include "wormscan/npm.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

namespace {

namespace fs = std::filesystem;

using wormscan::npm::read_dependency_tree;
using wormscan::npm::run_process;
using wormscan::npm::TreeOptions;

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

/// Writes an executable shell script standing in for npm
[[nodiscard]] fs::path write_script(const fs::path& dir, const std::string& body)
{
    const auto path = dir / "fake-npm";
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body;
    }
    fs::permissions(path,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);
    return path;
}

TEST(NpmProcess, CapturesStdoutStderrAndStatus)
{
    auto result =
        run_process({"/bin/sh", "-c", "printf out; printf err >&2; exit 3"}, fs::current_path());
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->out, "out");
    EXPECT_EQ(result->err, "err");
    EXPECT_EQ(result->exit_status, 3);
}

TEST(NpmProcess, RunsInWorkingDirectory)
{
    TempDir dir("wormscan_npm_cwd");
    auto result = run_process({"/bin/sh", "-c", "pwd -P"}, dir.path());
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->out, fs::canonical(dir.path()).string() + "\n");
}

TEST(NpmProcess, LargeOutputDoesNotDeadlock)
{
    const std::string script =
        "i=0; while [ $i -lt 20000 ]; do echo line-$i; echo err-$i >&2; i=$((i+1)); done";
    auto result = run_process({"/bin/sh", "-c", script}, fs::current_path());
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_GT(result->out.size(), 100000U);
    EXPECT_GT(result->err.size(), 100000U);
}

TEST(NpmProcess, MissingProgramIsSpawnFailure)
{
    auto result = run_process({"wormscan-no-such-program"}, fs::current_path());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SpawnFailed");
}

TEST(NpmTree, OverrideFileRelativeToWorkingDir)
{
    TreeOptions options;
    options.working_dir = WORMSCAN_FIXTURE_DIR;
    options.override_path = "npm-tree-evil-1.2.3.json";
    auto tree = read_dependency_tree(options);
    ASSERT_TRUE(tree.has_value()) << tree.error().message;
    EXPECT_EQ(tree->at("dependencies").at("evil").at("version"), "1.2.3");
}

TEST(NpmTree, MissingOverrideFile)
{
    TreeOptions options;
    options.override_path = "/nonexistent/tree.json";
    auto tree = read_dependency_tree(options);
    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, "IOError");
}

TEST(NpmTree, NonZeroExitWithOutputIsAccepted)
{
    TempDir dir("wormscan_npm_noisy");
    const auto npm = write_script(dir.path(),
                                  "echo 'npm ERR! extraneous: left-pad' >&2\n"
                                  "echo '{\"name\":\"app\",\"dependencies\":{}}'\n"
                                  "exit 1\n");
    TreeOptions options;
    options.working_dir = dir.path();
    options.npm_command = npm.string();
    auto tree = read_dependency_tree(options);
    ASSERT_TRUE(tree.has_value()) << tree.error().message;
    EXPECT_EQ(tree->at("name"), "app");
}

TEST(NpmTree, EmptyOutputReportsStderr)
{
    TempDir dir("wormscan_npm_empty");
    const auto npm =
        write_script(dir.path(), "echo 'npm ERR! missing package.json' >&2\nexit 254\n");
    TreeOptions options;
    options.working_dir = dir.path();
    options.npm_command = npm.string();
    auto tree = read_dependency_tree(options);
    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, "NpmFailed");
    EXPECT_EQ(tree.error().message, "npm ls failed: npm ERR! missing package.json");
}

TEST(NpmTree, EmptyOutputWithoutStderr)
{
    TempDir dir("wormscan_npm_silent");
    const auto npm = write_script(dir.path(), "exit 0\n");
    TreeOptions options;
    options.working_dir = dir.path();
    options.npm_command = npm.string();
    auto tree = read_dependency_tree(options);
    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().message, "npm ls failed: npm ls produced no output");
}

TEST(NpmTree, GarbageOutputIsParseError)
{
    TempDir dir("wormscan_npm_garbage");
    const auto npm = write_script(dir.path(), "echo 'not json'\n");
    TreeOptions options;
    options.working_dir = dir.path();
    options.npm_command = npm.string();
    auto tree = read_dependency_tree(options);
    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, "ParseError");
    EXPECT_TRUE(tree.error().message.starts_with("Failed to parse JSON from npm ls: "));
}

TEST(NpmTree, SpawnFailure)
{
    TreeOptions options;
    options.npm_command = "wormscan-no-such-npm";
    auto tree = read_dependency_tree(options);
    ASSERT_FALSE(tree.has_value());
    EXPECT_TRUE(tree.error().message.starts_with("Failed to spawn npm ls: "));
}

}  // namespace

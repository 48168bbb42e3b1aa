#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/toolgate_errors.hpp"
#include "policy/policy_guard.hpp"
#include "test_support.hpp"

namespace {

using toolgate::core::errors::ErrorCategory;
using toolgate::core::errors::get_error;
using toolgate::core::errors::get_value;
using toolgate::core::errors::is_error;
using toolgate::policy::DirectoryMode;
using toolgate::policy::LaunchPolicy;
using toolgate::policy::PolicyGuard;
using toolgate::test_support::TempWorkspace;
using toolgate::test_support::write_file;

TEST(PolicyGuardTest, ResolvesCommandOnPath) {
    PolicyGuard guard;
    auto result = guard.validate_command("sh");
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).is_absolute());
    EXPECT_EQ(get_value(result).filename().string(), "sh");
}

TEST(PolicyGuardTest, AcceptsExecutablePath) {
    PolicyGuard guard;
    auto result = guard.validate_command(toolgate::test_support::fake_server_path());
    ASSERT_FALSE(is_error(result));
}

TEST(PolicyGuardTest, RejectsShellExpression) {
    PolicyGuard guard;
    auto result = guard.validate_command("python server.py | tee log");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Configuration);
    EXPECT_EQ(get_error(result).code, "shell_syntax_in_command");
}

TEST(PolicyGuardTest, RejectsCommandWithSubstitution) {
    PolicyGuard guard;
    auto result = guard.validate_command("$(whoami)");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "shell_syntax_in_command");
}

TEST(PolicyGuardTest, AcceptsExecutablePathContainingSpaces) {
    TempWorkspace workspace("policy_guard");
    const auto dir = workspace.root() / "My Tools";
    std::filesystem::create_directories(dir);
    const auto server = dir / "srv";
    std::filesystem::copy_file(toolgate::test_support::fake_server_path(), server);
    std::filesystem::permissions(server, std::filesystem::perms::owner_all);

    PolicyGuard guard;
    auto result = guard.validate_command(server.string());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), server);

    auto missing = guard.validate_command((dir / "missing srv").string());
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "shell_syntax_in_command");
}

TEST(PolicyGuardTest, RejectsUnknownCommand) {
    PolicyGuard guard;
    auto result = guard.validate_command("definitely-not-a-real-command-7d1f");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "command_not_found");
}

TEST(PolicyGuardTest, RejectsNonExecutableFile) {
    TempWorkspace workspace("policy_guard");
    const auto script = workspace.root() / "server.py";
    write_file(script, "print('hi')\n");

    PolicyGuard guard;
    auto result = guard.validate_command(script.string());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "command_not_executable");
}

TEST(PolicyGuardTest, RejectsEmptyCommand) {
    PolicyGuard guard;
    auto result = guard.validate_command("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_command");
}

TEST(PolicyGuardTest, CreatesMissingWorkingDirectory) {
    TempWorkspace workspace("policy_guard");
    const auto missing = workspace.root() / "servers" / "billing";

    PolicyGuard guard;
    auto result = guard.validate_working_directory(missing);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(std::filesystem::is_directory(missing));
}

TEST(PolicyGuardTest, CheckCreatableDoesNotCreateDirectory) {
    TempWorkspace workspace("policy_guard");
    const auto missing = workspace.root() / "servers" / "billing";

    PolicyGuard guard;
    auto result = guard.validate_working_directory(missing, DirectoryMode::CheckCreatable);
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "servers"));

    const auto file = workspace.root() / "plain.txt";
    write_file(file, "x");
    auto under_file = guard.validate_working_directory(file / "sub", DirectoryMode::CheckCreatable);
    ASSERT_TRUE(is_error(under_file));
    EXPECT_EQ(get_error(under_file).code, "working_directory_unavailable");
}

TEST(PolicyGuardTest, EmptyWorkingDirectoryMeansCurrentDirectory) {
    PolicyGuard guard;
    auto result = guard.validate_working_directory("");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), std::filesystem::weakly_canonical(std::filesystem::current_path()));
}

TEST(PolicyGuardTest, RejectsWorkingDirectoryThatIsAFile) {
    TempWorkspace workspace("policy_guard");
    const auto file = workspace.root() / "plain.txt";
    write_file(file, "x");

    PolicyGuard guard;
    auto result = guard.validate_working_directory(file);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "working_directory_unavailable");
}

TEST(PolicyGuardTest, KeepsWorkingDirectoryInsideServersRoot) {
    TempWorkspace workspace("policy_guard");
    LaunchPolicy policy;
    policy.servers_root = workspace.root();
    PolicyGuard guard(policy);

    auto inside = guard.validate_working_directory("billing");
    ASSERT_FALSE(is_error(inside));
    EXPECT_TRUE(std::filesystem::is_directory(workspace.root() / "billing"));

    auto outside = guard.validate_working_directory("../escaped");
    ASSERT_TRUE(is_error(outside));
    EXPECT_EQ(get_error(outside).code, "path_outside_servers_root");
    EXPECT_FALSE(std::filesystem::exists(workspace.root().parent_path() / "escaped"));
}

TEST(PolicyGuardTest, RejectsInvalidServersRoot) {
    PolicyGuard guard;
    const auto missing_root =
        std::filesystem::current_path() / "__missing_servers_root_4c2e__";
    std::error_code ec;
    std::filesystem::remove_all(missing_root, ec);
    auto result = guard.validate_path_in_root(missing_root, "a");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_servers_root");
}

}  // namespace

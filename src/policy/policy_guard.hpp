#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/toolgate_errors.hpp"

namespace toolgate::policy {

struct LaunchPolicy {
    // When set, server working directories must resolve inside this root.
    std::optional<std::filesystem::path> servers_root;
    // Characters that only mean something to a shell.
    std::string shell_metacharacters = ";|&$`<>(){}*?!~'\"\\\n";
};

enum class DirectoryMode {
    // Missing directories are created.
    Create,
    // Nothing is created; a missing directory must be creatable.
    CheckCreatable
};

class PolicyGuard {
public:
    explicit PolicyGuard(LaunchPolicy launch_policy = {});

    // Resolves a command to an executable file without involving a shell. A
    // path that names an executable is accepted as is, spaces included.
    core::errors::Result<std::filesystem::path> validate_command(
        const std::string& command) const;

    // Resolves a server working directory. Empty means the servers root, or
    // the core's own working directory when there is none.
    core::errors::Result<std::filesystem::path> validate_working_directory(
        const std::filesystem::path& working_directory,
        DirectoryMode mode = DirectoryMode::Create) const;

    core::errors::Result<std::filesystem::path> validate_path_in_root(
        const std::filesystem::path& root,
        const std::filesystem::path& target_path) const;

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static bool is_executable_file(const std::filesystem::path& path);
    static bool is_creatable_directory(const std::filesystem::path& path);
    core::errors::Result<std::filesystem::path> resolve_executable(
        const std::string& command) const;

    LaunchPolicy launch_policy_;
};

}  // namespace toolgate::policy

#include "policy/policy_guard.hpp"

#include <cstdlib>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace toolgate::policy {

using core::errors::ErrorCategory;
using core::errors::ToolgateError;

PolicyGuard::PolicyGuard(LaunchPolicy launch_policy)
    : launch_policy_(std::move(launch_policy)) {}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

bool PolicyGuard::is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

bool PolicyGuard::is_creatable_directory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path ancestor = path.parent_path();
    while (!ancestor.empty() && !std::filesystem::exists(ancestor, ec)) {
        if (ancestor == ancestor.parent_path()) {
            return false;
        }
        ancestor = ancestor.parent_path();
    }
    if (ancestor.empty()) {
        ancestor = std::filesystem::current_path(ec);
        if (ec) {
            return false;
        }
    }
    if (!std::filesystem::is_directory(ancestor, ec) || ec) {
        return false;
    }
    return access(ancestor.c_str(), W_OK | X_OK) == 0;
}

core::errors::Result<std::filesystem::path> PolicyGuard::resolve_executable(
    const std::string& command) const {
    if (command.find('/') != std::string::npos) {
        if (!is_executable_file(command)) {
            return ToolgateError{ErrorCategory::Configuration,
                                 "Command is not an executable file: " + command,
                                 "command_not_executable"};
        }
        return std::filesystem::path(command);
    }

    const char* path_env = std::getenv("PATH");
    const std::string search_path = path_env != nullptr ? path_env : "/usr/bin:/bin";
    std::size_t start = 0;
    while (start <= search_path.size()) {
        const std::size_t end = search_path.find(':', start);
        const std::string dir = search_path.substr(
            start, end == std::string::npos ? std::string::npos : end - start);
        if (!dir.empty()) {
            const auto candidate = std::filesystem::path(dir) / command;
            if (is_executable_file(candidate)) {
                return candidate;
            }
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }

    return ToolgateError{ErrorCategory::Configuration,
                         "Command not found on PATH: " + command,
                         "command_not_found"};
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_command(
    const std::string& command) const {
    if (command.empty()) {
        return ToolgateError{ErrorCategory::Configuration, "Command cannot be empty.",
                             "empty_command"};
    }

    // execve takes the path literally, so only a command that does not
    // resolve is checked for shell syntax.
    auto resolved = resolve_executable(command);
    if (!core::errors::is_error(resolved)) {
        return resolved;
    }
    for (const char c : command) {
        if (c == ' ' || c == '\t' ||
            launch_policy_.shell_metacharacters.find(c) != std::string::npos) {
            return ToolgateError{
                ErrorCategory::Configuration,
                "Command must name a single executable, not a shell expression: " + command,
                "shell_syntax_in_command",
                "Move flags into the arguments list."};
        }
    }
    return resolved;
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_working_directory(
    const std::filesystem::path& working_directory, const DirectoryMode mode) const {
    std::error_code ec;
    std::filesystem::path candidate = working_directory;
    if (launch_policy_.servers_root.has_value()) {
        if (candidate.empty()) {
            candidate = launch_policy_.servers_root.value();
        }
        auto contained =
            validate_path_in_root(launch_policy_.servers_root.value(), candidate);
        if (core::errors::is_error(contained)) {
            return core::errors::get_error(contained);
        }
        candidate = core::errors::get_value(contained);
    } else if (candidate.empty()) {
        candidate = std::filesystem::current_path(ec);
        if (ec) {
            return ToolgateError{ErrorCategory::Configuration,
                                 "Unable to determine current directory.",
                                 "working_directory_unavailable"};
        }
    }

    if (!std::filesystem::exists(candidate, ec) && mode == DirectoryMode::CheckCreatable) {
        if (!is_creatable_directory(candidate)) {
            return ToolgateError{ErrorCategory::Configuration,
                                 "Working directory does not exist and cannot be created: " +
                                     candidate.string(),
                                 "working_directory_unavailable"};
        }
        const auto resolved = std::filesystem::weakly_canonical(candidate, ec);
        if (ec) {
            return ToolgateError{ErrorCategory::Configuration,
                                 "Unable to resolve working directory: " + candidate.string(),
                                 "working_directory_unavailable"};
        }
        return resolved;
    }
    if (!std::filesystem::exists(candidate, ec)) {
        std::filesystem::create_directories(candidate, ec);
        if (ec) {
            return ToolgateError{ErrorCategory::Configuration,
                                 "Working directory does not exist and cannot be created: " +
                                     candidate.string(),
                                 "working_directory_unavailable"};
        }
    }
    if (!std::filesystem::is_directory(candidate, ec) || ec) {
        return ToolgateError{ErrorCategory::Configuration,
                             "Working directory is not a directory: " + candidate.string(),
                             "working_directory_unavailable"};
    }

    const auto canonical = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return ToolgateError{ErrorCategory::Configuration,
                             "Unable to resolve working directory: " + candidate.string(),
                             "working_directory_unavailable"};
    }
    return canonical;
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_root(
    const std::filesystem::path& root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return ToolgateError{ErrorCategory::Configuration,
                             "Servers root is not a directory: " + root.string(),
                             "invalid_servers_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return ToolgateError{ErrorCategory::Configuration,
                             "Unable to resolve servers root: " + root.string(),
                             "invalid_servers_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return ToolgateError{ErrorCategory::Configuration,
                             "Unable to resolve path: " + target_path.string(),
                             "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return ToolgateError{ErrorCategory::Configuration,
                             "Path escapes servers root: " + canonical_candidate.string(),
                             "path_outside_servers_root"};
    }

    return canonical_candidate;
}

}  // namespace toolgate::policy

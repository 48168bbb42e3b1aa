#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/settings.hpp"
#include "core/errors/toolgate_errors.hpp"

namespace toolgate::app::cli {

    enum class CliCommand {
        Serve,
        List,
        Register,
        Remove,
        Catalog,
        Invoke
    };

    // Normalized command line, ready for main() to act on.
    struct CliRequest {
        CliCommand command = CliCommand::List;
        toolgate::core::config::CoreSettings settings;
        std::vector<std::string> server_ids;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::string> tool_name;
        nlohmann::json arguments = nlohmann::json::object();
        bool verbose = false;
    };

    toolgate::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);
}

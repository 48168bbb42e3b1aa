#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace toolgate::app::cli {

    using namespace toolgate::core::errors;

    namespace {
        constexpr const char* kUsage =
            "Usage: toolgate <serve|list|register|remove|catalog|invoke> [--registry FILE] "
            "[--config FILE] [--server ID]... [--tool NAME] [--args JSON] "
            "[--fallback-data FILE] [--audit-dir DIR] [--servers-root DIR] [--call-timeout-ms N] "
            "[--verbose]";

        std::optional<CliCommand> command_from_string(const std::string& name) {
            if (name == "serve") return CliCommand::Serve;
            if (name == "list") return CliCommand::List;
            if (name == "register") return CliCommand::Register;
            if (name == "remove") return CliCommand::Remove;
            if (name == "catalog") return CliCommand::Catalog;
            if (name == "invoke") return CliCommand::Invoke;
            return std::nullopt;
        }
    }

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> registry;
        std::optional<std::string> config;
        std::vector<std::string> servers;
        std::optional<std::string> tool;
        std::optional<std::string> args;
        std::optional<std::string> fallback_data;
        std::optional<std::string> audit_dir;
        std::optional<std::string> servers_root;
        std::optional<std::string> call_timeout_ms;
        bool verbose = false;
    };

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ToolgateError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        const std::string command_name = argv[1];
        const auto command = command_from_string(command_name);
        if (!command.has_value()) {
            return ToolgateError{ErrorCategory::Input, "Unknown command: " + command_name, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and the command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            const bool has_value = i + 1 < args.size();
            if (flag == "--verbose") {
                raw.verbose = true;
                continue;
            }

            std::optional<std::string>* slot = nullptr;
            if (flag == "--registry") slot = &raw.registry;
            else if (flag == "--config") slot = &raw.config;
            else if (flag == "--tool") slot = &raw.tool;
            else if (flag == "--args") slot = &raw.args;
            else if (flag == "--fallback-data") slot = &raw.fallback_data;
            else if (flag == "--audit-dir") slot = &raw.audit_dir;
            else if (flag == "--servers-root") slot = &raw.servers_root;
            else if (flag == "--call-timeout-ms") slot = &raw.call_timeout_ms;
            else if (flag != "--server") {
                return ToolgateError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }

            if (!has_value) {
                return ToolgateError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
            if (slot == nullptr) {
                raw.servers.push_back(args[++i]);
            } else {
                *slot = args[++i];
            }
        }

        // 3. Validator Phase: Enforce per-command requirements
        CliRequest req;
        req.command = command.value();
        req.verbose = raw.verbose;
        req.server_ids = raw.servers;
        if (raw.verbose) {
            req.settings.log_level = toolgate::core::logging::LogLevel::DEBUG;
        }
        if (raw.registry) req.settings.registry_path = raw.registry.value();
        if (raw.fallback_data) req.settings.fallback_data_path = raw.fallback_data.value();
        if (raw.audit_dir) req.settings.audit_dir = std::filesystem::path(raw.audit_dir.value());

        // Exception-free integer parsing
        if (raw.call_timeout_ms) {
            uint32_t timeout_ms = 0;
            const char* begin = raw.call_timeout_ms->data();
            const char* end = raw.call_timeout_ms->data() + raw.call_timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout_ms);
            if (ec != std::errc() || ptr != end) {
                return ToolgateError{ErrorCategory::Input, "Invalid number for --call-timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout_ms == 0 || timeout_ms > 600000) {
                return ToolgateError{ErrorCategory::Input, "--call-timeout-ms out of bounds", "bounds_error", "Must be between 1 and 600000."};
            }
            req.settings.call_timeout_ms = timeout_ms;
        }

        if (raw.servers_root) {
            std::filesystem::path root(raw.servers_root.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(root, path_ec);
            if (path_ec || !is_dir) {
                return ToolgateError{ErrorCategory::Input, "Servers root does not exist or is not a directory", "invalid_path"};
            }
            req.settings.servers_root = std::filesystem::canonical(root, path_ec);
            if (path_ec) {
                return ToolgateError{ErrorCategory::Input, "Failed to canonicalize servers root", "invalid_path"};
            }
        }

        if (req.command == CliCommand::Register) {
            if (!raw.config) {
                return ToolgateError{ErrorCategory::Input, "register requires --config", "missing_required_flag", "Provide a JSON server config file."};
            }
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(raw.config.value(), path_ec);
            if (path_ec || !is_file) {
                return ToolgateError{ErrorCategory::Input, "Config file does not exist: " + raw.config.value(), "invalid_path"};
            }
            req.config_file = std::filesystem::path(raw.config.value());
        } else if (raw.config) {
            return ToolgateError{ErrorCategory::Input, "--config is only valid with register", "conflicting_flags"};
        }

        if (req.command == CliCommand::Remove && req.server_ids.size() != 1) {
            return ToolgateError{ErrorCategory::Input, "remove requires exactly one --server", "missing_required_flag"};
        }

        if (req.command == CliCommand::Invoke) {
            if (!raw.tool || raw.tool->empty()) {
                return ToolgateError{ErrorCategory::Input, "invoke requires --tool", "missing_required_flag"};
            }
            req.tool_name = raw.tool.value();
        } else if (raw.tool || raw.args) {
            return ToolgateError{ErrorCategory::Input, "--tool and --args are only valid with invoke", "conflicting_flags"};
        }

        // Non-throwing JSON parsing
        if (raw.args) {
            auto parsed = nlohmann::json::parse(raw.args.value(), nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) {
                return ToolgateError{ErrorCategory::Input, "--args must be a JSON object", "invalid_json", "Example: --args '{\"rm\": 150}'"};
            }
            req.arguments = std::move(parsed);
        }

        return req;
    }

} // namespace toolgate::app::cli

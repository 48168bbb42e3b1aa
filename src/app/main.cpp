#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <pthread.h>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/errors/toolgate_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/wire_codec.hpp"
#include "service/tool_service.hpp"

namespace {

using toolgate::app::cli::CliCommand;
using toolgate::app::cli::CliRequest;
using toolgate::core::errors::get_error;
using toolgate::core::errors::get_value;
using toolgate::core::errors::is_error;
using toolgate::core::errors::ToolgateError;
using toolgate::service::ToolService;

void print_json(const nlohmann::json& value) {
    std::cout << value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

int report(const std::string& what, const ToolgateError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    return 3;
}

// Starts the servers named on the command line for the lifetime of one command.
void start_requested(ToolService& service, const CliRequest& req) {
    for (const auto& server_id : req.server_ids) {
        auto started = service.start(server_id);
        if (is_error(started)) {
            const auto& err = get_error(started);
            LOG_WARN("Server " + server_id + " not started [" + err.code + "]: " + err.message);
        } else if (get_value(started).last_error.has_value()) {
            LOG_WARN("Server " + server_id + " is in error: " +
                     get_value(started).last_error.value());
        }
    }
}

int run_serve(ToolService& service, const sigset_t& signals) {
    auto booted = service.boot();
    if (is_error(booted)) {
        return report("Boot failed", get_error(booted));
    }
    for (const auto& [server_id, reason] : get_value(booted).failed) {
        LOG_WARN("Server " + server_id + " failed to start: " + reason);
    }

    LOG_INFO("Serving; send SIGINT or SIGTERM to stop");
    int received = 0;
    sigwait(&signals, &received);
    LOG_INFO("Received signal " + std::to_string(received) + ", stopping servers");

    const auto stopped = service.stop_all();
    LOG_INFO("Stopped " + std::to_string(stopped) + " servers");
    return 0;
}

int run_list(ToolService& service) {
    nlohmann::json servers = nlohmann::json::array();
    for (const auto& config : service.list_servers()) {
        auto entry = toolgate::protocol::server_config_to_json(config);
        auto state = service.status(config.id);
        entry["status"] = is_error(state) ? std::string("unknown")
                                          : toolgate::protocol::to_string(get_value(state).status);
        servers.push_back(entry);
    }
    print_json(servers);
    return 0;
}

int run_register(ToolService& service, const CliRequest& req) {
    std::ifstream in(req.config_file.value());
    if (!in.is_open()) {
        LOG_ERROR("Unable to open config file: " + req.config_file->string());
        return 2;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    const auto payload = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (payload.is_discarded()) {
        LOG_ERROR("Config file is not valid JSON: " + req.config_file->string());
        return 2;
    }

    auto config = toolgate::protocol::server_config_from_json(payload);
    if (is_error(config)) {
        return report("Invalid server config", get_error(config));
    }
    auto registered = service.register_server(get_value(config));
    if (is_error(registered)) {
        return report("Registration failed", get_error(registered));
    }
    std::cout << get_value(registered) << std::endl;
    return 0;
}

int run_catalog(ToolService& service, const CliRequest& req) {
    start_requested(service, req);
    const auto catalog = service.get_tool_catalog(req.server_ids);
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : catalog.tools()) {
        tools.push_back(toolgate::protocol::descriptor_to_json(descriptor));
    }
    print_json(tools);
    return 0;
}

int run_invoke(ToolService& service, const CliRequest& req) {
    start_requested(service, req);
    const auto catalog = service.get_tool_catalog(req.server_ids);
    const auto record = service.invoke_tool(req.tool_name.value(), req.arguments, catalog);
    print_json(toolgate::protocol::record_to_json(record));
    return record.success ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    toolgate::core::logging::Logger::get().set_context("toolgate");

    // 1. Parse CLI input and return normalized input errors
    auto parsed = toolgate::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        const auto& err = get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& req = get_value(parsed);
    toolgate::core::logging::Logger::get().set_min_level(req.settings.log_level);

    // 2. Block termination signals before any worker thread exists so that
    // only the serve loop's sigwait sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (req.command == CliCommand::Serve) {
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    }

    // 3. Load the persisted registry; serve reloads it through boot() and reports there
    ToolService service(req.settings);
    auto loaded = service.load_registry();
    if (is_error(loaded) && req.command != CliCommand::Serve) {
        return report("Unable to load registry", get_error(loaded));
    }

    switch (req.command) {
        case CliCommand::Serve:
            return run_serve(service, signals);
        case CliCommand::List:
            return run_list(service);
        case CliCommand::Register:
            return run_register(service, req);
        case CliCommand::Remove: {
            auto removed = service.remove_server(req.server_ids.front());
            if (is_error(removed)) {
                return report("Removal failed", get_error(removed));
            }
            LOG_INFO("Removed server " + req.server_ids.front());
            return 0;
        }
        case CliCommand::Catalog:
            return run_catalog(service, req);
        case CliCommand::Invoke:
            return run_invoke(service, req);
    }
    return 2;
}

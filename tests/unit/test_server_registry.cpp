#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/toolgate_errors.hpp"
#include "process/process_supervisor.hpp"
#include "registry/server_registry.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using toolgate::core::errors::ErrorCategory;
using toolgate::core::errors::get_error;
using toolgate::core::errors::get_value;
using toolgate::core::errors::is_error;
using toolgate::process::ProcessSupervisor;
using toolgate::process::SupervisorOptions;
using toolgate::protocol::ServerStatus;
using toolgate::registry::ServerConfigPatch;
using toolgate::registry::ServerRegistry;
using toolgate::test_support::fake_server_config;
using toolgate::test_support::TempWorkspace;
using toolgate::test_support::write_file;

SupervisorOptions fast_options() {
    SupervisorOptions options;
    options.handshake_timeout = 2s;
    options.stop_grace = 1s;
    return options;
}

TEST(ServerRegistryTest, RegisterThenGetRoundTrips) {
    TempWorkspace workspace("registry");
    ProcessSupervisor supervisor(fast_options());
    ServerRegistry registry(workspace.root() / "servers.json", supervisor);

    auto config = fake_server_config("billing", {"--tools", "a,b"}, 5);
    config.environment = {{"TARIFF", "domestic"}, {"LEVEL", "2"}};
    config.working_directory = workspace.root() / "billing";

    auto registered = registry.register_server(config);
    ASSERT_FALSE(is_error(registered));
    EXPECT_EQ(get_value(registered), "billing");

    const auto fetched = registry.get("billing");
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->command, config.command);
    EXPECT_EQ(fetched->arguments, config.arguments);
    EXPECT_EQ(fetched->environment, config.environment);
    EXPECT_EQ(fetched->working_directory, config.working_directory);
    EXPECT_EQ(fetched->health_check_interval_s, 5U);
    EXPECT_GT(fetched->created_at_ms, 0);
}

TEST(ServerRegistryTest, WorkingDirectoryIsCreatedOnlyAtStart) {
    TempWorkspace workspace("registry");
    ProcessSupervisor supervisor(fast_options());
    ServerRegistry registry(workspace.root() / "servers.json", supervisor);

    ASSERT_FALSE(is_error(registry.register_server(fake_server_config("alpha"))));
    auto duplicate = fake_server_config("alpha");
    duplicate.working_directory = workspace.root() / "rejected";
    ASSERT_TRUE(is_error(registry.register_server(duplicate)));
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "rejected"));

    auto config = fake_server_config("billing");
    config.working_directory = workspace.root() / "servers" / "billing";
    ASSERT_FALSE(is_error(registry.register_server(config)));
    EXPECT_FALSE(std::filesystem::exists(config.working_directory));

    auto started = supervisor.start(config);
    ASSERT_FALSE(is_error(started));
    EXPECT_EQ(get_value(started).status, ServerStatus::Running);
    EXPECT_TRUE(std::filesystem::is_directory(config.working_directory));
    static_cast<void>(supervisor.stop("billing"));
}

TEST(ServerRegistryTest, GeneratesIdWhenAbsent) {
    TempWorkspace workspace("registry");
    ProcessSupervisor supervisor(fast_options());
    ServerRegistry registry(workspace.root() / "servers.json", supervisor);

    auto registered = registry.register_server(fake_server_config(""));
    ASSERT_FALSE(is_error(registered));
    const auto& id = get_value(registered);
    EXPECT_EQ(id.rfind("srv-", 0), 0U);
    EXPECT_EQ(id.size(), 16U);
    EXPECT_TRUE(registry.get(id).has_value());
}

TEST(ServerRegistryTest, RejectsInvalidConfigsWithoutPersisting) {
    TempWorkspace workspace("registry");
    const auto storage = workspace.root() / "servers.json";
    ProcessSupervisor supervisor(fast_options());
    ServerRegistry registry(storage, supervisor);

    auto shell = fake_server_config("shell");
    shell.command = "python server.py";
    auto rejected = registry.register_server(shell);
    ASSERT_TRUE(is_error(rejected));
    EXPECT_EQ(get_error(rejected).category, ErrorCategory::Configuration);

    auto bad_id = fake_server_config("bad id!");
    EXPECT_EQ(get_error(registry.register_server(bad_id)).code, "invalid_server_id");

    auto bad_env = fake_server_config("env");
    bad_env.environment = {{"A=B", "x"}};
    EXPECT_EQ(get_error(registry.register_server(bad_env)).code, "invalid_environment");

    EXPECT_TRUE(registry.list().empty());
    EXPECT_FALSE(std::filesystem::exists(storage));
}

TEST(ServerRegistryTest, RejectsDuplicateId) {
    TempWorkspace workspace("registry");
    ProcessSupervisor supervisor(fast_options());
    ServerRegistry registry(workspace.root() / "servers.json", supervisor);

    ASSERT_FALSE(is_error(registry.register_server(fake_server_config("alpha"))));
    auto duplicate = registry.register_server(fake_server_config("alpha"));
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).code, "duplicate_server_id");
    EXPECT_EQ(registry.list().size(), 1U);
}

TEST(ServerRegistryTest, PersistsAcrossInstances) {
    TempWorkspace workspace("registry");
    const auto storage = workspace.root() / "servers.json";
    ProcessSupervisor supervisor(fast_options());
    {
        ServerRegistry registry(storage, supervisor);
        auto config = fake_server_config("alpha");
        config.environment = {{"K", "v"}};
        ASSERT_FALSE(is_error(registry.register_server(config)));
    }

    ServerRegistry reloaded(storage, supervisor);
    auto loaded = reloaded.load();
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded), 1U);
    ASSERT_TRUE(reloaded.get("alpha").has_value());
    EXPECT_EQ(reloaded.get("alpha")->environment.at("K"), "v");
    // Loading never starts anything.
    EXPECT_EQ(supervisor.state("alpha").status, ServerStatus::Stopped);
}

TEST(ServerRegistryTest, CorruptFileIsStorageError) {
    TempWorkspace workspace("registry");
    const auto storage = workspace.root() / "servers.json";
    write_file(storage, "{ not json");
    ProcessSupervisor supervisor(fast_options());
    ServerRegistry registry(storage, supervisor);

    auto loaded = registry.load();
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).category, ErrorCategory::Storage);
    EXPECT_EQ(get_error(loaded).code, "registry_corrupt");
}

TEST(ServerRegistryTest, AutoStartsEnabledServer) {
    TempWorkspace workspace("registry");
    ProcessSupervisor supervisor(fast_options());
    ServerRegistry registry(workspace.root() / "servers.json", supervisor);

    auto config = fake_server_config("alpha");
    config.auto_start = true;
    ASSERT_FALSE(is_error(registry.register_server(config)));
    EXPECT_EQ(supervisor.state("alpha").status, ServerStatus::Running);
}

TEST(ServerRegistryTest, FailedAutoStartKeepsConfig) {
    TempWorkspace workspace("registry");
    ProcessSupervisor supervisor(fast_options());
    ServerRegistry registry(workspace.root() / "servers.json", supervisor);

    auto config = fake_server_config("alpha", {"--exit-immediately"});
    config.auto_start = true;
    auto registered = registry.register_server(config);
    ASSERT_FALSE(is_error(registered));
    EXPECT_TRUE(registry.get("alpha").has_value());
    EXPECT_EQ(supervisor.state("alpha").status, ServerStatus::Error);
}

TEST(ServerRegistryTest, UpdateAppliesPatchAndValidates) {
    TempWorkspace workspace("registry");
    ProcessSupervisor supervisor(fast_options());
    ServerRegistry registry(workspace.root() / "servers.json", supervisor);
    ASSERT_FALSE(is_error(registry.register_server(fake_server_config("alpha"))));

    ServerConfigPatch patch;
    patch.description = std::string("billing tools");
    patch.health_check_interval_s = 10U;
    auto updated = registry.update("alpha", patch);
    ASSERT_FALSE(is_error(updated));
    EXPECT_EQ(get_value(updated).description, "billing tools");
    EXPECT_EQ(registry.get("alpha")->health_check_interval_s, 10U);

    ServerConfigPatch invalid;
    invalid.health_check_interval_s = 0U;
    auto rejected = registry.update("alpha", invalid);
    ASSERT_TRUE(is_error(rejected));
    EXPECT_EQ(registry.get("alpha")->health_check_interval_s, 10U);

    auto missing = registry.update("ghost", patch);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "server_not_found");
}

TEST(ServerRegistryTest, RemoveStopsProcessAndDeletesConfig) {
    TempWorkspace workspace("registry");
    const auto storage = workspace.root() / "servers.json";
    ProcessSupervisor supervisor(fast_options());
    ServerRegistry registry(storage, supervisor);

    auto config = fake_server_config("alpha");
    config.auto_start = true;
    ASSERT_FALSE(is_error(registry.register_server(config)));
    ASSERT_EQ(supervisor.state("alpha").status, ServerStatus::Running);

    ASSERT_FALSE(is_error(registry.remove("alpha")));
    EXPECT_FALSE(registry.get("alpha").has_value());
    EXPECT_EQ(supervisor.state("alpha").status, ServerStatus::Stopped);
    EXPECT_EQ(supervisor.channel("alpha"), nullptr);

    std::ifstream in(storage);
    const auto document = nlohmann::json::parse(in);
    EXPECT_TRUE(document["servers"].empty());

    auto again = registry.remove("alpha");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "server_not_found");
}

}  // namespace

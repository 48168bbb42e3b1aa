#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include "catalog/tool_catalog.hpp"
#include "core/errors/toolgate_errors.hpp"
#include "fallback/fallback_tool_provider.hpp"
#include "process/process_supervisor.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using toolgate::catalog::CatalogBuilder;
using toolgate::core::errors::is_error;
using toolgate::fallback::FallbackToolProvider;
using toolgate::process::ProcessSupervisor;
using toolgate::process::SupervisorOptions;
using toolgate::protocol::AgentToolBinding;
using toolgate::protocol::ServerOwner;
using toolgate::test_support::fake_server_config;

class ToolCatalogTest : public ::testing::Test {
protected:
    ToolCatalogTest()
        : supervisor_(options()),
          fallback_(std::optional<toolgate::fallback::BillTable>{}),
          builder_(supervisor_, fallback_, 500ms) {}

    static SupervisorOptions options() {
        SupervisorOptions options;
        options.handshake_timeout = 2s;
        options.stop_grace = 1s;
        return options;
    }

    ProcessSupervisor supervisor_;
    FallbackToolProvider fallback_;
    CatalogBuilder builder_;
};

TEST_F(ToolCatalogTest, NoBoundServersYieldsFallbackTools) {
    const auto catalog = builder_.build({});
    EXPECT_TRUE(catalog.fallback_active());
    ASSERT_EQ(catalog.size(), fallback_.descriptors().size());
    for (const auto& tool : catalog.tools()) {
        EXPECT_TRUE(toolgate::protocol::is_fallback(tool.owner));
    }
}

TEST_F(ToolCatalogTest, RunningServerToolsAreTaggedWithOwner) {
    ASSERT_FALSE(is_error(supervisor_.start(fake_server_config("A", {"--tools", "t1,t2"}))));

    const auto catalog = builder_.build({"A"});
    EXPECT_FALSE(catalog.fallback_active());
    ASSERT_EQ(catalog.size(), 2U);
    for (const auto& tool : catalog.tools()) {
        const auto* owner = std::get_if<ServerOwner>(&tool.owner);
        ASSERT_NE(owner, nullptr);
        EXPECT_EQ(owner->server_id, "A");
    }
    EXPECT_NE(catalog.find("t1"), nullptr);
    EXPECT_NE(catalog.find("t2"), nullptr);
}

TEST_F(ToolCatalogTest, StoppedServerIsExcludedWithoutFallback) {
    ASSERT_FALSE(is_error(supervisor_.start(fake_server_config("A", {"--tools", "t1,t2"}))));
    ASSERT_EQ(builder_.build({"A"}).size(), 2U);

    supervisor_.stop("A");
    const auto catalog = builder_.build({"A"});
    EXPECT_TRUE(catalog.empty());
    EXPECT_FALSE(catalog.fallback_active());
    ASSERT_EQ(catalog.skipped_servers().size(), 1U);
    EXPECT_EQ(catalog.skipped_servers().front(), "A");
}

TEST_F(ToolCatalogTest, DuplicateNamesAcrossServersAreKept) {
    ASSERT_FALSE(is_error(supervisor_.start(fake_server_config("A", {"--tools", "lookup"}))));
    ASSERT_FALSE(is_error(supervisor_.start(fake_server_config("B", {"--tools", "lookup,extra"}))));

    const auto catalog = builder_.build({"A", "B"});
    ASSERT_EQ(catalog.size(), 3U);
    EXPECT_EQ(toolgate::protocol::describe(catalog.tools()[0].owner), "server:A");
    EXPECT_EQ(toolgate::protocol::describe(catalog.tools()[1].owner), "server:B");
    EXPECT_EQ(catalog.tools()[1].name, "lookup");
    EXPECT_EQ(toolgate::protocol::describe(catalog.find("lookup")->owner), "server:A");
}

TEST_F(ToolCatalogTest, UnresponsiveServerIsSkippedWithinTimeout) {
    ASSERT_FALSE(is_error(supervisor_.start(fake_server_config("A", {"--tools", "t1"}))));
    // Answers the handshake, then goes silent.
    ASSERT_FALSE(is_error(supervisor_.start(fake_server_config("B", {"--stall-after", "1"}))));

    const auto began = std::chrono::steady_clock::now();
    const auto catalog = builder_.build({"A", "B"});
    const auto took = std::chrono::steady_clock::now() - began;

    ASSERT_EQ(catalog.size(), 1U);
    EXPECT_EQ(catalog.tools().front().name, "t1");
    ASSERT_EQ(catalog.skipped_servers().size(), 1U);
    EXPECT_EQ(catalog.skipped_servers().front(), "B");
    EXPECT_LT(took, 1500ms);
}

TEST_F(ToolCatalogTest, BindingWithOnlyDisabledServersIsEmpty) {
    AgentToolBinding binding;
    binding.agent_id = "agent-1";
    binding.servers.push_back({"A", false});

    const auto catalog = builder_.build_for_agent(binding);
    EXPECT_TRUE(catalog.empty());
    EXPECT_FALSE(catalog.fallback_active());
}

TEST_F(ToolCatalogTest, EmptyBindingUsesFallback) {
    AgentToolBinding binding;
    binding.agent_id = "agent-1";
    EXPECT_TRUE(builder_.build_for_agent(binding).fallback_active());
}

}  // namespace

#include <gtest/gtest.h>
#include "core/errors/toolgate_errors.hpp"

using namespace toolgate::core::errors;

// A dummy function to simulate a tool call failing
Result<std::string> simulate_tool_call(bool should_fail) {
    if (should_fail) {
        return ToolgateError{ErrorCategory::ToolExecution, "Tool reported an error.", "tool_failed"};
    }
    return std::string("tool output here");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_tool_call(false);

    // Check that it is NOT an error
    EXPECT_FALSE(is_error(result));
    // Check that the value is correct
    EXPECT_EQ(get_value(result), "tool output here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_tool_call(true);

    // Check that it IS an error
    EXPECT_TRUE(is_error(result));

    // Check the error details
    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::ToolExecution);
    EXPECT_EQ(error.message, "Tool reported an error.");
    EXPECT_EQ(error.code, "tool_failed");
}

TEST(ErrorModelTest, CategoryNamesAreStable) {
    EXPECT_EQ(to_string(ErrorCategory::Configuration), "configuration");
    EXPECT_EQ(to_string(ErrorCategory::Timeout), "timeout");
    EXPECT_EQ(to_string(ErrorCategory::Protocol), "protocol");
    EXPECT_EQ(to_string(ErrorCategory::ToolExecution), "tool_execution");
    EXPECT_EQ(to_string(ErrorCategory::Unavailable), "unavailable");
}

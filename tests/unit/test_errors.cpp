#include <memory>
#include <gtest/gtest.h>
#include "core/errors/gate_errors.hpp"

using namespace shellgate::core::errors;

// A dummy function to simulate the shell failing to start
Result<std::string> simulate_spawn(bool should_fail) {
    if (should_fail) {
        return GateError{ErrorCategory::Spawn, "Shell not found", "spawn_failed"};
    }
    return std::string("/bin/bash");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_spawn(false);

    // Check that it is NOT an error
    EXPECT_FALSE(is_error(result));
    // Check that the value is correct
    EXPECT_EQ(get_value(result), "/bin/bash");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_spawn(true);

    // Check that it IS an error
    EXPECT_TRUE(is_error(result));

    // Check the error details
    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Spawn);
    EXPECT_EQ(error.message, "Shell not found");
    EXPECT_EQ(error.code, "spawn_failed");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, TakesMoveOnlyValues) {
    Result<std::unique_ptr<int>> result = std::make_unique<int>(7);
    ASSERT_FALSE(is_error(result));

    auto owned = take_value(result);
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ErrorModelTest, NamesEveryCategory) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Transport), "transport");
    EXPECT_EQ(to_string(ErrorCategory::Cancelled), "cancelled");
}

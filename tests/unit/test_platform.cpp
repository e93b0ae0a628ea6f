/**
 * @file test_platform.cpp
 * @brief Unit tests for platform detection and runtime queries
 */

#include <configs/common/platform.hpp>

#include <cstdlib>
#include <string>
#include <thread>

#include <gtest/gtest.h>

using namespace configs::common::platform;

// ============================================================================
// Compile-time Detection
// ============================================================================

class DetectionTest : public ::testing::Test {};

TEST_F(DetectionTest, LanguageVersion) {
    EXPECT_GE(CONFIGS_CPP_VERSION, 20);
}

TEST_F(DetectionTest, Names) {
    EXPECT_STRNE(CONFIGS_COMPILER_NAME, "");
    EXPECT_STRNE(CONFIGS_OS_NAME, "");
    EXPECT_STRNE(CONFIGS_BUILD_TYPE, "");
}

TEST_F(DetectionTest, BranchHints) {
    int taken = 0;
    if (CONFIGS_LIKELY(taken == 0)) {
        ++taken;
    }
    if (CONFIGS_UNLIKELY(taken == 0)) {
        ++taken;
    }
    EXPECT_EQ(taken, 1);
}

// ============================================================================
// Thread ID Tests
// ============================================================================

class ThreadIdTest : public ::testing::Test {};

TEST_F(ThreadIdTest, ConsistentResults) {
    EXPECT_EQ(get_thread_id(), get_thread_id());
}

TEST_F(ThreadIdTest, DifferentForDifferentThreads) {
    uint64_t main_tid  = get_thread_id();
    uint64_t other_tid = 0;

    std::thread t([&other_tid]() { other_tid = get_thread_id(); });
    t.join();

    EXPECT_NE(main_tid, other_tid);
}

// ============================================================================
// Environment Variable Tests
// ============================================================================

class EnvVarTest : public ::testing::Test {
protected:
    void TearDown() override { ::unsetenv("CONFIGS_TEST_VAR"); }
};

TEST_F(EnvVarTest, GetExistingVariable) {
    ::setenv("CONFIGS_TEST_VAR", "warn", 1);
    EXPECT_EQ(get_env("CONFIGS_TEST_VAR"), "warn");
}

TEST_F(EnvVarTest, GetNonexistentVariable) {
    EXPECT_TRUE(get_env("CONFIGS_NONEXISTENT_VAR_12345").empty());
}

// ============================================================================
// Terminal Detection
// ============================================================================

class TerminalTest : public ::testing::Test {};

TEST_F(TerminalTest, ConsistentResults) {
    EXPECT_EQ(stdout_is_terminal(), stdout_is_terminal());
}

#pragma once

#include <gtest/gtest.h>
#include <fmt/core.h>
#include <chrono>
#include <filesystem>
#include <string>

#include "utils/Logger.hpp"

namespace fs = std::filesystem;

// Helper functions shared by the test bodies and the worker processes.

size_t count_lines(const std::string &s);

bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(15));

/// Value of LOCKSTORE_TEST_SCALE ("small" shortens the stress tests).
std::string test_scale();

int scaled_value(int full_value, int small_value);

/// Writes `text` to `path` with plain stdio, bypassing the atomic writer.
void write_raw_file(const fs::path &path, const std::string &text);

/**
 * @brief Runs a worker body and maps its outcome to a process exit code.
 *
 * Assertion failures are turned into exceptions (throw_on_failure) so that a
 * failing ASSERT_* in a worker makes the process exit non-zero.
 */
template <typename Fn> int run_gtest_worker(Fn test_logic, const char *test_name)
{
    GTEST_FLAG_SET(throw_on_failure, true);

    int rc = 0;
    try
    {
        test_logic();
    }
    catch (const ::testing::AssertionException &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] GTest assertion failed in {}: {}\n", test_name,
                   e.what());
        rc = 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] {} threw an exception: {}\n", test_name, e.what());
        rc = 2;
    }
    lockstore::utils::Logger::instance().flush();
    return rc;
}

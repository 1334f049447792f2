// tests/helpers/test_entrypoint.h
#pragma once
#include <string>

/**
 * @brief Holds the path to the running test executable.
 *
 * Initialized in `main()`. Multi-process tests spawn this same binary with a
 * `module.scenario` argument to run a worker function in a child process.
 */
extern std::string g_self_exe_path;

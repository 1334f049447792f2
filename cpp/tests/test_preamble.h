#pragma once

// Core Google Test include
#include <gtest/gtest.h>

// Standard Library Includes (common across many tests)
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// Platform-specific headers for process management, etc.
#include "platform.hpp"
#if defined(PLATFORM_WIN64)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

#include <fmt/core.h>
#include <nlohmann/json.hpp>

// Project-specific common includes
#include "format_tools.hpp"
#include "recursion_guard.hpp"
#include "scope_guard.hpp"

#include "utils/AtomicFile.hpp"
#include "utils/ErrorCodes.hpp"
#include "utils/FileLock.hpp"
#include "utils/JsonStore.hpp"
#include "utils/Logger.hpp"

// Common using declarations
using namespace std::chrono_literals;
namespace fs = std::filesystem;

using namespace lockstore::basics;
using namespace lockstore::utils;

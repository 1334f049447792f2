#include "shared_test_helpers.h"

#include "utils/AtomicFile.hpp"

#include <cstdlib> // for getenv
#include <fstream>
#include <thread>

size_t count_lines(const std::string &s)
{
    size_t count = 0;
    for (char c : s)
        if (c == '\n') ++count;
    return count;
}

bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout)
{
    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < timeout)
    {
        std::string contents;
        if (lockstore::utils::read_file_contents(path, contents))
        {
            if (contents.find(expected) != std::string::npos) return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

std::string test_scale()
{
    const char *v = std::getenv("LOCKSTORE_TEST_SCALE");
    return v ? std::string(v) : std::string();
}

int scaled_value(int full_value, int small_value)
{
    if (test_scale() == "small") return small_value;
    return full_value;
}

void write_raw_file(const fs::path &path, const std::string &text)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << text;
}

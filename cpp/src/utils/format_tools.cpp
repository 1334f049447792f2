// format_tools.cpp
#include "format_tools.hpp"
#include "platform.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#if defined(PLATFORM_WIN64)
#define WIN32_LEAN_AND_MEAN
#include <windows.h>

#include <random>
#include <sstream>
#endif

namespace lockstore::format_tools
{

std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    // Seconds via fmt's chrono support, the fractional part appended by hand so the
    // output does not depend on whether this fmt version prints sub-seconds.
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::optional<uint64_t> parse_pid(std::string_view text) noexcept
{
    // 20 digits is the widest uint64_t; anything longer overflows.
    if (text.empty() || text.size() > 20)
        return std::nullopt;

    uint64_t value = 0;
    for (char c : text)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10)
            return std::nullopt;
        value = value * 10 + digit;
    }
    if (value == 0)
        return std::nullopt;
    return value;
}

#if defined(PLATFORM_WIN64)
static inline std::wstring normalize_backslashes(std::wstring s)
{
    for (auto &c : s)
        if (c == L'/')
            c = L'\\';
    return s;
}

std::wstring win32_to_long_path(const std::filesystem::path &p_in)
{
    std::error_code ec;
    std::filesystem::path abs = p_in;
    if (!abs.is_absolute())
    {
        abs = std::filesystem::absolute(abs, ec);
        if (ec)
            return std::wstring{};
    }
    std::wstring ws = normalize_backslashes(abs.wstring());

    if (ws.rfind(L"\\\\?\\", 0) == 0)
        return ws;
    if (ws.rfind(L"\\\\", 0) == 0)
        return std::wstring(L"\\\\?\\UNC\\") + ws.substr(2);
    return std::wstring(L"\\\\?\\") + ws;
}

std::wstring win32_make_unique_suffix()
{
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    DWORD pid = GetCurrentProcessId();
    DWORD tid = GetCurrentThreadId();

    std::random_device rd;
    std::mt19937_64 gen(rd());
    uint64_t r = gen();

    std::wstringstream ss;
    ss << L"." << pid << L"." << tid << L"." << now << L"." << std::hex << r;
    return ss.str();
}

std::wstring s2ws(const std::string &s)
{
    if (s.empty())
        return {};
    int required = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(),
                                       static_cast<int>(s.size()), nullptr, 0);
    if (required <= 0)
        return {};
    std::wstring w(required, L'\0');
    int written = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(),
                                      static_cast<int>(s.size()), w.data(), required);
    if (written == 0)
        return {};
    return w;
}
#endif

} // namespace lockstore::format_tools

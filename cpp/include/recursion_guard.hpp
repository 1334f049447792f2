#pragma once

/*******************************************************************************
 * @file recursion_guard.hpp
 * @brief Thread-local RAII marker used to refuse re-entrant calls on an object.
 *
 * `JsonStore::with_json_write` pushes the store's address while the user
 * callback runs. A nested mutating call on the same store from inside the
 * callback would wait on a marker lock that its own caller holds, so it is
 * rejected up front instead.
 ******************************************************************************/

#include <algorithm>
#include <vector>

namespace lockstore::basics
{

// Header-only and internal: not part of the exported ABI.
using recursion_stack_t = std::vector<const void *>;

inline recursion_stack_t &get_recursion_stack() noexcept
{
    static thread_local recursion_stack_t g_recursion_stack;
    return g_recursion_stack;
}

/**
 * @brief Records `key` on the calling thread's stack for the guard's lifetime.
 *
 * Construction may throw std::bad_alloc. Destruction never throws and copes
 * with out-of-order destruction by searching for the key.
 */
class RecursionGuard
{
  public:
    explicit RecursionGuard(const void *key) : key_(key) { get_recursion_stack().push_back(key_); }

    ~RecursionGuard() noexcept
    {
        auto &stack = get_recursion_stack();
        if (!stack.empty() && stack.back() == key_)
        {
            stack.pop_back();
            return;
        }
        auto it = std::find(stack.begin(), stack.end(), key_);
        if (it != stack.end())
        {
            stack.erase(it);
        }
    }

    RecursionGuard(const RecursionGuard &) = delete;
    RecursionGuard &operator=(const RecursionGuard &) = delete;
    RecursionGuard(RecursionGuard &&) = delete;
    RecursionGuard &operator=(RecursionGuard &&) = delete;

    /** @return true if `key` is on the current thread's stack. */
    [[nodiscard]] static bool is_recursing(const void *key) noexcept
    {
        const auto &stack = get_recursion_stack();
        return std::find(stack.crbegin(), stack.crend(), key) != stack.crend();
    }

  private:
    const void *key_;
};

} // namespace lockstore::basics

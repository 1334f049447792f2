#ifndef LOCKSTORE_SCOPE_GUARD_HPP
#define LOCKSTORE_SCOPE_GUARD_HPP

/*******************************************************************************
 * @file scope_guard.hpp
 * @brief Run a cleanup callable when the enclosing scope exits.
 *
 * Used by the lock and the store to guarantee that temporary files are
 * removed and file descriptors closed on every exit path.
 *
 * The callable runs inside a noexcept destructor: it must not throw. A throwing
 * cleanup terminates the process rather than being silently discarded.
 ******************************************************************************/

#include <type_traits>
#include <utility>

namespace lockstore::basics
{

template <typename F> class ScopeGuard
{
  public:
    using FnT = std::decay_t<F>;

    explicit ScopeGuard(F &&f) noexcept(std::is_nothrow_constructible_v<FnT, F &&>)
        : m_func(std::forward<F>(f))
    {
    }

    ScopeGuard(ScopeGuard &&rhs) noexcept(std::is_nothrow_move_constructible_v<FnT>)
        : m_func(std::move(rhs.m_func)), m_active(rhs.m_active)
    {
        rhs.dismiss();
    }

    ~ScopeGuard() noexcept { invoke(); }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// Disarm the guard; the callable will not run.
    void dismiss() noexcept { m_active = false; }

    /// Run the callable now (once) and disarm the guard.
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false;
            m_func();
        }
    }

    [[nodiscard]] bool active() const noexcept { return m_active; }

  private:
    FnT m_func;
    bool m_active = true;
};

template <typename F> [[nodiscard]] ScopeGuard<F> make_scope_guard(F &&f)
{
    return ScopeGuard<F>(std::forward<F>(f));
}

} // namespace lockstore::basics

#endif // LOCKSTORE_SCOPE_GUARD_HPP

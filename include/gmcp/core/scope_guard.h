#pragma once

#include <utility>

namespace gmcp {

/**
 * @brief Runs a callable when the enclosing scope exits, on every path.
 *
 * @code
 * auto cleanup = scope_exit([&] { proc.terminate(); });
 * ...
 * cleanup.dismiss(); // ownership handed elsewhere
 * @endcode
 */
template <typename Func> class ScopeGuard {
public:
    explicit ScopeGuard(Func func) : func_(std::move(func)) {}

    ~ScopeGuard() {
        if (active_) {
            func_();
        }
    }

    // Move-only
    ScopeGuard(ScopeGuard&& other) noexcept
        : func_(std::move(other.func_)), active_(other.active_) {
        other.active_ = false;
    }
    ScopeGuard& operator=(ScopeGuard&&) = delete;
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    void dismiss() noexcept { active_ = false; }

private:
    Func func_;
    bool active_ = true;
};

template <typename Func> ScopeGuard<Func> scope_exit(Func func) {
    return ScopeGuard<Func>(std::move(func));
}

} // namespace gmcp

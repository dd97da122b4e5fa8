#pragma once

#include <utility>

namespace pgtemp {

/**
 * @brief Run a callable when the enclosing scope is left
 *
 * @code
 * auto removeMarker = scope_exit([&] { fs::remove_all(markerDir, ec); });
 * if (auto rc = runCommand(dockerRun, false); !rc)
 *     return rc.error();   // marker removed here too
 * @endcode
 *
 * dismiss() cancels the call.
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

} // namespace pgtemp

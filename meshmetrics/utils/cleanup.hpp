// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <type_traits>
#include <utility>

namespace meshmetrics {

// Runs a callable when the guard leaves scope, including during stack unwinding. The lifecycle controller
// stacks these so that teardown runs in reverse order of a partially completed startup:
//
//   auto close_source = make_cleanup([&]() { source->close(); });
//   auto remove_pid = make_cleanup([&]() { remove_pid_file(path); });
//
template <typename Callable>
class ScopedCleanup final {
public:
    explicit ScopedCleanup(Callable callable) : callable_(std::move(callable)) {}
    ~ScopedCleanup() {
        if (armed_) {
            callable_();
        }
    }

    ScopedCleanup(const ScopedCleanup&) = delete;
    ScopedCleanup& operator=(const ScopedCleanup&) = delete;
    ScopedCleanup(ScopedCleanup&& other) noexcept(std::is_nothrow_move_constructible_v<Callable>) :
        callable_(std::move(other.callable_)), armed_(std::exchange(other.armed_, false)) {}
    ScopedCleanup& operator=(ScopedCleanup&&) = delete;

    // Disarms the guard. Rvalue-only so the released guard reads as consumed at the call site.
    void release() && { armed_ = false; }

private:
    Callable callable_;
    bool armed_ = true;
};

template <typename Callable>
[[nodiscard]] auto make_cleanup(Callable&& callable) {
    return ScopedCleanup<std::decay_t<Callable>>(std::forward<Callable>(callable));
}

}  // namespace meshmetrics

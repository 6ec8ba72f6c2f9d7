// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <type_traits>
#include <utility>

namespace tracelink {

// `ScopeExit` runs a callable when it leaves scope, on normal return and during stack unwinding alike.
// The daemon wraps its pipeline in one to guarantee the IPC socket file is removed on every exit path:
//
//   auto remove_socket = tracelink::make_scope_exit([&]() { remove_socket_file(path); });
//
template <typename Callable>
class ScopeExit final {
public:
    constexpr explicit ScopeExit(Callable callable) : callable_(std::move(callable)) {}
    ~ScopeExit() {
        if (callable_.has_value()) {
            (*callable_)();
        }
    }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;
    ScopeExit(ScopeExit&& other) noexcept : callable_(std::move(other.callable_)) { other.callable_.reset(); }
    ScopeExit& operator=(ScopeExit&& other) noexcept = delete;

    // Disarms the action. Rvalue-qualified so the disarmed object is visibly consumed at the call site.
    void release() && { callable_.reset(); }

private:
    std::optional<Callable> callable_;
};

template <typename Callable>
[[nodiscard]] auto make_scope_exit(Callable&& callable) {
    return ScopeExit<std::decay_t<Callable>>(std::forward<Callable>(callable));
}

}  // namespace tracelink

// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cxxabi.h>
#include <execinfo.h>

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <tt-logger/tt-logger.hpp>

namespace tracelink::assert {

namespace detail {

// backtrace_symbols() lines look like "binary(mangled+0x1f) [0x...]". Returns the frame with the symbol demangled
// where possible, otherwise the line unchanged.
inline std::string demangle_frame(std::string_view frame) {
    std::size_t open = frame.find('(');
    std::size_t plus = frame.find('+', open);
    if (open == std::string_view::npos || plus == std::string_view::npos || plus == open + 1) {
        return std::string(frame);
    }
    std::string mangled(frame.substr(open + 1, plus - open - 1));
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status), &std::free);
    if (status != 0 || demangled == nullptr) {
        return std::string(frame);
    }
    return fmt::format("{}({}{}", frame.substr(0, open), demangled.get(), frame.substr(plus));
}

}  // namespace detail

// Current call stack, innermost first, one line per frame, skipping the `skip` innermost frames.
inline std::string backtrace_to_string(int max_frames = 64, int skip = 1, std::string_view prefix = "") {
    std::unique_ptr<void*[]> frames(new void*[max_frames]);
    int depth = ::backtrace(frames.get(), max_frames);
    std::unique_ptr<char*, decltype(&std::free)> symbols(backtrace_symbols(frames.get(), depth), &std::free);
    if (symbols == nullptr) {
        return {};
    }
    std::string out;
    for (int i = skip; i < depth; ++i) {
        out += fmt::format("{}{}\n", prefix, detail::demangle_frame(symbols.get()[i]));
    }
    return out;
}

namespace detail {

inline bool backtrace_enabled() {
    static const bool enabled = std::getenv("TRACELINK_BACKTRACE") != nullptr;
    return enabled;
}

[[noreturn]] inline void fail(const char* file, int line, const char* kind, const char* condition, std::string info) {
    std::string message = fmt::format("{} @ {}:{}: {}", kind, file, line, condition);
    if (!info.empty()) {
        log_critical(tt::LogAlways, "{}: {}", kind, info);
        message += "\ninfo:\n" + info;
    }
    if (backtrace_enabled()) {
        message += "\nbacktrace:\n" + backtrace_to_string(100, 2, " --- ");
    }
    throw std::runtime_error(message);
}

[[noreturn]] inline void tl_throw(const char* file, int line, const char* kind, const char* condition) {
    fail(file, line, kind, condition, {});
}

template <typename... Args>
[[noreturn]] void tl_throw(
    const char* file,
    int line,
    const char* kind,
    const char* condition,
    fmt::format_string<const Args&...> format,
    const Args&... args) {
    fail(file, line, kind, condition, fmt::format(format, args...));
}

}  // namespace detail
}  // namespace tracelink::assert

#ifndef TL_THROW
#define TL_THROW(...) \
    tracelink::assert::detail::tl_throw(__FILE__, __LINE__, "TL_THROW", "tracelink::exception", ##__VA_ARGS__)
#endif

#ifndef TL_FATAL
#define TL_FATAL(condition, message, ...)                                                                    \
    do {                                                                                                     \
        if (not(condition)) [[unlikely]] {                                                                   \
            tracelink::assert::detail::tl_throw(                                                             \
                __FILE__, __LINE__, "TL_FATAL", #condition, message, ##__VA_ARGS__);                         \
            __builtin_unreachable();                                                                         \
        }                                                                                                    \
    } while (0)  // NOLINT(cppcoreguidelines-macro-usage)
#endif

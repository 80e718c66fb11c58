#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

inline std::string display(double s) {
    if (s == 0.0)
        return "0s";
    if (s < 0.0)
        return "-" + display(-s);
    if (s < 1e-9)
        return fmt::format("<1ns");
    if (s < 1e-6)
        return fmt::format("{:.1f}ns", s / 1e-9);
    if (s < 1e-3)
        return fmt::format("{:.1f}us", s / 1e-6);
    if (s < 1.0)
        return fmt::format("{:.1f}ms", s / 1e-3);
    if (s < 100.0)
        return fmt::format("{:.2f}s", s);
    return fmt::format("{}m{}s", (uint64_t)(s) / 60, (uint64_t)(s) % 60);
}

inline std::string display_bytes(uint64_t byte) {
    if (byte < 1000ull)
        return fmt::format("{}B", byte);
    if (byte < 1024 * 1024ull)
        return fmt::format("{:.2f}KiB", 1.0 * byte / 1024);
    return fmt::format("{:.2f}MiB", 1.0 * byte / 1024 / 1024);
}

// VERBOSE=<anything non-empty> turns on diagnostics on stderr
inline bool verbose() {
    static const bool v = ::getenv("VERBOSE") && *::getenv("VERBOSE");
    return v;
}

template <typename ... TArgs>
void trace(fmt::format_string<TArgs...> pattern, TArgs && ... args) {
    if (!verbose())
        return;
    fmt::print(stderr, "[advent] ");
    fmt::print(stderr, pattern, std::forward<TArgs>(args)...);
    fmt::print(stderr, "\n");
}

[[nodiscard]] constexpr inline std::string_view trim(std::string_view sv) {
    constexpr std::string_view ws = " \t\r\n\v\f";
    auto first = sv.find_first_not_of(ws);
    if (first == std::string_view::npos)
        return {};
    auto last = sv.find_last_not_of(ws);
    return sv.substr(first, last - first + 1);
}

#pragma once

#include <charconv>
#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <boost/container/small_vector.hpp>
#include <fmt/format.h>

#include "error.hpp"
#include "util.hpp"

template <std::integral T>
T parse_number(std::string_view sv, std::string_view what = "number") {
    T v{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    if (ec == std::errc::result_out_of_range)
        throw parse_error{ fmt::format("{} \"{}\" is out of range", what, sv) };
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
        throw parse_error{ fmt::format("expected a {}, found \"{}\"", what, sv) };
    return v;
}

// integers are read directly; anything else provides `static T parse(std::string_view)`
template <typename T>
T parse_item(std::string_view sv) {
    if constexpr (std::integral<T>)
        return parse_number<T>(sv);
    else
        return T::parse(sv);
}

// func(line_number, line) for every line, blank ones included; numbers are 1-based
void foreach_line(std::string_view text, auto &&func) {
    auto number = 0zu;
    for (;;) {
        auto nl = text.find('\n');
        func(++number, text.substr(0, nl));
        if (nl == std::string_view::npos)
            return;
        text.remove_prefix(nl + 1);
    }
}

// prefix parse errors raised by func with the line they came from
auto on_line(size_t number, auto &&func) -> decltype(func()) {
    try {
        return func();
    } catch (const parse_error &e) {
        throw parse_error{ fmt::format("line {}: {}", number, e.what()) };
    }
}

// one item per non-blank line, surrounding whitespace trimmed
template <typename T>
struct Lines : std::vector<T> {
    using std::vector<T>::vector;

    static Lines parse(std::string_view text) {
        Lines items;
        foreach_line(text, [&](size_t number, std::string_view line) {
            line = trim(line);
            if (line.empty())
                return;
            items.push_back(on_line(number, [&] { return parse_item<T>(line); }));
        });
        return items;
    }
};

struct Line {
    size_t number;
    std::string_view text; // trimmed, never empty
};

using group_t = boost::container::small_vector<Line, 8>;

// runs of non-blank lines separated by one or more blank lines
std::vector<group_t> split_groups(std::string_view text);

// throws input_error naming the byte offset of the first malformed sequence
void check_utf8(std::string_view text);

// throws parse_error on malformed sequences
[[nodiscard]] std::u32string decode_utf8(std::string_view sv);
[[nodiscard]] std::string encode_utf8(char32_t c);

// the bytes of the leading code point; a single byte when it is malformed
[[nodiscard]] std::string_view first_code_point(std::string_view sv);

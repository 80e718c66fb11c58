#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "input.hpp"

// "1-3 a": two numbers and a letter, read differently by each policy.
// the letter is one code point; passwords are counted in code points too
struct Rule {
    size_t a, b;
    char32_t letter;

    bool operator==(const Rule &other) const = default;

    // throws parse_error unless shaped like "2-15 x" with a word character for x
    static Rule parse(std::string_view sv);
};

struct Entry {
    Rule rule;
    std::string password;

    bool operator==(const Entry &other) const = default;

    // "<rule>: <password>"
    static Entry parse(std::string_view sv);
};

// occurrences of rule.letter within [rule.a, rule.b]
[[nodiscard]] bool occurrence_policy(const Rule &rule, std::string_view password);

// exactly one of the 1-based positions rule.a, rule.b holds rule.letter;
// throws solve_error when a position falls outside the password
[[nodiscard]] bool position_policy(const Rule &rule, std::string_view password);

size_t password_philosophy_occurrences(const Lines<Entry> &entries);
size_t password_philosophy_positions(const Lines<Entry> &entries);

template <>
struct fmt::formatter<Rule> : formatter<string_view> {
    auto format(const Rule &r, format_context &ctx) const -> format_context::iterator;
};

#include "password.hpp"

#include <algorithm>
#include <cctype>

#include "challenge.hpp"

// ASCII letters, digits and '_'; any code point beyond ASCII counts as a letter
static bool is_word_char(char32_t c) {
    if (c >= 0x80)
        return true;
    return std::isalnum(static_cast<unsigned char>(c)) || c == U'_';
}

Rule Rule::parse(std::string_view sv) {
    auto shape = [&] {
        return parse_error{ fmt::format("Rules should look like \"2-15 x\", found \"{}\"", sv) };
    };

    auto dash = sv.find('-');
    if (dash == std::string_view::npos)
        throw shape();
    auto end = sv.find_first_not_of("0123456789", dash + 1);
    if (end == std::string_view::npos)
        throw shape();

    auto first = sv.substr(0, dash);
    auto second = sv.substr(dash + 1, end - dash - 1);
    auto letters = trim(sv.substr(end));
    if (letters.empty())
        throw shape();
    auto decoded = decode_utf8(letters);
    if (decoded.size() != 1)
        throw parse_error{ fmt::format("The rule should only include one letter, found \"{}\"", letters) };
    if (!is_word_char(decoded.front()))
        throw parse_error{ fmt::format("The rule letter should be a word character, found \"{}\"", letters) };

    return Rule{
        parse_number<size_t>(first, "first value"),
        parse_number<size_t>(second, "second value"),
        decoded.front() };
}

Entry Entry::parse(std::string_view sv) {
    auto colon = sv.find(':');
    if (colon == std::string_view::npos)
        throw parse_error{ "Expected the rule and password to be separated by a colon" };
    auto password = trim(sv.substr(colon + 1));
    (void)decode_utf8(password);
    return Entry{ Rule::parse(trim(sv.substr(0, colon))), std::string{ password } };
}

bool occurrence_policy(const Rule &rule, std::string_view password) {
    auto n = static_cast<size_t>(std::ranges::count(decode_utf8(password), rule.letter));
    return rule.a <= n && n <= rule.b;
}

bool position_policy(const Rule &rule, std::string_view password) {
    auto chars = decode_utf8(password);
    auto at = [&](size_t pos) {
        if (pos == 0 || pos > chars.size())
            throw solve_error{ fmt::format("Position {} of rule \"{}\" is outside the password \"{}\"",
                    pos, rule, password) };
        return chars[pos - 1] == rule.letter;
    };
    return at(rule.a) != at(rule.b);
}

size_t password_philosophy_occurrences(const Lines<Entry> &entries) {
    return static_cast<size_t>(std::ranges::count_if(entries, [](const Entry &e) {
        return occurrence_policy(e.rule, e.password);
    }));
}

size_t password_philosophy_positions(const Lines<Entry> &entries) {
    return static_cast<size_t>(std::ranges::count_if(entries, [](const Entry &e) {
        return position_policy(e.rule, e.password);
    }));
}

auto fmt::formatter<Rule>::format(const Rule &r, format_context &ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(fmt::format("{}-{} {}", r.a, r.b, encode_utf8(r.letter)), ctx);
}

static constexpr std::string_view example = R"(1-3 a: abcde
1-3 b: cdefg
2-9 c: ccccccccc
)";

void register_password_philosophy(Registry &r) {
    r.add(make_challenge<&password_philosophy_occurrences>(
        "Day 2a: Password Philosophy",
        "Count the passwords whose letter appears between the rule's lowest and highest number of times.",
        { { example, "2" } }));
    r.add(make_challenge<&password_philosophy_positions>(
        "Day 2b: Password Philosophy",
        "Count the passwords where exactly one of the two 1-based positions holds the rule's letter.",
        { { example, "1" } }));
}

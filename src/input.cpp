#include "input.hpp"

#include <iterator>
#include <utility>

#include <boost/locale/utf.hpp>

namespace utf = boost::locale::utf;
using utf8_t = utf::utf_traits<char>;

std::vector<group_t> split_groups(std::string_view text) {
    std::vector<group_t> groups;
    group_t current;
    foreach_line(text, [&](size_t number, std::string_view line) {
        line = trim(line);
        if (!line.empty()) {
            current.push_back(Line{ number, line });
            return;
        }
        if (!current.empty()) {
            groups.push_back(std::move(current));
            current.clear();
        }
    });
    if (!current.empty())
        groups.push_back(std::move(current));
    return groups;
}

static bool malformed(utf::code_point c) {
    return c == utf::illegal || c == utf::incomplete;
}

void check_utf8(std::string_view text) {
    for (auto p = text.begin(); p != text.end(); ) {
        auto at = p - text.begin();
        if (malformed(utf8_t::decode(p, text.end())))
            throw input_error{ fmt::format(
                    "Unable to read the input as UTF-8 text (malformed sequence at byte {})", at) };
    }
}

std::u32string decode_utf8(std::string_view sv) {
    std::u32string res;
    for (auto p = sv.begin(); p != sv.end(); ) {
        auto c = utf8_t::decode(p, sv.end());
        if (malformed(c))
            throw parse_error{ "Expected UTF-8 text" };
        res.push_back(static_cast<char32_t>(c));
    }
    return res;
}

std::string encode_utf8(char32_t c) {
    std::string res;
    utf8_t::encode(c, std::back_inserter(res));
    return res;
}

std::string_view first_code_point(std::string_view sv) {
    if (sv.empty())
        return sv;
    auto p = sv.begin();
    if (malformed(utf8_t::decode(p, sv.end())))
        return sv.substr(0, 1);
    return sv.substr(0, static_cast<size_t>(p - sv.begin()));
}

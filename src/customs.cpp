#include "customs.hpp"

#include <functional>
#include <numeric>

#include "challenge.hpp"

Response Response::parse(std::string_view sv) {
    mask_t v{};
    for (auto i = 0zu; i < sv.size(); i++) {
        auto ch = sv[i];
        if (ch < 'a' || ch > 'z')
            throw parse_error{ fmt::format("Expected a lowercase letter, found \"{}\"",
                    first_code_point(sv.substr(i))) };
        v |= mask_t{ 1 } << (ch - 'a');
    }
    return Response{ v };
}

Response ResponseGroup::merge_any() const {
    return std::accumulate(members.begin(), members.end(), Response{}, std::bit_or{});
}

Response ResponseGroup::merge_all() const {
    return std::accumulate(members.begin(), members.end(), Response{ Response::ALL }, std::bit_and{});
}

Responses Responses::parse(std::string_view sv) {
    Responses groups;
    for (auto &lines : split_groups(sv)) {
        ResponseGroup g;
        for (auto &l : lines)
            g.members.push_back(on_line(l.number, [&] { return Response::parse(l.text); }));
        groups.push_back(std::move(g));
    }
    return groups;
}

size_t questions_anyone_answered(const Responses &groups) {
    auto total = 0zu;
    for (auto &g : groups)
        total += g.merge_any().pop_count();
    return total;
}

size_t questions_everyone_answered(const Responses &groups) {
    auto total = 0zu;
    for (auto &g : groups)
        total += g.merge_all().pop_count();
    return total;
}

static constexpr std::string_view example = R"(abc

a
b
c

ab
ac

a
a
a
a

b
)";

void register_custom_customs(Registry &r) {
    r.add(make_challenge<&questions_anyone_answered>(
        "Day 6a: Custom Customs",
        "Sum, over every group, the number of questions anyone in the group answered yes to.",
        { { example, "11" } }));
    r.add(make_challenge<&questions_everyone_answered>(
        "Day 6b: Custom Customs",
        "Sum, over every group, the number of questions everyone in the group answered yes to.",
        { { example, "6" } }));
}

#include "challenge.hpp"

#include <algorithm>
#include <chrono>
#include <regex>
#include <tuple>

#include "util.hpp"

Label parse_label(std::string_view label) {
    static const std::regex pattern{ R"(day\s+(\w+)\s*:\s*([\w ]+))", std::regex::icase };

    if (trim(label).empty())
        throw challenge_error{ "Challenges must have a label for their name and day" };

    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(label.begin(), label.end(), m, pattern))
        throw challenge_error{ fmt::format(
                "Unable to determine the challenge name and day from \"{}\". "
                "Expected something like \"Day 1: Report Repair\"", label) };

    auto name = trim(std::string_view{ &*m[2].first, static_cast<size_t>(m[2].length()) });
    return Label{ m[1].str(), std::string{ name } };
}

void Registry::add(Challenge c) {
    if (find(c.id))
        throw challenge_error{ fmt::format("Challenge \"{}\" is registered twice", c.id) };
    if (!c.solve)
        throw challenge_error{ fmt::format("Challenge \"{}\" has nothing to run", c.id) };
    challenges.push_back(std::move(c));
}

const Challenge *Registry::find(std::string_view id) const {
    auto it = std::ranges::find(challenges, id, &Challenge::id);
    if (it == challenges.end())
        return nullptr;
    return &*it;
}

static auto natural_key(std::string_view id) {
    auto digits = std::min(id.find_first_not_of("0123456789"), id.size());
    return std::make_tuple(digits, id.substr(0, digits), id.substr(digits));
}

std::vector<const Challenge *> Registry::sorted() const {
    std::vector<const Challenge *> res;
    for (auto &c : challenges)
        res.push_back(&c);
    std::ranges::sort(res, [](const Challenge *l, const Challenge *r) {
        return natural_key(l->id) < natural_key(r->id);
    });
    return res;
}

Registry build_registry() {
    Registry r;
    register_report_repair(r);
    register_password_philosophy(r);
    register_toboggan_trajectory(r);
    register_passport_processing(r);
    register_binary_boarding(r);
    register_custom_customs(r);
    return r;
}

const Registry &registry() {
    static const Registry r = build_registry();
    return r;
}

std::string run(const Registry &reg, std::string_view id, std::string_view input) {
    auto *c = reg.find(id);
    if (!c)
        throw unknown_challenge{ fmt::format("Unknown challenge \"{}\"", id) };
    check_utf8(input);

    trace("running {} ({}) on {} of input", c->id, c->name, display_bytes(input.size()));
    auto t1 = std::chrono::steady_clock::now();
    auto answer = c->solve(input);
    auto t2 = std::chrono::steady_clock::now();
    trace("{} solved in {}", c->id, display(std::chrono::duration<double>(t2 - t1).count()));
    return answer;
}

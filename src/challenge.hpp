#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "error.hpp"
#include "input.hpp"

struct Example {
    std::string_view input;
    std::string_view expected;
};

// parses the raw text, solves it and formats the answer
using solve_fn_t = std::string (*)(std::string_view);

struct Challenge {
    std::string id;   // e.g. "2a"
    std::string name; // e.g. "Password Philosophy"
    std::string description;
    std::vector<Example> examples;
    solve_fn_t solve;
};

struct Label {
    std::string id, name;
};

// "Day 2a: Password Philosophy" => { "2a", "Password Philosophy" }
// throws challenge_error when the label is empty or shaped differently
[[nodiscard]] Label parse_label(std::string_view label);

template <typename F>
struct solver_traits;

template <typename R, typename A>
struct solver_traits<R (*)(A)> {
    using input_t = std::remove_cvref_t<A>;
    using result_t = R;
};

template <auto Solver>
std::string solve_as_string(std::string_view raw) {
    using input_t = typename solver_traits<decltype(Solver)>::input_t;
    auto input = parse_item<input_t>(raw);
    return fmt::format("{}", Solver(std::move(input)));
}

template <auto Solver>
Challenge make_challenge(std::string_view label, std::string_view description,
        std::initializer_list<Example> examples = {}) {
    auto [id, name] = parse_label(label);
    return Challenge{
        std::move(id), std::move(name), std::string{ description },
        std::vector<Example>(examples), &solve_as_string<Solver> };
}

class Registry {
    std::vector<Challenge> challenges;

public:
    // throws challenge_error on a duplicate id
    void add(Challenge c);

    [[nodiscard]] const std::vector<Challenge> &all() const { return challenges; }

    // nullptr when no challenge has this id
    [[nodiscard]] const Challenge *find(std::string_view id) const;

    // ids compared as day number first, then part suffix: "2a" < "2b" < "10a"
    [[nodiscard]] std::vector<const Challenge *> sorted() const;
};

// defined next to each puzzle
void register_report_repair(Registry &r);
void register_password_philosophy(Registry &r);
void register_toboggan_trajectory(Registry &r);
void register_passport_processing(Registry &r);
void register_binary_boarding(Registry &r);
void register_custom_customs(Registry &r);

[[nodiscard]] Registry build_registry();

// built on first use, read-only afterwards
const Registry &registry();

// throws unknown_challenge before touching the input when id is not registered,
// input_error when the input is not UTF-8
std::string run(const Registry &reg, std::string_view id, std::string_view input);

#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "input.hpp"

using Expenses = Lines<uint64_t>;

inline constexpr uint64_t EXPENSE_TARGET = 2020;

// product of the first `n` entries (n = 2 or 3) summing to target, if any;
// throws solve_error when that product overflows
[[nodiscard]] std::optional<uint64_t> find_entries(std::span<const uint64_t> entries,
        unsigned n, uint64_t target = EXPENSE_TARGET);

uint64_t report_repair_pair(const Expenses &entries);
uint64_t report_repair_triple(const Expenses &entries);

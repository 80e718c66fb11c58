#include "expense.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <vector>

#include "challenge.hpp"

static uint64_t product(uint64_t l, uint64_t r) {
    if (l && r > std::numeric_limits<uint64_t>::max() / l)
        throw solve_error{ fmt::format("The product of {} and {} does not fit in 64 bits", l, r) };
    return l * r;
}

// two-pointer scan over the sorted range [lo, hi); never adds, so entries near
// the top of the range cannot wrap around to the target
static std::optional<uint64_t> pair_product(const std::vector<uint64_t> &v,
        size_t lo, size_t hi, uint64_t target) {
    while (lo + 1 < hi && v[lo] <= target) {
        auto rest = target - v[lo];
        if (v[hi - 1] == rest)
            return product(v[lo], v[hi - 1]);
        if (v[hi - 1] < rest)
            lo++;
        else
            hi--;
    }
    return {};
}

std::optional<uint64_t> find_entries(std::span<const uint64_t> entries, unsigned n, uint64_t target) {
    std::vector<uint64_t> v(entries.begin(), entries.end());
    std::ranges::sort(v);
    switch (n) {
        case 2:
            return pair_product(v, 0, v.size(), target);
        case 3:
            for (auto i = 0zu; i < v.size() && v[i] <= target; i++)
                if (auto p = pair_product(v, i + 1, v.size(), target - v[i]))
                    return product(v[i], *p);
            return {};
        default:
            throw std::invalid_argument{ "find_entries only supports pairs and triples" };
    }
}

uint64_t report_repair_pair(const Expenses &entries) {
    if (auto p = find_entries(entries, 2))
        return *p;
    throw solve_error{ fmt::format("No two entries sum to {}", EXPENSE_TARGET) };
}

uint64_t report_repair_triple(const Expenses &entries) {
    if (auto p = find_entries(entries, 3))
        return *p;
    throw solve_error{ fmt::format("No three entries sum to {}", EXPENSE_TARGET) };
}

static constexpr std::string_view example = R"(1721
979
366
299
675
1456
)";

void register_report_repair(Registry &r) {
    r.add(make_challenge<&report_repair_pair>(
        "Day 1a: Report Repair",
        "Find the two expense report entries that sum to 2020 and multiply them together.",
        { { example, "514579" } }));
    r.add(make_challenge<&report_repair_triple>(
        "Day 1b: Report Repair",
        "Find the three expense report entries that sum to 2020 and multiply them together.",
        { { example, "241861950" } }));
}

#include "boarding.hpp"

#include <algorithm>
#include <ranges>
#include <vector>

#include "challenge.hpp"

static Direction direction(char ch, char lower, char upper) {
    if (ch == lower)
        return Direction::Lower;
    if (ch == upper)
        return Direction::Upper;
    throw parse_error{ fmt::format("Expected \"{}\" or \"{}\", found \"{}\"", lower, upper, ch) };
}

BoardingPass BoardingPass::parse(std::string_view sv) {
    if (sv.size() != ROW_STEPS + COLUMN_STEPS)
        throw parse_error{ fmt::format("A boarding pass should be {} characters long, \"{}\" has {}",
                ROW_STEPS + COLUMN_STEPS, sv, sv.size()) };
    BoardingPass bp;
    for (auto i = 0zu; i < ROW_STEPS; i++)
        bp.rows[i] = direction(sv[i], 'F', 'B');
    for (auto i = 0zu; i < COLUMN_STEPS; i++)
        bp.columns[i] = direction(sv[ROW_STEPS + i], 'L', 'R');
    return bp;
}

uint32_t partition_range(std::span<const Direction> directions, uint32_t start, uint32_t end) {
    for (auto d : directions) {
        auto mid = (start + end) / 2;
        if (d == Direction::Upper)
            start = mid;
        else
            end = mid;
    }
    return start;
}

Seat BoardingPass::location() const {
    return Seat{ partition_range(rows, 0, 128), partition_range(columns, 0, 8) };
}

uint32_t highest_seat_id(const Lines<BoardingPass> &passes) {
    if (passes.empty())
        throw solve_error{ "No boarding passes provided" };
    auto ids = passes | std::views::transform([](const BoardingPass &b) { return b.location().id(); });
    return std::ranges::max(ids);
}

uint32_t missing_seat_id(const Lines<BoardingPass> &passes) {
    std::vector<uint32_t> ids;
    ids.reserve(passes.size());
    for (auto &b : passes)
        ids.push_back(b.location().id());
    std::ranges::sort(ids);
    auto it = std::ranges::adjacent_find(ids, [](uint32_t l, uint32_t r) { return l + 2 == r; });
    if (it == ids.end())
        throw solve_error{ "Unable to find the seat number" };
    return *it + 1;
}

auto fmt::formatter<Seat>::format(const Seat &s, format_context &ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(
            fmt::format("row {} column {} (id {})", s.row, s.column, s.id()), ctx);
}

static constexpr std::string_view example = R"(BFFFBBFRRR
FFFBBBFRRR
BBFFBBFRLL
)";

// seats 0..10 minus 6
static constexpr std::string_view gap_example = R"(FFFFFFFLLL
FFFFFFFLLR
FFFFFFFLRL
FFFFFFFLRR
FFFFFFFRLL
FFFFFFFRLR
FFFFFFFRRR
FFFFFFBLLL
FFFFFFBLLR
FFFFFFBLRL
)";

void register_binary_boarding(Registry &r) {
    r.add(make_challenge<&highest_seat_id>(
        "Day 5a: Binary Boarding",
        "Decode each binary space partitioned boarding pass and report the highest seat ID.",
        { { example, "820" } }));
    r.add(make_challenge<&missing_seat_id>(
        "Day 5b: Binary Boarding",
        "Find the one missing seat ID whose neighbours on both sides are taken.",
        { { gap_example, "6" } }));
}

#include "board.hpp"

#include <stdexcept>

#include "challenge.hpp"

Board::Board(size_t w, size_t h, std::vector<Tile> t)
    : tiles{ std::move(t) }, width{ w }, height{ h } {
    if (width * height != tiles.size())
        throw std::invalid_argument{ fmt::format("{}x{} board cannot hold {} tiles",
                width, height, tiles.size()) };
}

static void append_tiles(std::vector<Tile> &dest, std::string_view line) {
    for (auto ch : line) {
        switch (ch) {
            case '#': dest.push_back(Tile::Tree); break;
            case '.': dest.push_back(Tile::Open); break;
            default:
                throw parse_error{ fmt::format(
                        "The board can only contain \"#\" or \".\", found \"{}\"", ch) };
        }
    }
}

Board Board::parse(std::string_view sv) {
    std::vector<Tile> tiles;
    auto width = 0zu, height = 0zu;
    foreach_line(sv, [&](size_t number, std::string_view line) {
        line = trim(line);
        if (line.empty())
            return;
        auto before = tiles.size();
        on_line(number, [&] { append_tiles(tiles, line); });
        auto added = tiles.size() - before;
        if (!height++)
            width = added;
        else if (added != width)
            throw parse_error{ fmt::format("line {}: The board should be {} tiles wide but it has {}",
                    number, width, added) };
    });
    if (!height)
        throw parse_error{ "The board can't be empty" };
    return Board{ width, height, std::move(tiles) };
}

size_t trees_along_slope(const Board &board, slope_t slope) {
    auto [right, down] = slope;
    if (!down)
        throw std::invalid_argument{ "A slope has to go down" };
    auto trees = 0zu;
    for (auto row = 0zu, column = 0zu; row < board.get_height(); row += down, column += right)
        if (board.tile_at(column, row) == Tile::Tree)
            trees++;
    return trees;
}

size_t toboggan_single_slope(const Board &board) {
    return trees_along_slope(board, { 3, 1 });
}

size_t toboggan_all_slopes(const Board &board) {
    static constexpr slope_t slopes[]{ { 1, 1 }, { 3, 1 }, { 5, 1 }, { 7, 1 }, { 1, 2 } };
    auto product = 1zu;
    for (auto s : slopes)
        product *= trees_along_slope(board, s);
    return product;
}

auto fmt::formatter<Board>::format(const Board &b, format_context &ctx) const
    -> format_context::iterator {
    std::string s;
    for (auto r = 0zu; r < b.get_height(); r++) {
        for (auto t : b.row(r))
            s.push_back(t == Tile::Tree ? '#' : '.');
        s.push_back('\n');
    }
    return formatter<string_view>::format(s, ctx);
}

static constexpr std::string_view example = R"(..##.......
#...#...#..
.#....#..#.
..#.#...#.#
.#...##..#.
..#.##.....
.#.#.#....#
.#........#
#.##...#...
#...##....#
.#..#...#.#
)";

void register_toboggan_trajectory(Registry &r) {
    r.add(make_challenge<&toboggan_single_slope>(
        "Day 3a: Toboggan Trajectory",
        "Count the trees hit going right 3, down 1 across a map that repeats to the right.",
        { { example, "7" } }));
    r.add(make_challenge<&toboggan_all_slopes>(
        "Day 3b: Toboggan Trajectory",
        "Multiply together the trees hit on the slopes (1,1), (3,1), (5,1), (7,1) and (1,2).",
        { { example, "336" } }));
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

enum class Tile : uint8_t {
    Open,
    Tree,
};

// rectangular map that repeats forever to the right, but not downwards
class Board {
    std::vector<Tile> tiles; // row-major
    size_t width, height;

public:
    // tiles.size() must equal w * h
    Board(size_t w, size_t h, std::vector<Tile> t);

    // '.' and '#' lines of equal width, blank lines skipped
    static Board parse(std::string_view sv);

    [[nodiscard]] size_t get_width() const { return width; }
    [[nodiscard]] size_t get_height() const { return height; }

    // column wraps around, row must be below get_height()
    [[nodiscard]] Tile tile_at(size_t column, size_t row) const {
        return tiles[column % width + row * width];
    }

    [[nodiscard]] std::span<const Tile> row(size_t r) const {
        return std::span<const Tile>{ tiles }.subspan(r * width, width);
    }

    bool operator==(const Board &other) const = default;
};

using slope_t = std::pair<size_t, size_t>; // right, down

// trees met going from the top-left corner until falling off the bottom
[[nodiscard]] size_t trees_along_slope(const Board &board, slope_t slope);

size_t toboggan_single_slope(const Board &board);
size_t toboggan_all_slopes(const Board &board);

inline Board operator ""_board(const char *str, size_t len) {
    return Board::parse({ str, len });
}

template <>
struct fmt::formatter<Board> : formatter<string_view> {
    auto format(const Board &b, format_context &ctx) const -> format_context::iterator;
};

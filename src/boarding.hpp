#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include <fmt/format.h>

#include "input.hpp"

enum class Direction : uint8_t {
    Lower, // F, L
    Upper, // B, R
};

struct Seat {
    uint32_t row, column;

    bool operator==(const Seat &other) const = default;

    [[nodiscard]] constexpr uint32_t id() const { return column + row * 8; }
};

struct BoardingPass {
    static constexpr size_t ROW_STEPS = 7;
    static constexpr size_t COLUMN_STEPS = 3;

    std::array<Direction, ROW_STEPS> rows;
    std::array<Direction, COLUMN_STEPS> columns;

    bool operator==(const BoardingPass &other) const = default;

    // exactly 7 of F/B followed by 3 of L/R
    static BoardingPass parse(std::string_view sv);

    [[nodiscard]] Seat location() const;
};

// narrow [start, end) once per direction; the result is the lower bound left over
[[nodiscard]] uint32_t partition_range(std::span<const Direction> directions, uint32_t start, uint32_t end);

uint32_t highest_seat_id(const Lines<BoardingPass> &passes);
uint32_t missing_seat_id(const Lines<BoardingPass> &passes);

template <>
struct fmt::formatter<Seat> : formatter<string_view> {
    auto format(const Seat &s, format_context &ctx) const -> format_context::iterator;
};

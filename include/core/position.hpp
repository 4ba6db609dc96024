#pragma once

#include <cstdint>
#include <string>

namespace core {

struct Position {
    int8_t row, col;

    Position() = default;
    Position(int8_t r, int8_t c) : row(r), col(c) {}

    static Position from_action(int action, int board_size) noexcept {
        return Position{static_cast<int8_t>(action / board_size),
                        static_cast<int8_t>(action % board_size)};
    }

    int to_action(int board_size) const noexcept {
        return row * board_size + col;
    }

    bool in_bounds(int board_size) const noexcept {
        return row >= 0 && row < board_size && col >= 0 && col < board_size;
    }

    // accessors
    char get_col_label() const noexcept { return static_cast<char>('A' + col); }
    int get_row_label() const noexcept { return row + 1; }
    std::string to_string() const {
        return std::string(1, get_col_label()) + std::to_string(get_row_label());
    }

    bool operator==(const Position& other) const noexcept {
        return row == other.row && col == other.col;
    }

    bool operator!=(const Position& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace core

#pragma once

#include "position.hpp"
#include <algorithm>
#include <cstdlib>
#include <vector>

namespace core {

// Chebyshev-distance rings around every cell of an N x N grid. Computed once
// per board size and shared read-only between game states.
class DistanceRings {
private:
    int board_size_;

    // rings_[cell][distance] = cells at exactly that distance, row-major
    std::vector<std::vector<std::vector<Position>>> rings_;

    inline int position_to_id(Position pos) const noexcept {
        return pos.row * board_size_ + pos.col;
    }

    inline int chebyshev_distance(Position a, Position b) const noexcept {
        return std::max(std::abs(a.row - b.row), std::abs(a.col - b.col));
    }

    void precompute_all_distances();

public:
    explicit DistanceRings(int board_size);
    ~DistanceRings() = default;

    int board_size() const noexcept { return board_size_; }
    int max_distance() const noexcept { return board_size_ - 1; }

    const std::vector<Position>& get_positions_at_distance(
        Position center, int distance) const noexcept;

    // Adjacent cells (ring 1): 3 for corners, 5 for edges, 8 otherwise
    const std::vector<Position>& neighbors(Position center) const noexcept {
        return get_positions_at_distance(center, 1);
    }

    std::vector<Position> get_ordered_moves_around_stones(
        const std::vector<Position>& stone_positions,
        int max_distance = 3) const;
};

} // namespace core

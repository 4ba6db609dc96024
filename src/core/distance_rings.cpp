#include "core/distance_rings.hpp"
#include <stdexcept>
#include <string>

namespace core {

DistanceRings::DistanceRings(int board_size) : board_size_(board_size) {
    if (board_size_ < 1 || board_size_ > 64) {
        throw std::invalid_argument("DistanceRings: board size out of range: " +
                                    std::to_string(board_size_));
    }
    precompute_all_distances();
}

void DistanceRings::precompute_all_distances() {
    const int cells = board_size_ * board_size_;
    rings_.assign(cells, std::vector<std::vector<Position>>(max_distance() + 1));

    // Iterating targets row-major keeps every ring sorted without a second pass
    for (int center_id = 0; center_id < cells; ++center_id) {
        Position center = Position::from_action(center_id, board_size_);
        for (int target_id = 0; target_id < cells; ++target_id) {
            if (target_id == center_id) continue;

            Position target = Position::from_action(target_id, board_size_);
            rings_[center_id][chebyshev_distance(center, target)].push_back(target);
        }
    }
}

const std::vector<Position>& DistanceRings::get_positions_at_distance(
    Position center, int distance) const noexcept {

    if (!center.in_bounds(board_size_) || distance < 0 || distance > max_distance()) {
        static const std::vector<Position> empty;
        return empty;
    }

    return rings_[position_to_id(center)][distance];
}

std::vector<Position> DistanceRings::get_ordered_moves_around_stones(
    const std::vector<Position>& stone_positions,
    int max_distance) const {

    max_distance = std::min(max_distance, this->max_distance());
    if (max_distance < 1) {
        return {};
    }

    std::vector<bool> seen(board_size_ * board_size_, false);
    std::vector<std::vector<Position>> distance_groups(max_distance + 1);

    // Stones themselves are never candidates
    for (const Position& stone : stone_positions) {
        if (stone.in_bounds(board_size_)) {
            seen[position_to_id(stone)] = true;
        }
    }

    for (int distance = 1; distance <= max_distance; ++distance) {
        for (const Position& stone : stone_positions) {
            for (const Position& pos : get_positions_at_distance(stone, distance)) {
                int pos_id = position_to_id(pos);
                if (!seen[pos_id]) {
                    seen[pos_id] = true;
                    distance_groups[distance].push_back(pos);
                }
            }
        }
    }

    std::vector<Position> result;
    for (int distance = 1; distance <= max_distance; ++distance) {
        std::sort(distance_groups[distance].begin(), distance_groups[distance].end(),
            [](const Position& a, const Position& b) {
                if (a.row != b.row) return a.row < b.row;
                return a.col < b.col;
            });
        result.insert(result.end(), distance_groups[distance].begin(), distance_groups[distance].end());
    }

    return result;
}

} // namespace core

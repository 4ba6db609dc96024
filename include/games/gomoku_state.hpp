#pragma once

#include "core/distance_rings.hpp"
#include "core/game_state.hpp"
#include "core/position.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace games {

// k-in-a-row on an N x N board. Player 1 moves first, player -1 second.
// Cells are addressed by action = row * N + col.
class GomokuState : public core::GameState {
public:
    struct Config {
        int board_size = 3;
        int win_length = 3;
        int candidate_radius = 0;  // 0 = every empty cell is legal

        static Config tic_tac_toe() { return Config{3, 3, 0}; }
        static Config small() { return Config{6, 4, 0}; }
        static Config gomoku() { return Config{15, 5, 2}; }
    };

    GomokuState();  // tic-tac-toe
    explicit GomokuState(const Config& config,
                         std::shared_ptr<const core::DistanceRings> rings = nullptr);

    // core::GameState
    core::PlayerId player_to_move() const override { return current_player_; }
    bool is_terminal() const override;
    std::vector<core::ActionId> legal_actions() const override;
    std::unique_ptr<core::GameState> apply_action(core::ActionId action) const override;
    core::StateKey key() const override;
    double terminal_value() const override;
    std::unique_ptr<core::GameState> clone() const override;

    // Value-returning variant of apply_action for callers that know the type
    GomokuState play(core::ActionId action) const;
    GomokuState play(int row, int col) const;

    inline int get_stone(int row, int col) const noexcept {
        return cells_[row * config_.board_size + col];
    }

    inline bool is_empty(int row, int col) const noexcept {
        return get_stone(row, col) == 0;
    }

    const Config& config() const noexcept { return config_; }
    int board_size() const noexcept { return config_.board_size; }
    int action_size() const noexcept { return config_.board_size * config_.board_size; }
    int stone_count() const noexcept { return stone_count_; }
    core::ActionId last_action() const noexcept { return last_action_; }

    // 1 or -1 once a line is completed, 0 otherwise (including draws)
    int get_winner() const noexcept { return winner_; }

    std::string to_string() const;

private:
    Config config_;
    std::shared_ptr<const core::DistanceRings> rings_;
    std::vector<int8_t> cells_;
    int current_player_ = 1;
    int stone_count_ = 0;
    core::ActionId last_action_ = -1;
    int winner_ = 0;

    void place_stone(core::ActionId action);
    bool completes_line(int row, int col, int player) const noexcept;
    int count_consecutive(int row, int col, int dr, int dc, int player) const noexcept;
    std::vector<core::ActionId> empty_cells() const;
};

} // namespace games

#include "games/gomoku_state.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace games {

GomokuState::GomokuState() : GomokuState(Config::tic_tac_toe()) {
}

GomokuState::GomokuState(const Config& config,
                         std::shared_ptr<const core::DistanceRings> rings)
    : config_(config), rings_(std::move(rings)) {
    if (config_.board_size < 3 || config_.board_size > 19) {
        throw std::invalid_argument("GomokuState: board size must be in [3, 19], got " +
                                    std::to_string(config_.board_size));
    }
    if (config_.win_length < 3 || config_.win_length > config_.board_size) {
        throw std::invalid_argument("GomokuState: win length must be in [3, board size], got " +
                                    std::to_string(config_.win_length));
    }
    if (config_.candidate_radius < 0) {
        throw std::invalid_argument("GomokuState: candidate radius must be non-negative");
    }

    if (config_.candidate_radius > 0) {
        if (!rings_) {
            rings_ = std::make_shared<const core::DistanceRings>(config_.board_size);
        } else if (rings_->board_size() != config_.board_size) {
            throw std::invalid_argument("GomokuState: distance rings computed for a different board size");
        }
    }

    cells_.assign(action_size(), 0);
}

bool GomokuState::is_terminal() const {
    return winner_ != 0 || stone_count_ == action_size();
}

std::vector<core::ActionId> GomokuState::legal_actions() const {
    if (is_terminal()) {
        return {};
    }

    if (config_.candidate_radius == 0 || stone_count_ == 0) {
        return empty_cells();
    }

    std::vector<core::Position> stones;
    stones.reserve(stone_count_);
    for (int action = 0; action < action_size(); ++action) {
        if (cells_[action] != 0) {
            stones.push_back(core::Position::from_action(action, config_.board_size));
        }
    }

    std::vector<core::ActionId> actions;
    for (const core::Position& pos :
         rings_->get_ordered_moves_around_stones(stones, config_.candidate_radius)) {
        actions.push_back(pos.to_action(config_.board_size));
    }

    // Only happens when every cell near a stone is filled
    if (actions.empty()) {
        return empty_cells();
    }
    return actions;
}

std::unique_ptr<core::GameState> GomokuState::apply_action(core::ActionId action) const {
    return std::make_unique<GomokuState>(play(action));
}

GomokuState GomokuState::play(core::ActionId action) const {
    GomokuState next(*this);
    next.place_stone(action);
    return next;
}

GomokuState GomokuState::play(int row, int col) const {
    return play(row * config_.board_size + col);
}

core::StateKey GomokuState::key() const {
    core::StateKey key(cells_.size(), '.');
    for (size_t i = 0; i < cells_.size(); ++i) {
        if (cells_[i] == 1) {
            key[i] = 'X';
        } else if (cells_[i] == -1) {
            key[i] = 'O';
        }
    }
    return key;
}

double GomokuState::terminal_value() const {
    if (!is_terminal()) {
        std::cerr << "FATAL: terminal value requested for a non-terminal position\n";
        throw core::ContractViolation("GomokuState: terminal_value() on a non-terminal state");
    }
    // A completed line always belongs to the previous mover
    return winner_ != 0 ? -1.0 : 0.0;
}

std::unique_ptr<core::GameState> GomokuState::clone() const {
    return std::make_unique<GomokuState>(*this);
}

void GomokuState::place_stone(core::ActionId action) {
    if (action < 0 || action >= action_size()) {
        std::cerr << "FATAL: action " << action << " is off the board\n";
        throw core::ContractViolation("GomokuState: action out of range: " + std::to_string(action));
    }
    if (cells_[action] != 0) {
        std::string cell = core::Position::from_action(action, config_.board_size).to_string();
        std::cerr << "FATAL: cell " << cell << " is already occupied\n";
        throw core::ContractViolation("GomokuState: cell already occupied: " + cell);
    }
    if (is_terminal()) {
        std::cerr << "FATAL: move " << action << " played after the game ended\n";
        throw core::ContractViolation("GomokuState: move played after the game ended");
    }

    cells_[action] = static_cast<int8_t>(current_player_);
    ++stone_count_;
    last_action_ = action;

    int row = action / config_.board_size;
    int col = action % config_.board_size;
    if (completes_line(row, col, current_player_)) {
        winner_ = current_player_;
    }

    current_player_ = -current_player_;
}

bool GomokuState::completes_line(int row, int col, int player) const noexcept {
    constexpr int dr[] = {0, 1, 1, 1};
    constexpr int dc[] = {1, 0, 1, -1};

    for (int dir = 0; dir < 4; ++dir) {
        int length = 1 + count_consecutive(row, col, dr[dir], dc[dir], player)
                       + count_consecutive(row, col, -dr[dir], -dc[dir], player);
        if (length >= config_.win_length) {
            return true;
        }
    }
    return false;
}

int GomokuState::count_consecutive(int row, int col, int dr, int dc, int player) const noexcept {
    int count = 0;
    int r = row + dr;
    int c = col + dc;
    while (r >= 0 && r < config_.board_size && c >= 0 && c < config_.board_size &&
           get_stone(r, c) == player) {
        ++count;
        r += dr;
        c += dc;
    }
    return count;
}

std::vector<core::ActionId> GomokuState::empty_cells() const {
    std::vector<core::ActionId> actions;
    actions.reserve(action_size() - stone_count_);
    for (int action = 0; action < action_size(); ++action) {
        if (cells_[action] == 0) {
            actions.push_back(action);
        }
    }
    return actions;
}

std::string GomokuState::to_string() const {
    const int n = config_.board_size;
    std::ostringstream out;

    out << "   ";
    for (int col = 0; col < n; ++col) {
        out << static_cast<char>('A' + col) << ' ';
    }
    out << '\n';

    // Highest row on top, row labels are 1-based
    for (int row = n - 1; row >= 0; --row) {
        out << (row + 1 < 10 ? " " : "") << (row + 1) << ' ';
        for (int col = 0; col < n; ++col) {
            int stone = get_stone(row, col);
            out << (stone == 1 ? 'X' : stone == -1 ? 'O' : '.') << ' ';
        }
        out << '\n';
    }
    return out.str();
}

} // namespace games

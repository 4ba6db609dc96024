#pragma once

#include "core/game_state.hpp"
#include <memory>
#include <string>
#include <vector>

// Scripted game states with fully known trees, for exercising the search.
namespace test_games {

// A line of `length` forced moves, always labelled `action`. Players alternate
// starting with 1; the end position is worth `value` to whoever is to move.
class ChainGame : public core::GameState {
public:
    ChainGame(int length, double value, core::ActionId action = 0, int position = 0)
        : length_(length), value_(value), action_(action), position_(position) {}

    core::PlayerId player_to_move() const override { return position_ % 2 == 0 ? 1 : -1; }
    bool is_terminal() const override { return position_ >= length_; }

    std::vector<core::ActionId> legal_actions() const override {
        if (is_terminal()) return {};
        return {action_};
    }

    std::unique_ptr<core::GameState> apply_action(core::ActionId) const override {
        return std::make_unique<ChainGame>(length_, value_, action_, position_ + 1);
    }

    core::StateKey key() const override { return "chain:" + std::to_string(position_); }
    double terminal_value() const override { return value_; }
    std::unique_ptr<core::GameState> clone() const override { return std::make_unique<ChainGame>(*this); }

private:
    int length_;
    double value_;
    core::ActionId action_;
    int position_;
};

// Subtraction game: take 1 (action 0) or 2 (action 1) from a pile; whoever
// faces an empty pile has lost. Different move orders transpose freely.
class SubtractionGame : public core::GameState {
public:
    explicit SubtractionGame(int pile, core::PlayerId player = 1) : pile_(pile), player_(player) {}

    core::PlayerId player_to_move() const override { return player_; }
    bool is_terminal() const override { return pile_ == 0; }

    std::vector<core::ActionId> legal_actions() const override {
        std::vector<core::ActionId> actions;
        if (pile_ >= 1) actions.push_back(0);
        if (pile_ >= 2) actions.push_back(1);
        return actions;
    }

    std::unique_ptr<core::GameState> apply_action(core::ActionId action) const override {
        return std::make_unique<SubtractionGame>(pile_ - (action + 1), -player_);
    }

    core::StateKey key() const override {
        return "pile:" + std::to_string(pile_) + ":" + std::to_string(player_);
    }
    double terminal_value() const override { return -1.0; }
    std::unique_ptr<core::GameState> clone() const override { return std::make_unique<SubtractionGame>(*this); }

    int pile() const { return pile_; }

private:
    int pile_;
    core::PlayerId player_;
};

// Claims to be in progress but offers no moves
class BrokenGame : public core::GameState {
public:
    core::PlayerId player_to_move() const override { return 1; }
    bool is_terminal() const override { return false; }
    std::vector<core::ActionId> legal_actions() const override { return {}; }
    std::unique_ptr<core::GameState> apply_action(core::ActionId) const override {
        return std::make_unique<BrokenGame>();
    }
    core::StateKey key() const override { return "broken"; }
    double terminal_value() const override { return 0.0; }
    std::unique_ptr<core::GameState> clone() const override { return std::make_unique<BrokenGame>(); }
};

} // namespace test_games

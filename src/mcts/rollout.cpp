#include "mcts/rollout.hpp"
#include <iostream>
#include <memory>

namespace mcts {

RolloutPolicy::RolloutPolicy(uint64_t seed)
    : rng_(static_cast<std::mt19937::result_type>(seed)) {
}

double RolloutPolicy::simulate(const core::GameState& state) {
    const core::PlayerId starting_player = state.player_to_move();

    // Rollout states are never stored in the graph
    std::unique_ptr<core::GameState> current;
    const core::GameState* position = &state;

    while (!position->is_terminal()) {
        core::ActionId action = select_rollout_action(*position);
        current = position->apply_action(action);
        position = current.get();
    }

    // Terminal value is relative to whoever is to move at the end
    double value = position->terminal_value();
    return position->player_to_move() == starting_player ? value : -value;
}

core::ActionId RolloutPolicy::select_rollout_action(const core::GameState& state) {
    std::vector<core::ActionId> actions = state.legal_actions();

    if (actions.empty()) {
        std::cerr << "FATAL: non-terminal state reported no legal actions during rollout\n";
        throw core::ContractViolation("non-terminal state has no legal actions");
    }

    std::uniform_int_distribution<size_t> dist(0, actions.size() - 1);
    return actions[dist(rng_)];
}

} // namespace mcts

#pragma once

#include "core/game_state.hpp"
#include <cstdint>
#include <random>

namespace mcts {

// Uniformly random playout to a terminal state. The generator is seeded by the
// owner so that searches are reproducible.
class RolloutPolicy {
public:
    explicit RolloutPolicy(uint64_t seed);
    ~RolloutPolicy() = default;

    // Result from the perspective of state.player_to_move(). A terminal state
    // is scored directly without playing.
    double simulate(const core::GameState& state);

    void reseed(uint64_t seed) { rng_.seed(static_cast<std::mt19937::result_type>(seed)); }

private:
    std::mt19937 rng_;

    core::ActionId select_rollout_action(const core::GameState& state);
};

} // namespace mcts

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace core {

using PlayerId = int;
using ActionId = int;
using StateKey = std::string;

// Raised when a game implementation breaks its contract with the search
// (e.g. a non-terminal state with no legal actions). Not recoverable.
class ContractViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Capability set the search consumes. Implementations are immutable from the
// engine's point of view: apply_action() produces a new state.
class GameState {
public:
    virtual ~GameState() = default;

    virtual PlayerId player_to_move() const = 0;
    virtual bool is_terminal() const = 0;

    // Must be non-empty unless is_terminal()
    virtual std::vector<ActionId> legal_actions() const = 0;
    virtual std::unique_ptr<GameState> apply_action(ActionId action) const = 0;

    // States reached through different move orders but strategically identical
    // must return the same key.
    virtual StateKey key() const = 0;

    // Only defined for terminal states, from the perspective of player_to_move()
    virtual double terminal_value() const = 0;

    virtual std::unique_ptr<GameState> clone() const = 0;
};

} // namespace core

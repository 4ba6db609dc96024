#pragma once

#include "core/game_state.hpp"
#include <cmath>
#include <memory>
#include <vector>

namespace mcts {

class MCTSNode;

// Running statistics of an edge. Q == W / N whenever N > 0.
struct EdgeStats {
    int visits = 0;             // N
    double total_value = 0.0;   // W
    double mean_value = 0.0;    // Q
};

// Arc from the node holding it to a child node owned by the SearchGraph.
// The child pointer is non-owning: several parents may share one child.
class Edge {
public:
    Edge(MCTSNode* child, core::ActionId action, core::PlayerId player) noexcept
        : child_(child), action_(action), player_(player) {}

    MCTSNode* get_child() const noexcept { return child_; }
    core::ActionId get_action() const noexcept { return action_; }
    core::PlayerId get_player() const noexcept { return player_; }
    const EdgeStats& get_stats() const noexcept { return stats_; }
    int get_visits() const noexcept { return stats_.visits; }

    // Q + C * sqrt(ln(total) / N); only meaningful once N > 0
    double ucb1_value(int total_visits, double exploration_weight) const noexcept;

    // value is already signed for player_
    void update(double value) noexcept;

private:
    MCTSNode* child_;
    core::ActionId action_;
    core::PlayerId player_;  // player to move when the edge was created
    EdgeStats stats_;
};

class MCTSNode {
public:
    explicit MCTSNode(std::unique_ptr<core::GameState> state);
    ~MCTSNode() = default;

    MCTSNode(const MCTSNode&) = delete;
    MCTSNode& operator=(const MCTSNode&) = delete;

    const core::GameState& get_state() const noexcept { return *state_; }
    const core::StateKey& get_key() const noexcept { return key_; }

    // Edge order is the expansion order and decides selection ties
    const std::vector<Edge>& get_edges() const noexcept { return edges_; }
    Edge* get_edge(size_t index) noexcept { return index < edges_.size() ? &edges_[index] : nullptr; }
    bool is_leaf() const noexcept { return edges_.empty(); }
    size_t child_count() const noexcept { return edges_.size(); }

    // Sum of N over outgoing edges
    int total_visits() const noexcept;

    // First unvisited edge if any, else the first edge with the highest UCB1
    Edge* select_best_edge(double exploration_weight) noexcept;

    // Appends an edge labelled with this node's player to move
    void add_edge(MCTSNode* child, core::ActionId action);

    const Edge* find_edge_with_action(core::ActionId action) const noexcept;
    const Edge* get_most_visited_edge() const noexcept;

    // Edges sorted by visit count (descending); all of them if count <= 0
    std::vector<const Edge*> get_top_edges(int count = 10) const;

private:
    std::unique_ptr<core::GameState> state_;
    core::StateKey key_;
    std::vector<Edge> edges_;
};

} // namespace mcts

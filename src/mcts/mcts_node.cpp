#include "mcts/mcts_node.hpp"
#include <algorithm>
#include <limits>

namespace mcts {

double Edge::ucb1_value(int total_visits, double exploration_weight) const noexcept {
    double exploitation = stats_.mean_value;
    double exploration = exploration_weight *
        std::sqrt(std::log(static_cast<double>(total_visits)) / stats_.visits);

    return exploitation + exploration;
}

void Edge::update(double value) noexcept {
    stats_.visits++;
    stats_.total_value += value;
    stats_.mean_value = stats_.total_value / stats_.visits;
}

MCTSNode::MCTSNode(std::unique_ptr<core::GameState> state)
    : state_(std::move(state)), key_(state_->key()) {
}

int MCTSNode::total_visits() const noexcept {
    int total = 0;
    for (const Edge& edge : edges_) {
        total += edge.get_visits();
    }
    return total;
}

Edge* MCTSNode::select_best_edge(double exploration_weight) noexcept {
    if (edges_.empty()) {
        return nullptr;
    }

    // First-play urgency: every action is tried once before UCB is used,
    // which also keeps ln(total) well-defined below
    for (Edge& edge : edges_) {
        if (edge.get_visits() == 0) {
            return &edge;
        }
    }

    const int total = total_visits();
    Edge* best_edge = nullptr;
    double best_value = -std::numeric_limits<double>::infinity();

    for (Edge& edge : edges_) {
        double value = edge.ucb1_value(total, exploration_weight);
        if (value > best_value) {
            best_value = value;
            best_edge = &edge;
        }
    }

    return best_edge;
}

void MCTSNode::add_edge(MCTSNode* child, core::ActionId action) {
    edges_.emplace_back(child, action, state_->player_to_move());
}

const Edge* MCTSNode::find_edge_with_action(core::ActionId action) const noexcept {
    for (const Edge& edge : edges_) {
        if (edge.get_action() == action) {
            return &edge;
        }
    }
    return nullptr;
}

const Edge* MCTSNode::get_most_visited_edge() const noexcept {
    const Edge* best_edge = nullptr;
    int max_visits = -1;

    for (const Edge& edge : edges_) {
        if (edge.get_visits() > max_visits) {
            max_visits = edge.get_visits();
            best_edge = &edge;
        }
    }

    return best_edge;
}

std::vector<const Edge*> MCTSNode::get_top_edges(int count) const {
    std::vector<const Edge*> edge_ptrs;
    edge_ptrs.reserve(edges_.size());
    for (const Edge& edge : edges_) {
        edge_ptrs.push_back(&edge);
    }

    // Stable so equal visit counts keep expansion order
    std::stable_sort(edge_ptrs.begin(), edge_ptrs.end(),
                     [](const Edge* a, const Edge* b) {
                         return a->get_visits() > b->get_visits();
                     });

    if (count > 0 && static_cast<int>(edge_ptrs.size()) > count) {
        edge_ptrs.resize(count);
    }

    return edge_ptrs;
}

} // namespace mcts

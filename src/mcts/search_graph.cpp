#include "mcts/search_graph.hpp"
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace mcts {

MCTSNode* SearchGraph::reset(const core::GameState& state) {
    // Clone first: state may be owned by a node about to be released
    std::unique_ptr<core::GameState> root_state = state.clone();
    clear();
    root_ = lookup_or_insert(std::move(root_state));
    return root_;
}

MCTSNode* SearchGraph::lookup_or_insert(std::unique_ptr<core::GameState> state) {
    core::StateKey key = state->key();

    auto it = nodes_.find(key);
    if (it != nodes_.end()) {
        return it->second.get();
    }

    auto node = std::make_unique<MCTSNode>(std::move(state));
    MCTSNode* node_ptr = node.get();
    nodes_.emplace(std::move(key), std::move(node));
    return node_ptr;
}

void SearchGraph::prune_to(MCTSNode* new_root) {
    if (new_root == nullptr || find(new_root->get_key()) != new_root) {
        std::cerr << "FATAL: prune target is not a node of this graph\n";
        throw std::logic_error("SearchGraph::prune_to: node does not belong to the graph");
    }

    // The full reachable set is known before anything is released
    std::vector<MCTSNode*> reachable = collect_reachable(new_root);

    std::unordered_map<core::StateKey, std::unique_ptr<MCTSNode>> retained;
    retained.reserve(reachable.size());
    for (MCTSNode* node : reachable) {
        auto it = nodes_.find(node->get_key());
        retained.emplace(it->first, std::move(it->second));
    }

    nodes_ = std::move(retained);
    root_ = new_root;
}

void SearchGraph::clear() noexcept {
    root_ = nullptr;
    nodes_.clear();
}

MCTSNode* SearchGraph::find(const core::StateKey& key) const noexcept {
    auto it = nodes_.find(key);
    return it != nodes_.end() ? it->second.get() : nullptr;
}

std::vector<const MCTSNode*> SearchGraph::get_nodes() const {
    std::vector<const MCTSNode*> result;
    result.reserve(nodes_.size());
    for (const auto& entry : nodes_) {
        result.push_back(entry.second.get());
    }
    return result;
}

std::vector<MCTSNode*> SearchGraph::collect_reachable(MCTSNode* start) const {
    std::vector<MCTSNode*> reachable;
    std::unordered_set<const MCTSNode*> visited;
    std::vector<MCTSNode*> stack;

    // Explicit stack: graphs can be far deeper than the call stack allows
    stack.push_back(start);
    visited.insert(start);

    while (!stack.empty()) {
        MCTSNode* node = stack.back();
        stack.pop_back();
        reachable.push_back(node);

        for (const Edge& edge : node->get_edges()) {
            MCTSNode* child = edge.get_child();
            if (visited.insert(child).second) {
                stack.push_back(child);
            }
        }
    }

    return reachable;
}

} // namespace mcts

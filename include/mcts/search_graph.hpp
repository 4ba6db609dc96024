#pragma once

#include "mcts_node.hpp"
#include "core/game_state.hpp"
#include <memory>
#include <unordered_map>
#include <vector>

namespace mcts {

// Owns every node of the search, keyed by state key. Transpositions resolve to
// one shared node, so the structure is a DAG traversed from a single root.
class SearchGraph {
public:
    SearchGraph() = default;
    ~SearchGraph() = default;

    SearchGraph(const SearchGraph&) = delete;
    SearchGraph& operator=(const SearchGraph&) = delete;

    // Drops every node and makes a fresh root for state
    MCTSNode* reset(const core::GameState& state);

    MCTSNode* lookup_or_insert(std::unique_ptr<core::GameState> state);

    // Keeps only the nodes reachable from new_root, which becomes the root
    void prune_to(MCTSNode* new_root);

    void clear() noexcept;

    MCTSNode* find(const core::StateKey& key) const noexcept;
    bool contains(const core::StateKey& key) const noexcept { return nodes_.count(key) != 0; }
    MCTSNode* get_root() const noexcept { return root_; }
    size_t size() const noexcept { return nodes_.size(); }

    std::vector<const MCTSNode*> get_nodes() const;

private:
    std::unordered_map<core::StateKey, std::unique_ptr<MCTSNode>> nodes_;
    MCTSNode* root_ = nullptr;

    std::vector<MCTSNode*> collect_reachable(MCTSNode* start) const;
};

} // namespace mcts

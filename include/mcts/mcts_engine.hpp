#pragma once

#include "mcts_node.hpp"
#include "rollout.hpp"
#include "search_graph.hpp"
#include "core/game_state.hpp"
#include "utils/timer.hpp"
#include <cmath>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcts {

// Raised when a visit distribution is requested but no root edge was visited
class DistributionUndefined : public std::runtime_error {
public:
    DistributionUndefined()
        : std::runtime_error("distribution undefined: no simulations completed on a non-terminal root") {}
};

class MCTSEngine {
public:
    struct Config {
        double exploration_weight = std::sqrt(2.0);  // C in Q + C * sqrt(ln(total) / N)
        int simulations = 1000;
        int action_size = 0;          // length of the returned distribution
        uint64_t seed = 0x5EED;       // rollout generator seed
        double time_limit_ms = 0.0;   // 0 disables the deadline
        bool verbose = false;
    };

    // (completed, total, label), called after each simulation when verbose
    using ProgressCallback = std::function<void(int, int, const std::string&)>;

    explicit MCTSEngine(const Config& config);
    ~MCTSEngine() = default;

    MCTSEngine(const MCTSEngine&) = delete;
    MCTSEngine& operator=(const MCTSEngine&) = delete;

    // Main search interface: normalized root visit counts indexed by action.
    // Reuses the existing graph when state was already explored.
    std::vector<double> get_distribution(const core::GameState& state);
    std::vector<double> get_distribution(const core::GameState& state,
                                         int simulations,
                                         double exploration_weight,
                                         bool verbose);

    // Runs more simulations from the current root without re-rooting, using
    // the configured exploration weight
    void extend_search(int simulations);

    // Most visited root action, -1 when the root has no edges
    core::ActionId best_action() const noexcept;

    // Tree management
    void clear_tree() noexcept { graph_.clear(); }
    const MCTSNode* get_root() const noexcept { return graph_.get_root(); }
    const SearchGraph& get_graph() const noexcept { return graph_; }
    bool contains(const core::StateKey& key) const noexcept { return graph_.contains(key); }
    size_t node_count() const noexcept { return graph_.size(); }

    // Configuration
    const Config& get_config() const noexcept { return config_; }
    void set_exploration_weight(double weight);  // finite and >= 0
    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    // Statistics
    long long get_total_simulations() const noexcept { return total_simulations_; }
    int get_tree_reuse_count() const noexcept { return tree_reuse_count_; }
    int get_tree_fallback_count() const noexcept { return tree_fallback_count_; }
    double get_tree_reuse_rate() const noexcept;
    void reset_statistics() noexcept;

    void print_stats() const;
    void print_top_actions(int count = 5) const;

private:
    Config config_;
    SearchGraph graph_;
    RolloutPolicy rollout_policy_;
    ProgressCallback progress_callback_;
    utils::Timer search_timer_;

    // Statistics
    long long total_simulations_ = 0;
    int tree_reuse_count_ = 0;
    int tree_fallback_count_ = 0;

    // MCTS phases
    MCTSNode* select_leaf(std::vector<Edge*>& path, double exploration_weight);
    void expand_node(MCTSNode* leaf);
    double evaluate_leaf(MCTSNode* leaf);
    void backpropagate(const std::vector<Edge*>& path, core::PlayerId leaf_player, double value) noexcept;

    // Utilities
    void set_root(const core::GameState& state, bool verbose);
    void run_simulations(int simulations, double exploration_weight, bool verbose);
    void simulate(double exploration_weight);
    static void validate_exploration_weight(double weight);
    std::vector<double> extract_distribution() const;
};

} // namespace mcts

#include "mcts/mcts_engine.hpp"
#include "utils/progress.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>

namespace mcts {

MCTSEngine::MCTSEngine(const Config& config)
    : config_(config), rollout_policy_(config.seed),
      progress_callback_([](int completed, int total, const std::string& label) {
          utils::progress_bar(completed, total, label);
      }) {
    if (config_.action_size <= 0) {
        throw std::invalid_argument("MCTSEngine: action_size must be positive");
    }
    if (config_.simulations < 0) {
        throw std::invalid_argument("MCTSEngine: simulations must be non-negative");
    }
    if (config_.time_limit_ms < 0.0) {
        throw std::invalid_argument("MCTSEngine: time_limit_ms must be non-negative");
    }
    set_exploration_weight(config_.exploration_weight);
}

std::vector<double> MCTSEngine::get_distribution(const core::GameState& state) {
    return get_distribution(state, config_.simulations, config_.exploration_weight, config_.verbose);
}

std::vector<double> MCTSEngine::get_distribution(const core::GameState& state,
                                                 int simulations,
                                                 double exploration_weight,
                                                 bool verbose) {
    if (simulations < 0) {
        throw std::invalid_argument("MCTSEngine: simulations must be non-negative");
    }
    // Applies to this query only, config_ keeps its own weight
    validate_exploration_weight(exploration_weight);

    set_root(state, verbose);
    run_simulations(simulations, exploration_weight, verbose);

    return extract_distribution();
}

void MCTSEngine::extend_search(int simulations) {
    if (graph_.get_root() == nullptr) {
        throw std::logic_error("MCTSEngine::extend_search: no root, query a position first");
    }
    if (simulations < 0) {
        throw std::invalid_argument("MCTSEngine: simulations must be non-negative");
    }
    run_simulations(simulations, config_.exploration_weight, config_.verbose);
}

core::ActionId MCTSEngine::best_action() const noexcept {
    const MCTSNode* root = graph_.get_root();
    if (root == nullptr) {
        return -1;
    }
    const Edge* best_edge = root->get_most_visited_edge();
    return best_edge ? best_edge->get_action() : -1;
}

void MCTSEngine::set_exploration_weight(double weight) {
    validate_exploration_weight(weight);
    config_.exploration_weight = weight;
}

void MCTSEngine::validate_exploration_weight(double weight) {
    // An infinite weight turns C * sqrt(ln(1) / 1) into NaN
    if (!std::isfinite(weight) || weight < 0.0) {
        throw std::invalid_argument("MCTSEngine: exploration weight must be finite and non-negative, got " +
                                    std::to_string(weight));
    }
}

double MCTSEngine::get_tree_reuse_rate() const noexcept {
    int total = tree_reuse_count_ + tree_fallback_count_;
    return total > 0 ? static_cast<double>(tree_reuse_count_) / total : 0.0;
}

void MCTSEngine::reset_statistics() noexcept {
    total_simulations_ = 0;
    tree_reuse_count_ = 0;
    tree_fallback_count_ = 0;
}

void MCTSEngine::set_root(const core::GameState& state, bool verbose) {
    MCTSNode* existing = graph_.find(state.key());

    if (existing != nullptr) {
        size_t before = graph_.size();
        graph_.prune_to(existing);
        tree_reuse_count_++;

        if (verbose) {
            std::cout << "Tree reuse: kept " << graph_.size() << " of " << before
                      << " nodes, root has " << existing->total_visits() << " visits\n";
        }
    } else {
        graph_.reset(state);
        tree_fallback_count_++;
    }

    // Expanding the root up front means every simulation crosses a root edge
    MCTSNode* root = graph_.get_root();
    if (root->is_leaf() && !root->get_state().is_terminal()) {
        expand_node(root);
    }
}

void MCTSEngine::run_simulations(int simulations, double exploration_weight, bool verbose) {
    search_timer_.start();

    for (int i = 0; i < simulations; ++i) {
        simulate(exploration_weight);
        total_simulations_++;

        if (verbose && progress_callback_) {
            progress_callback_(i + 1, simulations, "Exploring tree");
        }

        // Invariants hold between whole simulations, so this is the only stop point
        if (config_.time_limit_ms > 0.0 && search_timer_.get_elapsed_ms() >= config_.time_limit_ms) {
            if (verbose) {
                std::cout << "\nTime limit reached after " << (i + 1) << " simulations\n";
            }
            break;
        }
    }

    search_timer_.stop();
}

void MCTSEngine::simulate(double exploration_weight) {
    std::vector<Edge*> path;
    MCTSNode* leaf = select_leaf(path, exploration_weight);

    double value = evaluate_leaf(leaf);
    backpropagate(path, leaf->get_state().player_to_move(), value);
}

MCTSNode* MCTSEngine::select_leaf(std::vector<Edge*>& path, double exploration_weight) {
    MCTSNode* node = graph_.get_root();

    while (!node->is_leaf()) {
        Edge* edge = node->select_best_edge(exploration_weight);
        if (edge == nullptr) {
            std::cerr << "FATAL: no edge selectable below node " << node->get_key() << "\n";
            throw core::ContractViolation("selection found no edge on an expanded node");
        }
        path.push_back(edge);
        node = edge->get_child();
    }

    return node;
}

double MCTSEngine::evaluate_leaf(MCTSNode* leaf) {
    const core::GameState& state = leaf->get_state();

    if (state.is_terminal()) {
        return state.terminal_value();
    }

    expand_node(leaf);
    return rollout_policy_.simulate(state);
}

void MCTSEngine::expand_node(MCTSNode* leaf) {
    const core::GameState& state = leaf->get_state();
    std::vector<core::ActionId> actions = state.legal_actions();

    if (actions.empty()) {
        std::cerr << "FATAL: non-terminal state reported no legal actions (key "
                  << leaf->get_key() << ")\n";
        throw core::ContractViolation("non-terminal state has no legal actions");
    }

    for (core::ActionId action : actions) {
        MCTSNode* child = graph_.lookup_or_insert(state.apply_action(action));
        leaf->add_edge(child, action);
    }
}

void MCTSEngine::backpropagate(const std::vector<Edge*>& path,
                               core::PlayerId leaf_player, double value) noexcept {
    // value is from leaf_player's perspective; flip it for the other side
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        Edge* edge = *it;
        double sign = edge->get_player() == leaf_player ? 1.0 : -1.0;
        edge->update(sign * value);
    }
}

std::vector<double> MCTSEngine::extract_distribution() const {
    std::vector<double> distribution(config_.action_size, 0.0);
    const MCTSNode* root = graph_.get_root();

    double total = 0.0;
    for (const Edge& edge : root->get_edges()) {
        core::ActionId action = edge.get_action();
        if (action < 0 || action >= config_.action_size) {
            std::cerr << "FATAL: action " << action << " outside action space of size "
                      << config_.action_size << "\n";
            throw core::ContractViolation("action id outside the configured action space");
        }
        distribution[action] = edge.get_visits();
        total += edge.get_visits();
    }

    if (total <= 0.0) {
        throw DistributionUndefined();
    }

    for (double& probability : distribution) {
        probability /= total;
    }
    return distribution;
}

void MCTSEngine::print_stats() const {
    std::cout << "Simulations: " << utils::format_with_commas(total_simulations_)
              << ", nodes: " << utils::format_with_commas(static_cast<long long>(graph_.size()))
              << ", tree reuse: " << tree_reuse_count_ << "/" << (tree_reuse_count_ + tree_fallback_count_)
              << ", last search: " << std::fixed << std::setprecision(1)
              << search_timer_.get_elapsed_ms() << " ms" << std::defaultfloat << "\n";
}

void MCTSEngine::print_top_actions(int count) const {
    const MCTSNode* root = graph_.get_root();
    if (root == nullptr) {
        std::cout << "No search tree\n";
        return;
    }

    int total = root->total_visits();
    std::cout << "Top actions (" << total << " root visits):\n";
    for (const Edge* edge : root->get_top_edges(count)) {
        double share = total > 0 ? 100.0 * edge->get_visits() / total : 0.0;
        std::cout << "  action " << std::setw(4) << edge->get_action()
                  << "  N=" << std::setw(7) << edge->get_visits()
                  << "  Q=" << std::showpos << std::fixed << std::setprecision(3)
                  << edge->get_stats().mean_value << std::noshowpos
                  << "  (" << std::setprecision(1) << share << "%)"
                  << std::defaultfloat << "\n";
    }
}

} // namespace mcts

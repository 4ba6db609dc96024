#include "games/gomoku_state.hpp"
#include "mcts/mcts_engine.hpp"
#include "utils/progress.hpp"
#include "utils/timer.hpp"
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

games::GomokuState::Config preset_from_name(const std::string& name) {
    if (name == "tictactoe") return games::GomokuState::Config::tic_tac_toe();
    if (name == "small") return games::GomokuState::Config::small();
    if (name == "gomoku") return games::GomokuState::Config::gomoku();
    throw std::invalid_argument("unknown game '" + name + "' (expected tictactoe, small or gomoku)");
}

} // namespace

// How to run: ./play [tictactoe|small|gomoku] [simulations] [exploration] [seed]
int main(int argc, char* argv[]) {
    try {
        std::string game_name = (argc >= 2) ? argv[1] : "tictactoe";
        int simulations = (argc >= 3) ? std::stoi(argv[2]) : 2000;
        double exploration = (argc >= 4) ? std::stod(argv[3]) : 1.4;
        uint64_t seed = (argc >= 5) ? std::stoull(argv[4]) : 42;

        games::GomokuState state(preset_from_name(game_name));

        mcts::MCTSEngine::Config config;
        config.simulations = simulations;
        config.exploration_weight = exploration;
        config.action_size = state.action_size();
        config.verbose = simulations >= 10000;

        // One engine per side so each keeps its own graph between moves
        config.seed = seed;
        mcts::MCTSEngine engine_x(config);
        config.seed = seed + 1;
        mcts::MCTSEngine engine_o(config);

        std::cout << "Playing " << game_name << " (" << state.board_size() << "x" << state.board_size()
                  << ", " << state.config().win_length << " in a row), "
                  << utils::format_with_commas(simulations) << " simulations per move\n";

        utils::Timer game_timer;
        game_timer.start();

        while (!state.is_terminal()) {
            std::cout << "\n" << state.to_string();

            mcts::MCTSEngine& engine = state.player_to_move() == 1 ? engine_x : engine_o;
            std::vector<double> distribution = engine.get_distribution(state);
            core::ActionId action = engine.best_action();

            core::Position pos = core::Position::from_action(action, state.board_size());
            std::cout << (state.player_to_move() == 1 ? "X" : "O") << " plays " << pos.to_string()
                      << " (p=" << distribution[action] << ")\n";
            engine.print_top_actions(3);

            state = state.play(action);
        }

        game_timer.stop();
        std::cout << "\n" << state.to_string();

        int winner = state.get_winner();
        if (winner == 1) {
            std::cout << "Winner: X\n";
        } else if (winner == -1) {
            std::cout << "Winner: O\n";
        } else {
            std::cout << "Draw\n";
        }

        std::cout << "Game took " << game_timer.get_elapsed_seconds() << "s\n";
        std::cout << "X engine: ";
        engine_x.print_stats();
        std::cout << "O engine: ";
        engine_o.print_stats();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

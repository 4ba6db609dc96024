#include "games/gomoku_state.hpp"
#include "mcts/mcts_engine.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

games::GomokuState::Config preset_from_name(const std::string& name) {
    if (name == "tictactoe") return games::GomokuState::Config::tic_tac_toe();
    if (name == "small") return games::GomokuState::Config::small();
    if (name == "gomoku") return games::GomokuState::Config::gomoku();
    throw std::invalid_argument("unknown game '" + name + "' (expected tictactoe, small or gomoku)");
}

// Moves are whitespace separated "row,col" tokens, 0-based
games::GomokuState replay_moves(games::GomokuState state, const std::string& moves) {
    std::istringstream tokens(moves);
    std::string token;
    while (tokens >> token) {
        size_t comma = token.find(',');
        if (comma == std::string::npos) {
            throw std::invalid_argument("bad move '" + token + "' (expected row,col)");
        }
        int row = std::stoi(token.substr(0, comma));
        int col = std::stoi(token.substr(comma + 1));
        if (row < 0 || row >= state.board_size() || col < 0 || col >= state.board_size()) {
            throw std::invalid_argument("move '" + token + "' is off the board");
        }
        state = state.play(row, col);
    }
    return state;
}

void print_distribution(const games::GomokuState& state, const std::vector<double>& distribution) {
    const int n = state.board_size();
    std::cout << "Visit distribution (%):\n";
    for (int row = n - 1; row >= 0; --row) {
        std::cout << std::setw(3) << (row + 1) << " ";
        for (int col = 0; col < n; ++col) {
            int stone = state.get_stone(row, col);
            if (stone != 0) {
                std::cout << std::setw(6) << (stone == 1 ? "X" : "O");
            } else {
                std::cout << std::setw(6) << std::fixed << std::setprecision(1)
                          << distribution[row * n + col] * 100.0;
            }
        }
        std::cout << "\n";
    }
    std::cout << std::defaultfloat;
}

} // namespace

// How to run: ./analyze tictactoe "1,1 0,0" 20000 1.4
int main(int argc, char* argv[]) {
    try {
        std::string game_name = (argc >= 2) ? argv[1] : "tictactoe";
        std::string moves = (argc >= 3) ? argv[2] : "";
        int simulations = (argc >= 4) ? std::stoi(argv[3]) : 10000;
        double exploration = (argc >= 5) ? std::stod(argv[4]) : 1.4;

        games::GomokuState state = replay_moves(games::GomokuState(preset_from_name(game_name)), moves);
        std::cout << state.to_string();
        std::cout << "To move: " << (state.player_to_move() == 1 ? "X" : "O") << "\n";

        mcts::MCTSEngine::Config config;
        config.action_size = state.action_size();
        mcts::MCTSEngine engine(config);

        std::vector<double> distribution = engine.get_distribution(state, simulations, exploration, true);

        print_distribution(state, distribution);
        engine.print_top_actions(5);
        engine.print_stats();

        core::Position best = core::Position::from_action(engine.best_action(), state.board_size());
        std::cout << "MCTS selected move: " << best.to_string() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

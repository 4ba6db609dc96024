#include <gtest/gtest.h>
#include "mcts/mcts_engine.hpp"
#include "games/gomoku_state.hpp"
#include <numeric>

using namespace mcts;
using games::GomokuState;

class CompleteGamesTest : public ::testing::Test {
protected:
    struct GameResult {
        int winner = 0;
        int move_count = 0;
        bool game_completed = false;
        int reuse_count_x = 0;
        int reuse_count_o = 0;
    };

    GameResult play_complete_game(const GomokuState::Config& game_config, int simulations, uint64_t seed) {
        GomokuState state(game_config);

        MCTSEngine::Config config;
        config.action_size = state.action_size();
        config.simulations = simulations;
        config.exploration_weight = 1.4;
        config.seed = seed;
        MCTSEngine engine_x(config);
        config.seed = seed + 1;
        MCTSEngine engine_o(config);

        GameResult result;
        while (!state.is_terminal() && result.move_count < state.action_size()) {
            MCTSEngine& engine = state.player_to_move() == 1 ? engine_x : engine_o;
            std::vector<double> distribution = engine.get_distribution(state);

            double sum = std::accumulate(distribution.begin(), distribution.end(), 0.0);
            EXPECT_NEAR(sum, 1.0, 1e-9);

            core::ActionId action = engine.best_action();
            EXPECT_GT(distribution[action], 0.0);

            state = state.play(action);
            result.move_count++;
        }

        result.game_completed = state.is_terminal();
        result.winner = state.get_winner();
        result.reuse_count_x = engine_x.get_tree_reuse_count();
        result.reuse_count_o = engine_o.get_tree_reuse_count();
        return result;
    }
};

TEST_F(CompleteGamesTest, TicTacToeSelfPlayCompletes) {
    GameResult result = play_complete_game(GomokuState::Config::tic_tac_toe(), 2000, 11);

    EXPECT_TRUE(result.game_completed);
    EXPECT_GE(result.move_count, 5);
    EXPECT_LE(result.move_count, 9);
    // Each engine's next position was already in its own graph
    EXPECT_GT(result.reuse_count_x, 0);
    EXPECT_GT(result.reuse_count_o, 0);
}

TEST_F(CompleteGamesTest, SmallBoardSelfPlayCompletes) {
    GameResult result = play_complete_game(GomokuState::Config::small(), 300, 5);

    EXPECT_TRUE(result.game_completed);
    EXPECT_GE(result.move_count, 7);
    EXPECT_LE(result.move_count, 36);
}

TEST_F(CompleteGamesTest, TakesImmediateWin) {
    // X: 0 1, O: 3 4 -- X completes the top row with 2, O threatens 5
    GomokuState state = GomokuState().play(0).play(3).play(1).play(4);

    MCTSEngine::Config config;
    config.action_size = 9;
    MCTSEngine engine(config);

    std::vector<double> distribution = engine.get_distribution(state, 3000, 1.4, false);

    EXPECT_EQ(engine.best_action(), 2);
    EXPECT_GT(distribution[2], 0.5);
    EXPECT_DOUBLE_EQ(engine.get_root()->find_edge_with_action(2)->get_stats().mean_value, 1.0);
}

TEST_F(CompleteGamesTest, BlocksImmediateLoss) {
    // X: 0 1, O: 4 -- O must take 2
    GomokuState state = GomokuState().play(0).play(4).play(1);

    MCTSEngine::Config config;
    config.action_size = 9;
    config.seed = 3;
    MCTSEngine engine(config);

    engine.get_distribution(state, 5000, 1.4, false);
    EXPECT_EQ(engine.best_action(), 2);
}

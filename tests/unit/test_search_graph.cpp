#include <gtest/gtest.h>
#include "mcts/search_graph.hpp"
#include "test_games.hpp"
#include <stdexcept>
#include <unordered_set>

using namespace mcts;
using test_games::ChainGame;
using test_games::SubtractionGame;

class SearchGraphTest : public ::testing::Test {
protected:
    void expand(MCTSNode* node) {
        const core::GameState& state = node->get_state();
        for (core::ActionId action : state.legal_actions()) {
            node->add_edge(graph_.lookup_or_insert(state.apply_action(action)), action);
        }
    }

    static std::string pile_key(int pile, int player) {
        return SubtractionGame(pile, player).key();
    }

    SearchGraph graph_;
};

TEST_F(SearchGraphTest, ResetCreatesRoot) {
    MCTSNode* root = graph_.reset(SubtractionGame(4));

    ASSERT_NE(root, nullptr);
    EXPECT_EQ(graph_.get_root(), root);
    EXPECT_EQ(graph_.size(), 1u);
    EXPECT_TRUE(graph_.contains(pile_key(4, 1)));
    EXPECT_TRUE(root->is_leaf());
}

TEST_F(SearchGraphTest, ResetDiscardsPreviousNodes) {
    expand(graph_.reset(SubtractionGame(4)));
    EXPECT_EQ(graph_.size(), 3u);

    graph_.reset(SubtractionGame(7));
    EXPECT_EQ(graph_.size(), 1u);
    EXPECT_FALSE(graph_.contains(pile_key(4, 1)));
    EXPECT_FALSE(graph_.contains(pile_key(3, -1)));
}

TEST_F(SearchGraphTest, ResetFromStateOwnedByGraph) {
    MCTSNode* root = graph_.reset(SubtractionGame(4));
    graph_.reset(root->get_state());

    EXPECT_EQ(graph_.size(), 1u);
    EXPECT_TRUE(graph_.contains(pile_key(4, 1)));
}

TEST_F(SearchGraphTest, LookupOrInsertDeduplicatesTranspositions) {
    MCTSNode* root = graph_.reset(SubtractionGame(4));
    expand(root);

    MCTSNode* take_one = graph_.find(pile_key(3, -1));
    MCTSNode* take_two = graph_.find(pile_key(2, -1));
    ASSERT_NE(take_one, nullptr);
    ASSERT_NE(take_two, nullptr);

    expand(take_one);
    size_t before = graph_.size();
    expand(take_two);

    // 4 -> 3 -> 1 and 4 -> 2 -> 1 meet at the same node
    EXPECT_EQ(take_one->get_edges()[1].get_child(), take_two->get_edges()[0].get_child());
    EXPECT_EQ(graph_.size(), before + 1);  // only pile 0 is new

    MCTSNode* again = graph_.lookup_or_insert(std::make_unique<SubtractionGame>(3, -1));
    EXPECT_EQ(again, take_one);
}

TEST_F(SearchGraphTest, FindMissingKeyReturnsNull) {
    graph_.reset(SubtractionGame(4));
    EXPECT_EQ(graph_.find("nothing"), nullptr);
    EXPECT_FALSE(graph_.contains("nothing"));
}

TEST_F(SearchGraphTest, PruneKeepsOnlyReachableNodes) {
    MCTSNode* root = graph_.reset(SubtractionGame(4));
    expand(root);
    MCTSNode* take_one = graph_.find(pile_key(3, -1));
    MCTSNode* take_two = graph_.find(pile_key(2, -1));
    expand(take_one);
    expand(take_two);

    graph_.prune_to(take_one);

    EXPECT_EQ(graph_.get_root(), take_one);
    EXPECT_EQ(graph_.size(), 3u);
    EXPECT_TRUE(graph_.contains(pile_key(3, -1)));
    EXPECT_TRUE(graph_.contains(pile_key(2, 1)));
    // Shared with the dropped sibling, still reachable from the new root
    EXPECT_TRUE(graph_.contains(pile_key(1, 1)));

    EXPECT_FALSE(graph_.contains(pile_key(4, 1)));
    EXPECT_FALSE(graph_.contains(pile_key(2, -1)));
    EXPECT_FALSE(graph_.contains(pile_key(0, 1)));

    // Surviving edges still point into the graph
    for (const Edge& edge : take_one->get_edges()) {
        EXPECT_EQ(graph_.find(edge.get_child()->get_key()), edge.get_child());
    }
}

TEST_F(SearchGraphTest, PruneToRootKeepsEverything) {
    MCTSNode* root = graph_.reset(SubtractionGame(4));
    expand(root);
    size_t before = graph_.size();

    graph_.prune_to(root);
    EXPECT_EQ(graph_.size(), before);
    EXPECT_EQ(graph_.get_root(), root);
}

TEST_F(SearchGraphTest, PruneHandlesVeryDeepGraphs) {
    const int length = 100000;
    MCTSNode* node = graph_.reset(ChainGame(length, 1.0));
    MCTSNode* middle = nullptr;

    for (int i = 0; i < length; ++i) {
        expand(node);
        node = node->get_edges()[0].get_child();
        if (i + 1 == length / 2) {
            middle = node;
        }
    }
    ASSERT_EQ(graph_.size(), static_cast<size_t>(length + 1));

    graph_.prune_to(graph_.get_root());
    EXPECT_EQ(graph_.size(), static_cast<size_t>(length + 1));

    ASSERT_NE(middle, nullptr);
    graph_.prune_to(middle);
    EXPECT_EQ(graph_.size(), static_cast<size_t>(length / 2 + 1));
    EXPECT_FALSE(graph_.contains("chain:0"));
    EXPECT_TRUE(graph_.contains("chain:" + std::to_string(length)));
}

TEST_F(SearchGraphTest, PruneRejectsForeignNode) {
    graph_.reset(SubtractionGame(4));
    MCTSNode stranger(std::make_unique<SubtractionGame>(4));

    EXPECT_THROW(graph_.prune_to(&stranger), std::logic_error);
    EXPECT_THROW(graph_.prune_to(nullptr), std::logic_error);
    EXPECT_EQ(graph_.size(), 1u);
}

TEST_F(SearchGraphTest, GetNodesListsEveryNodeOnce) {
    expand(graph_.reset(SubtractionGame(4)));

    std::vector<const MCTSNode*> nodes = graph_.get_nodes();
    std::unordered_set<const MCTSNode*> unique(nodes.begin(), nodes.end());
    EXPECT_EQ(nodes.size(), graph_.size());
    EXPECT_EQ(unique.size(), nodes.size());
}

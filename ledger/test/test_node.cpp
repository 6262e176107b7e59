#include "Node.h"
#include <gtest/gtest.h>

using namespace fv;

class NodeTest : public ::testing::Test {
protected:
    NodeTest() : rng(2024), node(7) {}

    SeededRandom rng;
    Node node;
};

TEST_F(NodeTest, StartsAtGenesis) {
    EXPECT_EQ(node.getId(), 7u);
    EXPECT_EQ(node.getHeight(), 0u);
    EXPECT_EQ(node.getTipId(), Block::GENESIS_ID);
    EXPECT_EQ(node.getChainLength(), 1u);
    EXPECT_EQ(node.getTip(), Block::genesis());
}

TEST_F(NodeTest, AllNodesShareGenesis) {
    Node other(8);
    EXPECT_EQ(node.getTipId(), other.getTipId());
    EXPECT_EQ(node.getChain(), other.getChain());
}

TEST_F(NodeTest, ProposeExtendsTipWithoutMutating) {
    Block proposal = node.propose(rng);

    EXPECT_EQ(proposal.getHeight(), 1u);
    EXPECT_EQ(proposal.getParentId(), Block::GENESIS_ID);
    EXPECT_EQ(node.getHeight(), 0u);
    EXPECT_EQ(node.getChainLength(), 1u);

    Block again = node.propose(rng);
    EXPECT_NE(again.getId(), proposal.getId());
}

TEST_F(NodeTest, AppendAcceptsBlockExtendingTip) {
    Block block = node.propose(rng);

    EXPECT_TRUE(node.append(block));
    EXPECT_EQ(node.getHeight(), 1u);
    EXPECT_EQ(node.getTipId(), block.getId());
    EXPECT_EQ(node.getChainLength(), 2u);
}

TEST_F(NodeTest, AppendRejectsWrongHeight) {
    Block skip = Block::create(2, Block::GENESIS_ID, rng);
    Block same = Block::create(0, Block::GENESIS_ID, rng);

    EXPECT_FALSE(node.append(skip));
    EXPECT_FALSE(node.append(same));
    EXPECT_EQ(node.getHeight(), 0u);
    EXPECT_EQ(node.getTipId(), Block::GENESIS_ID);
}

TEST_F(NodeTest, AppendRejectsWrongParent) {
    Block first = node.propose(rng);
    ASSERT_TRUE(node.append(first));

    // Right height, but built on genesis instead of our tip
    Block sibling = Block::create(2, Block::GENESIS_ID, rng);
    EXPECT_FALSE(node.append(sibling));
    EXPECT_EQ(node.getHeight(), 1u);
    EXPECT_EQ(node.getTipId(), first.getId());
}

TEST_F(NodeTest, AppendSameBlockTwiceFails) {
    Block block = node.propose(rng);
    ASSERT_TRUE(node.append(block));
    EXPECT_FALSE(node.append(block));
    EXPECT_EQ(node.getChainLength(), 2u);
}

TEST_F(NodeTest, RollbackRemovesTip) {
    Block first = node.propose(rng);
    ASSERT_TRUE(node.append(first));
    Block second = node.propose(rng);
    ASSERT_TRUE(node.append(second));

    EXPECT_TRUE(node.rollback());
    EXPECT_EQ(node.getHeight(), 1u);
    EXPECT_EQ(node.getTipId(), first.getId());
}

TEST_F(NodeTest, RollbackNeverRemovesGenesis) {
    ASSERT_TRUE(node.append(node.propose(rng)));

    EXPECT_TRUE(node.rollback());
    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(node.rollback());
    }
    EXPECT_EQ(node.getChainLength(), 1u);
    EXPECT_EQ(node.getTipId(), Block::GENESIS_ID);
}

TEST_F(NodeTest, StateReflectsTip) {
    Block block = node.propose(rng);
    ASSERT_TRUE(node.append(block));

    NodeState state = node.getState();
    EXPECT_EQ(state.nodeId, 7u);
    EXPECT_EQ(state.height, 1u);
    EXPECT_EQ(state.tipId, block.getId());
}

TEST_F(NodeTest, ChainToStringListsBlocks) {
    Block block = node.propose(rng);
    ASSERT_TRUE(node.append(block));

    EXPECT_EQ(node.chainToString(),
              "[Block(h=0, hash=000000, parent=None), " + block.toString() + "]");
}

#pragma once

#include "Block.h"
#include <cstdint>
#include <string>
#include <vector>

namespace fv {

/** Observable state of a node: who it is, how tall, and what its tip is */
struct NodeState {
  uint64_t nodeId{ 0 };
  uint64_t height{ 0 };
  std::string tipId;
};

/**
 * A node and its local chain.
 *
 * The chain always holds at least the genesis block. append() only accepts a
 * block extending the current tip, rollback() never removes genesis. Both
 * are silent no-ops on rejection; the return value tells the caller.
 */
class Node {
public:
  explicit Node(uint64_t nodeId);

  uint64_t getId() const { return id_; }
  uint64_t getHeight() const { return chain_.back().getHeight(); }
  const Block &getTip() const { return chain_.back(); }
  const std::string &getTipId() const { return chain_.back().getId(); }
  const std::vector<Block> &getChain() const { return chain_; }
  size_t getChainLength() const { return chain_.size(); }
  NodeState getState() const;

  /** Candidate extending the current tip; the node is not modified */
  Block propose(RandomSource &rng) const;

  /**
   * Append block if its height is one above the tip and its parent is the tip
   * @return true if the block was appended
   */
  bool append(const Block &block);

  /**
   * Drop the tip unless it is genesis
   * @return true if a block was removed
   */
  bool rollback();

  /** Chain rendered as "[Block(...), Block(...)]" */
  std::string chainToString(size_t idLength = Block::DEFAULT_SHORT_ID_LENGTH) const;

private:
  uint64_t id_;
  std::vector<Block> chain_;
};

} // namespace fv

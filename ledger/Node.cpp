#include "Node.h"

#include <sstream>

namespace fv {

Node::Node(uint64_t nodeId) : id_(nodeId) { chain_.push_back(Block::genesis()); }

NodeState Node::getState() const {
  NodeState state;
  state.nodeId = id_;
  state.height = getHeight();
  state.tipId = getTipId();
  return state;
}

Block Node::propose(RandomSource &rng) const {
  const Block &tip = chain_.back();
  return Block::create(tip.getHeight() + 1, tip.getId(), rng);
}

bool Node::append(const Block &block) {
  if (block.getHeight() != getHeight() + 1) {
    return false;
  }
  if (block.getParentId() != getTipId()) {
    return false;
  }
  chain_.push_back(block);
  return true;
}

bool Node::rollback() {
  if (chain_.size() <= 1) {
    return false;
  }
  chain_.pop_back();
  return true;
}

std::string Node::chainToString(size_t idLength) const {
  std::ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < chain_.size(); ++i) {
    if (i > 0) {
      oss << ", ";
    }
    oss << chain_[i].toString(idLength);
  }
  oss << "]";
  return oss.str();
}

} // namespace fv

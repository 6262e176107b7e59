#include "RoundEngine.h"

#include <algorithm>

namespace fv {
namespace consensus {

namespace {

template <typename K>
void countInOrder(std::vector<std::pair<K, size_t>> &counts, const K &key) {
  auto it = std::find_if(counts.begin(), counts.end(),
                         [&key](const auto &entry) { return entry.first == key; });
  if (it == counts.end()) {
    counts.emplace_back(key, 1);
  } else {
    ++it->second;
  }
}

// Earliest entry wins among equal counts; counts must not be empty
template <typename K>
const K &firstMaximum(const std::vector<std::pair<K, size_t>> &counts) {
  auto best = counts.begin();
  for (auto it = counts.begin(); it != counts.end(); ++it) {
    if (it->second > best->second) {
      best = it;
    }
  }
  return best->first;
}

} // namespace

std::string toString(RoundEvent::Type type) {
  switch (type) {
  case RoundEvent::Type::SELF_CORRECTED:
    return "SELF_CORRECTED";
  case RoundEvent::Type::SELECTION_REJECTED:
    return "SELECTION_REJECTED";
  case RoundEvent::Type::ADOPTED:
    return "ADOPTED";
  default:
    return "UNKNOWN";
  }
}

RoundEngine::RoundEngine(RandomSource &rng) : rng_(rng) {}

RoundSummary RoundEngine::runRound(std::vector<Node> &nodes) {
  RoundSummary summary;

  std::vector<Block> proposals = collectProposals(nodes);
  selectOrCorrect(nodes, proposals, summary.events);
  summary.tally = computeTally(nodes);
  if (summary.tally.hasMajority) {
    reconcile(nodes, summary.tally, summary.events);
  }

  summary.states.reserve(nodes.size());
  for (const auto &node : nodes) {
    summary.states.push_back(node.getState());
  }
  return summary;
}

std::vector<Block> RoundEngine::collectProposals(const std::vector<Node> &nodes) {
  std::vector<Block> proposals;
  proposals.reserve(nodes.size());
  for (const auto &node : nodes) {
    proposals.push_back(node.propose(rng_));
  }
  return proposals;
}

void RoundEngine::selectOrCorrect(std::vector<Node> &nodes,
                                  const std::vector<Block> &proposals,
                                  std::vector<RoundEvent> &events) {
  for (auto &node : nodes) {
    uint64_t nextHeight = node.getHeight() + 1;

    std::vector<const Block *> candidates;
    for (const auto &block : proposals) {
      if (block.getHeight() == nextHeight) {
        candidates.push_back(&block);
      }
    }

    if (!candidates.empty()) {
      const Block &chosen = *candidates[rng_.pickIndex(candidates.size())];
      if (!node.append(chosen)) {
        RoundEvent event;
        event.type = RoundEvent::Type::SELECTION_REJECTED;
        event.nodeId = node.getId();
        event.heightBefore = node.getHeight();
        event.heightAfter = node.getHeight();
        event.localTipId = node.getTipId();
        event.blockId = chosen.getId();
        events.push_back(event);
      }
      continue;
    }

    uint64_t networkHeight = getNetworkHeight(nodes);
    if (networkHeight > node.getHeight()) {
      RoundEvent event;
      event.type = RoundEvent::Type::SELF_CORRECTED;
      event.nodeId = node.getId();
      event.heightBefore = node.getHeight();
      event.networkHeight = networkHeight;
      event.localTipId = node.getTipId();
      node.rollback();
      event.heightAfter = node.getHeight();
      events.push_back(event);
    }
  }
}

MajorityTally RoundEngine::computeTally(const std::vector<Node> &nodes) {
  MajorityTally tally;
  for (const auto &node : nodes) {
    countInOrder(tally.heightCounts, node.getHeight());
  }
  if (tally.heightCounts.empty()) {
    return tally;
  }
  tally.height = firstMaximum(tally.heightCounts);

  for (const auto &node : nodes) {
    if (node.getHeight() == tally.height) {
      countInOrder(tally.hashCounts, node.getTipId());
    }
  }
  // Never empty: at least one node sits at the majority height
  tally.hash = firstMaximum(tally.hashCounts);
  tally.hasMajority = true;
  return tally;
}

void RoundEngine::reconcile(std::vector<Node> &nodes, const MajorityTally &tally,
                            std::vector<RoundEvent> &events) {
  auto refIt = std::find_if(nodes.begin(), nodes.end(), [&tally](const Node &n) {
    return n.getHeight() == tally.height && n.getTipId() == tally.hash;
  });
  if (refIt == nodes.end()) {
    return;
  }
  // Copy: the reference node's chain is not touched below, but others are
  const Block reference = refIt->getTip();

  for (auto &node : nodes) {
    uint64_t heightBefore = node.getHeight();
    std::string replacedTip;

    if (node.getHeight() < tally.height) {
      // Trim anything at or above the majority height. Unreachable from this
      // branch, kept so the catch-up path matches the conflict path exactly.
      while (node.getHeight() >= tally.height && node.getChainLength() > 1) {
        node.rollback();
      }
    } else if (node.getHeight() == tally.height && node.getTipId() != tally.hash) {
      replacedTip = node.getTipId();
      node.rollback();
    } else {
      continue;
    }

    if (adoptReference(node, reference)) {
      RoundEvent event;
      event.type = RoundEvent::Type::ADOPTED;
      event.nodeId = node.getId();
      event.heightBefore = heightBefore;
      event.heightAfter = node.getHeight();
      event.localTipId = replacedTip;
      event.blockId = reference.getId();
      events.push_back(event);
    }
  }
}

uint64_t RoundEngine::getNetworkHeight(const std::vector<Node> &nodes) {
  uint64_t maxHeight = 0;
  for (const auto &node : nodes) {
    maxHeight = std::max(maxHeight, node.getHeight());
  }
  return maxHeight;
}

bool RoundEngine::adoptReference(Node &node, const Block &reference) {
  if (node.getHeight() + 1 != reference.getHeight()) {
    return false;
  }
  return node.append(Block::adopt(reference, node.getTipId()));
}

} // namespace consensus
} // namespace fv

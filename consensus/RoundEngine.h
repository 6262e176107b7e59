#pragma once

#include "Types.hpp"
#include "../ledger/Node.h"
#include "../lib/Random.h"
#include <vector>

namespace fv {
namespace consensus {

/**
 * Majority-adoption round engine
 *
 * One round runs four phases over an ordered set of nodes, each phase
 * finishing for every node before the next starts:
 * - Propose: every node proposes a block on top of its tip
 * - Select-or-correct: every node appends a random proposal at its next
 *   height, or rolls back once if none exists and the network is ahead
 * - Aggregate: majority height, then majority tip hash at that height, both
 *   resolved to the first value seen in node order on ties
 * - Reconcile: nodes behind the majority, or at it with another tip, adopt
 *   the majority tip re-parented onto their own chain
 *
 * Nothing here fails; rejected appends and rollbacks are no-ops. Notable
 * outcomes are returned as events for the caller to report.
 */
class RoundEngine {
public:
  explicit RoundEngine(RandomSource &rng);

  /** Run all four phases once, mutating nodes in place */
  RoundSummary runRound(std::vector<Node> &nodes);

  // ----- phases, in order -----
  std::vector<Block> collectProposals(const std::vector<Node> &nodes);

  /**
   * Candidates are filtered by height only. A pick whose parent is not the
   * node's tip is rejected by append() and the node does not grow this round.
   * The self-correction check sees heights already changed earlier in this
   * same pass.
   */
  void selectOrCorrect(std::vector<Node> &nodes,
                       const std::vector<Block> &proposals,
                       std::vector<RoundEvent> &events);

  static MajorityTally computeTally(const std::vector<Node> &nodes);

  static void reconcile(std::vector<Node> &nodes, const MajorityTally &tally,
                        std::vector<RoundEvent> &events);

  /** Highest tip over all nodes, 0 for an empty set */
  static uint64_t getNetworkHeight(const std::vector<Node> &nodes);

private:
  static bool adoptReference(Node &node, const Block &reference);

  RandomSource &rng_;
};

} // namespace consensus
} // namespace fv

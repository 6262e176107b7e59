#pragma once

#include "../ledger/Node.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace fv {
namespace consensus {

/**
 * Majority picks of one round, rebuilt from scratch every round.
 * Counts are kept in the order values were first seen while scanning nodes,
 * which is what the first-maximum tie-break relies on.
 */
struct MajorityTally {
  bool hasMajority{ false }; // false only when there are no nodes
  uint64_t height{ 0 };
  std::string hash;
  std::vector<std::pair<uint64_t, size_t>> heightCounts;
  std::vector<std::pair<std::string, size_t>> hashCounts; // at majority height
};

// Informational outcome of one node's step, reported to whoever drives rounds
struct RoundEvent {
  enum class Type {
    SELF_CORRECTED,     // no candidate at next height, network ahead, rolled back
    SELECTION_REJECTED, // picked a candidate whose parent is not our tip
    ADOPTED,            // majority block spliced onto the local chain
  };

  Type type{ Type::SELF_CORRECTED };
  uint64_t nodeId{ 0 };
  uint64_t heightBefore{ 0 };
  uint64_t heightAfter{ 0 };
  uint64_t networkHeight{ 0 }; // SELF_CORRECTED only
  std::string localTipId;      // tip before the step; empty when catching up
  std::string blockId;         // candidate or adopted block
};

std::string toString(RoundEvent::Type type);

struct RoundSummary {
  MajorityTally tally;
  std::vector<RoundEvent> events;
  std::vector<NodeState> states;
};

} // namespace consensus
} // namespace fv

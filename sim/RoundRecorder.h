#pragma once

#include "../ledger/Node.h"
#include "../lib/ResultOrError.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fv {

/**
 * Ordered log of per-round node states, written out as a JSON array of
 * {"node_id", "height", "hash", "round"} objects.
 */
class RoundRecorder {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_IO = -2;

  struct Record {
    uint64_t round{ 0 };
    uint64_t nodeId{ 0 };
    uint64_t height{ 0 };
    std::string hash; // tip id, possibly truncated

    nlohmann::json ltsToJson() const;
  };

  /**
   * @param hashPrefixLength Characters of the tip id kept per record, 0 keeps
   * the full id
   */
  explicit RoundRecorder(size_t hashPrefixLength = Block::DEFAULT_SHORT_ID_LENGTH);

  /** Append one record per node, in node order */
  void record(uint64_t round, const std::vector<NodeState> &states);

  const std::vector<Record> &getRecords() const { return records_; }
  size_t size() const { return records_.size(); }
  void clear() { records_.clear(); }

  void setHashPrefixLength(size_t length) { hashPrefixLength_ = length; }
  size_t getHashPrefixLength() const { return hashPrefixLength_; }

  nlohmann::json toJson() const;

  /** Write toJson() with 2-space indentation, replacing the file */
  Roe<void> writeToFile(const std::string &path) const;

private:
  size_t hashPrefixLength_;
  std::vector<Record> records_;
};

} // namespace fv

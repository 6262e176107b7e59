#include "RoundRecorder.h"
#include "../lib/Utilities.h"

namespace fv {

nlohmann::json RoundRecorder::Record::ltsToJson() const {
  nlohmann::json jd;
  jd["node_id"] = nodeId;
  jd["height"] = height;
  jd["hash"] = hash;
  jd["round"] = round;
  return jd;
}

RoundRecorder::RoundRecorder(size_t hashPrefixLength)
    : hashPrefixLength_(hashPrefixLength) {}

void RoundRecorder::record(uint64_t round, const std::vector<NodeState> &states) {
  for (const auto &state : states) {
    Record rec;
    rec.round = round;
    rec.nodeId = state.nodeId;
    rec.height = state.height;
    rec.hash = shortId(state.tipId, hashPrefixLength_);
    records_.push_back(rec);
  }
}

nlohmann::json RoundRecorder::toJson() const {
  nlohmann::json jd = nlohmann::json::array();
  for (const auto &rec : records_) {
    jd.push_back(rec.ltsToJson());
  }
  return jd;
}

RoundRecorder::Roe<void> RoundRecorder::writeToFile(const std::string &path) const {
  auto result = utl::writeToFile(path, toJson().dump(2) + "\n");
  if (!result) {
    return Error(E_IO, result.error().message);
  }
  return {};
}

} // namespace fv

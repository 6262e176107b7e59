#include "Simulation.h"

#include <exception>

namespace fv {

nlohmann::json Simulation::Config::ltsToJson() const {
  nlohmann::json jd;
  jd["nodeCount"] = nodeCount;
  jd["rounds"] = rounds;
  if (seed) {
    jd["seed"] = *seed;
  }
  jd["hashPrefixLength"] = hashPrefixLength;
  jd["outputPath"] = outputPath;
  return jd;
}

Simulation::Roe<void> Simulation::Config::ltsFromJson(const nlohmann::json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_CONFIG, "Configuration must be a JSON object");
    }

    if (jd.contains("nodeCount")) {
      if (!jd["nodeCount"].is_number_unsigned()) {
        return Error(E_CONFIG, "Field 'nodeCount' must be a positive number");
      }
      nodeCount = jd["nodeCount"].get<uint64_t>();
      if (nodeCount == 0) {
        return Error(E_CONFIG, "Field 'nodeCount' must be at least 1");
      }
    }

    if (jd.contains("rounds")) {
      if (!jd["rounds"].is_number_unsigned()) {
        return Error(E_CONFIG, "Field 'rounds' must be a non-negative number");
      }
      rounds = jd["rounds"].get<uint64_t>();
    }

    if (jd.contains("seed")) {
      if (jd["seed"].is_null()) {
        seed.reset();
      } else if (!jd["seed"].is_number_unsigned()) {
        return Error(E_CONFIG, "Field 'seed' must be a non-negative number");
      } else {
        seed = jd["seed"].get<uint64_t>();
      }
    }

    if (jd.contains("hashPrefixLength")) {
      if (!jd["hashPrefixLength"].is_number_unsigned()) {
        return Error(E_CONFIG,
                     "Field 'hashPrefixLength' must be a non-negative number");
      }
      hashPrefixLength = jd["hashPrefixLength"].get<uint64_t>();
    }

    if (jd.contains("outputPath")) {
      if (!jd["outputPath"].is_string()) {
        return Error(E_CONFIG, "Field 'outputPath' must be a string");
      }
      outputPath = jd["outputPath"].get<std::string>();
    }

    return {};
  } catch (const nlohmann::json::exception &e) {
    return Error(E_CONFIG, "Failed to parse configuration: " + std::string(e.what()));
  }
}

Simulation::Simulation() : Module("simulation") {}

Simulation::Roe<void> Simulation::validate(const Config &config) const {
  if (config.nodeCount == 0) {
    return Error(E_CONFIG, "Node count must be at least 1");
  }
  return {};
}

Simulation::Roe<void> Simulation::init(const Config &config) {
  std::unique_ptr<RandomSource> rng;
  if (config.seed) {
    rng = std::make_unique<SeededRandom>(*config.seed);
  } else {
    try {
      rng = std::make_unique<SystemRandom>();
    } catch (const std::exception &e) {
      return Error(E_CONFIG, e.what());
    }
  }
  return init(config, std::move(rng));
}

Simulation::Roe<void> Simulation::init(const Config &config,
                                       std::unique_ptr<RandomSource> rng) {
  auto validResult = validate(config);
  if (!validResult) {
    return validResult;
  }
  if (!rng) {
    return Error(E_CONFIG, "Random source is required");
  }

  config_ = config;
  rng_ = std::move(rng);
  engine_ = std::make_unique<consensus::RoundEngine>(*rng_);
  recorder_.clear();
  recorder_.setHashPrefixLength(config_.hashPrefixLength);
  currentRound_ = 0;

  nodes_.clear();
  nodes_.reserve(config_.nodeCount);
  for (uint64_t i = 0; i < config_.nodeCount; ++i) {
    nodes_.emplace_back(i);
  }

  log().info << "Initialized " << config_.nodeCount << " nodes, "
             << config_.rounds << " rounds, seed "
             << (config_.seed ? std::to_string(*config_.seed) : "none");
  return {};
}

Simulation::Roe<consensus::RoundSummary> Simulation::runRound() {
  if (!engine_) {
    return Error(E_CONFIG, "Simulation is not initialized");
  }

  log().info << "=== Round " << currentRound_ << " ===";
  consensus::RoundSummary summary = engine_->runRound(nodes_);

  for (const auto &event : summary.events) {
    logEvent(event);
  }
  if (summary.tally.hasMajority) {
    log().debug << "Majority height " << summary.tally.height << ", hash "
                << shortId(summary.tally.hash, config_.hashPrefixLength);
  }
  for (const auto &node : nodes_) {
    log().info << "Node " << node.getId() << " | height=" << node.getHeight()
               << " | chain=" << node.chainToString(config_.hashPrefixLength);
  }

  recorder_.record(currentRound_, summary.states);
  ++currentRound_;
  return summary;
}

Simulation::Roe<void> Simulation::run() {
  for (uint64_t r = 0; r < config_.rounds; ++r) {
    auto roundResult = runRound();
    if (!roundResult) {
      return Error(roundResult.error().code, roundResult.error().message);
    }
  }

  if (config_.outputPath.empty()) {
    return {};
  }

  auto writeResult = recorder_.writeToFile(config_.outputPath);
  if (!writeResult) {
    log().error << "Failed to write report: " << writeResult.error().message;
    return Error(E_IO, writeResult.error().message);
  }
  log().info << "Wrote " << recorder_.size() << " records to "
             << config_.outputPath;
  return {};
}

void Simulation::logEvent(const consensus::RoundEvent &event) const {
  size_t n = config_.hashPrefixLength;
  switch (event.type) {
  case consensus::RoundEvent::Type::SELF_CORRECTED:
    log().info << "Node " << event.nodeId
               << " discarding last block (behind network: "
               << event.heightBefore << " < " << event.networkHeight << ")";
    break;
  case consensus::RoundEvent::Type::SELECTION_REJECTED:
    log().debug << "Node " << event.nodeId << " picked "
                << shortId(event.blockId, n) << " which does not extend tip "
                << shortId(event.localTipId, n);
    break;
  case consensus::RoundEvent::Type::ADOPTED:
    if (event.localTipId.empty()) {
      log().info << "Node " << event.nodeId << " caught up to majority ("
                 << shortId(event.blockId, n) << ") at height "
                 << event.heightAfter;
    } else {
      log().info << "Node " << event.nodeId
                 << " is at majority height but with a different hash ("
                 << shortId(event.localTipId, n) << "), adopting majority ("
                 << shortId(event.blockId, n) << ")";
    }
    break;
  }
}

} // namespace fv

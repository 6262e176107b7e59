#pragma once

#include "RoundRecorder.h"
#include "../consensus/RoundEngine.h"
#include "../ledger/Node.h"
#include "../lib/Module.h"
#include "../lib/Random.h"
#include "../lib/ResultOrError.hpp"
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fv {

/**
 * Drives a fixed set of nodes through consecutive consensus rounds.
 *
 * Owns the nodes, the random source and the recorder. After every round it
 * logs what the engine reported, dumps each node's chain and records the
 * node states; run() finally writes the report file.
 */
class Simulation : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Error codes
  static constexpr const int32_t E_CONFIG = -1;
  static constexpr const int32_t E_IO = -2;

  static constexpr const uint64_t DEFAULT_NODE_COUNT = 5;
  static constexpr const uint64_t DEFAULT_ROUNDS = 5;
  static constexpr const char *DEFAULT_OUTPUT_PATH = "consensus_data.json";

  struct Config {
    uint64_t nodeCount{ DEFAULT_NODE_COUNT };
    uint64_t rounds{ DEFAULT_ROUNDS };
    std::optional<uint64_t> seed; // unset: non-reproducible system randomness
    uint64_t hashPrefixLength{ Block::DEFAULT_SHORT_ID_LENGTH };
    std::string outputPath{ DEFAULT_OUTPUT_PATH }; // empty: no report file

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  Simulation();
  ~Simulation() override = default;

  // ----- accessors -----
  const Config &getConfig() const { return config_; }
  const std::vector<Node> &getNodes() const { return nodes_; }
  const RoundRecorder &getRecorder() const { return recorder_; }
  /** Index of the next round to run */
  uint64_t getCurrentRound() const { return currentRound_; }

  // ----- methods -----
  /** Validate config, create the random source and fresh nodes */
  Roe<void> init(const Config &config);
  /** Same as init(config) but with an externally supplied random source */
  Roe<void> init(const Config &config, std::unique_ptr<RandomSource> rng);

  /** Run one round; requires a successful init() */
  Roe<consensus::RoundSummary> runRound();

  /** Run the configured number of rounds and write the report */
  Roe<void> run();

private:
  Roe<void> validate(const Config &config) const;
  void logEvent(const consensus::RoundEvent &event) const;

  Config config_;
  std::unique_ptr<RandomSource> rng_;
  std::unique_ptr<consensus::RoundEngine> engine_;
  std::vector<Node> nodes_;
  RoundRecorder recorder_;
  uint64_t currentRound_{ 0 };
};

} // namespace fv

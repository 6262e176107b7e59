#include "../lib/Logger.h"
#include "../lib/Utilities.h"
#include "../sim/Simulation.h"

#include <cstring>
#include <exception>
#include <iostream>
#include <string>

namespace {

const char *VERSION = "0.1.0";

void printUsage() {
  std::cout << "Usage: forkvote [options]\n";
  std::cout << "  -c <config.json>   - Load simulation settings from a JSON file\n";
  std::cout << "  -n <nodes>         - Number of nodes (default: 5)\n";
  std::cout << "  -r <rounds>        - Number of rounds (default: 5)\n";
  std::cout << "  -s <seed>          - Seed for a reproducible run (default: random)\n";
  std::cout << "  -o <output.json>   - Report file, \"\" disables it (default: consensus_data.json)\n";
  std::cout << "  -p <length>        - Hash prefix length in output, 0 = full (default: 6)\n";
  std::cout << "  --log <file>       - Also write the log to a file\n";
  std::cout << "  -v                 - Verbose (debug) logging\n";
  std::cout << "  -q                 - Quiet, warnings and errors only\n";
  std::cout << "  -h, --help         - Show this help\n";
  std::cout << "\n";
  std::cout << "Command line options override values from the config file:\n";
  std::cout << "  {\n";
  std::cout << "    \"nodeCount\": 5,\n";
  std::cout << "    \"rounds\": 5,\n";
  std::cout << "    \"seed\": 42,\n";
  std::cout << "    \"hashPrefixLength\": 6,\n";
  std::cout << "    \"outputPath\": \"consensus_data.json\"\n";
  std::cout << "  }\n";
}

bool requireValue(int argc, char *argv[], int i, const char *option) {
  if (i + 1 < argc) {
    return true;
  }
  std::cerr << "Error: " << option << " option requires a value.\n";
  printUsage();
  return false;
}

bool parseCount(const std::string &text, const char *option, uint64_t &value) {
  if (!fv::utl::parseUInt64(text, value)) {
    std::cerr << "Error: invalid value for " << option << ": " << text << "\n";
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  std::string configPath;
  std::string logPath;
  fv::logging::Level level = fv::logging::Level::INFO;

  bool hasNodes = false, hasRounds = false, hasSeed = false;
  bool hasOutput = false, hasPrefix = false;
  uint64_t nodes = 0, rounds = 0, seed = 0, prefix = 0;
  std::string output;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
      printUsage();
      return 0;
    } else if (strcmp(argv[i], "-c") == 0) {
      if (!requireValue(argc, argv, i, "-c")) return 1;
      configPath = argv[++i];
    } else if (strcmp(argv[i], "-n") == 0) {
      if (!requireValue(argc, argv, i, "-n")) return 1;
      if (!parseCount(argv[++i], "-n", nodes)) return 1;
      hasNodes = true;
    } else if (strcmp(argv[i], "-r") == 0) {
      if (!requireValue(argc, argv, i, "-r")) return 1;
      if (!parseCount(argv[++i], "-r", rounds)) return 1;
      hasRounds = true;
    } else if (strcmp(argv[i], "-s") == 0) {
      if (!requireValue(argc, argv, i, "-s")) return 1;
      if (!parseCount(argv[++i], "-s", seed)) return 1;
      hasSeed = true;
    } else if (strcmp(argv[i], "-o") == 0) {
      if (!requireValue(argc, argv, i, "-o")) return 1;
      output = argv[++i];
      hasOutput = true;
    } else if (strcmp(argv[i], "-p") == 0) {
      if (!requireValue(argc, argv, i, "-p")) return 1;
      if (!parseCount(argv[++i], "-p", prefix)) return 1;
      hasPrefix = true;
    } else if (strcmp(argv[i], "--log") == 0) {
      if (!requireValue(argc, argv, i, "--log")) return 1;
      logPath = argv[++i];
    } else if (strcmp(argv[i], "-v") == 0) {
      level = fv::logging::Level::DEBUG;
    } else if (strcmp(argv[i], "-q") == 0) {
      level = fv::logging::Level::WARNING;
    } else {
      std::cerr << "Error: Unknown argument: " << argv[i] << "\n";
      printUsage();
      return 1;
    }
  }

  auto rootLogger = fv::logging::getRootLogger();
  rootLogger.setLevel(level);
  if (!logPath.empty()) {
    try {
      rootLogger.addFileHandler(logPath, fv::logging::Level::DEBUG);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }
  rootLogger.info << "forkvote v" << VERSION;

  fv::Simulation::Config config;
  if (!configPath.empty()) {
    auto jsonResult = fv::utl::loadJsonFile(configPath);
    if (!jsonResult) {
      rootLogger.error << jsonResult.error().message;
      std::cerr << "Error: " << jsonResult.error().message << "\n";
      return 1;
    }
    auto parseResult = config.ltsFromJson(jsonResult.value());
    if (!parseResult) {
      rootLogger.error << "Invalid config " << configPath << ": "
                       << parseResult.error().message;
      std::cerr << "Error: " << parseResult.error().message << "\n";
      return 1;
    }
  }

  if (hasNodes) config.nodeCount = nodes;
  if (hasRounds) config.rounds = rounds;
  if (hasSeed) config.seed = seed;
  if (hasOutput) config.outputPath = output;
  if (hasPrefix) config.hashPrefixLength = prefix;

  fv::Simulation simulation;
  auto initResult = simulation.init(config);
  if (!initResult) {
    std::cerr << "Error: " << initResult.error().message << "\n";
    return 1;
  }

  auto runResult = simulation.run();
  if (!runResult) {
    std::cerr << "Error: " << runResult.error().message << "\n";
    return 1;
  }
  return 0;
}

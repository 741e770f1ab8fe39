#include "gftmax/common.hpp"
#include "gftmax/config.hpp"
#include "gftmax/environment.hpp"
#include "gftmax/logger.hpp"
#include "gftmax/mechanism.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace gftmax;

static void printHelp() {
  std::cout << R"(
╔═══════════════════════════════════════════════════════════╗
║          GFTMAX — Online Bilateral Trade Mechanism        ║
║        Hedge over price grids · budget then GFT phase     ║
╚═══════════════════════════════════════════════════════════╝

Usage: gftmax [OPTIONS]

Options:
  --config <FILE>       JSON config file (flags below override it)
  --horizon <T>         Number of rounds (default: 1000)
  --seed <S>            Seed for action and valuation draws (default: 42)
  --constrained         Keep posted prices inside per-round bounds
  --replay <FILE>       Replay valuations/constraints from a JSON file
  --band <W>            Half-width of generated bounds (default: 0.25)
  --log-dir <DIR>       Directory for rounds.csv / runs.csv (default: logs)
  --log-level <LEVEL>   trace|debug|info|warn|error|critical|off
  --no-rounds           Do not write rounds.csv
  --help, -h            Show this help
)";
}

// ── Parse CLI args ──────────────────────────────────────────────────
static Config parseArgs(int argc, char *argv[]) {
  Config cfg;

  // The config file is the base; flags override it regardless of order.
  for (int i = 1; i + 1 < argc; i++) {
    if (std::string(argv[i]) == "--config")
      cfg = loadConfig(argv[i + 1], cfg);
  }

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc)
      ++i;
    else if (arg == "--horizon" && i + 1 < argc)
      cfg.horizon = std::stoi(argv[++i]);
    else if (arg == "--seed" && i + 1 < argc)
      cfg.seed = std::stoull(argv[++i]);
    else if (arg == "--constrained")
      cfg.constrained = true;
    else if (arg == "--replay" && i + 1 < argc)
      cfg.replay_path = argv[++i];
    else if (arg == "--band" && i + 1 < argc)
      cfg.band = std::stod(argv[++i]);
    else if (arg == "--log-dir" && i + 1 < argc)
      cfg.log_dir = argv[++i];
    else if (arg == "--log-level" && i + 1 < argc)
      cfg.log_level = argv[++i];
    else if (arg == "--no-rounds")
      cfg.write_rounds = false;
    else if (arg == "--help" || arg == "-h") {
      printHelp();
      std::exit(0);
    } else
      throw InvalidConfiguration("unknown or incomplete option: " + arg);
  }
  return cfg;
}

// ── Main ─────────────────────────────────────────────────────────────
int main(int argc, char *argv[]) {
  // Setup logging
  auto console = spdlog::stdout_color_mt("gftmax");
  spdlog::set_default_logger(console);
  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  Config cfg;
  try {
    cfg = parseArgs(argc, argv);
    validateConfig(cfg);
  } catch (const InvalidConfiguration &e) {
    spdlog::error("Invalid configuration: {}", e.what());
    return 1;
  } catch (const std::logic_error &e) {
    // std::stoi and friends
    spdlog::error("Invalid numeric argument: {}", e.what());
    return 1;
  }
  spdlog::set_level(spdlog::level::from_str(cfg.log_level));

  spdlog::info("Horizon: {}", cfg.horizon);
  spdlog::info("Seed: {}", cfg.seed);
  spdlog::info("Mode: {}", cfg.constrained ? "constrained" : "unconstrained");
  spdlog::info("Environment: {}",
               cfg.replay_path.empty() ? "uniform" : cfg.replay_path);

  try {
    std::unique_ptr<Environment> env;
    if (cfg.replay_path.empty())
      env = std::make_unique<UniformEnvironment>(cfg.seed + 1, cfg.band);
    else
      env = std::make_unique<ReplayEnvironment>(
          ReplayEnvironment::fromJson(cfg.replay_path));

    std::unique_ptr<TradeMechanism> mechanism;
    if (cfg.constrained)
      mechanism = std::make_unique<ConstrainedTradeMechanism>(cfg, *env);
    else
      mechanism = std::make_unique<TradeMechanism>(cfg, *env);

    RunLogger logger(cfg.log_dir, cfg.write_rounds);
    mechanism->run([&](const TradeMechanism::RoundRecord &rec) {
      logger.logRound(rec);
    });
    logger.logSummary(mechanism->summary(), cfg);

    std::cout << "final_gft=" << mechanism->finalGFT() << "\n";
  } catch (const InvalidConfiguration &e) {
    spdlog::error("Invalid configuration: {}", e.what());
    return 1;
  } catch (const EnvironmentContractViolation &e) {
    spdlog::error("Environment contract violated: {}", e.what());
    return 1;
  } catch (const NumericDegeneracy &e) {
    spdlog::error("Numeric degeneracy: {}", e.what());
    return 1;
  } catch (const std::exception &e) {
    spdlog::error("Run failed: {}", e.what());
    return 1;
  }

  return 0;
}

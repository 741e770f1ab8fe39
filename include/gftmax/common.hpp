#pragma once
#include <chrono>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace gftmax {

// ── Configuration ────────────────────────────────────────────────────
struct Config {
  int horizon = 1000;       // T, number of rounds
  std::uint64_t seed = 42;  // action-selection engine seed
  bool constrained = false; // rescale actions into per-round bounds
  std::string replay_path;  // empty = uniform stochastic environment
  double band = 0.25;       // half-width of generated bounds
  std::string log_dir = "logs";
  std::string log_level = "info";
  bool write_rounds = true; // rounds.csv
};

// ── Errors ───────────────────────────────────────────────────────────
struct InvalidConfiguration : std::invalid_argument {
  explicit InvalidConfiguration(const std::string &what)
      : std::invalid_argument(what) {}
};

struct EnvironmentContractViolation : std::runtime_error {
  explicit EnvironmentContractViolation(const std::string &what)
      : std::runtime_error(what) {}
};

struct NumericDegeneracy : std::runtime_error {
  explicit NumericDegeneracy(const std::string &what)
      : std::runtime_error(what) {}
};

// ── Prices ───────────────────────────────────────────────────────────
// ask is paid to the seller, bid is charged to the buyer.
struct PricePair {
  double ask = 0.0;
  double bid = 0.0;

  bool operator==(const PricePair &o) const {
    return ask == o.ask && bid == o.bid;
  }
};

using ExpertSet = std::vector<PricePair>;

// ── Round feedback ───────────────────────────────────────────────────
struct Valuations {
  double sell = 0.0; // seller's hidden valuation
  double buy = 0.0;  // buyer's hidden valuation

  double potential() const { return buy - sell; }
};

struct Bounds {
  double lower = 0.0; // s_dot
  double upper = 1.0; // b_dot
};

// A trade clears when the seller accepts the ask and the buyer accepts the
// bid.
inline bool clears(const PricePair &p, const Valuations &v) {
  return v.sell <= p.ask && p.bid <= v.buy;
}

inline bool withinBounds(const PricePair &p, const Bounds &b) {
  return !(p.ask < b.lower || b.upper < p.bid);
}

// Maps a normalized pair into [lower, upper]: the ask is lifted from the
// lower bound and the bid is pulled down from the upper bound, both scaled by
// (upper - lower)^2.
inline PricePair rescale(const PricePair &p, const Bounds &b) {
  double f = (b.upper - b.lower) * (b.upper - b.lower);
  return {b.lower + p.ask * f, b.upper - (1.0 - p.bid) * f};
}

// ── Mechanism phase ──────────────────────────────────────────────────
enum class Phase { PROFIT_MAX, GFT_MAX };

inline const char *phaseName(Phase p) {
  return p == Phase::PROFIT_MAX ? "PROFIT_MAX" : "GFT_MAX";
}

using Rng = std::mt19937_64;

// ── Timing helper ────────────────────────────────────────────────────
inline double elapsed_ms(std::chrono::steady_clock::time_point start) {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration<double, std::milli>(now - start).count();
}

} // namespace gftmax

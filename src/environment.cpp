#include "gftmax/environment.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <utility>

using json = nlohmann::json;

namespace gftmax {

Bounds Environment::getConstraints(std::size_t round) {
  throw EnvironmentContractViolation(
      "environment provides no constraints (round " + std::to_string(round) +
      ")");
}

// ── Replay ───────────────────────────────────────────────────────────
ReplayEnvironment::ReplayEnvironment(std::vector<Valuations> valuations,
                                     std::vector<Bounds> constraints)
    : valuations_(std::move(valuations)), constraints_(std::move(constraints)) {
}

Valuations ReplayEnvironment::getValuations(std::size_t round) {
  if (round >= valuations_.size())
    throw EnvironmentContractViolation(
        "replay has " + std::to_string(valuations_.size()) +
        " valuation rounds, asked for round " + std::to_string(round));
  return valuations_[round];
}

Bounds ReplayEnvironment::getConstraints(std::size_t round) {
  if (constraints_.empty())
    return Environment::getConstraints(round);
  if (round >= constraints_.size())
    throw EnvironmentContractViolation(
        "replay has " + std::to_string(constraints_.size()) +
        " constraint rounds, asked for round " + std::to_string(round));
  return constraints_[round];
}

static std::pair<double, double> parsePair(const json &j, const char *field,
                                           std::size_t i) {
  if (!j.is_array() || j.size() != 2 || !j[0].is_number() ||
      !j[1].is_number())
    throw InvalidConfiguration(std::string("replay: ") + field + "[" +
                               std::to_string(i) +
                               "] must be a pair of numbers");
  return {j[0].get<double>(), j[1].get<double>()};
}

ReplayEnvironment ReplayEnvironment::fromJson(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw InvalidConfiguration("cannot open replay file: " + path);

  json doc;
  try {
    doc = json::parse(in);
  } catch (const json::parse_error &e) {
    throw InvalidConfiguration("replay " + path + ": " + e.what());
  }

  if (!doc.contains("valuations") || !doc["valuations"].is_array())
    throw InvalidConfiguration("replay " + path +
                               ": missing \"valuations\" array");

  std::vector<Valuations> valuations;
  const auto &vals = doc["valuations"];
  for (std::size_t i = 0; i < vals.size(); i++) {
    auto [s, b] = parsePair(vals[i], "valuations", i);
    valuations.push_back({s, b});
  }

  std::vector<Bounds> constraints;
  if (doc.contains("constraints")) {
    const auto &cons = doc["constraints"];
    if (!cons.is_array())
      throw InvalidConfiguration("replay " + path +
                                 ": \"constraints\" must be an array");
    for (std::size_t i = 0; i < cons.size(); i++) {
      auto [lo, hi] = parsePair(cons[i], "constraints", i);
      constraints.push_back({lo, hi});
    }
  }

  spdlog::info("[Env] Loaded replay {}: {} rounds, {} constraint rounds", path,
               valuations.size(), constraints.size());
  return ReplayEnvironment(std::move(valuations), std::move(constraints));
}

// ── Uniform ──────────────────────────────────────────────────────────
UniformEnvironment::UniformEnvironment(std::uint64_t seed, double band)
    : rng_(seed), band_(band) {
  if (band_ < 0.0 || band_ > 0.5)
    throw InvalidConfiguration("band must lie in [0, 0.5], got " +
                               std::to_string(band_));
}

Valuations UniformEnvironment::getValuations(std::size_t round) {
  auto it = valuations_.find(round);
  if (it != valuations_.end())
    return it->second;

  std::uniform_real_distribution<double> unif(0.0, 1.0);
  Valuations v;
  v.sell = unif(rng_);
  v.buy = unif(rng_);
  valuations_.emplace(round, v);
  return v;
}

Bounds UniformEnvironment::getConstraints(std::size_t round) {
  auto it = constraints_.find(round);
  if (it != constraints_.end())
    return it->second;

  std::uniform_real_distribution<double> unif(band_, 1.0 - band_);
  double mid = unif(rng_);
  Bounds b{mid - band_, mid + band_};
  constraints_.emplace(round, b);
  return b;
}

} // namespace gftmax

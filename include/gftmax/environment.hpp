#pragma once
#include "gftmax/common.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace gftmax {

// Source of per-round feedback for a mechanism.
class Environment {
public:
  virtual ~Environment() = default;

  // Seller and buyer valuations for the round. Defined for round in [0, T).
  virtual Valuations getValuations(std::size_t round) = 0;

  // Feasible [lower, upper] price envelope for the round. Only the
  // constrained mechanism asks for it; the default has none to give.
  virtual Bounds getConstraints(std::size_t round);

  // Rounds this environment can serve, 0 if unlimited.
  virtual std::size_t rounds() const { return 0; }
};

// Replays recorded sequences.
class ReplayEnvironment : public Environment {
public:
  explicit ReplayEnvironment(std::vector<Valuations> valuations,
                             std::vector<Bounds> constraints = {});

  // {"valuations": [[s, b], ...], "constraints": [[lo, hi], ...]}
  // "constraints" is optional.
  static ReplayEnvironment fromJson(const std::string &path);

  Valuations getValuations(std::size_t round) override;
  Bounds getConstraints(std::size_t round) override;
  std::size_t rounds() const override { return valuations_.size(); }

  bool hasConstraints() const { return !constraints_.empty(); }

private:
  std::vector<Valuations> valuations_;
  std::vector<Bounds> constraints_;
};

// Valuations drawn i.i.d. from U[0,1]. Bounds are centred on a uniform
// midpoint with half-width `band`. Draws are cached per round, so asking for
// the same round twice gives the same answer.
class UniformEnvironment : public Environment {
public:
  explicit UniformEnvironment(std::uint64_t seed, double band = 0.25);

  Valuations getValuations(std::size_t round) override;
  Bounds getConstraints(std::size_t round) override;

private:
  Rng rng_;
  double band_;
  std::unordered_map<std::size_t, Valuations> valuations_;
  std::unordered_map<std::size_t, Bounds> constraints_;
};

} // namespace gftmax

#include "gftmax/action_policy.hpp"
#include <spdlog/spdlog.h>

namespace gftmax {

ActionDecision PassThroughPolicy::decide(const PricePair &raw, Environment &,
                                         std::size_t) {
  return {raw, UpdateMode::PLAIN, Bounds{}};
}

ActionDecision RescalingPolicy::decide(const PricePair &raw, Environment &env,
                                       std::size_t round) {
  Bounds b = env.getConstraints(round);
  if (b.lower > b.upper)
    throw EnvironmentContractViolation(
        "round " + std::to_string(round) + ": lower bound " +
        std::to_string(b.lower) + " > upper bound " + std::to_string(b.upper));

  if (withinBounds(raw, b))
    return {raw, UpdateMode::PLAIN, b};

  PricePair scaled = rescale(raw, b);
  spdlog::trace("[Policy] round {}: ({:.4f}, {:.4f}) -> ({:.4f}, {:.4f}) in "
                "[{:.4f}, {:.4f}]",
                round, raw.ask, raw.bid, scaled.ask, scaled.bid, b.lower,
                b.upper);
  return {scaled, UpdateMode::RESCALED, b};
}

} // namespace gftmax

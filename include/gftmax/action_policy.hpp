#pragma once
#include "gftmax/common.hpp"
#include "gftmax/environment.hpp"

namespace gftmax {

enum class UpdateMode { PLAIN, RESCALED };

struct ActionDecision {
  PricePair action; // price pair actually posted
  UpdateMode mode;
  Bounds bounds;    // meaningful only when mode == RESCALED
};

// Turns the learner's proposal into the posted action for a round and says
// how the learners must account for it.
class ActionPolicy {
public:
  virtual ~ActionPolicy() = default;
  virtual ActionDecision decide(const PricePair &raw, Environment &env,
                                std::size_t round) = 0;
};

// Posts the learner's proposal unchanged.
class PassThroughPolicy : public ActionPolicy {
public:
  ActionDecision decide(const PricePair &raw, Environment &env,
                        std::size_t round) override;
};

// Queries the round's bounds and rescales any proposal that falls outside
// them.
class RescalingPolicy : public ActionPolicy {
public:
  ActionDecision decide(const PricePair &raw, Environment &env,
                        std::size_t round) override;
};

} // namespace gftmax

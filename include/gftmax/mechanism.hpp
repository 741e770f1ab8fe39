#pragma once
#include "gftmax/action_policy.hpp"
#include "gftmax/common.hpp"
#include "gftmax/environment.hpp"
#include "gftmax/hedge.hpp"
#include <functional>
#include <memory>
#include <optional>

namespace gftmax {

// Repeated bilateral trade with two learners. The profit learner (over the
// multiplicative grid) posts prices until the budget reaches sqrt(T); from
// then on the GFT learner (over the additive grid) posts prices and spends
// that budget. The profit learner keeps learning in the second phase so its
// hindsight bookkeeping covers the whole run.
//
// One instance per run. Not thread-safe.
class TradeMechanism {
public:
  struct RoundRecord {
    std::size_t round;
    Phase phase;          // phase the round was played in
    PricePair proposed;   // learner's draw
    PricePair posted;     // after the action policy
    Valuations valuations;
    bool traded;
    bool rescaled;
    double budget; // after the round
    double gft;    // after the round
  };

  struct RunSummary {
    std::size_t rounds;
    std::size_t trades;
    std::size_t rescaled_rounds;
    double budget;
    double gft;
    std::optional<std::size_t> switch_round; // first round played in GFT_MAX
    HedgeLearner::BestExpert best_profit_expert;
    HedgeLearner::BestExpert best_gft_expert;
    double elapsed_ms;
  };

  using RoundObserver = std::function<void(const RoundRecord &)>;

  TradeMechanism(const Config &config, Environment &env);
  TradeMechanism(const Config &config, Environment &env, Rng rng);
  virtual ~TradeMechanism() = default;

  // Play exactly T rounds, each in the phase current at its start.
  void run(const RoundObserver &observer = nullptr);

  RoundRecord step(std::size_t round);
  RoundRecord profitMaxStep(std::size_t round);
  RoundRecord gftMaxStep(std::size_t round);

  double finalGFT() const { return gft_; }
  double budget() const { return budget_; }
  double budgetThreshold() const { return budget_threshold_; }
  int resolution() const { return K_; }
  int horizon() const { return horizon_; }
  Phase phase() const { return phase_; }
  std::optional<std::size_t> switchRound() const { return switch_round_; }
  std::size_t roundsPlayed() const { return rounds_played_; }

  const HedgeLearner &profitLearner() const { return profit_; }
  const HedgeLearner &gftLearner() const { return gft_learner_; }

  RunSummary summary() const;

protected:
  TradeMechanism(const Config &config, Environment &env, Rng rng,
                 std::unique_ptr<ActionPolicy> policy);

private:
  int horizon_;
  Environment &env_;
  Rng rng_;
  std::unique_ptr<ActionPolicy> policy_;
  int K_;
  double budget_threshold_;
  HedgeLearner profit_;
  HedgeLearner gft_learner_;

  double budget_ = 0.0;
  double gft_ = 0.0;
  Phase phase_ = Phase::PROFIT_MAX;
  std::optional<std::size_t> switch_round_;
  std::size_t rounds_played_ = 0;
  std::size_t trades_ = 0;
  std::size_t rescaled_rounds_ = 0;
  double run_ms_ = 0.0;

  RoundRecord play(std::size_t round, HedgeLearner &chooser);
  void update(HedgeLearner &learner, const Valuations &v,
              const ActionDecision &d);
};

// TradeMechanism that keeps posted prices inside the bounds the environment
// reports for each round, rescaling proposals that fall outside.
class ConstrainedTradeMechanism : public TradeMechanism {
public:
  ConstrainedTradeMechanism(const Config &config, Environment &env);
  ConstrainedTradeMechanism(const Config &config, Environment &env, Rng rng);
};

} // namespace gftmax

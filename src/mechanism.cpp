#include "gftmax/mechanism.hpp"
#include "gftmax/price_grid.hpp"
#include <chrono>
#include <cmath>
#include <spdlog/spdlog.h>
#include <utility>

namespace gftmax {

static int checkedHorizon(const Config &config) {
  if (config.horizon <= 0)
    throw InvalidConfiguration("horizon must be positive, got " +
                               std::to_string(config.horizon));
  return config.horizon;
}

TradeMechanism::TradeMechanism(const Config &config, Environment &env)
    : TradeMechanism(config, env, Rng(config.seed)) {}

TradeMechanism::TradeMechanism(const Config &config, Environment &env, Rng rng)
    : TradeMechanism(config, env, std::move(rng),
                     std::make_unique<PassThroughPolicy>()) {}

TradeMechanism::TradeMechanism(const Config &config, Environment &env, Rng rng,
                               std::unique_ptr<ActionPolicy> policy)
    : horizon_(checkedHorizon(config)), env_(env), rng_(std::move(rng)),
      policy_(std::move(policy)),
      K_(static_cast<int>(std::floor(std::sqrt(horizon_)))),
      budget_threshold_(std::sqrt(static_cast<double>(horizon_))),
      profit_(multiplicativeGrid(K_), horizon_),
      gft_learner_(additiveGrid(K_), horizon_) {
  spdlog::debug("[Mechanism] T={}, K={}, threshold={:.4f}, profit experts={}, "
                "gft experts={}",
                horizon_, K_, budget_threshold_, profit_.size(),
                gft_learner_.size());
}

// ── Round execution ──────────────────────────────────────────────────
void TradeMechanism::update(HedgeLearner &learner, const Valuations &v,
                            const ActionDecision &d) {
  if (d.mode == UpdateMode::RESCALED)
    learner.updateWeightsWithRescaling(v.sell, v.buy, d.bounds.lower,
                                       d.bounds.upper);
  else
    learner.updateWeights(v.sell, v.buy);
}

TradeMechanism::RoundRecord TradeMechanism::play(std::size_t round,
                                                 HedgeLearner &chooser) {
  RoundRecord rec;
  rec.round = round;
  rec.phase = phase_;
  rec.proposed = chooser.chooseAction(rng_);

  rec.valuations = env_.getValuations(round);
  if (!std::isfinite(rec.valuations.sell) || !std::isfinite(rec.valuations.buy))
    throw EnvironmentContractViolation("round " + std::to_string(round) +
                                       ": non-finite valuations");

  ActionDecision d = policy_->decide(rec.proposed, env_, round);
  rec.posted = d.action;
  rec.rescaled = d.mode == UpdateMode::RESCALED;

  update(chooser, rec.valuations, d);
  if (&chooser != &profit_)
    update(profit_, rec.valuations, d);

  rec.traded = clears(rec.posted, rec.valuations);
  if (rec.traded) {
    budget_ += rec.posted.bid - rec.posted.ask;
    gft_ += rec.valuations.potential();
    trades_++;
  }
  if (rec.rescaled)
    rescaled_rounds_++;
  rounds_played_++;

  rec.budget = budget_;
  rec.gft = gft_;
  return rec;
}

TradeMechanism::RoundRecord TradeMechanism::profitMaxStep(std::size_t round) {
  RoundRecord rec = play(round, profit_);
  if (budget_ >= budget_threshold_) {
    phase_ = Phase::GFT_MAX;
    switch_round_ = round + 1;
    spdlog::info("[Mechanism] Budget {:.4f} >= {:.4f} after round {}, "
                 "switching to {}",
                 budget_, budget_threshold_, round, phaseName(phase_));
  }
  return rec;
}

TradeMechanism::RoundRecord TradeMechanism::gftMaxStep(std::size_t round) {
  return play(round, gft_learner_);
}

TradeMechanism::RoundRecord TradeMechanism::step(std::size_t round) {
  return phase_ == Phase::PROFIT_MAX ? profitMaxStep(round)
                                     : gftMaxStep(round);
}

void TradeMechanism::run(const RoundObserver &observer) {
  const auto T = static_cast<std::size_t>(horizon_);
  if (env_.rounds() != 0 && env_.rounds() < T)
    throw EnvironmentContractViolation(
        "environment serves " + std::to_string(env_.rounds()) +
        " rounds, horizon is " + std::to_string(T));

  auto start = std::chrono::steady_clock::now();
  for (std::size_t i = 0; i < T; i++) {
    RoundRecord rec = step(i);
    spdlog::trace("[Mechanism] round {} {} ask={:.4f} bid={:.4f} traded={} "
                  "budget={:.4f} gft={:.4f}",
                  i, phaseName(rec.phase), rec.posted.ask, rec.posted.bid,
                  rec.traded, rec.budget, rec.gft);
    if (observer)
      observer(rec);
  }
  run_ms_ = elapsed_ms(start);
}

TradeMechanism::RunSummary TradeMechanism::summary() const {
  RunSummary s;
  s.rounds = rounds_played_;
  s.trades = trades_;
  s.rescaled_rounds = rescaled_rounds_;
  s.budget = budget_;
  s.gft = gft_;
  s.switch_round = switch_round_;
  s.best_profit_expert = profit_.bestExpertSoFar();
  s.best_gft_expert = gft_learner_.bestExpertSoFar();
  s.elapsed_ms = run_ms_;
  return s;
}

// ── Constrained ──────────────────────────────────────────────────────
ConstrainedTradeMechanism::ConstrainedTradeMechanism(const Config &config,
                                                     Environment &env)
    : ConstrainedTradeMechanism(config, env, Rng(config.seed)) {}

ConstrainedTradeMechanism::ConstrainedTradeMechanism(const Config &config,
                                                     Environment &env, Rng rng)
    : TradeMechanism(config, env, std::move(rng),
                     std::make_unique<RescalingPolicy>()) {}

} // namespace gftmax

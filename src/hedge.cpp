#include "gftmax/hedge.hpp"
#include <cmath>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace gftmax {

HedgeLearner::HedgeLearner(ExpertSet experts, int horizon)
    : experts_(std::move(experts)), epsilon_(0.0), horizon_(horizon) {
  if (horizon_ <= 0)
    throw InvalidConfiguration("horizon must be positive, got " +
                               std::to_string(horizon_));
  if (experts_.size() < 2)
    throw InvalidConfiguration("hedge needs at least 2 experts, got " +
                               std::to_string(experts_.size()));

  const Eigen::Index n = static_cast<Eigen::Index>(experts_.size());
  asks_.resize(n);
  bids_.resize(n);
  for (Eigen::Index i = 0; i < n; i++) {
    asks_[i] = experts_[i].ask;
    bids_[i] = experts_[i].bid;
  }

  weights_ = Eigen::VectorXd::Constant(n, 1.0 / n);
  gft_ = Eigen::VectorXd::Zero(n);
  epsilon_ = std::sqrt(std::log(static_cast<double>(n)) / horizon_);

  spdlog::debug("[Hedge] {} experts, T={}, epsilon={:.6f}", n, horizon_,
                epsilon_);
}

// ── Action selection ─────────────────────────────────────────────────
double HedgeLearner::checkedWeightSum() const {
  double total = weights_.sum();
  if (!(total > 0.0) || !std::isfinite(total))
    throw NumericDegeneracy("hedge weights degenerate after " +
                            std::to_string(updates_) +
                            " updates (sum=" + std::to_string(total) + ")");
  return total;
}

std::size_t HedgeLearner::chooseIndex(Rng &rng) const {
  checkedWeightSum();
  std::discrete_distribution<std::size_t> pick(
      weights_.data(), weights_.data() + weights_.size());
  return pick(rng);
}

PricePair HedgeLearner::chooseAction(Rng &rng) const {
  return experts_[chooseIndex(rng)];
}

Eigen::VectorXd HedgeLearner::probabilities() const {
  return weights_ / checkedWeightSum();
}

// ── Weight updates ───────────────────────────────────────────────────
void HedgeLearner::applyFeedback(const Eigen::ArrayXd &asks,
                                 const Eigen::ArrayXd &bids, double hidden_s,
                                 double hidden_b) {
  // 1.0 where the expert's trade would have cleared
  Eigen::ArrayXd hit =
      (asks >= hidden_s).cast<double>() * (bids <= hidden_b).cast<double>();
  const double potential = hidden_b - hidden_s;

  Eigen::ArrayXd realized = hit * potential;
  Eigen::ArrayXd losses =
      potential >= 0.0 ? Eigen::ArrayXd((1.0 - hit) * potential) : realized;

  weights_.array() *= (-epsilon_ * losses).exp();
  gft_.array() += realized;
  updates_++;

  checkedWeightSum();
}

void HedgeLearner::updateWeights(double hidden_s, double hidden_b) {
  applyFeedback(asks_, bids_, hidden_s, hidden_b);
}

void HedgeLearner::updateWeightsWithRescaling(double hidden_s, double hidden_b,
                                              double s_dot, double b_dot) {
  const double f = (b_dot - s_dot) * (b_dot - s_dot);
  Eigen::ArrayXd asks = s_dot + asks_ * f;
  Eigen::ArrayXd bids = b_dot - (1.0 - bids_) * f;
  applyFeedback(asks, bids, hidden_s, hidden_b);
}

// ── Hindsight ────────────────────────────────────────────────────────
HedgeLearner::BestExpert HedgeLearner::bestExpertSoFar() const {
  std::size_t best = 0;
  for (Eigen::Index i = 1; i < gft_.size(); i++) {
    if (gft_[i] > gft_[best])
      best = static_cast<std::size_t>(i);
  }
  return {experts_[best], gft_[best], best};
}

} // namespace gftmax

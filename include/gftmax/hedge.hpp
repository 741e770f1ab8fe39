#pragma once
#include "gftmax/common.hpp"
#include <Eigen/Dense>

namespace gftmax {

// Multiplicative-weights learner over a fixed set of price pairs.
//
// Every expert is charged a loss each round, not only the one that was
// played: an expert that misses a positive-surplus trade loses the whole
// surplus, and when the surplus is negative an expert's loss is whatever it
// would have realized. Weights are never renormalized; only their ratios
// matter.
class HedgeLearner {
public:
  struct BestExpert {
    PricePair expert;
    double gft;       // cumulative counterfactual gains from trade
    std::size_t index;
  };

  // epsilon = sqrt(ln(N) / horizon). Requires N >= 2 and horizon > 0.
  HedgeLearner(ExpertSet experts, int horizon);

  // Draw an expert with probability proportional to its weight.
  PricePair chooseAction(Rng &rng) const;
  std::size_t chooseIndex(Rng &rng) const;

  void updateWeights(double hidden_s, double hidden_b);

  // Same update, but every expert is first mapped through rescale() with the
  // round's bounds, so counterfactuals match a rescaled played action.
  void updateWeightsWithRescaling(double hidden_s, double hidden_b,
                                  double s_dot, double b_dot);

  // Largest cumulative GFT; ties go to the lowest index.
  BestExpert bestExpertSoFar() const;

  std::size_t size() const { return experts_.size(); }
  double epsilon() const { return epsilon_; }
  int horizon() const { return horizon_; }
  long updates() const { return updates_; }
  const ExpertSet &experts() const { return experts_; }
  const Eigen::VectorXd &weights() const { return weights_; }
  const Eigen::VectorXd &cumulativeGft() const { return gft_; }
  Eigen::VectorXd probabilities() const;

private:
  ExpertSet experts_;
  Eigen::ArrayXd asks_;
  Eigen::ArrayXd bids_;
  Eigen::VectorXd weights_;
  Eigen::VectorXd gft_;
  double epsilon_;
  int horizon_;
  long updates_ = 0;

  void applyFeedback(const Eigen::ArrayXd &asks, const Eigen::ArrayXd &bids,
                     double hidden_s, double hidden_b);
  double checkedWeightSum() const;
};

} // namespace gftmax

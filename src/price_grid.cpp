#include "gftmax/price_grid.hpp"
#include <cmath>
#include <spdlog/spdlog.h>
#include <string>

namespace gftmax {

static void checkResolution(int K) {
  if (K <= 0)
    throw InvalidConfiguration("grid resolution must be >= 1, got " +
                               std::to_string(K));
}

ExpertSet multiplicativeGrid(int K) {
  checkResolution(K);

  const int levels = static_cast<int>(std::floor(std::log(K)));
  ExpertSet grid;
  grid.reserve((K + 1) * (1 + 2 * levels));

  for (int k = 0; k <= K; k++) {
    double g = static_cast<double>(k) / K;
    grid.push_back({g, g});
    for (int i = 0; i < levels; i++) {
      double step = std::ldexp(1.0, -i); // 2^-i
      if (g - step >= 0.0)
        grid.push_back({g - step, g});
      if (g + step <= 1.0)
        grid.push_back({g, g + step});
    }
  }

  spdlog::debug("[Grid] multiplicative K={} -> {} experts", K, grid.size());
  return grid;
}

ExpertSet additiveGrid(int K) {
  checkResolution(K);

  ExpertSet grid;
  grid.reserve(K);
  for (int i = 0; i < K; i++) {
    grid.push_back({static_cast<double>(i + 1) / K, static_cast<double>(i) / K});
  }

  spdlog::debug("[Grid] additive K={} -> {} experts", K, grid.size());
  return grid;
}

} // namespace gftmax

#pragma once
#include "gftmax/common.hpp"

namespace gftmax {

// Diagonal pairs (k/K, k/K) for k in [0, K], each surrounded by pairs offset
// by 2^-i for i in [0, floor(ln K)). Offsets that leave [0, 1] are skipped.
// Every pair has ask <= bid. Used by the profit learner.
ExpertSet multiplicativeGrid(int K);

// K pairs ((i+1)/K, i/K), i in [0, K). Every pair has ask - bid = 1/K.
// Used by the GFT learner.
ExpertSet additiveGrid(int K);

} // namespace gftmax

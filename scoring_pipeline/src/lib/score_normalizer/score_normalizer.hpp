#pragma once

#include <vector>

namespace wallet_scoring {

inline constexpr int kMinFinalScore = 0;
inline constexpr int kMaxFinalScore = 1000;

// Quantile ranking of the population: every score gets the mid-rank of its
// tie group, rank / (n - 1) is scaled to [0, 1000] and rounded half up.
// A single-wallet population maps to the middle of the range.
// Throws std::invalid_argument on non-finite scores.
std::vector<int> NormalizeScores(const std::vector<double>& scores);

}  // namespace wallet_scoring

#pragma once

#include <vector>

#include "feature_aggregator/wallet_features.hpp"
#include "heuristic_scorer/heuristic_weights.hpp"

namespace wallet_scoring {

class HeuristicScorer {
public:
    explicit HeuristicScorer(HeuristicWeights weights);

    // Unbounded risk-adjusted score, higher is more trustworthy.
    double Score(const WalletFeatureVector& features) const;

    std::vector<double> ScoreAll(const std::vector<WalletFeatureVector>& population) const;

    const HeuristicWeights& GetWeights() const { return weights_; }

private:
    double Penalties(const WalletFeatureVector& features) const;
    double Rewards(const WalletFeatureVector& features) const;

    HeuristicWeights weights_;
};

}  // namespace wallet_scoring

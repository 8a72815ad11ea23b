#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <userver/formats/parse/to.hpp>

#include "behavioral_clusterer/hdbscan.hpp"
#include "feature_aggregator/wallet_features.hpp"

namespace wallet_scoring {

struct ClustererConfig {
    std::size_t min_cluster_size = 15;
    std::size_t min_samples = 5;
    // Clusters with at least this share of liquidated wallets are flagged.
    double risky_cluster_liquidation_share = 0.5;
    // Subtracted from members of flagged clusters before normalization.
    double cluster_risk_penalty = 0.0;
};

enum class ClusteringStatus {
    kSuccess,
    kDegraded,
};

struct ClusterProfile {
    int label = kNoiseLabel;
    std::size_t size = 0;
    double liquidated_share = 0.0;
    bool risky = false;
};

struct ClusteringResult {
    ClusteringStatus status = ClusteringStatus::kDegraded;
    std::vector<int> labels;
    std::vector<ClusterProfile> clusters;
    std::string reason;

    std::size_t NoiseCount() const;
    std::size_t RiskyClusterCount() const;
    bool IsRiskyMember(std::size_t index) const;
};

class BehavioralClusterer {
public:
    explicit BehavioralClusterer(ClustererConfig config);

    // Batch operation over the whole population. Never throws for a
    // degenerate population: the result is tagged kDegraded with every
    // wallet labelled as noise.
    ClusteringResult Cluster(const std::vector<WalletFeatureVector>& population) const;

    // Advisory adjustment; identity when the penalty is zero or the
    // clustering is degraded.
    std::vector<double> AdjustScores(const std::vector<double>& raw_scores,
                                     const ClusteringResult& clustering) const;

    const ClustererConfig& GetConfig() const { return config_; }

private:
    ClustererConfig config_;
};

// Log-scaled, z-scored clustering space. Zero-variance columns become 0.
std::vector<FeaturePoint> BuildClusteringSpace(const std::vector<WalletFeatureVector>& population);

template <typename Value>
ClustererConfig Parse(const Value& value, userver::formats::parse::To<ClustererConfig>) {
    const ClustererConfig d;
    ClustererConfig config;
    config.min_cluster_size = value["min-cluster-size"].template As<std::size_t>(d.min_cluster_size);
    config.min_samples = value["min-samples"].template As<std::size_t>(d.min_samples);
    config.risky_cluster_liquidation_share = value["risky-cluster-liquidation-share"].template As<double>(
        d.risky_cluster_liquidation_share);
    config.cluster_risk_penalty = value["cluster-risk-penalty"].template As<double>(d.cluster_risk_penalty);
    return config;
}

}  // namespace wallet_scoring

#include "behavioral_clusterer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

namespace wallet_scoring {

namespace {

constexpr double kZeroVariance = 1e-12;

// Over-repayment (accrued interest) is clipped before scaling.
constexpr double kRepayRatioClip = 2.0;

FeaturePoint RawClusteringFeatures(const WalletFeatureVector& f) {
    return {
        std::log1p(f.wallet_age_days),
        std::log1p(f.total_transactions),
        std::log1p(f.unique_active_days),
        std::log1p(f.transaction_frequency),
        std::log1p(f.liquidation_count),
        std::log1p(f.asset_diversity),
        std::log1p(f.total_deposit_usd),
        std::log1p(f.total_borrow_usd),
        std::log1p(f.total_repay_usd),
        std::log1p(f.total_redeem_usd),
        std::log1p(f.average_transaction_value_usd),
        std::log1p(f.min_health_factor_proxy),
        std::min(f.repay_to_borrow_ratio, kRepayRatioClip),
        std::log1p(f.borrow_to_deposit_ratio),
    };
}

bool AllZero(const std::vector<FeaturePoint>& points) {
    return std::all_of(points.begin(), points.end(), [](const FeaturePoint& point) {
        return std::all_of(point.begin(), point.end(), [](double v) { return v == 0.0; });
    });
}

ClusteringResult Degraded(std::size_t population, std::string reason) {
    LOG_WARNING() << "Clustering degraded to heuristic-only scoring: " << reason;
    ClusteringResult result;
    result.status = ClusteringStatus::kDegraded;
    result.labels.assign(population, kNoiseLabel);
    result.reason = std::move(reason);
    return result;
}

}  // namespace

std::size_t ClusteringResult::NoiseCount() const {
    return static_cast<std::size_t>(std::count(labels.begin(), labels.end(), kNoiseLabel));
}

std::size_t ClusteringResult::RiskyClusterCount() const {
    return static_cast<std::size_t>(std::count_if(
        clusters.begin(), clusters.end(), [](const ClusterProfile& c) { return c.risky; }));
}

bool ClusteringResult::IsRiskyMember(std::size_t index) const {
    const int label = labels.at(index);
    if (label == kNoiseLabel) {
        return false;
    }
    return clusters.at(static_cast<std::size_t>(label)).risky;
}

std::vector<FeaturePoint> BuildClusteringSpace(const std::vector<WalletFeatureVector>& population) {
    std::vector<FeaturePoint> points;
    points.reserve(population.size());
    for (const auto& features : population) {
        points.push_back(RawClusteringFeatures(features));
    }
    if (points.empty()) {
        return points;
    }

    const std::size_t dims = points.front().size();
    const double n = static_cast<double>(points.size());
    for (std::size_t d = 0; d < dims; ++d) {
        double mean = 0.0;
        for (const auto& p : points) mean += p[d];
        mean /= n;

        double var = 0.0;
        for (const auto& p : points) var += (p[d] - mean) * (p[d] - mean);
        const double stddev = std::sqrt(var / n);

        for (auto& p : points) {
            p[d] = stddev > kZeroVariance ? (p[d] - mean) / stddev : 0.0;
        }
    }
    return points;
}

BehavioralClusterer::BehavioralClusterer(ClustererConfig config)
    : config_(config) {
    if (config_.min_cluster_size < 2) {
        throw std::invalid_argument("clustering min-cluster-size must be at least 2");
    }
    if (config_.min_samples < 1) {
        throw std::invalid_argument("clustering min-samples must be at least 1");
    }
    if (!(config_.risky_cluster_liquidation_share >= 0.0 && config_.risky_cluster_liquidation_share <= 1.0)) {
        throw std::invalid_argument("clustering risky-cluster-liquidation-share must be within [0, 1]");
    }
    if (!std::isfinite(config_.cluster_risk_penalty) || config_.cluster_risk_penalty < 0.0) {
        throw std::invalid_argument("clustering cluster-risk-penalty must be a non-negative number");
    }
}

ClusteringResult BehavioralClusterer::Cluster(const std::vector<WalletFeatureVector>& population) const {
    const std::size_t n = population.size();
    if (n < config_.min_cluster_size) {
        return Degraded(n, fmt::format("population of {} wallets is smaller than min cluster size {}",
                                       n, config_.min_cluster_size));
    }

    const auto points = BuildClusteringSpace(population);
    if (AllZero(points)) {
        return Degraded(n, "feature space has no variance");
    }

    LOG_INFO() << fmt::format("Running HDBSCAN over {} wallets (min_cluster_size={}, min_samples={})",
                              n, config_.min_cluster_size, config_.min_samples);
    ClusteringResult result;
    result.labels = RunHdbscan(points, HdbscanParams{config_.min_cluster_size, config_.min_samples});

    const int max_label = result.labels.empty()
        ? kNoiseLabel
        : *std::max_element(result.labels.begin(), result.labels.end());
    if (max_label == kNoiseLabel) {
        return Degraded(n, "no cluster survived condensation");
    }

    result.clusters.resize(static_cast<std::size_t>(max_label) + 1);
    std::vector<std::size_t> liquidated(result.clusters.size(), 0);
    for (std::size_t i = 0; i < n; ++i) {
        const int label = result.labels[i];
        if (label == kNoiseLabel) continue;
        auto& cluster = result.clusters[static_cast<std::size_t>(label)];
        cluster.label = label;
        ++cluster.size;
        if (population[i].liquidation_count > 0.0) {
            ++liquidated[static_cast<std::size_t>(label)];
        }
    }
    for (std::size_t c = 0; c < result.clusters.size(); ++c) {
        auto& cluster = result.clusters[c];
        cluster.liquidated_share = cluster.size > 0
            ? static_cast<double>(liquidated[c]) / static_cast<double>(cluster.size)
            : 0.0;
        cluster.risky = cluster.size > 0 &&
                        cluster.liquidated_share >= config_.risky_cluster_liquidation_share;
        LOG_DEBUG() << fmt::format("Cluster {}: {} wallets, liquidated share {:.3f}{}",
                                   c, cluster.size, cluster.liquidated_share,
                                   cluster.risky ? " (risky)" : "");
    }

    result.status = ClusteringStatus::kSuccess;
    LOG_INFO() << fmt::format("Identified {} distinct clusters and {} outliers, {} flagged as risky",
                              result.clusters.size(), result.NoiseCount(), result.RiskyClusterCount());
    return result;
}

std::vector<double> BehavioralClusterer::AdjustScores(const std::vector<double>& raw_scores,
                                                      const ClusteringResult& clustering) const {
    std::vector<double> adjusted = raw_scores;
    if (clustering.status != ClusteringStatus::kSuccess || config_.cluster_risk_penalty == 0.0) {
        return adjusted;
    }
    if (clustering.labels.size() != raw_scores.size()) {
        throw std::invalid_argument("cluster assignments do not match the scored population");
    }
    for (std::size_t i = 0; i < adjusted.size(); ++i) {
        if (clustering.IsRiskyMember(i)) {
            adjusted[i] -= config_.cluster_risk_penalty;
        }
    }
    return adjusted;
}

}  // namespace wallet_scoring

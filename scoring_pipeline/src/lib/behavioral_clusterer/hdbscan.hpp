#pragma once

#include <cstddef>
#include <vector>

namespace wallet_scoring {

inline constexpr int kNoiseLabel = -1;

struct HdbscanParams {
    std::size_t min_cluster_size = 15;
    std::size_t min_samples = 5;
};

using FeaturePoint = std::vector<double>;

// Hierarchical density-based clustering over euclidean distance with
// excess-of-mass cluster selection. The root cluster is never selected.
// Returns one label per point: dense ids 0..k-1 ordered by cluster
// discovery, kNoiseLabel for points outside every selected cluster.
// Deterministic: ties are always broken by the lowest point index.
std::vector<int> RunHdbscan(const std::vector<FeaturePoint>& points, const HdbscanParams& params);

}  // namespace wallet_scoring

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <userver/formats/json/value.hpp>

#include "behavioral_clusterer/behavioral_clusterer.hpp"
#include "feature_aggregator/feature_aggregator.hpp"
#include "heuristic_scorer/heuristic_scorer.hpp"
#include "score_table/score_table.hpp"
#include "transaction_loader/transaction_loader.hpp"

namespace wallet_scoring {

// A pipeline contract was broken between stages (e.g. a wallet reached
// normalization without a feature vector). Always fatal.
class PipelineInvariantError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class StageStatus {
    kSuccess,
    kDegraded,
    kFatal,
};

std::string_view ToString(StageStatus status);

struct StageReport {
    std::string stage;
    StageStatus status = StageStatus::kSuccess;
    std::string detail;
};

struct RunSummary {
    std::size_t records_read = 0;
    std::size_t records_dropped = 0;
    std::size_t transactions_processed = 0;
    std::size_t wallets = 0;
    std::size_t clusters = 0;
    std::size_t noise_wallets = 0;
    std::size_t risky_clusters = 0;
    bool clustering_degraded = false;
};

struct PipelineConfig {
    HeuristicWeights weights;
    ClustererConfig clustering;
};

struct PipelineRunResult {
    StageStatus status = StageStatus::kSuccess;
    std::vector<StageReport> stages;
    RunSummary summary;
    // Sorted by credit score descending, then by wallet. Empty when fatal.
    ScoreTable table;
    FeatureTable features;

    bool IsFatal() const { return status == StageStatus::kFatal; }
    // Stage and reason of the fatal failure, empty otherwise.
    std::string FailureDescription() const;
};

class ScoringPipeline {
public:
    explicit ScoringPipeline(PipelineConfig config);

    PipelineRunResult RunFromFile(const std::string& input_path) const;
    PipelineRunResult RunFromString(std::string_view json) const;
    PipelineRunResult Run(const userver::formats::json::Value& records) const;
    // Stages after loading.
    PipelineRunResult Run(const TransactionLog& log) const;

    const PipelineConfig& GetConfig() const { return config_; }

private:
    template <typename LoadFn>
    PipelineRunResult LoadAndRun(LoadFn&& load) const;

    void Score(const TransactionLog& log, PipelineRunResult& result) const;

    PipelineConfig config_;
    TransactionLoader loader_;
    FeatureAggregator aggregator_;
    HeuristicScorer scorer_;
    BehavioralClusterer clusterer_;
};

}  // namespace wallet_scoring

#include "pipeline.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

#include "score_normalizer/score_normalizer.hpp"

namespace wallet_scoring {

namespace {

constexpr std::string_view kLoadStage = "load";
constexpr std::string_view kAggregateStage = "aggregate";
constexpr std::string_view kScoreStage = "score";
constexpr std::string_view kClusterStage = "cluster";
constexpr std::string_view kNormalizeStage = "normalize";

void MarkFatal(PipelineRunResult& result, std::string_view stage, std::string_view reason) {
    LOG_ERROR() << fmt::format("Scoring pipeline aborted at stage '{}': {}", stage, reason);
    result.status = StageStatus::kFatal;
    result.stages.push_back({std::string(stage), StageStatus::kFatal, std::string(reason)});
    result.table.clear();
}

}  // namespace

std::string_view ToString(StageStatus status) {
    switch (status) {
        case StageStatus::kSuccess:
            return "success";
        case StageStatus::kDegraded:
            return "degraded";
        case StageStatus::kFatal:
            return "fatal";
    }
    return "unknown";
}

std::string PipelineRunResult::FailureDescription() const {
    for (const auto& report : stages) {
        if (report.status == StageStatus::kFatal) {
            return fmt::format("stage '{}' failed: {}", report.stage, report.detail);
        }
    }
    return {};
}

ScoringPipeline::ScoringPipeline(PipelineConfig config)
    : config_(std::move(config)),
      scorer_(config_.weights),
      clusterer_(config_.clustering) {}

PipelineRunResult ScoringPipeline::RunFromFile(const std::string& input_path) const {
    return LoadAndRun([&] { return loader_.LoadFromFile(input_path); });
}

PipelineRunResult ScoringPipeline::RunFromString(std::string_view json) const {
    return LoadAndRun([&] { return loader_.LoadFromString(json); });
}

PipelineRunResult ScoringPipeline::Run(const userver::formats::json::Value& records) const {
    return LoadAndRun([&] { return loader_.Load(records); });
}

template <typename LoadFn>
PipelineRunResult ScoringPipeline::LoadAndRun(LoadFn&& load) const {
    LOG_INFO() << "Starting scoring pipeline";
    TransactionLog log;
    try {
        log = load();
    } catch (const InputUnreadableError& e) {
        PipelineRunResult result;
        MarkFatal(result, kLoadStage, e.what());
        return result;
    }
    return Run(log);
}

PipelineRunResult ScoringPipeline::Run(const TransactionLog& log) const {
    PipelineRunResult result;
    result.summary.records_read = log.records_read;
    result.summary.records_dropped = log.records_dropped;
    result.summary.transactions_processed = log.ProcessedCount();
    result.summary.wallets = log.WalletCount();
    result.stages.push_back({std::string(kLoadStage), StageStatus::kSuccess,
                             fmt::format("{} records read, {} dropped", log.records_read, log.records_dropped)});

    Score(log, result);

    if (!result.IsFatal()) {
        const auto& s = result.summary;
        LOG_INFO() << fmt::format(
            "Scoring pipeline finished ({}): {} wallets, {} transactions, {} dropped records, "
            "{} clusters, {} noise wallets, {} risky clusters",
            ToString(result.status), s.wallets, s.transactions_processed, s.records_dropped,
            s.clusters, s.noise_wallets, s.risky_clusters);
    }
    return result;
}

void ScoringPipeline::Score(const TransactionLog& log, PipelineRunResult& result) const {
    std::string_view stage = kAggregateStage;
    try {
        auto features = aggregator_.AggregateAll(log);
        result.stages.push_back({std::string(kAggregateStage), StageStatus::kSuccess,
                                 fmt::format("{} feature vectors", features.size())});

        stage = kScoreStage;
        std::vector<std::string> wallets;
        std::vector<WalletFeatureVector> population;
        wallets.reserve(log.WalletCount());
        population.reserve(log.WalletCount());
        for (const auto& [wallet, transactions] : log.by_wallet) {
            const auto it = features.find(wallet);
            if (it == features.end()) {
                throw PipelineInvariantError(fmt::format("wallet {} has no feature vector", wallet));
            }
            wallets.push_back(wallet);
            population.push_back(it->second);
        }
        const auto raw_scores = scorer_.ScoreAll(population);
        result.stages.push_back({std::string(kScoreStage), StageStatus::kSuccess,
                                 fmt::format("{} raw scores", raw_scores.size())});

        stage = kClusterStage;
        const auto clustering = clusterer_.Cluster(population);
        result.summary.clusters = clustering.clusters.size();
        result.summary.noise_wallets = clustering.NoiseCount();
        result.summary.risky_clusters = clustering.RiskyClusterCount();
        if (clustering.status == ClusteringStatus::kDegraded) {
            result.summary.clustering_degraded = true;
            result.status = StageStatus::kDegraded;
            result.stages.push_back({std::string(kClusterStage), StageStatus::kDegraded, clustering.reason});
        } else {
            result.stages.push_back({std::string(kClusterStage), StageStatus::kSuccess,
                                     fmt::format("{} clusters, {} noise wallets",
                                                 clustering.clusters.size(), clustering.NoiseCount())});
        }

        stage = kNormalizeStage;
        const auto adjusted = clusterer_.AdjustScores(raw_scores, clustering);
        const auto final_scores = NormalizeScores(adjusted);
        if (final_scores.size() != wallets.size() || clustering.labels.size() != wallets.size()) {
            throw PipelineInvariantError(fmt::format(
                "{} wallets reached normalization but {} scores and {} cluster labels were produced",
                wallets.size(), final_scores.size(), clustering.labels.size()));
        }

        ScoreTable table;
        table.reserve(wallets.size());
        for (std::size_t i = 0; i < wallets.size(); ++i) {
            table.push_back({wallets[i], final_scores[i], clustering.labels[i], raw_scores[i]});
        }
        std::sort(table.begin(), table.end(), [](const ScoreRow& lhs, const ScoreRow& rhs) {
            if (lhs.credit_score != rhs.credit_score) return lhs.credit_score > rhs.credit_score;
            return lhs.user_wallet < rhs.user_wallet;
        });
        result.stages.push_back({std::string(kNormalizeStage), StageStatus::kSuccess,
                                 fmt::format("{} final scores", table.size())});

        result.table = std::move(table);
        result.features = std::move(features);
    } catch (const PipelineInvariantError& e) {
        MarkFatal(result, stage, e.what());
    } catch (const std::invalid_argument& e) {
        MarkFatal(result, stage, e.what());
    }
}

}  // namespace wallet_scoring

#include "scoring_runner.hpp"

// stdcpp
#include <system_error>
#include <utility>

// userver
#include <userver/components/component_config.hpp>
#include <userver/components/component_context.hpp>
#include <userver/fs/blocking/read.hpp>
#include <userver/logging/log.hpp>
#include <userver/utils/scope_guard.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

// fmt
#include <fmt/format.h>

// self
#include <heuristic_scorer/heuristic_weights.hpp>
#include <transaction_loader/transaction_loader.hpp>

namespace scoring_service {

namespace {

wallet_scoring::PipelineConfig MakePipelineConfig(const userver::components::ComponentConfig& config) {
    wallet_scoring::PipelineConfig pipeline_config;
    pipeline_config.clustering = config["clustering"].As<wallet_scoring::ClustererConfig>(
        wallet_scoring::ClustererConfig{});

    const auto weights_path = config["weights-path"].As<std::string>("");
    if (!weights_path.empty()) {
        pipeline_config.weights = wallet_scoring::LoadHeuristicWeights(weights_path);
        LOG_INFO() << "Heuristic weights loaded from " << weights_path;
    }
    return pipeline_config;
}

} // namespace


ScoringRunner::ScoringRunner(
    std::string input_path,
    std::string output_path,
    wallet_scoring::PipelineConfig config,
    userver::engine::TaskProcessor& task_processor
)
    : input_path_(std::move(input_path)),
    output_path_(std::move(output_path)),
    pipeline_(std::move(config)),
    tasks_(task_processor) {
    LOG_INFO() << fmt::format("Scoring runner ready, input: {}, output: {}", input_path_, output_path_);
}

ScoringRunner::~ScoringRunner() {
    tasks_.CancelAndWait();
}

TriggerOutcome ScoringRunner::TriggerRun() {
    bool expected = false;
    if (!run_in_flight_.compare_exchange_strong(expected, true)) {
        LOG_WARNING() << "Scoring run rejected: another run is in flight";
        return {false, "a scoring run is already in flight"};
    }

    const auto previous = last_run_.ReadCopy();
    tasks_.AsyncDetach("scoring-run", [this] {
        userver::utils::ScopeGuard release([this] { run_in_flight_ = false; });
        RunOnce();
    });
    return {true, previous.empty() ? "scoring run started"
                                   : fmt::format("scoring run started; previous run: {}", previous)};
}

bool ScoringRunner::LoadPersisted() {
    if (!userver::fs::blocking::FileExists(output_path_)) {
        LOG_WARNING() << "No persisted scores at " << output_path_ << ", waiting for the first run";
        return false;
    }

    wallet_scoring::ScoreTable table;
    try {
        table = wallet_scoring::ReadScoreTable(output_path_);
    } catch (const wallet_scoring::ScoreTableFormatError& e) {
        LOG_WARNING() << fmt::format("Ignoring unreadable score table {}: {}", output_path_, e.what());
        return false;
    } catch (const std::system_error& e) {
        LOG_WARNING() << fmt::format("Cannot read score table {}: {}", output_path_, e.what());
        return false;
    }

    Publish(table);
    last_run_.Assign(fmt::format("restored scores from {}", output_path_));
    return true;
}

std::optional<wallet_scoring::ScoreRow> ScoringRunner::FindScore(std::string_view user_wallet) const {
    const auto key = wallet_scoring::TransactionLoader::NormalizeWallet(user_wallet);
    const auto snapshot = scores_.Read();
    const auto it = snapshot->find(key);
    if (it == snapshot->end()) {
        return std::nullopt;
    }
    return it->second;
}

void ScoringRunner::RunOnce() {
    const auto result = pipeline_.RunFromFile(input_path_);
    if (result.IsFatal()) {
        const auto failure = result.FailureDescription();
        LOG_ERROR() << "Scoring run failed, previous scores stay published: " << failure;
        last_run_.Assign(fmt::format("fatal, {}", failure));
        return;
    }

    try {
        wallet_scoring::WriteScoreTable(output_path_, result.table);
    } catch (const wallet_scoring::ScoreTableFormatError& e) {
        LOG_ERROR() << fmt::format("Cannot persist scores to {}: {}", output_path_, e.what());
        last_run_.Assign(fmt::format("fatal, cannot persist scores: {}", e.what()));
        return;
    } catch (const std::system_error& e) {
        LOG_ERROR() << fmt::format("Cannot persist scores to {}: {}", output_path_, e.what());
        last_run_.Assign(fmt::format("fatal, cannot persist scores: {}", e.what()));
        return;
    }

    Publish(result.table);
    last_run_.Assign(fmt::format("{}, {} wallets scored, {} records dropped",
                                 wallet_scoring::ToString(result.status), result.table.size(),
                                 result.summary.records_dropped));
}

void ScoringRunner::Publish(const wallet_scoring::ScoreTable& table) {
    ScoreIndex index;
    index.reserve(table.size());
    for (const auto& row : table) {
        index.emplace(wallet_scoring::TransactionLoader::NormalizeWallet(row.user_wallet), row);
    }
    scores_.Assign(std::move(index));
    LOG_INFO() << "Published " << table.size() << " wallet scores";
}

ScoringRunnerComponent::ScoringRunnerComponent(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context
)
    : userver::components::ComponentBase{config, context},
    runner_(
        config["input-path"].As<std::string>(),
        config["output-path"].As<std::string>(),
        MakePipelineConfig(config),
        context.GetTaskProcessor(config["fs-task-processor"].As<std::string>("fs-task-processor"))
    ) {
    if (config["load-on-start"].As<bool>(false)) {
        runner_.LoadPersisted();
    }
}

userver::yaml_config::Schema ScoringRunnerComponent::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::components::ComponentBase>(R"(
type: object
description: Runs the wallet scoring pipeline and publishes its results
additionalProperties: false
properties:
    input-path:
        type: string
        description: JSON transaction dump to score
    output-path:
        type: string
        description: CSV file the score table is written to
    load-on-start:
        type: boolean
        description: publish the score table found at output-path on startup
        defaultDescription: false
    weights-path:
        type: string
        description: YAML file overriding the default heuristic weights
    fs-task-processor:
        type: string
        description: task processor for pipeline runs and file IO
        defaultDescription: fs-task-processor
    clustering:
        type: object
        description: behavioral clustering settings
        additionalProperties: false
        properties:
            min-cluster-size:
                type: integer
                description: smallest group reported as a cluster
                defaultDescription: 15
            min-samples:
                type: integer
                description: neighbours used for core distances
                defaultDescription: 5
            risky-cluster-liquidation-share:
                type: number
                description: liquidated share at which a cluster is flagged
                defaultDescription: 0.5
            cluster-risk-penalty:
                type: number
                description: raw score penalty for members of flagged clusters
                defaultDescription: 0
)");
}


} // namespace scoring_service

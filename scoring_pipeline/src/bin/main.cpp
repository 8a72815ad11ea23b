// stdcpp
#include <algorithm>
#include <cstddef>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

// boost
#include <boost/program_options.hpp>

// fmt
#include <fmt/format.h>

// userver
#include <userver/formats/yaml/exception.hpp>
#include <userver/logging/level.hpp>
#include <userver/logging/log.hpp>
#include <userver/logging/logger.hpp>

// self
#include <heuristic_scorer/heuristic_weights.hpp>
#include <pipeline/pipeline.hpp>
#include <score_normalizer/score_normalizer.hpp>
#include <score_table/score_table.hpp>

namespace {

namespace po = boost::program_options;

constexpr int kExitSuccess = 0;
constexpr int kExitFatal = 1;
constexpr int kExitBadArguments = 2;

constexpr int kDistributionBucket = 100;

struct CliOptions {
    std::string input;
    std::string output;
    std::string features_output;
    std::string weights;
    std::size_t min_cluster_size = 0;
    std::size_t min_samples = 0;
    std::string log_level;
    std::size_t top = 10;
};

void PrintRows(const wallet_scoring::ScoreTable& table, std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
        const auto& row = table[i];
        fmt::print("  {:<44} {:>5} {:>8} {:>12.2f}\n", row.user_wallet, row.credit_score, row.cluster_label,
                   row.raw_score);
    }
}

void PrintReport(const wallet_scoring::PipelineRunResult& result, std::size_t top) {
    const auto& summary = result.summary;
    fmt::print("Status: {}\n", wallet_scoring::ToString(result.status));
    for (const auto& stage : result.stages) {
        fmt::print("  {:<10} {:<9} {}\n", stage.stage, wallet_scoring::ToString(stage.status), stage.detail);
    }
    fmt::print("Records read: {}, dropped: {}, wallets scored: {}\n", summary.records_read,
               summary.records_dropped, result.table.size());
    fmt::print("Clusters: {}, noise wallets: {}, risky clusters: {}\n", summary.clusters, summary.noise_wallets,
               summary.risky_clusters);

    const auto& table = result.table;
    if (table.empty()) {
        return;
    }
    const std::size_t shown = std::min(top, table.size());
    fmt::print("\nTop {} wallets:\n", shown);
    PrintRows(table, 0, shown);
    fmt::print("\nBottom {} wallets:\n", shown);
    PrintRows(table, table.size() - shown, table.size());

    fmt::print("\nScore distribution:\n");
    for (int low = wallet_scoring::kMinFinalScore; low < wallet_scoring::kMaxFinalScore; low += kDistributionBucket) {
        const int high = low + kDistributionBucket;
        const bool last = high >= wallet_scoring::kMaxFinalScore;
        const auto count = std::count_if(table.begin(), table.end(), [&](const wallet_scoring::ScoreRow& row) {
            return row.credit_score >= low && (row.credit_score < high || (last && row.credit_score <= high));
        });
        fmt::print("  {:>4}-{:<4} {}\n", low, high, count);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    po::options_description description("Wallet credit scoring");
    description.add_options()
        ("help,h", "print usage")
        ("input,i", po::value<std::string>(&options.input)->required(), "JSON transaction dump")
        ("output,o", po::value<std::string>(&options.output)->required(), "score table CSV")
        ("features-output", po::value<std::string>(&options.features_output), "feature matrix CSV")
        ("weights", po::value<std::string>(&options.weights), "heuristic weights YAML")
        ("min-cluster-size", po::value<std::size_t>(&options.min_cluster_size), "HDBSCAN min cluster size")
        ("min-samples", po::value<std::size_t>(&options.min_samples), "HDBSCAN min samples")
        ("log-level", po::value<std::string>(&options.log_level)->default_value("info"), "log level")
        ("top", po::value<std::size_t>(&options.top)->default_value(10), "rows in top/bottom listing");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, description), vm);
        if (vm.count("help")) {
            std::cout << description << std::endl;
            return kExitSuccess;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << "\n" << description << std::endl;
        return kExitBadArguments;
    }

    userver::logging::Level level;
    try {
        level = userver::logging::LevelFromString(options.log_level);
    } catch (const std::runtime_error& e) {
        std::cerr << fmt::format("invalid --log-level '{}': {}", options.log_level, e.what()) << std::endl;
        return kExitBadArguments;
    }
    userver::logging::DefaultLoggerGuard logger_guard{
        userver::logging::MakeStderrLogger("default", userver::logging::Format::kTskv, level)};

    wallet_scoring::PipelineConfig config;
    try {
        if (!options.weights.empty()) {
            config.weights = wallet_scoring::LoadHeuristicWeights(options.weights);
        }
        if (vm.count("min-cluster-size")) config.clustering.min_cluster_size = options.min_cluster_size;
        if (vm.count("min-samples")) config.clustering.min_samples = options.min_samples;
    } catch (const userver::formats::yaml::Exception& e) {
        LOG_ERROR() << fmt::format("cannot read weights from {}: {}", options.weights, e.what());
        return kExitBadArguments;
    } catch (const std::system_error& e) {
        LOG_ERROR() << fmt::format("cannot read weights from {}: {}", options.weights, e.what());
        return kExitBadArguments;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR() << fmt::format("invalid weights in {}: {}", options.weights, e.what());
        return kExitBadArguments;
    }

    std::optional<wallet_scoring::ScoringPipeline> pipeline;
    try {
        pipeline.emplace(config);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR() << "invalid pipeline configuration: " << e.what();
        return kExitBadArguments;
    }

    const auto result = pipeline->RunFromFile(options.input);
    PrintReport(result, options.top);
    if (result.IsFatal()) {
        std::cerr << result.FailureDescription() << std::endl;
        return kExitFatal;
    }

    try {
        wallet_scoring::WriteScoreTable(options.output, result.table);
        if (!options.features_output.empty()) {
            wallet_scoring::WriteFeatureMatrix(options.features_output, result.features);
        }
    } catch (const std::exception& e) {
        LOG_ERROR() << "cannot persist scores: " << e.what();
        std::cerr << "cannot persist scores: " << e.what() << std::endl;
        return kExitFatal;
    }
    fmt::print("\nScores written to {}\n", options.output);
    return kExitSuccess;
}

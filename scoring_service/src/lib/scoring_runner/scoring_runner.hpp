#pragma once

// stdcpp
#include <atomic>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

// userver
#include <userver/components/component_base.hpp>
#include <userver/concurrent/background_task_storage.hpp>
#include <userver/engine/task/task_processor_fwd.hpp>
#include <userver/rcu/rcu.hpp>
#include <userver/yaml_config/schema.hpp>

// self
#include <pipeline/pipeline.hpp>
#include <score_table/score_table.hpp>

namespace scoring_service {


struct TriggerOutcome {
    bool accepted = false;
    std::string message;
};

// Published scores keyed by lower-cased wallet address.
using ScoreIndex = std::unordered_map<std::string, wallet_scoring::ScoreRow>;


// Owns the pipeline and the published score table. Runs execute on the
// given task processor, at most one at a time.
class ScoringRunner final {
public:
    ScoringRunner(
        std::string input_path,
        std::string output_path,
        wallet_scoring::PipelineConfig config,
        userver::engine::TaskProcessor& task_processor
    );

    ~ScoringRunner();

    // Starts a pipeline run in the background. Rejected while another run
    // is in flight.
    TriggerOutcome TriggerRun();

    // Publishes the table persisted at the output path. Returns false when
    // there is none or it cannot be parsed; the published scores are kept.
    bool LoadPersisted();

    std::optional<wallet_scoring::ScoreRow> FindScore(std::string_view user_wallet) const;

    bool IsRunInFlight() const { return run_in_flight_.load(); }

    std::string GetLastRunDescription() const { return last_run_.ReadCopy(); }

    const std::string& GetOutputPath() const { return output_path_; }

private:
    void RunOnce();
    void Publish(const wallet_scoring::ScoreTable& table);

private:
    const std::string input_path_;
    const std::string output_path_;
    const wallet_scoring::ScoringPipeline pipeline_;

    std::atomic<bool> run_in_flight_{false};
    userver::rcu::Variable<ScoreIndex> scores_;
    userver::rcu::Variable<std::string> last_run_;

    // Declared last: pending runs are cancelled before the members they use.
    userver::concurrent::BackgroundTaskStorage tasks_;
};


class ScoringRunnerComponent final : public userver::components::ComponentBase {
public:
    static constexpr std::string_view kName = "scoring-runner";

    ScoringRunnerComponent(
        const userver::components::ComponentConfig& config,
        const userver::components::ComponentContext& context
    );

    ~ScoringRunnerComponent() override = default;

    static userver::yaml_config::Schema GetStaticConfigSchema();

    ScoringRunner& GetRunner() { return runner_; }

private:
    ScoringRunner runner_;
};


} // namespace scoring_service

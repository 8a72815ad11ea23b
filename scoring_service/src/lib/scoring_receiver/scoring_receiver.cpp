#include "scoring_receiver.hpp"

// grpc
#include <grpcpp/support/status.h>

// userver
#include <userver/components/component_context.hpp>
#include <userver/logging/log.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

// fmt
#include <fmt/format.h>

namespace scoring_service {


ScoringReceiver::ScoringReceiver(ScoringRunner& runner)
    : runner_(runner) {}

ScoringReceiver::TriggerRunResult ScoringReceiver::TriggerRun(
    CallContext&,
    scoring::TriggerRunRequest&&) {
    LOG_INFO() << "receive scoring run trigger";
    const auto outcome = runner_.TriggerRun();

    scoring::TriggerRunResponse response;
    response.set_accepted(outcome.accepted);
    response.set_message(outcome.message);
    response.set_output_file(runner_.GetOutputPath());
    return response;
}

ScoringReceiver::GetWalletScoreResult ScoringReceiver::GetWalletScore(
    CallContext&,
    scoring::GetWalletScoreRequest&& request) {
    const auto row = runner_.FindScore(request.user_wallet());
    if (!row) {
        LOG_DEBUG() << fmt::format("no score for wallet {}", request.user_wallet());
        return grpc::Status{
            grpc::StatusCode::NOT_FOUND,
            fmt::format("no score published for wallet {}", request.user_wallet())
        };
    }

    scoring::WalletScore response;
    response.set_user_wallet(row->user_wallet);
    response.set_credit_score(row->credit_score);
    response.set_cluster_label(row->cluster_label);
    response.set_raw_score(row->raw_score);
    return response;
}


ScoringReceiverComponent::ScoringReceiverComponent(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context
)
  : userver::ugrpc::server::ServiceComponentBase(config, context),
  service_(context.FindComponent<ScoringRunnerComponent>().GetRunner()) {
    RegisterService(service_);
}

userver::yaml_config::Schema ScoringReceiverComponent::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::ugrpc::server::ServiceComponentBase>(R"(
type: object
description: gRPC wallet scoring service component
additionalProperties: false
properties: {}
)");
}


} // namespace scoring_service

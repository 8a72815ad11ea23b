#pragma once

// libstd
#include <string_view>

// userver
#include <userver/ugrpc/server/service_component_base.hpp>

// models
#include <scoring/scoring.pb.h>
#include <scoring/scoring_service.usrv.pb.hpp>

// self
#include <scoring_runner/scoring_runner.hpp>


namespace scoring_service {


class ScoringReceiver final : public scoring::ScoringServiceBase {
public:
    explicit ScoringReceiver(ScoringRunner& runner);

    TriggerRunResult TriggerRun(CallContext&, scoring::TriggerRunRequest&& request) override;

    GetWalletScoreResult GetWalletScore(CallContext&, scoring::GetWalletScoreRequest&& request) override;

private:
    ScoringRunner& runner_;
};



class ScoringReceiverComponent final : public userver::ugrpc::server::ServiceComponentBase {
public:
    static constexpr std::string_view kName = "scoring-receiver-service";

    ScoringReceiverComponent(
        const userver::components::ComponentConfig& config,
        const userver::components::ComponentContext& context
    );

    static userver::yaml_config::Schema GetStaticConfigSchema();

    ~ScoringReceiverComponent() override = default;

private:
    ScoringReceiver service_;
};


} // namespace scoring_service

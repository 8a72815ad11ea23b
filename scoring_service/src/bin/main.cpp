// protobuf
#include <google/protobuf/stubs/common.h>

// userver
#include <userver/components/minimal_server_component_list.hpp>
#include <userver/ugrpc/server/component_list.hpp>
#include <userver/utils/daemon_run.hpp>

// self
#include <scoring_receiver/scoring_receiver.hpp>
#include <scoring_runner/scoring_runner.hpp>

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    const auto component_list =
        userver::components::MinimalServerComponentList()
            .AppendComponentList(userver::ugrpc::server::MinimalComponentList())
            .Append<scoring_service::ScoringRunnerComponent>()
            .Append<scoring_service::ScoringReceiverComponent>()
        ;

    return userver::utils::DaemonMain(argc, argv, component_list);
}

#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/health_check_service_interface.h>

#include "tapcore/config.hpp"
#include "tapcore/errors.hpp"
#include "tapcore/game_service.hpp"
#include "tapcore/logging.hpp"
#include "tapcore/memory_game_store.hpp"

int main(int argc, char** argv) {
    tapcore::ServerConfig config;
    try {
        config = tapcore::ServerConfig::from_env();
    } catch (const tapcore::ConfigError& e) {
        tapcore::log_error("server", "invalid_configuration", {{"error", e.what()}});
        return 1;
    }

    auto store = std::make_shared<tapcore::InMemoryGameStore>();
    tapcore::GameService service(tapcore::RequestAuthenticator(config.bot_token), store);

    grpc::EnableDefaultHealthCheckService(true);
    grpc::reflection::InitProtoReflectionServerBuilderPlugin();

    std::string server_address = config.listen_address();
    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        tapcore::log_error("server", "server_start_failed", {{"address", server_address}});
        return 1;
    }

    tapcore::log_info("server", "game_server_started",
                      {{"address", server_address}, {"client_origin", config.client_origin}});

    server->Wait();
    return 0;
}

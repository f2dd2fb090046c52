#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>
#include "action_processor.hpp"
#include "game_store.hpp"
#include "leaderboard_view.hpp"
#include "player_directory.hpp"
#include "request_authenticator.hpp"
#include "tapcore/game.grpc.pb.h"

namespace tapcore {

/// Wire form of a GameState, with upgrade_cost derived fresh.
GameStateSnapshot to_snapshot(const GameState& state);

/**
 * gRPC front end for the game core.
 *
 * Each player RPC re-verifies the signed payload, resolves the player,
 * then delegates to ActionProcessor. Core errors become gRPC statuses
 * through TapcoreError::to_grpc_status(); soft-fails are OK responses.
 */
class GameService final : public TapGame::Service {
public:
    GameService(RequestAuthenticator authenticator,
                std::shared_ptr<GameStore> store,
                ActionProcessor::TimeSource now = [] { return Clock::now(); });

    grpc::Status Authenticate(grpc::ServerContext* context,
                              const AuthenticateRequest* request,
                              AuthenticateResponse* response) override;

    grpc::Status Tap(grpc::ServerContext* context,
                     const TapRequest* request,
                     TapResponse* response) override;

    grpc::Status Upgrade(grpc::ServerContext* context,
                         const UpgradeRequest* request,
                         UpgradeResponse* response) override;

    grpc::Status Leaderboard(grpc::ServerContext* context,
                             const LeaderboardRequest* request,
                             LeaderboardResponse* response) override;

private:
    template<typename Fn>
    grpc::Status guarded(const char* rpc, Fn&& body);

    RequestAuthenticator authenticator_;
    PlayerDirectory directory_;
    ActionProcessor actions_;
    LeaderboardView leaderboard_;
};

} // namespace tapcore

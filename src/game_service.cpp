#include "tapcore/game_service.hpp"
#include "tapcore/errors.hpp"
#include "tapcore/logging.hpp"
#include <utility>

namespace tapcore {

namespace {
constexpr const char* GAME_DOMAIN = "game";
} // anonymous namespace

GameStateSnapshot to_snapshot(const GameState& state) {
    GameStateSnapshot snapshot;
    snapshot.set_tokens(state.tokens);
    snapshot.set_level(state.level);
    snapshot.set_tap_power(state.tap_power);
    snapshot.set_energy(state.energy);
    snapshot.set_cap(state.cap);
    snapshot.set_regen_per_sec(state.regen_per_sec);
    snapshot.set_upgrade_cost(upgrade_cost(state.tap_power));
    return snapshot;
}

GameService::GameService(RequestAuthenticator authenticator,
                         std::shared_ptr<GameStore> store,
                         ActionProcessor::TimeSource now)
    : authenticator_(std::move(authenticator)),
      directory_(store, now),
      actions_(store, now),
      leaderboard_(store) {}

template<typename Fn>
grpc::Status GameService::guarded(const char* rpc, Fn&& body) {
    try {
        body();
        return grpc::Status::OK;
    } catch (const TapcoreError& e) {
        grpc::Status status = e.to_grpc_status();
        if (e.is_storage_error()) {
            log_error(GAME_DOMAIN, "request_failed", {{"rpc", rpc}, {"error", e.what()}});
        } else {
            log_warn(GAME_DOMAIN, "request_rejected", {{"rpc", rpc}, {"error", e.what()}});
        }
        return status;
    } catch (const std::exception& e) {
        log_error(GAME_DOMAIN, "request_failed", {{"rpc", rpc}, {"error", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

grpc::Status GameService::Authenticate(grpc::ServerContext* context,
                                       const AuthenticateRequest* request,
                                       AuthenticateResponse* response) {
    return guarded("Authenticate", [&] {
        auto credential = authenticator_.verify(request->init_data());
        Player player = directory_.ensure(credential.identity);
        GameState state = actions_.refresh(player.id);

        response->set_ok(true);
        if (player.username) {
            response->set_username(*player.username);
        }
        *response->mutable_state() = to_snapshot(state);
    });
}

grpc::Status GameService::Tap(grpc::ServerContext* context,
                              const TapRequest* request,
                              TapResponse* response) {
    return guarded("Tap", [&] {
        auto credential = authenticator_.verify(request->init_data());
        Player player = directory_.require(credential.identity.id);
        TapResult result = actions_.tap(player.id);

        response->set_ok(true);
        response->set_applied(result.applied);
        *response->mutable_state() = to_snapshot(result.state);
    });
}

grpc::Status GameService::Upgrade(grpc::ServerContext* context,
                                  const UpgradeRequest* request,
                                  UpgradeResponse* response) {
    return guarded("Upgrade", [&] {
        auto credential = authenticator_.verify(request->init_data());
        Player player = directory_.require(credential.identity.id);
        UpgradeResult result = actions_.upgrade(player.id);

        response->set_ok(result.ok);
        response->set_cost(result.cost);
        if (result.reason) {
            response->set_reason(*result.reason);
        }
        *response->mutable_state() = to_snapshot(result.state);

        if (result.ok) {
            log_info(GAME_DOMAIN, "upgrade_applied",
                     {{"player_id", player.id}, {"tap_power", result.state.tap_power},
                      {"cost", result.cost}});
        }
    });
}

grpc::Status GameService::Leaderboard(grpc::ServerContext* context,
                                      const LeaderboardRequest* request,
                                      LeaderboardResponse* response) {
    return guarded("Leaderboard", [&] {
        int limit = request->limit() == 0 ? LeaderboardView::DEFAULT_LIMIT : request->limit();
        for (const auto& entry : leaderboard_.top(limit)) {
            auto* row = response->add_top();
            if (entry.display_name) {
                row->set_display_name(*entry.display_name);
            }
            row->set_tokens(entry.tokens);
        }
        response->set_ok(true);
    });
}

} // namespace tapcore

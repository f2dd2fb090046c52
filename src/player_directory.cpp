#include "tapcore/player_directory.hpp"
#include "tapcore/errors.hpp"
#include "tapcore/logging.hpp"
#include <utility>

namespace tapcore {

PlayerDirectory::PlayerDirectory(std::shared_ptr<GameStore> store, TimeSource now)
    : store_(std::move(store)), now_(std::move(now)) {}

Player PlayerDirectory::ensure(const Identity& identity) {
    Player player = store_->upsert_player(identity);
    if (store_->create_state_if_absent(player.id, now_())) {
        log_info("player", "player_created",
                 {{"player_id", player.id}, {"external_id", player.external_id}});
    }
    return player;
}

std::optional<Player> PlayerDirectory::find(int64_t external_id) const {
    return store_->find_player(external_id);
}

Player PlayerDirectory::require(int64_t external_id) const {
    auto player = store_->find_player(external_id);
    if (!player) {
        throw NotFoundError("Player not found");
    }
    return *player;
}

} // namespace tapcore

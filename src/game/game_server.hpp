#ifndef GAME_SERVER_HPP
#define GAME_SERVER_HPP

#include "game_store.hpp"
#include "rotation_engine.hpp"
#include "../common/types.hpp"
#include "../common/data_structures.hpp"
#include "../persistence/persistence_queue.hpp"
#include <string>
#include <vector>

namespace kott {

/**
 * GameServer - Operations offered to the request layer
 *
 * Each operation resolves the game, runs one RotationEngine call inside
 * the store's exclusive access window, and only after the lock is
 * released hands durability work to the PersistenceQueue.
 *
 * Player ids are trimmed before validation.
 * Rejections are thrown as GameError.
 */
class GameServer {
public:
    GameServer(GameStore& store, PersistenceQueue& persistence);
    ~GameServer() = default;

    GameServer(const GameServer&) = delete;
    GameServer& operator=(const GameServer&) = delete;

    CreatedGame createGame(const TeamSlot& red, const TeamSlot& blue,
                           const std::vector<PlayerId>& waiting);

    GameView getGame(const GameId& id) const;

    std::vector<GameSummary> listGames() const;

    GameView enqueuePlayer(const GameId& id, const PlayerId& player);

    GoalOutcome applyGoal(const GameId& id, const std::string& team);

    GameView removePlayer(const GameId& id, const PlayerId& player);

    GameView undo(const GameId& id);

    /**
     * Register a player in the persistent catalogue without joining a game
     */
    void registerPlayer(const PlayerId& name);

private:
    GameStore& store_;
    PersistenceQueue& persistence_;
};

} // namespace kott

#endif // GAME_SERVER_HPP

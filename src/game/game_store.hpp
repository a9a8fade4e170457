#ifndef GAME_STORE_HPP
#define GAME_STORE_HPP

#include "game_state.hpp"
#include "../common/types.hpp"
#include "../common/data_structures.hpp"
#include "../common/errors.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace kott {

/**
 * GameStore - Registry of all live games
 *
 * A single registry-wide lock:
 * - readers (get, list, size) share it
 * - create and update hold it exclusively
 *
 * update() is the exclusive access window for a single GameState:
 * one logical operation per acquisition.
 */
class GameStore {
public:
    using IdGenerator = std::function<GameId()>;

    /**
     * idGenerator defaults to 12 random bytes rendered as 24 hex chars
     */
    explicit GameStore(IdGenerator idGenerator = IdGenerator());

    GameStore(const GameStore&) = delete;
    GameStore& operator=(const GameStore&) = delete;

    /**
     * Insert a game under a fresh identifier
     * Identifiers already in the registry are regenerated
     */
    GameId create(GameState initial);

    /**
     * Point-in-time view of one game, or nullopt
     */
    std::optional<GameView> get(const GameId& id) const;

    /**
     * Summaries of every game, ordered by id
     */
    std::vector<GameSummary> list() const;

    size_t size() const;

    /**
     * Run fn on the game under the exclusive lock
     * Throws NOT_FOUND for unknown ids; exceptions from fn propagate
     */
    template<typename Fn>
    auto update(const GameId& id, Fn&& fn) -> decltype(fn(std::declval<GameState&>())) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = games_.find(id);
        if (it == games_.end()) {
            throw GameError(ErrorCode::NOT_FOUND, "game not found");
        }
        return fn(*it->second);
    }

private:
    GameId generateId();

private:
    std::map<GameId, std::unique_ptr<GameState>> games_;
    IdGenerator idGenerator_;
    std::mt19937_64 rng_;

    mutable std::shared_mutex mutex_;
};

} // namespace kott

#endif // GAME_STORE_HPP

#ifndef GAME_STATE_HPP
#define GAME_STATE_HPP

#include "waiting_queue.hpp"
#include "../common/types.hpp"
#include "../common/data_structures.hpp"
#include <vector>

namespace kott {

/**
 * GameState - One table: both sides, the waiting queue, score,
 * streak tracking and the undo history
 *
 * Owned by the GameStore; only touched inside an exclusive access window.
 */
struct GameState {
    TeamSlot red;
    TeamSlot blue;
    WaitingQueue waiting;
    Score score;
    bool started = false;
    StreakState streak;
    std::vector<Snapshot> history;

    GameState() = default;
    GameState(TeamSlot redSide, TeamSlot blueSide, const std::vector<PlayerId>& queue, bool isStarted);

    TeamSlot& side(Team team) { return team == Team::RED ? red : blue; }
    const TeamSlot& side(Team team) const { return team == Team::RED ? red : blue; }

    /**
     * Copy of every mutable field except the history itself
     */
    Snapshot snapshot() const;

    /**
     * Replace every mutable field with the snapshot contents
     */
    void restore(const Snapshot& snap);

    /**
     * Push a snapshot of the current state onto the history
     */
    void pushHistory();

    bool containsPlayer(const PlayerId& id) const;

    /**
     * Active slots (red F, red G, blue F, blue G) followed by the queue
     */
    std::vector<PlayerId> allPlayers() const;

    GameView view(const GameId& id) const;
    GameSummary summary(const GameId& id) const;
};

} // namespace kott

#endif // GAME_STATE_HPP

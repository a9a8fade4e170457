#ifndef ROTATION_ENGINE_HPP
#define ROTATION_ENGINE_HPP

#include "game_state.hpp"
#include "../common/types.hpp"
#include "../common/data_structures.hpp"
#include "../common/errors.hpp"
#include <string>
#include <vector>

namespace kott {

/**
 * RotationEngine - Rules applied to a locked GameState
 *
 * Every operation validates first and throws GameError without touching
 * the state. Mutating operations other than undo push a snapshot onto the
 * history before the first change.
 */
class RotationEngine {
public:
    /**
     * Parse "red" / "blue" (trimmed, case-insensitive)
     * Throws INVALID_TEAM for anything else
     */
    static Team parseTeam(const std::string& token);

    /**
     * Validate a lineup and build a started game from it
     * Throws EMPTY_SLOT or DUPLICATE_ID
     */
    static GameState setupGame(const TeamSlot& red, const TeamSlot& blue,
                               const std::vector<PlayerId>& waiting);

    /**
     * The scoring team keeps its pair; the losing side rotates:
     * goalkeeper to the back of the queue, forward to goal,
     * queue head to forward.
     *
     * Throws NOT_STARTED or QUEUE_EMPTY.
     */
    static GoalResult applyGoal(GameState& gs, Team scoringTeam);
    static GoalResult applyGoal(GameState& gs, const std::string& scoringTeam);

    /**
     * Append a player to the waiting queue
     * Throws EMPTY_SLOT or DUPLICATE_ID
     */
    static void enqueue(GameState& gs, const PlayerId& id);

    /**
     * Remove a player, searching the queue first, then red forward,
     * red goalkeeper, blue forward, blue goalkeeper. A removed active
     * slot is left empty.
     *
     * Throws NOT_FOUND, also for a blank id.
     */
    static void removePlayer(GameState& gs, const PlayerId& id);

    /**
     * Restore the most recent snapshot
     * Throws NO_HISTORY. Not itself undoable.
     */
    static void undo(GameState& gs);

private:
    /**
     * Reset the streak when the scoring side changed, then report whether
     * the rotated losers are back to the streak's opponent baseline
     */
    static std::optional<FullRotationEvent> trackStreak(GameState& gs, Team scoringTeam,
                                                        const TeamSlot& losersBefore);
};

} // namespace kott

#endif // ROTATION_ENGINE_HPP

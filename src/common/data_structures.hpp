#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kott {

// ============================================
// TeamSlot - Forward and goalkeeper of one side
// ============================================
struct TeamSlot {
    PlayerId forward;
    PlayerId goalkeeper;

    TeamSlot() = default;
    TeamSlot(PlayerId fwd, PlayerId gk)
        : forward(std::move(fwd)), goalkeeper(std::move(gk)) {}

    // Unordered comparison: same two players regardless of position
    bool samePair(const TeamSlot& other) const {
        return (forward == other.forward && goalkeeper == other.goalkeeper)
            || (forward == other.goalkeeper && goalkeeper == other.forward);
    }

    bool operator==(const TeamSlot& other) const {
        return forward == other.forward && goalkeeper == other.goalkeeper;
    }
    bool operator!=(const TeamSlot& other) const { return !(*this == other); }
};

// ============================================
// Score - Goals per team
// ============================================
struct Score {
    int red = 0;
    int blue = 0;

    int& of(Team team) { return team == Team::RED ? red : blue; }
    int of(Team team) const { return team == Team::RED ? red : blue; }

    bool operator==(const Score& other) const {
        return red == other.red && blue == other.blue;
    }
    bool operator!=(const Score& other) const { return !(*this == other); }
};

// ============================================
// StreakState - Winning pair and the opponents it started against
// ============================================
struct StreakState {
    bool active = false;
    Team team = Team::RED;
    TeamSlot pair;
    TeamSlot opponentBaseline;

    bool operator==(const StreakState& other) const {
        return active == other.active && team == other.team
            && pair == other.pair && opponentBaseline == other.opponentBaseline;
    }
    bool operator!=(const StreakState& other) const { return !(*this == other); }
};

// ============================================
// Snapshot - Immutable copy of the mutable game fields, for undo
// ============================================
struct Snapshot {
    TeamSlot red;
    TeamSlot blue;
    std::vector<PlayerId> waiting;
    Score score;
    bool started = false;
    StreakState streak;

    bool operator==(const Snapshot& other) const {
        return red == other.red && blue == other.blue && waiting == other.waiting
            && score == other.score && started == other.started
            && streak == other.streak;
    }
    bool operator!=(const Snapshot& other) const { return !(*this == other); }
};

// ============================================
// Rotation results
// ============================================
struct RotationSummary {
    PlayerId benched;
    PlayerId movedToGoalkeeper;
    PlayerId newForward;
};

struct FullRotationEvent {
    Team team = Team::RED;
    TeamSlot players;
};

struct GoalResult {
    RotationSummary rotation;
    std::optional<FullRotationEvent> fullRotation;
};

// ============================================
// Views returned to callers of the game server
// ============================================
struct GameView {
    GameId id;
    TeamSlot red;
    TeamSlot blue;
    std::vector<PlayerId> waiting;
    Score score;
    bool started = false;
    size_t undoDepth = 0;
};

struct GameSummary {
    GameId id;
    bool started = false;
    Score score;
};

struct CreatedGame {
    GameId id;
    GameView state;
};

struct GoalOutcome {
    GameView state;
    RotationSummary rotation;
    std::optional<FullRotationEvent> fullRotation;
};

// ============================================
// GoalEvent - Durable record of one goal
//
// red/blue hold the lineup BEFORE the rotation. For the losing side,
// forward == rotation.movedToGoalkeeper and goalkeeper == rotation.benched.
// ============================================
struct GoalEvent {
    GameId gameId;
    Team scoringTeam = Team::RED;
    TeamSlot red;
    TeamSlot blue;
    RotationSummary rotation;
    bool fullRotation = false;

    const TeamSlot& winners() const { return scoringTeam == Team::RED ? red : blue; }
    const TeamSlot& losers() const { return scoringTeam == Team::RED ? blue : red; }
};

} // namespace kott

#endif // DATA_STRUCTURES_HPP

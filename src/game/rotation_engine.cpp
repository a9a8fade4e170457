#include "rotation_engine.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <unordered_set>

namespace kott {

Team RotationEngine::parseTeam(const std::string& token) {
    std::string team = trimCopy(token);
    std::transform(team.begin(), team.end(), team.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (team == "red") return Team::RED;
    if (team == "blue") return Team::BLUE;
    throw GameError(ErrorCode::INVALID_TEAM, "team must be 'red' or 'blue'");
}

GameState RotationEngine::setupGame(const TeamSlot& red, const TeamSlot& blue,
                                    const std::vector<PlayerId>& waiting) {
    for (const auto* id : {&red.forward, &red.goalkeeper, &blue.forward, &blue.goalkeeper}) {
        if (trimCopy(*id).empty()) {
            throw GameError(ErrorCode::EMPTY_SLOT, "empty player_id in active slots");
        }
    }
    for (const auto& id : waiting) {
        if (trimCopy(id).empty()) {
            throw GameError(ErrorCode::EMPTY_SLOT, "empty player_id in waiting queue");
        }
    }

    GameState gs(red, blue, waiting, true);

    std::unordered_set<PlayerId> seen;
    for (const auto& id : gs.allPlayers()) {
        if (!seen.insert(id).second) {
            throw GameError(ErrorCode::DUPLICATE_ID, "duplicate player_id: " + id);
        }
    }
    return gs;
}

GoalResult RotationEngine::applyGoal(GameState& gs, const std::string& scoringTeam) {
    return applyGoal(gs, parseTeam(scoringTeam));
}

GoalResult RotationEngine::applyGoal(GameState& gs, Team scoringTeam) {
    if (!gs.started) {
        throw GameError(ErrorCode::NOT_STARTED, "game not started");
    }
    if (gs.waiting.empty()) {
        throw GameError(ErrorCode::QUEUE_EMPTY, "waiting queue empty; cannot rotate losing team");
    }

    gs.pushHistory();

    TeamSlot& loser = gs.side(opponentOf(scoringTeam));
    const TeamSlot losersBefore = loser;

    GoalResult result;
    result.rotation.benched = loser.goalkeeper;
    gs.waiting.enqueue(loser.goalkeeper);
    result.rotation.movedToGoalkeeper = loser.forward;
    loser.goalkeeper = loser.forward;
    // Non-empty: the benched goalkeeper was just queued
    result.rotation.newForward = gs.waiting.dequeue().value_or(PlayerId());
    loser.forward = result.rotation.newForward;

    gs.score.of(scoringTeam)++;

    result.fullRotation = trackStreak(gs, scoringTeam, losersBefore);
    return result;
}

std::optional<FullRotationEvent> RotationEngine::trackStreak(GameState& gs, Team scoringTeam,
                                                             const TeamSlot& losersBefore) {
    const TeamSlot& winners = gs.side(scoringTeam);
    StreakState& streak = gs.streak;

    if (!streak.active || streak.team != scoringTeam || !streak.pair.samePair(winners)) {
        streak.active = true;
        streak.team = scoringTeam;
        streak.pair = winners;
        streak.opponentBaseline = losersBefore;
    }

    // Baseline is kept on a match so further cycles are detected as well
    if (gs.side(opponentOf(scoringTeam)).samePair(streak.opponentBaseline)) {
        FullRotationEvent event;
        event.team = scoringTeam;
        event.players = winners;
        return event;
    }
    return std::nullopt;
}

void RotationEngine::enqueue(GameState& gs, const PlayerId& id) {
    if (trimCopy(id).empty()) {
        throw GameError(ErrorCode::EMPTY_SLOT, "player_id is required");
    }
    if (gs.containsPlayer(id)) {
        throw GameError(ErrorCode::DUPLICATE_ID, "player_id already exists in game");
    }
    gs.pushHistory();
    gs.waiting.enqueue(id);
}

void RotationEngine::removePlayer(GameState& gs, const PlayerId& id) {
    // Emptied slots and benched blanks never match
    if (trimCopy(id).empty()) {
        throw GameError(ErrorCode::NOT_FOUND, "player_id is required");
    }
    if (gs.waiting.contains(id)) {
        gs.pushHistory();
        gs.waiting.removeValue(id);
        return;
    }

    PlayerId* slots[] = {&gs.red.forward, &gs.red.goalkeeper, &gs.blue.forward, &gs.blue.goalkeeper};
    for (PlayerId* slot : slots) {
        if (*slot == id) {
            gs.pushHistory();
            slot->clear();
            return;
        }
    }

    throw GameError(ErrorCode::NOT_FOUND, "player not found in game: " + id);
}

void RotationEngine::undo(GameState& gs) {
    if (gs.history.empty()) {
        throw GameError(ErrorCode::NO_HISTORY, "no actions to undo");
    }
    Snapshot last = std::move(gs.history.back());
    gs.history.pop_back();
    gs.restore(last);
}

} // namespace kott

#include "game_state.hpp"
#include "../common/config.hpp"
#include <utility>

namespace kott {

GameState::GameState(TeamSlot redSide, TeamSlot blueSide, const std::vector<PlayerId>& queue, bool isStarted)
    : red(std::move(redSide))
    , blue(std::move(blueSide))
    , waiting(WaitingQueue::fromSequence(queue, Config::Queue::MIN_WAITING_CAPACITY))
    , started(isStarted)
{
}

Snapshot GameState::snapshot() const {
    Snapshot snap;
    snap.red = red;
    snap.blue = blue;
    snap.waiting = waiting.snapshot();
    snap.score = score;
    snap.started = started;
    snap.streak = streak;
    return snap;
}

void GameState::restore(const Snapshot& snap) {
    red = snap.red;
    blue = snap.blue;
    waiting = WaitingQueue::fromSequence(snap.waiting, Config::Queue::MIN_WAITING_CAPACITY);
    score = snap.score;
    started = snap.started;
    streak = snap.streak;
}

void GameState::pushHistory() {
    history.push_back(snapshot());
}

bool GameState::containsPlayer(const PlayerId& id) const {
    if (red.forward == id || red.goalkeeper == id || blue.forward == id || blue.goalkeeper == id) {
        return true;
    }
    return waiting.contains(id);
}

std::vector<PlayerId> GameState::allPlayers() const {
    std::vector<PlayerId> ids = {red.forward, red.goalkeeper, blue.forward, blue.goalkeeper};
    auto queued = waiting.snapshot();
    ids.insert(ids.end(), queued.begin(), queued.end());
    return ids;
}

GameView GameState::view(const GameId& id) const {
    GameView v;
    v.id = id;
    v.red = red;
    v.blue = blue;
    v.waiting = waiting.snapshot();
    v.score = score;
    v.started = started;
    v.undoDepth = history.size();
    return v;
}

GameSummary GameState::summary(const GameId& id) const {
    GameSummary s;
    s.id = id;
    s.started = started;
    s.score = score;
    return s;
}

} // namespace kott

#include "game_server.hpp"
#include "../common/logger.hpp"
#include <utility>

namespace kott {

namespace {
constexpr const char* TAG = "GameServer";

TeamSlot trimmedSlot(const TeamSlot& slot) {
    return TeamSlot(trimCopy(slot.forward), trimCopy(slot.goalkeeper));
}
}

GameServer::GameServer(GameStore& store, PersistenceQueue& persistence)
    : store_(store)
    , persistence_(persistence)
{
}

CreatedGame GameServer::createGame(const TeamSlot& red, const TeamSlot& blue,
                                   const std::vector<PlayerId>& waiting) {
    std::vector<PlayerId> queue;
    queue.reserve(waiting.size());
    for (const auto& id : waiting) {
        queue.push_back(trimCopy(id));
    }

    GameState initial = RotationEngine::setupGame(trimmedSlot(red), trimmedSlot(blue), queue);
    std::vector<PlayerId> players = initial.allPlayers();

    CreatedGame created;
    created.state = initial.view(GameId());
    created.id = store_.create(std::move(initial));
    created.state.id = created.id;
    Logger::info(TAG, "game %s created with %zu players", created.id.c_str(), players.size());

    persistence_.ensurePlayersExist(std::move(players));
    return created;
}

GameView GameServer::getGame(const GameId& id) const {
    std::optional<GameView> view = store_.get(id);
    if (!view) {
        throw GameError(ErrorCode::NOT_FOUND, "game not found");
    }
    return std::move(*view);
}

std::vector<GameSummary> GameServer::listGames() const {
    return store_.list();
}

GameView GameServer::enqueuePlayer(const GameId& id, const PlayerId& player) {
    PlayerId trimmed = trimCopy(player);
    GameView view = store_.update(id, [&](GameState& gs) {
        RotationEngine::enqueue(gs, trimmed);
        return gs.view(id);
    });

    persistence_.ensurePlayersExist({trimmed});
    return view;
}

GoalOutcome GameServer::applyGoal(const GameId& id, const std::string& team) {
    Team scoringTeam = RotationEngine::parseTeam(team);

    GoalEvent event;
    GoalOutcome outcome = store_.update(id, [&](GameState& gs) {
        event.red = gs.red;
        event.blue = gs.blue;
        GoalResult result = RotationEngine::applyGoal(gs, scoringTeam);

        GoalOutcome out;
        out.state = gs.view(id);
        out.rotation = result.rotation;
        out.fullRotation = result.fullRotation;
        return out;
    });

    event.gameId = id;
    event.scoringTeam = scoringTeam;
    event.rotation = outcome.rotation;
    event.fullRotation = outcome.fullRotation.has_value();

    if (outcome.fullRotation) {
        Logger::info(TAG, "game %s: full rotation by %s (%s, %s)", id.c_str(),
                     teamToString(scoringTeam),
                     outcome.fullRotation->players.forward.c_str(),
                     outcome.fullRotation->players.goalkeeper.c_str());
    }
    Logger::debug(TAG, "game %s: %s scored, benched %s, new forward %s", id.c_str(),
                  teamToString(scoringTeam), outcome.rotation.benched.c_str(),
                  outcome.rotation.newForward.c_str());

    persistence_.recordGoalEvent(std::move(event));
    return outcome;
}

GameView GameServer::removePlayer(const GameId& id, const PlayerId& player) {
    PlayerId trimmed = trimCopy(player);
    return store_.update(id, [&](GameState& gs) {
        RotationEngine::removePlayer(gs, trimmed);
        return gs.view(id);
    });
}

GameView GameServer::undo(const GameId& id) {
    return store_.update(id, [&](GameState& gs) {
        RotationEngine::undo(gs);
        return gs.view(id);
    });
}

void GameServer::registerPlayer(const PlayerId& name) {
    PlayerId trimmed = trimCopy(name);
    if (trimmed.empty()) {
        throw GameError(ErrorCode::EMPTY_SLOT, "name is required");
    }
    persistence_.ensurePlayersExist({trimmed});
}

} // namespace kott

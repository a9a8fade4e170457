#include "game_store.hpp"
#include <cstdio>
#include <utility>

namespace kott {

namespace {
constexpr size_t GAME_ID_BYTES = 12;
}

GameStore::GameStore(IdGenerator idGenerator)
    : idGenerator_(std::move(idGenerator))
{
    std::random_device device;
    std::seed_seq seed{device(), device(), device(), device()};
    rng_.seed(seed);
}

GameId GameStore::create(GameState initial) {
    auto state = std::make_unique<GameState>(std::move(initial));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    GameId id = generateId();
    while (games_.count(id) != 0) {
        id = generateId();
    }
    games_.emplace(id, std::move(state));
    return id;
}

std::optional<GameView> GameStore::get(const GameId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = games_.find(id);
    if (it == games_.end()) {
        return std::nullopt;
    }
    return it->second->view(id);
}

std::vector<GameSummary> GameStore::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<GameSummary> summaries;
    summaries.reserve(games_.size());
    for (const auto& entry : games_) {
        summaries.push_back(entry.second->summary(entry.first));
    }
    return summaries;
}

size_t GameStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return games_.size();
}

GameId GameStore::generateId() {
    // Called with the exclusive lock held
    if (idGenerator_) {
        return idGenerator_();
    }

    std::uniform_int_distribution<unsigned int> byteDist(0, 255);
    char hex[GAME_ID_BYTES * 2 + 1];
    for (size_t i = 0; i < GAME_ID_BYTES; ++i) {
        snprintf(hex + i * 2, 3, "%02x", byteDist(rng_));
    }
    return GameId(hex, GAME_ID_BYTES * 2);
}

} // namespace kott

#include "client.hpp"
#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

namespace kott {

TableClient::TableClient(int clientId, GameId gameId, size_t numCommands)
    : clientId_(clientId)
    , gameId_(std::move(gameId))
    , numCommands_(numCommands)
    , rng_(static_cast<unsigned int>(clientId))  // Seed with clientId for reproducible runs
{
}

std::vector<PlayerId> TableClient::rosterFor(int clientId, size_t numPlayers) {
    std::vector<PlayerId> roster;
    roster.reserve(numPlayers);
    for (size_t i = 0; i < numPlayers; ++i) {
        roster.push_back("t" + std::to_string(clientId) + "-p" + std::to_string(i + 1));
    }
    return roster;
}

std::vector<Command> TableClient::generateBatch(size_t batchSize) {
    std::vector<Command> batch;
    batch.reserve(batchSize);

    // 80% goals, 8% joins, 6% leaves, 6% undos
    std::uniform_int_distribution<int> kindDist(0, 99);
    std::uniform_int_distribution<int> teamDist(0, 1);

    size_t end = std::min(generated_ + batchSize, numCommands_);
    for (size_t i = generated_; i < end; ++i) {
        Command cmd;
        int roll = kindDist(rng_);
        if (roll < 80) {
            cmd.kind = Command::Kind::GOAL;
            // Team tokens arrive as typed by hand
            cmd.team = teamDist(rng_) == 0 ? "red" : "Blue ";
        } else if (roll < 88) {
            cmd.kind = Command::Kind::JOIN;
            cmd.player = newcomerName();
            joined_.push_back(cmd.player);
        } else if (roll < 94 && !joined_.empty()) {
            cmd.kind = Command::Kind::LEAVE;
            std::uniform_int_distribution<size_t> pick(0, joined_.size() - 1);
            size_t idx = pick(rng_);
            cmd.player = joined_[idx];
            joined_.erase(joined_.begin() + static_cast<std::ptrdiff_t>(idx));
        } else {
            cmd.kind = Command::Kind::UNDO;
        }
        batch.push_back(std::move(cmd));
    }

    generated_ = end;
    return batch;
}

bool TableClient::isFinished() const {
    return generated_ >= numCommands_;
}

PlayerId TableClient::newcomerName() {
    return "t" + std::to_string(clientId_) + "-guest" + std::to_string(++newcomers_);
}

} // namespace kott

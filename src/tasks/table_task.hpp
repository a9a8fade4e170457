#ifndef TABLE_TASK_HPP
#define TABLE_TASK_HPP

#include "../client/client.hpp"
#include "../common/errors.hpp"
#include "../game/game_server.hpp"
#include "../scheduler/thread_pool.hpp"
#include <array>
#include <atomic>
#include <cstddef>

namespace kott {

// ============================================
// TableStats - Outcome counters shared by all table tasks
// ============================================
struct TableStats {
    std::atomic<size_t> accepted{0};
    std::atomic<size_t> goals{0};
    std::atomic<size_t> fullRotations{0};
    std::array<std::atomic<size_t>, ERROR_CODE_COUNT> rejected{};  // indexed by ErrorCode

    void reject(ErrorCode code) {
        rejected[static_cast<size_t>(code)].fetch_add(1, std::memory_order_relaxed);
    }
};

/**
 * Task running one batch of a table client's commands against the server.
 * Self-replicating: resubmits itself until the client is exhausted.
 */
struct TableTask {
    TableClient* client;
    GameServer* server;
    ThreadPool* pool;
    TableStats* stats;
    std::atomic<int>* clientsFinished;
    size_t batchSize;

    void operator()() {
        for (const Command& cmd : client->generateBatch(batchSize)) {
            try {
                execute(cmd);
                stats->accepted.fetch_add(1, std::memory_order_relaxed);
            } catch (const GameError& e) {
                stats->reject(e.code());
            }
        }

        if (!client->isFinished()) {
            pool->submit(*this);
        } else {
            clientsFinished->fetch_add(1, std::memory_order_relaxed);
        }
    }

    void execute(const Command& cmd) {
        const GameId& gameId = client->getGameId();
        switch (cmd.kind) {
            case Command::Kind::GOAL: {
                GoalOutcome outcome = server->applyGoal(gameId, cmd.team);
                stats->goals.fetch_add(1, std::memory_order_relaxed);
                if (outcome.fullRotation) {
                    stats->fullRotations.fetch_add(1, std::memory_order_relaxed);
                }
                break;
            }
            case Command::Kind::JOIN:
                server->enqueuePlayer(gameId, cmd.player);
                break;
            case Command::Kind::LEAVE:
                server->removePlayer(gameId, cmd.player);
                break;
            case Command::Kind::UNDO:
                server->undo(gameId);
                break;
        }
    }
};

} // namespace kott

#endif // TABLE_TASK_HPP

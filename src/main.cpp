#include "common/types.hpp"
#include "common/data_structures.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "scheduler/thread_pool.hpp"
#include "game/game_store.hpp"
#include "game/game_server.hpp"
#include "persistence/journal_store.hpp"
#include "persistence/persistence_queue.hpp"
#include "client/client.hpp"
#include "tasks/table_task.hpp"

#include <iostream>
#include <chrono>
#include <iomanip>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

using namespace kott;
using namespace std::chrono;

namespace {

constexpr const char* TAG = "Main";

void printSeparator() {
    std::cout << std::string(60, '=') << std::endl;
}

void printGame(const GameView& game) {
    std::cout << "  " << game.id
              << "  red " << game.score.red << " - " << game.score.blue << " blue"
              << "  [" << game.red.forward << "/" << game.red.goalkeeper << " vs "
              << game.blue.forward << "/" << game.blue.goalkeeper << "]"
              << "  waiting " << game.waiting.size()
              << "  undo " << game.undoDepth << std::endl;
}

void printLeaderboard(const JournalStore& journal) {
    printSeparator();
    std::cout << "  LEADERBOARD (" << journal.goalCount() << " goals recorded)" << std::endl;
    printSeparator();
    std::cout << "  Player           |  Wins | Survives | Full rotations" << std::endl;
    std::cout << "  -----------------|-------|----------|---------------" << std::endl;
    for (const auto& player : journal.leaderboard(10)) {
        std::cout << "  " << std::left << std::setw(16) << player.name << std::right
                  << " | " << std::setw(5) << player.wins
                  << " | " << std::setw(8) << player.survives
                  << " | " << std::setw(14) << player.fullRotations << std::endl;
    }
}

int run(const ServerConfig& config) {
    std::shared_ptr<JournalStore> journal;
    if (!config.journalPath.empty()) {
        journal = std::make_shared<JournalStore>(config.journalPath);
        journal->open();
    }

    GameStore store;
    PersistenceQueue persistence(journal, config.retry);
    GameServer server(store, persistence);

    printSeparator();
    std::cout << "  KING OF THE TABLE - SIMULATED EVENING" << std::endl;
    printSeparator();
    std::cout << "  Tables:        " << config.numTables << std::endl;
    std::cout << "  Commands/table: " << config.commandsPerTable << std::endl;
    std::cout << "  Workers:       " << config.numWorkers << std::endl;
    std::cout << "  Journal:       " << (journal ? config.journalPath : "(disabled)") << std::endl;

    // 1. Open one game per table
    std::vector<TableClient> clients;
    clients.reserve(config.numTables);
    for (size_t i = 0; i < config.numTables; ++i) {
        int clientId = static_cast<int>(i);
        auto roster = TableClient::rosterFor(clientId, Config::Simulation::PLAYERS_PER_TABLE);
        TeamSlot red(roster[0], roster[1]);
        TeamSlot blue(roster[2], roster[3]);
        std::vector<PlayerId> waiting(roster.begin() + 4, roster.end());

        CreatedGame game = server.createGame(red, blue, waiting);
        clients.emplace_back(clientId, game.id, config.commandsPerTable);
    }

    // 2. Run every table's command stream concurrently
    TableStats stats;
    std::atomic<int> clientsFinished{0};
    ThreadPool pool(config.numWorkers);

    auto start = high_resolution_clock::now();
    for (auto& client : clients) {
        pool.submit(TableTask{&client, &server, &pool, &stats, &clientsFinished,
                              Config::Simulation::BATCH_SIZE});
    }
    pool.waitAll();
    auto end = high_resolution_clock::now();
    double elapsedMs = duration_cast<microseconds>(end - start).count() / 1000.0;

    // 3. Let the persistence worker catch up
    if (persistence.enabled() && !persistence.waitIdle(Config::Persistence::DRAIN_TIMEOUT)) {
        Logger::warn(TAG, "persistence still has %zu pending operation(s)", persistence.pending());
    }

    printSeparator();
    std::cout << "  TABLES" << std::endl;
    printSeparator();
    for (const auto& summary : server.listGames()) {
        printGame(server.getGame(summary.id));
    }

    printSeparator();
    std::cout << "  RESULTS" << std::endl;
    printSeparator();
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Time:           " << elapsedMs << " ms" << std::endl;
    std::cout << "  Accepted:       " << stats.accepted.load() << std::endl;
    std::cout << "  Goals:          " << stats.goals.load() << std::endl;
    std::cout << "  Full rotations: " << stats.fullRotations.load() << std::endl;
    for (size_t i = 0; i < stats.rejected.size(); ++i) {
        size_t count = stats.rejected[i].load();
        if (count > 0) {
            std::cout << "  Rejected " << std::left << std::setw(13)
                      << errorCodeToString(static_cast<ErrorCode>(i)) << std::right
                      << " " << count << std::endl;
        }
    }
    if (persistence.enabled()) {
        std::cout << "  Persisted ops:  " << persistence.deliveredCount()
                  << " (" << persistence.failedAttemptCount() << " failed attempts)" << std::endl;
    }

    if (journal) {
        printLeaderboard(*journal);
    }

    persistence.shutdown();
    return 0;
}

} // namespace

int main() {
    ServerConfig config;
    try {
        config = loadServerConfig();
    } catch (const ConfigError& e) {
        std::cerr << "configuration error: " << e.what() << std::endl;
        return 2;
    }
    Logger::setLevel(config.logLevel);

    try {
        return run(config);
    } catch (const std::exception& e) {
        Logger::error(TAG, "fatal: %s", e.what());
        return 1;
    }
}

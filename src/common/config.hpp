#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "logger.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace kott {

// ============================================
// Compile-time defaults
// ============================================
namespace Config {
    namespace Queue {
        constexpr size_t MIN_WAITING_CAPACITY = 8;
    }

    namespace Persistence {
        constexpr std::chrono::milliseconds INITIAL_BACKOFF{1000};
        constexpr std::chrono::milliseconds MAX_BACKOFF{60 * 1000};
        constexpr std::chrono::milliseconds ATTEMPT_TIMEOUT{10 * 1000};
        constexpr std::chrono::milliseconds DRAIN_TIMEOUT{5 * 1000};
    }

    namespace Store {
        constexpr size_t DEFAULT_SEARCH_LIMIT = 20;
        constexpr size_t MAX_SEARCH_LIMIT = 100;
        constexpr size_t DEFAULT_LEADERBOARD_LIMIT = 50;
        constexpr size_t MAX_LEADERBOARD_LIMIT = 1000;
    }

    namespace Simulation {
        constexpr size_t NUM_TABLES = 8;
        constexpr size_t PLAYERS_PER_TABLE = 8;
        constexpr size_t COMMANDS_PER_TABLE = 500;
        constexpr size_t BATCH_SIZE = 25;
    }
}

/**
 * RetryPolicy - Backoff settings of the persistence worker
 */
struct RetryPolicy {
    std::chrono::milliseconds initialBackoff = Config::Persistence::INITIAL_BACKOFF;
    std::chrono::milliseconds maxBackoff = Config::Persistence::MAX_BACKOFF;
    std::chrono::milliseconds attemptTimeout = Config::Persistence::ATTEMPT_TIMEOUT;
};

/**
 * ServerConfig - Runtime settings of the kott_server process
 */
struct ServerConfig {
    std::string journalPath;  // empty = persistence disabled
    Logger::Level logLevel = Logger::Level::INFO;
    size_t numWorkers = 4;
    size_t numTables = Config::Simulation::NUM_TABLES;
    size_t commandsPerTable = Config::Simulation::COMMANDS_PER_TABLE;
    RetryPolicy retry;
};

/**
 * Build the server configuration from defaults overlaid with the
 * KOTT_* environment variables. Throws ConfigError on malformed values.
 */
ServerConfig loadServerConfig();

} // namespace kott

#endif // CONFIG_HPP

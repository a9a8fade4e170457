#ifndef CLIENT_HPP
#define CLIENT_HPP

#include "../common/types.hpp"
#include "../common/data_structures.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace kott {

// ============================================
// Command - One request a table client sends
// ============================================
struct Command {
    enum class Kind : uint8_t {
        GOAL,
        JOIN,
        LEAVE,
        UNDO
    };

    Kind kind = Kind::GOAL;
    std::string team;   // GOAL
    PlayerId player;    // JOIN, LEAVE
};

inline const char* commandKindToString(Command::Kind kind) {
    switch (kind) {
        case Command::Kind::GOAL:  return "GOAL";
        case Command::Kind::JOIN:  return "JOIN";
        case Command::Kind::LEAVE: return "LEAVE";
        case Command::Kind::UNDO:  return "UNDO";
        default: return "UNKNOWN";
    }
}

/**
 * TableClient - Scorekeeper at one table sending a seeded stream of commands
 *
 * Mostly goals, with the occasional player walking up, walking away or
 * a scoring mistake being undone.
 */
class TableClient {
public:
    TableClient(int clientId, GameId gameId, size_t numCommands);

    /**
     * Players to seat when the table's game is created: 4 active + queue
     */
    static std::vector<PlayerId> rosterFor(int clientId, size_t numPlayers);

    /**
     * Generate the next batch of commands
     */
    std::vector<Command> generateBatch(size_t batchSize);

    bool isFinished() const;

    int getClientId() const { return clientId_; }
    const GameId& getGameId() const { return gameId_; }
    size_t getNumCommands() const { return numCommands_; }

private:
    PlayerId newcomerName();

private:
    int clientId_;
    GameId gameId_;
    size_t numCommands_;
    size_t generated_ = 0;
    int newcomers_ = 0;
    std::vector<PlayerId> joined_;

    std::mt19937 rng_;
};

} // namespace kott

#endif // CLIENT_HPP

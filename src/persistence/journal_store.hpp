#ifndef JOURNAL_STORE_HPP
#define JOURNAL_STORE_HPP

#include "persistence_store.hpp"
#include "../common/config.hpp"
#include <cstdint>
#include <ctime>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kott {

// ============================================
// PlayerRecord - Persisted player with counters
// ============================================
struct PlayerRecord {
    int64_t id = 0;
    std::string name;
    int64_t wins = 0;
    int64_t survives = 0;
    int64_t fullRotations = 0;
    time_t lastSeen = 0;
};

/**
 * JournalStore - Append-only file store for players and goal events
 *
 * Each accepted call appends tab-separated records to the journal file;
 * counters in memory are updated only after the write succeeded, and a
 * failed write is cut back to the previous end of file.
 * open() replays an existing journal, so counters survive restarts.
 *
 * Counters per goal:
 * - wins: both players of the scoring side
 * - survives: both winners and the losing forward (moved to goal)
 * - fullRotations: both winners, when the goal closed a full rotation
 */
class JournalStore : public PersistenceStore {
public:
    explicit JournalStore(std::string path);

    JournalStore(const JournalStore&) = delete;
    JournalStore& operator=(const JournalStore&) = delete;

    /**
     * Replay the journal if it exists; throws StoreError on a malformed line
     * An unterminated last line is left over from an interrupted append:
     * it is discarded and cut from the file
     */
    void open();

    void ensurePlayersExist(const StoreContext& ctx, const std::vector<PlayerId>& names) override;
    void recordGoalEvent(const StoreContext& ctx, const GoalEvent& event) override;

    /**
     * Substring search on names, best players first
     * limit outside 1..100 falls back to 20
     */
    std::vector<PlayerRecord> searchPlayers(const std::string& query,
                                            size_t limit = Config::Store::DEFAULT_SEARCH_LIMIT) const;

    /**
     * Best players first; limit outside 1..1000 falls back to 50
     */
    std::vector<PlayerRecord> leaderboard(size_t limit = Config::Store::DEFAULT_LEADERBOARD_LIMIT) const;

    std::optional<PlayerRecord> findPlayer(const std::string& name) const;

    size_t playerCount() const;
    size_t goalCount() const;
    const std::string& path() const { return path_; }

private:
    /**
     * Names not yet known, trimmed and deduplicated, in input order
     */
    std::vector<std::string> unknownNames(const std::vector<PlayerId>& names) const;

    void appendLines(const std::vector<std::string>& lines);

    int64_t registerPlayer(const std::string& name, time_t seen);
    void applyGoal(const GoalEvent& event);
    void replayLine(const std::string& line, size_t lineNo);

    static std::vector<PlayerRecord> ranked(std::vector<PlayerRecord> players, size_t limit);

private:
    std::string path_;
    std::map<std::string, PlayerRecord> players_;
    int64_t nextPlayerId_ = 1;
    size_t goalCount_ = 0;

    mutable std::mutex mutex_;
};

} // namespace kott

#endif // JOURNAL_STORE_HPP

#include "TestSuites.hpp"
#include "persistence/journal_store.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <random>

using namespace kott;
using std::chrono::milliseconds;

namespace Test {

namespace {

/**
 * Journal file under /tmp, removed on scope exit
 */
class TempJournal {
public:
    TempJournal() {
        std::random_device device;
        path_ = "/tmp/kott_journal_test_" + std::to_string(device()) + "_" + std::to_string(device()) + ".tsv";
        std::remove(path_.c_str());
    }

    ~TempJournal() {
        std::remove(path_.c_str());
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

StoreContext ctx() {
    return StoreContext::withTimeout(milliseconds(10000));
}

GoalEvent redGoal(bool fullRotation = false) {
    GoalEvent event;
    event.gameId = "game1";
    event.scoringTeam = Team::RED;
    event.red = TeamSlot("r1", "r2");
    event.blue = TeamSlot("b1", "b2");
    event.rotation.benched = "b2";
    event.rotation.movedToGoalkeeper = "b1";
    event.rotation.newForward = "w1";
    event.fullRotation = fullRotation;
    return event;
}

std::vector<std::string> namesOf(const std::vector<PlayerRecord>& players) {
    std::vector<std::string> out;
    for (const auto& p : players) {
        out.push_back(p.name);
    }
    return out;
}

void counters(TestResult& r, const JournalStore& store, const std::string& name,
              int64_t wins, int64_t survives, int64_t fullRotations) {
    std::optional<PlayerRecord> p = store.findPlayer(name);
    if (!p) {
        r.addFailure(name + " should exist");
        return;
    }
    if (p->wins != wins || p->survives != survives || p->fullRotations != fullRotations) {
        r.addFailure(name + ": expected " + std::to_string(wins) + "/" + std::to_string(survives) + "/"
                     + std::to_string(fullRotations) + ", got " + std::to_string(p->wins) + "/"
                     + std::to_string(p->survives) + "/" + std::to_string(p->fullRotations));
    }
}

void ensureDeduplicates(TestResult& r) {
    TempJournal journal;
    JournalStore store(journal.path());
    store.open();

    store.ensurePlayersExist(ctx(), {"alice", " bob ", "alice", "", "bob"});
    r.check(store.playerCount() == 2, "alice and bob registered once each");
    r.check(store.findPlayer("bob").has_value(), "names are trimmed");

    store.ensurePlayersExist(ctx(), {"alice", "carol"});
    r.check(store.playerCount() == 3, "only carol is new");

    std::optional<PlayerRecord> alice = store.findPlayer("alice");
    std::optional<PlayerRecord> carol = store.findPlayer("carol");
    r.check(alice && carol && carol->id > alice->id, "ids grow in registration order");
}

void goalCounters(TestResult& r) {
    TempJournal journal;
    JournalStore store(journal.path());
    store.open();

    store.recordGoalEvent(ctx(), redGoal());
    store.recordGoalEvent(ctx(), redGoal(true));

    r.check(store.goalCount() == 2, "two goals recorded");
    r.check(store.playerCount() == 5, "every involved player registered");
    counters(r, store, "r1", 2, 2, 1);
    counters(r, store, "r2", 2, 2, 1);
    counters(r, store, "b1", 0, 2, 0);
    counters(r, store, "b2", 0, 0, 0);
    counters(r, store, "w1", 0, 0, 0);
}

void blueGoalCounters(TestResult& r) {
    TempJournal journal;
    JournalStore store(journal.path());
    store.open();

    GoalEvent event = redGoal();
    event.scoringTeam = Team::BLUE;
    event.rotation.benched = "r2";
    event.rotation.movedToGoalkeeper = "r1";
    store.recordGoalEvent(ctx(), event);

    counters(r, store, "b1", 1, 1, 0);
    counters(r, store, "b2", 1, 1, 0);
    counters(r, store, "r1", 0, 1, 0);
    counters(r, store, "r2", 0, 0, 0);
}

void replayRestoresState(TestResult& r) {
    TempJournal journal;
    {
        JournalStore store(journal.path());
        store.open();
        store.ensurePlayersExist(ctx(), {"zed"});
        store.recordGoalEvent(ctx(), redGoal());
        store.recordGoalEvent(ctx(), redGoal(true));
    }

    JournalStore reopened(journal.path());
    reopened.open();
    r.check(reopened.playerCount() == 6, "players replayed");
    r.check(reopened.goalCount() == 2, "goals replayed");
    counters(r, reopened, "r1", 2, 2, 1);
    counters(r, reopened, "b1", 0, 2, 0);

    std::optional<PlayerRecord> zed = reopened.findPlayer("zed");
    reopened.ensurePlayersExist(ctx(), {"newcomer"});
    std::optional<PlayerRecord> newcomer = reopened.findPlayer("newcomer");
    r.check(zed && zed->id == 1, "replayed ids are kept");
    r.check(newcomer && newcomer->id == 7, "new ids continue after the replayed ones");
}

void escapedNames(TestResult& r) {
    TempJournal journal;
    const std::string odd = "tab\there\\slash\nline";
    {
        JournalStore store(journal.path());
        store.open();
        store.ensurePlayersExist(ctx(), {odd});
    }

    JournalStore reopened(journal.path());
    reopened.open();
    r.check(reopened.findPlayer(odd).has_value(), "special characters survive a replay");
    r.check(reopened.playerCount() == 1, "escaped record is a single player");
}

void expiredDeadline(TestResult& r) {
    TempJournal journal;
    JournalStore store(journal.path());
    store.open();

    StoreContext expired = StoreContext::withTimeout(milliseconds(0));
    bool threw = false;
    try {
        store.recordGoalEvent(expired, redGoal());
    } catch (const StoreError&) {
        threw = true;
    }
    r.check(threw, "expired deadline rejects the goal");
    r.check(store.goalCount() == 0 && store.playerCount() == 0, "nothing applied in memory");

    JournalStore reopened(journal.path());
    reopened.open();
    r.check(reopened.goalCount() == 0, "nothing written to the journal");
}

void unwritablePath(TestResult& r) {
    JournalStore store("/nonexistent-kott-dir/sub/journal.tsv");
    store.open();
    bool threw = false;
    try {
        store.ensurePlayersExist(ctx(), {"alice"});
    } catch (const StoreError&) {
        threw = true;
    }
    r.check(threw, "write failure surfaces as StoreError");
    r.check(store.playerCount() == 0, "failed write leaves counters untouched");
}

void malformedJournal(TestResult& r) {
    TempJournal journal;
    {
        std::ofstream out(journal.path());
        out << "P\t1\talice\t0\n";
        out << "X\tgarbage\n";
    }
    JournalStore store(journal.path());
    bool threw = false;
    try {
        store.open();
    } catch (const StoreError&) {
        threw = true;
    }
    r.check(threw, "unknown record type is rejected");
}

void incompleteLastLine(TestResult& r) {
    TempJournal journal;
    {
        std::ofstream out(journal.path());
        out << "P\t1\talice\t1700000000\n";
        out << "P\t2\tbob\t1700000000\n";
        out << "G\t1700000000\tgame";
    }

    JournalStore store(journal.path());
    bool opened = true;
    try {
        store.open();
    } catch (const StoreError& e) {
        opened = false;
        r.addFailure(std::string("open should tolerate a torn tail: ") + e.what());
    }
    if (!opened) return;
    r.check(store.playerCount() == 2, "complete records replayed");
    r.check(store.goalCount() == 0, "torn goal record discarded");

    store.ensurePlayersExist(ctx(), {"carol"});

    JournalStore reopened(journal.path());
    reopened.open();
    r.check(reopened.playerCount() == 3, "append after the cut starts on a clean line");
    std::optional<PlayerRecord> carol = reopened.findPlayer("carol");
    r.check(carol && carol->id == 3, "carol continues the id sequence");
}

void unterminatedRecordDiscarded(TestResult& r) {
    TempJournal journal;
    {
        std::ofstream out(journal.path());
        out << "P\t1\talice\t1700000000\n";
        out << "P\t2\tbob\t17000";
    }
    JournalStore store(journal.path());
    store.open();
    r.check(store.playerCount() == 1, "a record without its terminator is not committed");
    r.check(!store.findPlayer("bob").has_value(), "bob was never fully written");
}

void malformedMiddleLine(TestResult& r) {
    TempJournal journal;
    {
        std::ofstream out(journal.path());
        out << "P\t1\talice\t0\n";
        out << "G\t1700000000\tgame\n";
        out << "P\t2\tbob\t0\n";
    }
    JournalStore store(journal.path());
    bool threw = false;
    try {
        store.open();
    } catch (const StoreError&) {
        threw = true;
    }
    r.check(threw, "a short record followed by more records is corruption");
}

void searchAndLeaderboard(TestResult& r) {
    TempJournal journal;
    JournalStore store(journal.path());
    store.open();

    store.recordGoalEvent(ctx(), redGoal());
    GoalEvent second = redGoal();
    second.red = TeamSlot("r1", "x9");
    store.recordGoalEvent(ctx(), second);

    std::vector<PlayerRecord> top = store.leaderboard(3);
    checkIds(r, namesOf(top), {"r1", "r2", "x9"}, "leaderboard by wins, survives, name");

    checkIds(r, namesOf(store.searchPlayers("b")), {"b1", "b2"}, "substring search");
    r.check(store.searchPlayers("nobody").empty(), "no match yields nothing");

    std::vector<PlayerId> many;
    for (int i = 0; i < 120; ++i) {
        many.push_back("bulk" + std::to_string(i));
    }
    store.ensurePlayersExist(ctx(), many);
    r.check(store.searchPlayers("bulk", 0).size() == Config::Store::DEFAULT_SEARCH_LIMIT, "limit 0 uses default");
    r.check(store.searchPlayers("bulk", 500).size() == Config::Store::DEFAULT_SEARCH_LIMIT, "oversized limit uses default");
    r.check(store.searchPlayers("bulk", 100).size() == 100, "maximum limit honoured");
    r.check(store.leaderboard(0).size() == Config::Store::DEFAULT_LEADERBOARD_LIMIT, "leaderboard default limit");
}

} // namespace

TestSuite journalStoreSuite() {
    return TestSuite{"journal_store", {
        {"ensure_dedup", "ensurePlayersExist trims and registers each name once", ensureDeduplicates},
        {"goal_counters", "wins, survives and full rotations per red goal", goalCounters},
        {"blue_goal_counters", "counters follow the scoring side", blueGoalCounters},
        {"replay", "reopening the journal restores players and counters", replayRestoresState},
        {"escaping", "names with separators round-trip through the file", escapedNames},
        {"expired_deadline", "an expired attempt writes and applies nothing", expiredDeadline},
        {"unwritable_path", "write failures throw StoreError", unwritablePath},
        {"malformed_journal", "replay rejects unknown records", malformedJournal},
        {"incomplete_last_line", "a torn final record is dropped and cut from the file", incompleteLastLine},
        {"unterminated_record", "only newline-terminated records are replayed", unterminatedRecordDiscarded},
        {"malformed_middle_line", "short records inside the journal are still rejected", malformedMiddleLine},
        {"search_leaderboard", "search and leaderboard ordering and limits", searchAndLeaderboard},
    }};
}

} // namespace Test

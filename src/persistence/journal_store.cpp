#include "journal_store.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace kott {

namespace {

constexpr const char* TAG = "JournalStore";
constexpr const char* PLAYER_RECORD = "P";
constexpr const char* GOAL_RECORD = "G";
constexpr size_t PLAYER_FIELDS = 4;
constexpr size_t GOAL_FIELDS = 12;

std::string escapeField(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string unescapeField(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '\\' || i + 1 == value.size()) {
            out += value[i];
            continue;
        }
        char next = value[++i];
        switch (next) {
            case 't': out += '\t'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            default: out += next; break;
        }
    }
    return out;
}

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream in(line);
    while (std::getline(in, field, '\t')) {
        fields.push_back(unescapeField(field));
    }
    if (!line.empty() && line.back() == '\t') {
        fields.emplace_back();
    }
    return fields;
}

std::string joinFields(const std::vector<std::string>& fields) {
    std::string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += '\t';
        line += escapeField(fields[i]);
    }
    return line;
}

int64_t parseInt(const std::string& text, size_t lineNo) {
    try {
        size_t pos = 0;
        long long value = std::stoll(text, &pos);
        if (pos != text.size()) throw std::invalid_argument(text);
        return static_cast<int64_t>(value);
    } catch (const std::exception&) {
        throw StoreError("journal line " + std::to_string(lineNo) + ": bad number '" + text + "'");
    }
}

} // namespace

JournalStore::JournalStore(std::string path)
    : path_(std::move(path))
{
}

void JournalStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path_);
    if (!in.is_open()) {
        Logger::info(TAG, "starting new journal at %s", path_.c_str());
        return;
    }

    // Only newline-terminated lines are committed records
    std::string line;
    size_t lineNo = 0;
    std::uintmax_t committed = 0;
    bool torn = false;
    while (std::getline(in, line)) {
        ++lineNo;
        if (in.eof()) {
            Logger::warn(TAG, "journal line %zu is incomplete; discarding %zu byte(s)",
                         lineNo, line.size());
            torn = true;
            break;
        }
        committed += line.size() + 1;
        if (line.empty()) continue;
        replayLine(line, lineNo);
    }
    if (in.bad()) {
        throw StoreError("failed reading journal " + path_);
    }
    in.close();

    if (torn) {
        std::error_code ec;
        std::filesystem::resize_file(path_, committed, ec);
        if (ec) {
            throw StoreError("cannot truncate incomplete journal " + path_ + ": " + ec.message());
        }
    }
    Logger::info(TAG, "replayed %zu players and %zu goals from %s",
                 players_.size(), goalCount_, path_.c_str());
}

void JournalStore::ensurePlayersExist(const StoreContext& ctx, const std::vector<PlayerId>& names) {
    std::lock_guard<std::mutex> lock(mutex_);
    time_t now = time(nullptr);

    std::vector<std::string> fresh = unknownNames(names);
    std::vector<std::string> lines;
    int64_t id = nextPlayerId_;
    for (const auto& name : fresh) {
        lines.push_back(joinFields({PLAYER_RECORD, std::to_string(id++), name, std::to_string(now)}));
    }

    ctx.checkDeadline("ensurePlayersExist");
    if (!lines.empty()) {
        appendLines(lines);
    }

    for (const auto& name : fresh) {
        registerPlayer(name, now);
    }
    for (const auto& raw : names) {
        auto it = players_.find(trimCopy(raw));
        if (it != players_.end()) {
            it->second.lastSeen = now;
        }
    }
}

void JournalStore::recordGoalEvent(const StoreContext& ctx, const GoalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    time_t now = time(nullptr);

    std::vector<PlayerId> involved = {
        event.red.forward, event.red.goalkeeper, event.blue.forward, event.blue.goalkeeper,
        event.rotation.benched, event.rotation.movedToGoalkeeper, event.rotation.newForward
    };
    std::vector<std::string> fresh = unknownNames(involved);

    std::vector<std::string> lines;
    int64_t id = nextPlayerId_;
    for (const auto& name : fresh) {
        lines.push_back(joinFields({PLAYER_RECORD, std::to_string(id++), name, std::to_string(now)}));
    }
    lines.push_back(joinFields({
        GOAL_RECORD, std::to_string(now), event.gameId, teamToString(event.scoringTeam),
        event.red.forward, event.red.goalkeeper, event.blue.forward, event.blue.goalkeeper,
        event.rotation.benched, event.rotation.movedToGoalkeeper, event.rotation.newForward,
        event.fullRotation ? "1" : "0"
    }));

    ctx.checkDeadline("recordGoalEvent");
    appendLines(lines);

    for (const auto& name : fresh) {
        registerPlayer(name, now);
    }
    applyGoal(event);
    for (const auto& name : involved) {
        auto it = players_.find(name);
        if (it != players_.end()) {
            it->second.lastSeen = now;
        }
    }
}

std::vector<PlayerRecord> JournalStore::searchPlayers(const std::string& query, size_t limit) const {
    if (limit == 0 || limit > Config::Store::MAX_SEARCH_LIMIT) {
        limit = Config::Store::DEFAULT_SEARCH_LIMIT;
    }
    std::string needle = trimCopy(query);

    std::vector<PlayerRecord> matches;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : players_) {
            if (entry.first.find(needle) != std::string::npos) {
                matches.push_back(entry.second);
            }
        }
    }
    return ranked(std::move(matches), limit);
}

std::vector<PlayerRecord> JournalStore::leaderboard(size_t limit) const {
    if (limit == 0 || limit > Config::Store::MAX_LEADERBOARD_LIMIT) {
        limit = Config::Store::DEFAULT_LEADERBOARD_LIMIT;
    }

    std::vector<PlayerRecord> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.reserve(players_.size());
        for (const auto& entry : players_) {
            all.push_back(entry.second);
        }
    }
    return ranked(std::move(all), limit);
}

std::optional<PlayerRecord> JournalStore::findPlayer(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = players_.find(name);
    if (it == players_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t JournalStore::playerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return players_.size();
}

size_t JournalStore::goalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return goalCount_;
}

std::vector<std::string> JournalStore::unknownNames(const std::vector<PlayerId>& names) const {
    std::vector<std::string> fresh;
    std::set<std::string> seen;
    for (const auto& raw : names) {
        std::string name = trimCopy(raw);
        if (name.empty() || players_.count(name) != 0) continue;
        if (seen.insert(name).second) {
            fresh.push_back(name);
        }
    }
    return fresh;
}

void JournalStore::appendLines(const std::vector<std::string>& lines) {
    std::error_code ec;
    std::uintmax_t committed = std::filesystem::file_size(path_, ec);
    if (ec) {
        committed = 0;
    }

    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        throw StoreError("cannot open journal " + path_);
    }
    for (const auto& line : lines) {
        out << line << '\n';
    }
    out.flush();
    if (!out) {
        out.close();
        // Drop the partial batch; the retry appends it again
        std::filesystem::resize_file(path_, committed, ec);
        if (ec) {
            Logger::error(TAG, "cannot roll back journal %s: %s", path_.c_str(), ec.message().c_str());
        }
        throw StoreError("write to journal " + path_ + " failed");
    }
}

int64_t JournalStore::registerPlayer(const std::string& name, time_t seen) {
    PlayerRecord record;
    record.id = nextPlayerId_++;
    record.name = name;
    record.lastSeen = seen;
    players_.emplace(name, record);
    return record.id;
}

void JournalStore::applyGoal(const GoalEvent& event) {
    const TeamSlot& winners = event.winners();
    const TeamSlot& losers = event.losers();

    std::set<std::string> winnerNames = {winners.forward, winners.goalkeeper};
    std::set<std::string> survivorNames = {winners.forward, winners.goalkeeper, losers.forward};

    for (const auto& name : winnerNames) {
        auto it = players_.find(name);
        if (it == players_.end()) continue;
        it->second.wins++;
        if (event.fullRotation) {
            it->second.fullRotations++;
        }
    }
    for (const auto& name : survivorNames) {
        auto it = players_.find(name);
        if (it != players_.end()) {
            it->second.survives++;
        }
    }
    goalCount_++;
}

void JournalStore::replayLine(const std::string& line, size_t lineNo) {
    std::vector<std::string> fields = splitFields(line);

    if (fields[0] == PLAYER_RECORD && fields.size() == PLAYER_FIELDS) {
        PlayerRecord record;
        record.id = parseInt(fields[1], lineNo);
        record.name = fields[2];
        record.lastSeen = static_cast<time_t>(parseInt(fields[3], lineNo));
        players_[record.name] = record;
        nextPlayerId_ = std::max(nextPlayerId_, record.id + 1);
        return;
    }

    if (fields[0] == GOAL_RECORD && fields.size() == GOAL_FIELDS) {
        GoalEvent event;
        time_t seen = static_cast<time_t>(parseInt(fields[1], lineNo));
        event.gameId = fields[2];
        if (fields[3] == "red") {
            event.scoringTeam = Team::RED;
        } else if (fields[3] == "blue") {
            event.scoringTeam = Team::BLUE;
        } else {
            throw StoreError("journal line " + std::to_string(lineNo) + ": bad team '" + fields[3] + "'");
        }
        event.red = TeamSlot(fields[4], fields[5]);
        event.blue = TeamSlot(fields[6], fields[7]);
        event.rotation.benched = fields[8];
        event.rotation.movedToGoalkeeper = fields[9];
        event.rotation.newForward = fields[10];
        event.fullRotation = fields[11] == "1";

        for (const auto& name : unknownNames({event.red.forward, event.red.goalkeeper,
                                              event.blue.forward, event.blue.goalkeeper})) {
            registerPlayer(name, seen);
        }
        applyGoal(event);
        return;
    }

    throw StoreError("journal line " + std::to_string(lineNo) + ": unrecognised record");
}

std::vector<PlayerRecord> JournalStore::ranked(std::vector<PlayerRecord> players, size_t limit) {
    std::sort(players.begin(), players.end(), [](const PlayerRecord& a, const PlayerRecord& b) {
        if (a.wins != b.wins) return a.wins > b.wins;
        if (a.survives != b.survives) return a.survives > b.survives;
        return a.name < b.name;
    });
    if (players.size() > limit) {
        players.resize(limit);
    }
    return players;
}

} // namespace kott

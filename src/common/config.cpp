#include "config.hpp"
#include "errors.hpp"
#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace kott {

namespace {

bool readEnv(const char* name, std::string& out) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) return false;
    out = trimCopy(raw);
    return !out.empty();
}

size_t parsePositive(const char* name, const std::string& value) {
    size_t pos = 0;
    unsigned long long parsed = 0;
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
        throw ConfigError(std::string(name) + ": not a number: " + value);
    }
    try {
        parsed = std::stoull(value, &pos);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + ": not a number: " + value);
    }
    if (pos != value.size() || parsed == 0) {
        throw ConfigError(std::string(name) + ": expected a positive integer, got " + value);
    }
    return static_cast<size_t>(parsed);
}

void overlayCount(const char* name, size_t& target) {
    std::string value;
    if (readEnv(name, value)) {
        target = parsePositive(name, value);
    }
}

void overlayMillis(const char* name, std::chrono::milliseconds& target) {
    std::string value;
    if (readEnv(name, value)) {
        target = std::chrono::milliseconds(parsePositive(name, value));
    }
}

} // namespace

ServerConfig loadServerConfig() {
    ServerConfig config;

    std::string value;
    if (readEnv("KOTT_JOURNAL_PATH", value)) {
        config.journalPath = value;
    }

    if (readEnv("KOTT_LOG_LEVEL", value)) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!Logger::parseLevel(value, config.logLevel)) {
            throw ConfigError("KOTT_LOG_LEVEL: unknown level " + value);
        }
    }

    overlayCount("KOTT_WORKERS", config.numWorkers);
    overlayCount("KOTT_TABLES", config.numTables);
    overlayCount("KOTT_COMMANDS_PER_TABLE", config.commandsPerTable);

    overlayMillis("KOTT_BACKOFF_INITIAL_MS", config.retry.initialBackoff);
    overlayMillis("KOTT_BACKOFF_MAX_MS", config.retry.maxBackoff);
    overlayMillis("KOTT_STORE_TIMEOUT_MS", config.retry.attemptTimeout);

    if (config.retry.maxBackoff < config.retry.initialBackoff) {
        throw ConfigError("KOTT_BACKOFF_MAX_MS must not be below KOTT_BACKOFF_INITIAL_MS");
    }

    return config;
}

} // namespace kott

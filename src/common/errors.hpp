#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace kott {

// ============================================
// ErrorCode - Rejections of game operations
//
// Every code is raised before any state is touched.
// ============================================
enum class ErrorCode : uint8_t {
    EMPTY_SLOT,
    DUPLICATE_ID,
    INVALID_TEAM,
    NOT_FOUND,
    NOT_STARTED,
    QUEUE_EMPTY,
    NO_HISTORY
};

// NO_HISTORY stays the last code
constexpr size_t ERROR_CODE_COUNT = static_cast<size_t>(ErrorCode::NO_HISTORY) + 1;

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::EMPTY_SLOT:   return "EMPTY_SLOT";
        case ErrorCode::DUPLICATE_ID: return "DUPLICATE_ID";
        case ErrorCode::INVALID_TEAM: return "INVALID_TEAM";
        case ErrorCode::NOT_FOUND:    return "NOT_FOUND";
        case ErrorCode::NOT_STARTED:  return "NOT_STARTED";
        case ErrorCode::QUEUE_EMPTY:  return "QUEUE_EMPTY";
        case ErrorCode::NO_HISTORY:   return "NO_HISTORY";
        default: return "UNKNOWN";
    }
}

/**
 * GameError - A rejected game operation
 *
 * Validation errors (EMPTY_SLOT, DUPLICATE_ID, INVALID_TEAM) and
 * state conflicts (NOT_FOUND, NOT_STARTED, QUEUE_EMPTY, NO_HISTORY).
 */
class GameError : public std::runtime_error {
public:
    GameError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/**
 * StoreError - A failed call to the external store
 *
 * Only ever seen by the persistence worker, which retries.
 */
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * ConfigError - Malformed configuration value at startup
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace kott

#endif // ERRORS_HPP

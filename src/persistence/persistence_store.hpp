#ifndef PERSISTENCE_STORE_HPP
#define PERSISTENCE_STORE_HPP

#include "../common/types.hpp"
#include "../common/data_structures.hpp"
#include "../common/errors.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace kott {

/**
 * StoreContext - Deadline of a single store attempt
 *
 * Store implementations check it before committing and throw StoreError
 * once it has passed.
 */
struct StoreContext {
    std::chrono::steady_clock::time_point deadline;

    static StoreContext withTimeout(std::chrono::milliseconds timeout) {
        return StoreContext{std::chrono::steady_clock::now() + timeout};
    }

    bool expired() const {
        return std::chrono::steady_clock::now() >= deadline;
    }

    void checkDeadline(const char* operation) const {
        if (expired()) {
            throw StoreError(std::string(operation) + ": deadline exceeded");
        }
    }
};

/**
 * PersistenceStore - External store fed by the PersistenceQueue
 *
 * Both calls must be idempotent enough to be retried after a failure.
 * Failures are reported by throwing (StoreError or any std::exception).
 */
class PersistenceStore {
public:
    virtual ~PersistenceStore() = default;

    virtual void ensurePlayersExist(const StoreContext& ctx, const std::vector<PlayerId>& names) = 0;

    virtual void recordGoalEvent(const StoreContext& ctx, const GoalEvent& event) = 0;
};

} // namespace kott

#endif // PERSISTENCE_STORE_HPP

#ifndef PERSISTENCE_QUEUE_HPP
#define PERSISTENCE_QUEUE_HPP

#include "persistence_store.hpp"
#include "../common/config.hpp"
#include "../common/data_structures.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace kott {

// ============================================
// PersistenceOp - One unit of durable work
// ============================================
struct PersistenceOp {
    enum class Kind : uint8_t {
        ENSURE_PLAYERS,
        RECORD_GOAL
    };

    Kind kind = Kind::ENSURE_PLAYERS;
    std::vector<PlayerId> names;  // ENSURE_PLAYERS
    GoalEvent goal;               // RECORD_GOAL

    static PersistenceOp ensurePlayers(std::vector<PlayerId> ids) {
        PersistenceOp op;
        op.kind = Kind::ENSURE_PLAYERS;
        op.names = std::move(ids);
        return op;
    }

    static PersistenceOp recordGoal(GoalEvent event) {
        PersistenceOp op;
        op.kind = Kind::RECORD_GOAL;
        op.goal = std::move(event);
        return op;
    }
};

inline const char* opKindToString(PersistenceOp::Kind kind) {
    switch (kind) {
        case PersistenceOp::Kind::ENSURE_PLAYERS: return "ENSURE_PLAYERS";
        case PersistenceOp::Kind::RECORD_GOAL:    return "RECORD_GOAL";
        default: return "UNKNOWN";
    }
}

/**
 * PersistenceQueue - Ordered, single-worker durability queue
 *
 * submit() only appends and wakes the worker; it never waits on the store.
 * The worker delivers operations strictly in submission order. A failing
 * operation is retried forever with capped exponential backoff and blocks
 * everything behind it.
 *
 * Without a store the queue is disabled and submit() does nothing.
 * Operations still queued at shutdown are dropped.
 */
class PersistenceQueue {
public:
    explicit PersistenceQueue(std::shared_ptr<PersistenceStore> store,
                              RetryPolicy policy = RetryPolicy());
    ~PersistenceQueue();

    PersistenceQueue(const PersistenceQueue&) = delete;
    PersistenceQueue& operator=(const PersistenceQueue&) = delete;

    bool enabled() const { return store_ != nullptr; }

    void submit(PersistenceOp op);

    void ensurePlayersExist(std::vector<PlayerId> names);
    void recordGoalEvent(GoalEvent event);

    /**
     * Block until every submitted operation has been delivered
     * Returns false on timeout
     */
    bool waitIdle(std::chrono::milliseconds timeout);

    /**
     * Stop the worker; interrupts a backoff wait, drops what is queued
     */
    void shutdown();

    size_t pending() const;
    uint64_t deliveredCount() const { return delivered_.load(std::memory_order_relaxed); }
    uint64_t failedAttemptCount() const { return failedAttempts_.load(std::memory_order_relaxed); }

private:
    void workerFunction();

    /**
     * Drive one operation through the retry state machine
     * Returns false if shutdown interrupted it
     */
    bool deliver(const PersistenceOp& op);

    void attempt(const PersistenceOp& op);

private:
    std::shared_ptr<PersistenceStore> store_;
    RetryPolicy policy_;

    std::deque<PersistenceOp> queue_;
    bool inFlight_ = false;
    bool running_ = true;
    bool stopped_ = false;  // shutdown already claimed by a caller

    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failedAttempts_{0};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::thread worker_;
};

} // namespace kott

#endif // PERSISTENCE_QUEUE_HPP

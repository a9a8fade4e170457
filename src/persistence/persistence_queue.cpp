#include "persistence_queue.hpp"
#include "backoff.hpp"
#include "../common/logger.hpp"
#include <exception>
#include <utility>

namespace kott {

namespace {
constexpr const char* TAG = "PersistenceQueue";
}

PersistenceQueue::PersistenceQueue(std::shared_ptr<PersistenceStore> store, RetryPolicy policy)
    : store_(std::move(store))
    , policy_(policy)
{
    if (!store_) {
        running_ = false;
        Logger::info(TAG, "no store configured; persistence disabled");
        return;
    }
    worker_ = std::thread(&PersistenceQueue::workerFunction, this);
}

PersistenceQueue::~PersistenceQueue() {
    shutdown();
}

void PersistenceQueue::submit(PersistenceOp op) {
    if (!store_) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            Logger::warn(TAG, "submit after shutdown; dropping %s", opKindToString(op.kind));
            return;
        }
        queue_.push_back(std::move(op));
    }
    cv_.notify_one();
}

void PersistenceQueue::ensurePlayersExist(std::vector<PlayerId> names) {
    if (names.empty()) return;
    submit(PersistenceOp::ensurePlayers(std::move(names)));
}

void PersistenceQueue::recordGoalEvent(GoalEvent event) {
    submit(PersistenceOp::recordGoal(std::move(event)));
}

bool PersistenceQueue::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this]() {
        return queue_.empty() && !inFlight_;
    });
}

void PersistenceQueue::shutdown() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        running_ = false;
        dropped = queue_.size();
        queue_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    idleCv_.notify_all();
    if (dropped > 0) {
        Logger::warn(TAG, "shutdown dropped %zu undelivered operation(s)", dropped);
    }
}

size_t PersistenceQueue::pending() const {
    // The operation in flight is still at the head
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void PersistenceQueue::workerFunction() {
    while (true) {
        PersistenceOp op;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
            if (!running_) return;
            // Peek only: the head stays queued until delivered
            op = queue_.front();
            inFlight_ = true;
        }

        bool delivered = deliver(op);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            inFlight_ = false;
            if (!delivered) return;
            if (!queue_.empty()) {
                queue_.pop_front();
            }
            delivered_.fetch_add(1, std::memory_order_relaxed);
            if (queue_.empty()) {
                idleCv_.notify_all();
            }
        }
    }
}

bool PersistenceQueue::deliver(const PersistenceOp& op) {
    RetryState retry(policy_);

    while (retry.phase() != RetryState::Phase::DONE) {
        switch (retry.phase()) {
            case RetryState::Phase::ATTEMPT:
                try {
                    attempt(op);
                    retry.onSuccess();
                } catch (const std::exception& e) {
                    retry.onFailure();
                    failedAttempts_.fetch_add(1, std::memory_order_relaxed);
                    Logger::warn(TAG, "%s failed (attempt %u): %s; retrying in %lld ms",
                                 opKindToString(op.kind), retry.attempts(), e.what(),
                                 static_cast<long long>(retry.currentBackoff().count()));
                }
                break;

            case RetryState::Phase::WAITING: {
                std::unique_lock<std::mutex> lock(mutex_);
                bool stopped = cv_.wait_for(lock, retry.currentBackoff(), [this]() {
                    return !running_;
                });
                if (stopped) return false;
                retry.onWaitElapsed();
                break;
            }

            case RetryState::Phase::DONE:
                break;
        }
    }

    if (retry.attempts() > 1) {
        Logger::info(TAG, "%s delivered after %u attempts", opKindToString(op.kind), retry.attempts());
    }
    return true;
}

void PersistenceQueue::attempt(const PersistenceOp& op) {
    StoreContext ctx = StoreContext::withTimeout(policy_.attemptTimeout);
    switch (op.kind) {
        case PersistenceOp::Kind::ENSURE_PLAYERS:
            store_->ensurePlayersExist(ctx, op.names);
            break;
        case PersistenceOp::Kind::RECORD_GOAL:
            store_->recordGoalEvent(ctx, op.goal);
            break;
    }
}

} // namespace kott

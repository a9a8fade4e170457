#include "TestSuites.hpp"
#include "persistence/backoff.hpp"
#include "persistence/persistence_queue.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace kott;
using std::chrono::milliseconds;

namespace Test {

namespace {

RetryPolicy fastPolicy() {
    RetryPolicy policy;
    policy.initialBackoff = milliseconds(5);
    policy.maxBackoff = milliseconds(20);
    policy.attemptTimeout = milliseconds(1000);
    return policy;
}

/**
 * Store recording every successful call; the first failuresLeft attempts throw
 */
class ScriptedStore : public PersistenceStore {
public:
    explicit ScriptedStore(int failures = 0, milliseconds firstAttemptDelay = milliseconds(0))
        : failuresLeft_(failures)
        , firstAttemptDelay_(firstAttemptDelay)
    {
    }

    void ensurePlayersExist(const StoreContext& ctx, const std::vector<PlayerId>& names) override {
        call(ctx, "ensure:" + join(names));
    }

    void recordGoalEvent(const StoreContext& ctx, const GoalEvent& event) override {
        call(ctx, "goal:" + event.gameId);
    }

    std::vector<std::string> log() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_;
    }

    int attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

private:
    void call(const StoreContext& ctx, const std::string& entry) {
        bool first = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            first = attempts_++ == 0;
            if (failuresLeft_ > 0) {
                failuresLeft_--;
                throw StoreError("scripted failure");
            }
        }
        if (first && firstAttemptDelay_.count() > 0) {
            std::this_thread::sleep_for(firstAttemptDelay_);
        }
        ctx.checkDeadline("scripted");
        std::lock_guard<std::mutex> lock(mutex_);
        log_.push_back(entry);
    }

    int failuresLeft_;
    milliseconds firstAttemptDelay_;
    int attempts_ = 0;
    std::vector<std::string> log_;
    mutable std::mutex mutex_;
};

GoalEvent goal(const std::string& gameId) {
    GoalEvent event;
    event.gameId = gameId;
    return event;
}

template<typename Pred>
bool waitUntil(Pred pred, milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(milliseconds(1));
    }
    return true;
}

void deliversInOrder(TestResult& r) {
    auto store = std::make_shared<ScriptedStore>();
    PersistenceQueue queue(store, fastPolicy());

    queue.ensurePlayersExist({"a", "b"});
    queue.recordGoalEvent(goal("g1"));
    queue.ensurePlayersExist({"c"});
    queue.recordGoalEvent(goal("g2"));

    r.check(queue.waitIdle(milliseconds(2000)), "queue should drain");
    checkIds(r, store->log(), {"ensure:[a,b]", "goal:g1", "ensure:[c]", "goal:g2"}, "delivery order");
    r.check(queue.deliveredCount() == 4, "four operations delivered");
    r.check(queue.pending() == 0, "nothing pending");
}

void emptyEnsureSkipped(TestResult& r) {
    auto store = std::make_shared<ScriptedStore>();
    PersistenceQueue queue(store, fastPolicy());
    queue.ensurePlayersExist({});
    r.check(queue.waitIdle(milliseconds(500)), "queue should be idle");
    r.check(store->attempts() == 0, "empty name list never reaches the store");
}

void retriesAndBlocksLaterOps(TestResult& r) {
    auto store = std::make_shared<ScriptedStore>(3);
    PersistenceQueue queue(store, fastPolicy());

    queue.recordGoalEvent(goal("g1"));
    queue.recordGoalEvent(goal("g2"));

    r.check(queue.waitIdle(milliseconds(3000)), "queue should drain after retries");
    checkIds(r, store->log(), {"goal:g1", "goal:g2"}, "failed head delivered before its successors");
    r.check(queue.failedAttemptCount() == 3, "three failed attempts");
    r.check(store->attempts() == 5, "three failures then two successes");
}

void disabledWithoutStore(TestResult& r) {
    PersistenceQueue queue(nullptr, fastPolicy());
    r.check(!queue.enabled(), "queue without store is disabled");
    queue.ensurePlayersExist({"a"});
    queue.recordGoalEvent(goal("g1"));
    r.check(queue.pending() == 0, "disabled queue holds nothing");
    r.check(queue.waitIdle(milliseconds(10)), "disabled queue is always idle");
    queue.shutdown();
}

void shutdownInterruptsBackoff(TestResult& r) {
    auto store = std::make_shared<ScriptedStore>(1000);
    RetryPolicy slow;
    slow.initialBackoff = milliseconds(10000);
    slow.maxBackoff = milliseconds(60000);
    PersistenceQueue queue(store, slow);

    queue.recordGoalEvent(goal("g1"));
    queue.recordGoalEvent(goal("g2"));
    r.check(waitUntil([&] { return queue.failedAttemptCount() >= 1; }, milliseconds(2000)),
            "first attempt should fail");
    r.check(!queue.waitIdle(milliseconds(20)), "queue is not idle while retrying");
    r.check(queue.pending() == 2, "failed head and its successor stay queued");

    auto start = std::chrono::steady_clock::now();
    queue.shutdown();
    auto elapsed = std::chrono::steady_clock::now() - start;
    r.check(elapsed < milliseconds(2000), "shutdown must not wait out the backoff");
    r.check(queue.pending() == 0, "shutdown drops undelivered operations");
    r.check(queue.deliveredCount() == 0, "nothing was delivered");

    queue.recordGoalEvent(goal("g3"));
    r.check(queue.pending() == 0, "submit after shutdown is ignored");
}

void concurrentShutdown(TestResult& r) {
    auto store = std::make_shared<ScriptedStore>(1000);
    RetryPolicy slow;
    slow.initialBackoff = milliseconds(10000);
    auto queue = std::make_unique<PersistenceQueue>(store, slow);

    queue->recordGoalEvent(goal("g1"));
    r.check(waitUntil([&] { return queue->failedAttemptCount() >= 1; }, milliseconds(2000)),
            "worker should be backing off");

    std::vector<std::thread> stoppers;
    for (int i = 0; i < 4; ++i) {
        stoppers.emplace_back([&queue] { queue->shutdown(); });
    }
    for (auto& t : stoppers) {
        t.join();
    }
    r.check(queue->pending() == 0, "queue emptied once");
    queue.reset();
    r.check(store->log().empty(), "nothing delivered");
}

void attemptDeadline(TestResult& r) {
    auto store = std::make_shared<ScriptedStore>(0, milliseconds(100));
    RetryPolicy policy = fastPolicy();
    policy.attemptTimeout = milliseconds(20);
    PersistenceQueue queue(store, policy);

    queue.recordGoalEvent(goal("g1"));
    r.check(queue.waitIdle(milliseconds(3000)), "queue should drain");
    r.check(queue.failedAttemptCount() == 1, "slow first attempt times out");
    checkIds(r, store->log(), {"goal:g1"}, "second attempt commits once");
}

void retryStateBackoff(TestResult& r) {
    RetryPolicy policy;
    policy.initialBackoff = milliseconds(1000);
    policy.maxBackoff = milliseconds(5000);
    RetryState retry(policy);
    r.check(retry.phase() == RetryState::Phase::ATTEMPT, "starts in ATTEMPT");

    std::vector<long long> waits;
    for (int i = 0; i < 5; ++i) {
        retry.onFailure();
        r.check(retry.phase() == RetryState::Phase::WAITING, "failure enters WAITING");
        waits.push_back(static_cast<long long>(retry.currentBackoff().count()));
        retry.onWaitElapsed();
    }
    r.check(waits == std::vector<long long>{1000, 2000, 4000, 5000, 5000},
            "backoff doubles from the initial value up to the cap");

    retry.onSuccess();
    r.check(retry.phase() == RetryState::Phase::DONE, "success ends in DONE");
    r.check(retry.attempts() == 6, "every attempt counted");
}

void retryStateInitialAboveCap(TestResult& r) {
    RetryPolicy policy;
    policy.initialBackoff = milliseconds(90000);
    policy.maxBackoff = milliseconds(60000);
    RetryState retry(policy);
    retry.onFailure();
    r.check(retry.currentBackoff() == milliseconds(60000), "initial backoff clamped to the cap");
}

void expiredContext(TestResult& r) {
    StoreContext ctx = StoreContext::withTimeout(milliseconds(0));
    r.check(ctx.expired(), "zero timeout is already expired");
    bool threw = false;
    try {
        ctx.checkDeadline("op");
    } catch (const StoreError&) {
        threw = true;
    }
    r.check(threw, "checkDeadline throws StoreError once expired");
    r.check(!StoreContext::withTimeout(milliseconds(60000)).expired(), "long timeout not expired");
}

} // namespace

TestSuite persistenceQueueSuite() {
    return TestSuite{"persistence_queue", {
        {"in_order", "operations reach the store in submission order", deliversInOrder},
        {"empty_ensure", "empty ensure requests are skipped", emptyEnsureSkipped},
        {"retry_blocks", "a failing head is retried and blocks later operations", retriesAndBlocksLaterOps},
        {"disabled", "without a store every submit is a no-op", disabledWithoutStore},
        {"shutdown", "shutdown interrupts backoff and drops queued operations", shutdownInterruptsBackoff},
        {"concurrent_shutdown", "shutdown from several threads joins the worker once", concurrentShutdown},
        {"attempt_deadline", "attempts past their deadline fail and are retried", attemptDeadline},
        {"retry_state", "backoff doubles and stays at the cap", retryStateBackoff},
        {"retry_state_clamp", "an initial backoff above the cap is clamped", retryStateInitialAboveCap},
        {"store_context", "expired contexts reject commits", expiredContext},
    }};
}

} // namespace Test

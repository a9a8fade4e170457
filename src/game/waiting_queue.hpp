#ifndef WAITING_QUEUE_HPP
#define WAITING_QUEUE_HPP

#include "../common/types.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace kott {

/**
 * WaitingQueue - Growable circular-buffer FIFO of waiting players
 *
 * - enqueue: append at the logical tail, doubling capacity when full
 * - dequeue: remove the logical head
 * - removeValue: drop the first occurrence, keeping the order of the rest
 *
 * Identifier-agnostic: duplicates are the caller's concern.
 * Not thread-safe; owned by a GameState under the GameStore lock.
 */
class WaitingQueue {
public:
    explicit WaitingQueue(size_t capacity = 1);

    /**
     * Build a queue holding ids in order
     */
    static WaitingQueue fromSequence(const std::vector<PlayerId>& ids, size_t minCapacity = 1);

    void enqueue(PlayerId id);

    /**
     * Remove and return the head
     * Returns nullopt if the queue is empty
     */
    std::optional<PlayerId> dequeue();

    /**
     * Remove the first occurrence of id in FIFO order
     * Returns false if id is not queued
     */
    bool removeValue(const PlayerId& id);

    bool contains(const PlayerId& id) const;

    /**
     * Copy of the contents, head first
     */
    std::vector<PlayerId> snapshot() const;

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    size_t capacity() const { return data_.size(); }

private:
    size_t physicalIndex(size_t logical) const {
        return (head_ + logical) % data_.size();
    }

    /**
     * Copy the live elements in FIFO order into a buffer of newCapacity,
     * then reset head to 0 and tail to size
     */
    void rebuild(size_t newCapacity);

private:
    std::vector<PlayerId> data_;
    size_t head_ = 0;
    size_t tail_ = 0;
    size_t size_ = 0;
};

} // namespace kott

#endif // WAITING_QUEUE_HPP

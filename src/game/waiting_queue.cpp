#include "waiting_queue.hpp"
#include <algorithm>
#include <utility>

namespace kott {

WaitingQueue::WaitingQueue(size_t capacity)
    : data_(std::max<size_t>(capacity, 1))
{
}

WaitingQueue WaitingQueue::fromSequence(const std::vector<PlayerId>& ids, size_t minCapacity) {
    WaitingQueue queue(std::max(minCapacity, ids.size()));
    for (const auto& id : ids) {
        queue.enqueue(id);
    }
    return queue;
}

void WaitingQueue::enqueue(PlayerId id) {
    if (size_ == data_.size()) {
        rebuild(data_.size() * 2);
    }
    data_[tail_] = std::move(id);
    tail_ = (tail_ + 1) % data_.size();
    size_++;
}

std::optional<PlayerId> WaitingQueue::dequeue() {
    if (size_ == 0) {
        return std::nullopt;
    }
    PlayerId id = std::move(data_[head_]);
    data_[head_].clear();
    head_ = (head_ + 1) % data_.size();
    size_--;
    return id;
}

bool WaitingQueue::removeValue(const PlayerId& id) {
    for (size_t i = 0; i < size_; ++i) {
        if (data_[physicalIndex(i)] != id) continue;

        // Shift the remainder one step towards the head, then retract the tail
        for (size_t j = i; j + 1 < size_; ++j) {
            data_[physicalIndex(j)] = std::move(data_[physicalIndex(j + 1)]);
        }
        tail_ = (tail_ + data_.size() - 1) % data_.size();
        data_[tail_].clear();
        size_--;
        return true;
    }
    return false;
}

bool WaitingQueue::contains(const PlayerId& id) const {
    for (size_t i = 0; i < size_; ++i) {
        if (data_[physicalIndex(i)] == id) return true;
    }
    return false;
}

std::vector<PlayerId> WaitingQueue::snapshot() const {
    std::vector<PlayerId> out;
    out.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        out.push_back(data_[physicalIndex(i)]);
    }
    return out;
}

void WaitingQueue::rebuild(size_t newCapacity) {
    std::vector<PlayerId> next(std::max<size_t>(newCapacity, 1));
    for (size_t i = 0; i < size_; ++i) {
        next[i] = std::move(data_[physicalIndex(i)]);
    }
    data_ = std::move(next);
    head_ = 0;
    tail_ = size_ % data_.size();
}

} // namespace kott

#pragma once

#include <cstddef>
#include <deque>
#include <sklib/concurrent/mutexed_value.hh>
#include <sklib/concurrent/semaphore.hh>

namespace concurrent {

// FIFO queue with non-blocking push() and blocking pop(). If max_size is
// non-zero and the queue is full, push() drops the oldest element instead of
// blocking.
template <class Elem>
class BlockingQueue {
private:
    size_t max_size_;
    Semaphore queued_elems_{0};
    MutexedValue<std::deque<Elem>> elems_;

public:
    explicit BlockingQueue(size_t max_size = 0)
    : max_size_(max_size) {}

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue(BlockingQueue&&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;
    BlockingQueue& operator=(BlockingQueue&&) = delete;

    ~BlockingQueue() = default;

    // Returns true iff the oldest element had to be dropped to make room
    bool push(Elem elem) {
        return elems_.perform([&](auto& elems) {
            if (max_size_ > 0 and elems.size() >= max_size_) {
                // The dropped element's semaphore unit is taken over by the new one
                elems.pop_front();
                elems.emplace_back(std::move(elem));
                return true;
            }

            elems.emplace_back(std::move(elem));
            queued_elems_.post();
            return false;
        });
    }

    // Like push() but ignores max_size
    void force_push(Elem elem) {
        elems_.perform([&](auto& elems) {
            elems.emplace_back(std::move(elem));
            queued_elems_.post();
        });
    }

    // Blocks until an element is available
    Elem pop() {
        queued_elems_.wait();
        return elems_.perform([&](auto& elems) {
            Elem elem = std::move(elems.front());
            elems.pop_front();
            return elem;
        });
    }

    size_t size() {
        return elems_.perform([](auto& elems) { return elems.size(); });
    }
};

} // namespace concurrent

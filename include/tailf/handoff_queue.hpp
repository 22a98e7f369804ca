#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "tailf/chunk.hpp"

namespace tailf {

// Unbounded single-producer/single-consumer handoff between the watcher
// thread and the reader. push never blocks; pop blocks until a chunk arrives
// or the queue is cancelled.
class HandoffQueue {
public:
    HandoffQueue() = default;

    HandoffQueue(const HandoffQueue&) = delete;
    HandoffQueue& operator=(const HandoffQueue&) = delete;

    void push(Chunk chunk);

    // nullopt only after cancel()
    [[nodiscard]] std::optional<Chunk> pop();

    // nullopt on timeout or after cancel()
    template <typename Rep, typename Period>
    [[nodiscard]] std::optional<Chunk> pop_for(const std::chrono::duration<Rep, Period>& timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return cancelled_ || !chunks_.empty(); }))
            return std::nullopt;
        return take_locked();
    }

    // Wakes every blocked pop; they and all later pops return nullopt.
    void cancel();

    [[nodiscard]] bool cancelled() const;
    [[nodiscard]] std::size_t size() const;

private:
    std::optional<Chunk> take_locked();

    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<Chunk>       chunks_;
    bool                    cancelled_ = false;
};

} // namespace tailf

#include "tailf/handoff_queue.hpp"

#include <utility>

namespace tailf {

void HandoffQueue::push(Chunk chunk)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_.push_back(std::move(chunk));
    }
    cv_.notify_one();
}

std::optional<Chunk> HandoffQueue::pop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return cancelled_ || !chunks_.empty(); });
    return take_locked();
}

void HandoffQueue::cancel()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) return;
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool HandoffQueue::cancelled() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

std::size_t HandoffQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

std::optional<Chunk> HandoffQueue::take_locked()
{
    if (cancelled_) return std::nullopt;
    Chunk c = std::move(chunks_.front());
    chunks_.pop_front();
    return c;
}

} // namespace tailf

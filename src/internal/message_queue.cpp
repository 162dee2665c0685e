#include "message_queue.hpp"

namespace agentwire
{
namespace internal
{

void MessageQueue::push(Message message)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(Item{std::move(message), nullptr});
    }
    cv_.notify_all();
}

void MessageQueue::push_error(std::exception_ptr error)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(Item{std::nullopt, std::move(error)});
    }
    cv_.notify_all();
}

void MessageQueue::finish(std::exception_ptr error)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_)
            return;
        if (error)
            queue_.push_back(Item{std::nullopt, std::move(error)});
        finished_ = true;
    }
    cv_.notify_all();
}

std::optional<Message> MessageQueue::pop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || finished_; });
    return take_front();
}

std::optional<Message> MessageQueue::pop_for(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || finished_; }))
        return std::nullopt;
    return take_front();
}

bool MessageQueue::has_more() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !queue_.empty() || !finished_;
}

// Requires mutex_ held
std::optional<Message> MessageQueue::take_front()
{
    if (queue_.empty())
        return std::nullopt;

    Item item = std::move(queue_.front());
    queue_.pop_front();

    if (item.error)
        std::rethrow_exception(item.error);
    return std::move(item.message);
}

} // namespace internal
} // namespace agentwire

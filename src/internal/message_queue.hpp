#ifndef AGENTWIRE_INTERNAL_MESSAGE_QUEUE_HPP
#define AGENTWIRE_INTERNAL_MESSAGE_QUEUE_HPP

#include <agentwire/types.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>

namespace agentwire
{
namespace internal
{

// Thread-safe queue of decoded output messages, interleaved with the decode
// errors the reader hit on the way. Single producer (the reader thread).
class MessageQueue
{
  public:
    void push(Message message);

    // Route a failure to the consumer in arrival order
    void push_error(std::exception_ptr error);

    // No more items after the queued ones. A non-null error is delivered last.
    void finish(std::exception_ptr error = nullptr);

    // Blocking. std::nullopt once finished and drained; rethrows routed errors.
    std::optional<Message> pop();

    // As pop(), but also std::nullopt when nothing arrives within timeout
    std::optional<Message> pop_for(std::chrono::milliseconds timeout);

    // True while items are queued or more may arrive
    bool has_more() const;

  private:
    struct Item
    {
        std::optional<Message> message;
        std::exception_ptr error;
    };

    std::optional<Message> take_front();

    std::deque<Item> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool finished_ = false;
};

} // namespace internal
} // namespace agentwire

#endif // AGENTWIRE_INTERNAL_MESSAGE_QUEUE_HPP

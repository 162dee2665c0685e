#ifndef AGENTWIRE_CANCELLATION_HPP
#define AGENTWIRE_CANCELLATION_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace agentwire
{

namespace detail
{
struct CancellationState
{
    std::mutex mutex;
    bool cancelled = false;
    std::uint64_t next_id = 1;
    std::map<std::uint64_t, std::function<void()>> callbacks;
};
} // namespace detail

class CancellationToken;

// Unregisters a cancellation callback when destroyed
class CancellationRegistration
{
  public:
    CancellationRegistration() = default;
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    void reset();

  private:
    friend class CancellationToken;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, std::uint64_t id)
        : state_(std::move(state)), id_(id)
    {
    }

    std::weak_ptr<detail::CancellationState> state_;
    std::uint64_t id_ = 0;
};

/**
 * Read side of a cancellation signal.
 *
 * A default-constructed token can never be cancelled. Tokens are cheap to copy
 * and may outlive the source that issued them.
 */
class CancellationToken
{
  public:
    CancellationToken() = default;

    bool is_cancelled() const;
    bool can_be_cancelled() const
    {
        return state_ != nullptr;
    }

    /**
     * Run callback when the token is cancelled.
     * If the token is already cancelled the callback runs immediately on the
     * calling thread. Callbacks must not throw.
     */
    CancellationRegistration on_cancel(std::function<void()> callback) const;

  private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state))
    {
    }

    std::shared_ptr<detail::CancellationState> state_;
};

// Write side of a cancellation signal
class CancellationSource
{
  public:
    CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

    CancellationToken token() const
    {
        return CancellationToken(state_);
    }

    // Idempotent; registered callbacks run once on the cancelling thread
    void cancel();

    bool is_cancelled() const;

  private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace agentwire

#endif // AGENTWIRE_CANCELLATION_HPP

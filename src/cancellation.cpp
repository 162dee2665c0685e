#include <agentwire/cancellation.hpp>
#include <vector>

namespace agentwire
{

// ============================================================================
// CancellationRegistration
// ============================================================================

CancellationRegistration::~CancellationRegistration()
{
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_)
{
    other.id_ = 0;
}

CancellationRegistration&
CancellationRegistration::operator=(CancellationRegistration&& other) noexcept
{
    if (this != &other)
    {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancellationRegistration::reset()
{
    if (id_ == 0)
        return;

    if (auto state = state_.lock())
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

// ============================================================================
// CancellationToken
// ============================================================================

bool CancellationToken::is_cancelled() const
{
    if (!state_)
        return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationRegistration CancellationToken::on_cancel(std::function<void()> callback) const
{
    if (!state_)
        return {};

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled)
        {
            std::uint64_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration(state_, id);
        }
    }

    // Already cancelled
    callback();
    return {};
}

// ============================================================================
// CancellationSource
// ============================================================================

void CancellationSource::cancel()
{
    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled)
            return;
        state_->cancelled = true;
        for (auto& [id, callback] : state_->callbacks)
            to_run.push_back(std::move(callback));
        state_->callbacks.clear();
    }

    for (auto& callback : to_run)
        callback();
}

bool CancellationSource::is_cancelled() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

} // namespace agentwire

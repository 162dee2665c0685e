#include <agentwire/errors.hpp>
#include <agentwire/memory_transport.hpp>

namespace agentwire
{

namespace
{
std::string strip_newline(const std::string& data)
{
    std::string line = data;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        line.pop_back();
    return line;
}
} // namespace

// ============================================================================
// MemoryTransport::Peer
// ============================================================================

void MemoryTransport::Peer::push_line(const std::string& line)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_.push_back(line);
    }
    cv_.notify_all();
}

void MemoryTransport::Peer::push_message(const json& message)
{
    push_line(message.dump());
}

void MemoryTransport::Peer::finish()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

std::vector<std::string> MemoryTransport::Peer::written_lines() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

std::vector<json> MemoryTransport::Peer::written_messages() const
{
    std::vector<json> messages;
    for (const auto& line : written_lines())
        messages.push_back(json::parse(line));
    return messages;
}

bool MemoryTransport::Peer::wait_for_writes(std::size_t count,
                                            std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, count] { return written_.size() >= count; });
}

void MemoryTransport::Peer::set_responder(Responder responder)
{
    std::lock_guard<std::mutex> lock(mutex_);
    responder_ = std::make_shared<Responder>(std::move(responder));
}

bool MemoryTransport::Peer::input_ended() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return input_ended_;
}

bool MemoryTransport::Peer::closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

int MemoryTransport::Peer::connect_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return connect_count_;
}

// ============================================================================
// MemoryTransport
// ============================================================================

MemoryTransport::MemoryTransport() : peer_(std::make_shared<Peer>()) {}

MemoryTransport::~MemoryTransport()
{
    close();
}

void MemoryTransport::connect()
{
    std::lock_guard<std::mutex> lock(peer_->mutex_);
    if (peer_->closed_)
        throw ConnectionError("Transport has been closed");
    peer_->connected_ = true;
    ++peer_->connect_count_;
}

void MemoryTransport::write(const std::string& data)
{
    std::string line = strip_newline(data);
    std::shared_ptr<Responder> responder;
    {
        std::lock_guard<std::mutex> lock(peer_->mutex_);
        if (!peer_->connected_ || peer_->closed_ || peer_->input_ended_)
            throw ConnectionError("Transport is not ready for writing");
        peer_->written_.push_back(line);
        responder = peer_->responder_;
    }
    peer_->cv_.notify_all();

    if (!responder || !*responder)
        return;

    json written = json::parse(line, nullptr, false);
    if (written.is_discarded())
        return;
    (*responder)(written, *peer_);
}

std::optional<json> MemoryTransport::read_message()
{
    std::string line;
    {
        std::unique_lock<std::mutex> lock(peer_->mutex_);
        peer_->cv_.wait(lock, [this]
                        { return !peer_->inbound_.empty() || peer_->finished_ || peer_->closed_; });

        if (peer_->closed_ || peer_->inbound_.empty())
            return std::nullopt;

        line = std::move(peer_->inbound_.front());
        peer_->inbound_.pop_front();
    }

    try
    {
        return json::parse(line);
    }
    catch (const json::parse_error& e)
    {
        throw JSONDecodeError(std::string("JSON parse error: ") + e.what(), line);
    }
}

void MemoryTransport::end_input()
{
    std::lock_guard<std::mutex> lock(peer_->mutex_);
    peer_->input_ended_ = true;
}

void MemoryTransport::close()
{
    {
        std::lock_guard<std::mutex> lock(peer_->mutex_);
        peer_->closed_ = true;
    }
    peer_->cv_.notify_all();
}

bool MemoryTransport::is_ready() const
{
    std::lock_guard<std::mutex> lock(peer_->mutex_);
    return peer_->connected_ && !peer_->closed_ && !peer_->input_ended_;
}

} // namespace agentwire

#include "internal/config.hpp"
#include "internal/engine.hpp"
#include "internal/hook_registry.hpp"
#include "internal/log.hpp"
#include "internal/message_queue.hpp"

#include <agentwire/client.hpp>
#include <agentwire/errors.hpp>
#include <stdexcept>

namespace agentwire
{

// ============================================================================
// AgentClient::Impl
// ============================================================================

class AgentClient::Impl
{
  public:
    AgentOptions options_;
    std::unique_ptr<Transport> transport_;

    // Built on connect(); the registry outlives the engine that references it
    std::unique_ptr<internal::HookRegistry> hooks_;
    std::unique_ptr<internal::Engine> engine_;

    Impl(AgentOptions options, std::unique_ptr<Transport> transport)
        : options_(std::move(options)), transport_(std::move(transport))
    {
        if (!transport_)
            throw ConnectionError("AgentClient requires a transport");
    }

    ~Impl()
    {
        if (engine_)
            engine_->close();
    }

    internal::Engine& ready_engine(const char* operation)
    {
        if (!engine_ || engine_->state() != ConnectionState::Ready)
        {
            std::string state = engine_ ? to_string(engine_->state()) : "disconnected";
            throw ConnectionError(std::string("Cannot ") + operation + ": client is " + state);
        }
        return *engine_;
    }
};

// ============================================================================
// AgentClient implementation
// ============================================================================

AgentClient::AgentClient(AgentOptions options, std::unique_ptr<Transport> transport)
    : impl_(std::make_unique<Impl>(std::move(options), std::move(transport)))
{
}

AgentClient::~AgentClient()
{
    if (impl_)
        disconnect();
}

AgentClient::AgentClient(AgentClient&&) noexcept = default;
AgentClient& AgentClient::operator=(AgentClient&&) noexcept = default;

void AgentClient::connect(const std::optional<std::string>& initial_prompt)
{
    if (impl_->engine_)
    {
        if (impl_->engine_->state() == ConnectionState::Closed)
            throw ConnectionError("Client has been disconnected and cannot reconnect");
        throw ConnectionError("Client is already connected");
    }

    impl_->hooks_ = std::make_unique<internal::HookRegistry>(impl_->options_.hooks);
    impl_->engine_ = std::make_unique<internal::Engine>(
        std::move(impl_->transport_), *impl_->hooks_, impl_->options_.permission_callback,
        internal::Logger(impl_->options_.log_callback), impl_->options_.control_request_timeout);

    impl_->engine_->start();
    impl_->engine_->initialize(internal::initialize_timeout(impl_->options_));

    if (initial_prompt.has_value())
        send_query(*initial_prompt);
}

void AgentClient::disconnect()
{
    if (impl_ && impl_->engine_)
        impl_->engine_->close();
}

bool AgentClient::is_connected() const
{
    return state() == ConnectionState::Ready;
}

ConnectionState AgentClient::state() const
{
    if (!impl_ || !impl_->engine_)
        return ConnectionState::Disconnected;
    return impl_->engine_->state();
}

void AgentClient::send_query(const std::string& prompt, const std::string& session_id)
{
    auto& engine = impl_->ready_engine("send query");

    engine.begin_turn();

    json msg = {{"type", "user"},
                {"message", {{"role", "user"}, {"content", prompt}}},
                {"parent_tool_use_id", nullptr},
                {"session_id", session_id}};
    engine.write_message(msg);
}

MessageStream AgentClient::receive_messages()
{
    if (!impl_->engine_)
        throw ConnectionError("Cannot receive messages: client is disconnected");
    return MessageStream(impl_->engine_->messages(), false);
}

MessageStream AgentClient::receive_response()
{
    if (!impl_->engine_)
        throw ConnectionError("Cannot receive messages: client is disconnected");
    return MessageStream(impl_->engine_->messages(), true);
}

bool AgentClient::wait_for_result(std::chrono::milliseconds timeout)
{
    if (!impl_->engine_)
        return false;
    return impl_->engine_->wait_for_result(timeout);
}

void AgentClient::end_input()
{
    if (!impl_->engine_)
        throw ConnectionError("Cannot end input: client is disconnected");
    impl_->engine_->end_input();
}

void AgentClient::interrupt(const CancellationToken& cancel)
{
    impl_->ready_engine("interrupt").interrupt(cancel);
}

void AgentClient::set_permission_mode(const std::string& mode, const CancellationToken& cancel)
{
    impl_->ready_engine("set permission mode").set_permission_mode(mode, cancel);
}

void AgentClient::set_model(const std::optional<std::string>& model,
                            const CancellationToken& cancel)
{
    impl_->ready_engine("set model").set_model(model, cancel);
}

void AgentClient::rewind_files(const std::string& user_message_id,
                               const CancellationToken& cancel)
{
    impl_->ready_engine("rewind files").rewind_files(user_message_id, cancel);
}

std::optional<json> AgentClient::get_server_info() const
{
    if (!impl_ || !impl_->engine_)
        return std::nullopt;
    return impl_->engine_->server_info();
}

const AgentOptions& AgentClient::options() const
{
    return impl_->options_;
}

// ============================================================================
// MessageStream implementation
// ============================================================================

MessageStream::MessageStream(std::shared_ptr<internal::MessageQueue> queue, bool until_result)
    : queue_(std::move(queue)), until_result_(until_result)
{
}

MessageStream::~MessageStream() = default;

MessageStream::MessageStream(MessageStream&&) noexcept = default;
MessageStream& MessageStream::operator=(MessageStream&&) noexcept = default;

MessageStream::Iterator MessageStream::begin()
{
    return Iterator(this);
}

MessageStream::Iterator MessageStream::end()
{
    return Iterator();
}

std::optional<Message> MessageStream::get_next()
{
    if (done_)
        return std::nullopt;
    return track(queue_->pop());
}

std::optional<Message> MessageStream::get_next_for(std::chrono::milliseconds timeout)
{
    if (done_)
        return std::nullopt;
    return track(queue_->pop_for(timeout));
}

bool MessageStream::has_more() const
{
    return !done_ && queue_->has_more();
}

std::optional<Message> MessageStream::track(std::optional<Message> message)
{
    if (message && until_result_ && is_result_message(*message))
        done_ = true;
    return message;
}

// ============================================================================
// MessageStream::Iterator implementation
// ============================================================================

MessageStream::Iterator::Iterator() : stream_(nullptr), is_end_(true) {}

MessageStream::Iterator::Iterator(MessageStream* stream) : stream_(stream), is_end_(false)
{
    fetch_next();
}

void MessageStream::Iterator::fetch_next()
{
    if (!stream_)
    {
        is_end_ = true;
        return;
    }

    current_ = stream_->get_next();
    if (!current_)
        is_end_ = true;
}

MessageStream::Iterator::reference MessageStream::Iterator::operator*() const
{
    if (!current_)
        throw std::out_of_range("Dereferencing end iterator");
    return *current_;
}

MessageStream::Iterator::pointer MessageStream::Iterator::operator->() const
{
    return &(operator*());
}

MessageStream::Iterator& MessageStream::Iterator::operator++()
{
    fetch_next();
    return *this;
}

bool MessageStream::Iterator::operator==(const Iterator& other) const
{
    if (is_end_ && other.is_end_)
        return true;
    if (is_end_ || other.is_end_)
        return false;
    return stream_ == other.stream_;
}

bool MessageStream::Iterator::operator!=(const Iterator& other) const
{
    return !(*this == other);
}

} // namespace agentwire

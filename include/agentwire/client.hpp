#ifndef AGENTWIRE_CLIENT_HPP
#define AGENTWIRE_CLIENT_HPP

#include <agentwire/cancellation.hpp>
#include <agentwire/connection_state.hpp>
#include <agentwire/options.hpp>
#include <agentwire/transport.hpp>
#include <agentwire/types.hpp>
#include <chrono>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

namespace agentwire
{

namespace internal
{
class MessageQueue;
}

/**
 * Stream of output messages from the agent.
 *
 * Every stream obtained from one client reads the same underlying queue, so
 * each message is delivered once, to whichever stream asks first. Decode
 * errors are rethrown from the call that would have returned the message.
 */
class MessageStream
{
  public:
    class Iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Message;
        using difference_type = std::ptrdiff_t;
        using pointer = const Message*;
        using reference = const Message&;

        Iterator();
        explicit Iterator(MessageStream* stream);

        reference operator*() const;
        pointer operator->() const;
        Iterator& operator++();

        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const;

      private:
        MessageStream* stream_;
        std::optional<Message> current_;
        bool is_end_;

        void fetch_next();
    };

    ~MessageStream();

    // No copy, move only
    MessageStream(const MessageStream&) = delete;
    MessageStream& operator=(const MessageStream&) = delete;
    MessageStream(MessageStream&&) noexcept;
    MessageStream& operator=(MessageStream&&) noexcept;

    Iterator begin();
    Iterator end();

    // Get next message (blocking); std::nullopt at end of stream
    std::optional<Message> get_next();

    // Get next message with timeout (returns nullopt on timeout or end)
    std::optional<Message> get_next_for(std::chrono::milliseconds timeout);

    // False once the stream has ended
    bool has_more() const;

  private:
    friend class AgentClient;

    MessageStream(std::shared_ptr<internal::MessageQueue> queue, bool until_result);

    std::optional<Message> track(std::optional<Message> message);

    std::shared_ptr<internal::MessageQueue> queue_;
    bool until_result_;
    bool done_ = false;
};

/**
 * Session with one agent over a caller-supplied transport.
 *
 * Typical use:
 * ```cpp
 * AgentClient client(options, std::move(transport));
 * client.connect();
 * client.send_query("What is 2 + 2?");
 * for (const auto& msg : client.receive_response())
 *     ...
 * client.disconnect();
 * ```
 */
class AgentClient
{
  public:
    AgentClient(AgentOptions options, std::unique_ptr<Transport> transport);
    ~AgentClient();

    // No copy, move only
    AgentClient(const AgentClient&) = delete;
    AgentClient& operator=(const AgentClient&) = delete;
    AgentClient(AgentClient&&) noexcept;
    AgentClient& operator=(AgentClient&&) noexcept;

    /**
     * Connect the transport and perform the initialize handshake.
     *
     * @param initial_prompt Sent as the first query once the session is ready
     * @throws ConnectionError if already connected or the handshake fails
     * @throws ControlRequestError if the agent rejects or never answers initialize
     */
    void connect(const std::optional<std::string>& initial_prompt = std::nullopt);

    // Close the session; idempotent. Fails in-flight control requests.
    void disconnect();

    bool is_connected() const;
    ConnectionState state() const;

    // Send a user turn. Throws ConnectionError unless connected.
    void send_query(const std::string& prompt, const std::string& session_id = "default");

    // Every output message until the connection ends
    MessageStream receive_messages();

    // Output messages up to and including the next ResultMessage
    MessageStream receive_response();

    // Block until the current turn's ResultMessage arrived (true) or timeout
    bool wait_for_result(std::chrono::milliseconds timeout);

    // Close the agent's input; no further queries or control responses
    void end_input();

    // Control operations (Ready only)
    void interrupt(const CancellationToken& cancel = {});
    void set_permission_mode(const std::string& mode, const CancellationToken& cancel = {});
    // std::nullopt resets to the agent's default model
    void set_model(const std::optional<std::string>& model, const CancellationToken& cancel = {});
    void rewind_files(const std::string& user_message_id, const CancellationToken& cancel = {});

    // Payload of the initialize response, once connected
    std::optional<json> get_server_info() const;

    const AgentOptions& options() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace agentwire

#endif // AGENTWIRE_CLIENT_HPP

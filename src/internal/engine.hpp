#ifndef AGENTWIRE_INTERNAL_ENGINE_HPP
#define AGENTWIRE_INTERNAL_ENGINE_HPP

#include "hook_registry.hpp"
#include "log.hpp"
#include "message_queue.hpp"

#include <agentwire/cancellation.hpp>
#include <agentwire/connection_state.hpp>
#include <agentwire/permissions.hpp>
#include <agentwire/protocol/control.hpp>
#include <agentwire/transport.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace agentwire
{
namespace internal
{

/**
 * Control protocol engine for one connection.
 *
 * Owns the transport and a single reader thread that routes every inbound
 * object: control responses resolve pending requests, control requests are
 * answered on worker tasks, everything else is decoded and queued for the
 * consumer in arrival order.
 */
class Engine
{
  public:
    Engine(std::unique_ptr<Transport> transport, const HookRegistry& hooks,
           std::optional<PermissionCallback> permission_callback, Logger logger,
           std::chrono::milliseconds control_request_timeout =
               protocol::ControlProtocol::kDefaultTimeout);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Disconnected -> Connecting: connect the transport and start the reader
    void start();

    // Initialize handshake; Connecting -> Ready. Closes the engine on failure.
    json initialize(std::chrono::milliseconds timeout);

    // Send an outbound control request and wait for its response payload
    json send_control_request(const std::string& subtype, const json& data,
                              std::chrono::milliseconds timeout,
                              const CancellationToken& cancel = {});

    // Answer an inbound control request; returns the control_response envelope
    json handle_control_request(const protocol::ControlRequest& request);

    // handle_control_request() and write the envelope
    void dispatch_control_request(const protocol::ControlRequest& request);

    // Serialize and write one line
    void write_message(const json& message);

    void interrupt(const CancellationToken& cancel = {});
    void set_permission_mode(const std::string& mode, const CancellationToken& cancel = {});
    void set_model(const std::optional<std::string>& model, const CancellationToken& cancel = {});
    void rewind_files(const std::string& user_message_id, const CancellationToken& cancel = {});

    // Start tracking a new turn for wait_for_result()
    void begin_turn();

    // True once a ResultMessage arrived since begin_turn(); false on timeout or
    // when the reader stopped first
    bool wait_for_result(std::chrono::milliseconds timeout);

    void end_input();

    // Idempotent teardown; fails in-flight requests with ConnectionClosed.
    // May be called from a permission or hook callback.
    void close();

    ConnectionState state() const;
    std::optional<json> server_info() const;

    std::shared_ptr<MessageQueue> messages() const
    {
        return messages_;
    }

    std::size_t pending_count() const
    {
        return protocol_.pending_count();
    }

  private:
    void reader_loop();
    void route(const json& raw);
    void spawn_worker(protocol::ControlRequest request);
    void wait_for_workers();

    json handle_can_use_tool(const json& request);
    json handle_hook_callback(const json& request);

    void write_line(const std::string& line);
    void require_state(const std::string& subtype) const;
    std::string with_diagnostics(const std::string& message) const;

    std::unique_ptr<Transport> transport_;
    const HookRegistry& hooks_;
    std::optional<PermissionCallback> permission_callback_;
    Logger logger_;
    std::chrono::milliseconds control_request_timeout_;

    protocol::ControlProtocol protocol_;
    std::shared_ptr<MessageQueue> messages_;

    // Fires when the engine closes; handed to callbacks
    CancellationSource cancel_source_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::optional<json> server_info_;

    // Serialize transport writes
    std::mutex write_mutex_;

    std::thread reader_thread_;

    // In-flight control request handler
    struct Worker
    {
        std::uint64_t id;
        std::future<void> done;
    };

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;

    // Turn tracking
    std::mutex turn_mutex_;
    std::condition_variable turn_cv_;
    bool result_seen_ = false;
    bool reader_stopped_ = false;
};

} // namespace internal
} // namespace agentwire

#endif // AGENTWIRE_INTERNAL_ENGINE_HPP

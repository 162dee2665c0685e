#include "engine.hpp"

#include "message_parser.hpp"

#include <agentwire/errors.hpp>
#include <agentwire/hooks.hpp>
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <variant>

namespace agentwire
{

const char* to_string(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Disconnected:
        return "disconnected";
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Ready:
        return "ready";
    case ConnectionState::Closing:
        return "closing";
    case ConnectionState::Closed:
        return "closed";
    }
    return "unknown";
}

namespace internal
{

namespace
{
std::atomic<std::uint64_t> next_worker_id{1};

// Id of the control request handler running on this thread, 0 elsewhere
thread_local std::uint64_t current_worker_id = 0;
} // namespace

Engine::Engine(std::unique_ptr<Transport> transport, const HookRegistry& hooks,
               std::optional<PermissionCallback> permission_callback, Logger logger,
               std::chrono::milliseconds control_request_timeout)
    : transport_(std::move(transport)), hooks_(hooks),
      permission_callback_(std::move(permission_callback)), logger_(std::move(logger)),
      control_request_timeout_(control_request_timeout),
      messages_(std::make_shared<MessageQueue>())
{
    if (!transport_)
        throw ConnectionError("Engine requires a transport");
}

Engine::~Engine()
{
    close();
}

// ============================================================================
// Lifecycle
// ============================================================================

void Engine::start()
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ConnectionState::Disconnected)
            throw ConnectionError(std::string("Cannot start engine in state ") + to_string(state_));
        state_ = ConnectionState::Connecting;
    }

    try
    {
        transport_->connect();
    }
    catch (const std::exception&)
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ConnectionState::Closed;
        messages_->finish();
        throw;
    }

    reader_thread_ = std::thread(&Engine::reader_loop, this);
    logger_.debug("Engine started");
}

json Engine::initialize(std::chrono::milliseconds timeout)
{
    json request_data = {{"hooks", hooks_.initialize_config()}};

    try
    {
        json result = send_control_request("initialize", request_data, timeout);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != ConnectionState::Connecting)
                throw ConnectionError(std::string("Connection ") + to_string(state_) +
                                      " during initialize");
            server_info_ = result;
            state_ = ConnectionState::Ready;
        }
        logger_.debug("Initialize handshake complete");
        return result;
    }
    catch (const ControlRequestError& e)
    {
        std::string message = with_diagnostics(std::string("Initialize failed: ") + e.what());
        close();
        throw ControlRequestError(message, e.reason(), e.subtype());
    }
    catch (const std::exception& e)
    {
        std::string message = with_diagnostics(std::string("Initialize failed: ") + e.what());
        close();
        throw ConnectionError(message);
    }
}

void Engine::end_input()
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    transport_->end_input();
}

void Engine::close()
{
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (state_ == ConnectionState::Closing)
        {
            // Another thread is tearing down. Handlers must not wait on it.
            if (current_worker_id == 0)
                state_cv_.wait(lock, [this] { return state_ == ConnectionState::Closed; });
            return;
        }
        if (state_ == ConnectionState::Closed)
            return;
        if (state_ == ConnectionState::Disconnected)
        {
            state_ = ConnectionState::Closed;
            messages_->finish();
            return;
        }
        state_ = ConnectionState::Closing;
    }

    logger_.debug("Closing engine");

    // Callbacks still running see the session going away
    cancel_source_.cancel();

    // Closing the transport first fails any write stuck behind write_mutex_
    try
    {
        transport_->close();
    }
    catch (const std::exception& e)
    {
        logger_.warning(std::string("Failed to close transport: ") + e.what());
    }

    try
    {
        end_input();
    }
    catch (const std::exception& e)
    {
        logger_.debug(std::string("end_input during close failed: ") + e.what());
    }

    if (reader_thread_.joinable())
        reader_thread_.join();

    protocol_.fail_all_pending("connection closed");
    wait_for_workers();
    messages_->finish();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ConnectionState::Closed;
    }
    state_cv_.notify_all();
    turn_cv_.notify_all();
}

ConnectionState Engine::state() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<json> Engine::server_info() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

// ============================================================================
// Reader
// ============================================================================

void Engine::reader_loop()
{
    std::exception_ptr failure;
    std::string reason = "end of stream";

    try
    {
        while (true)
        {
            std::optional<json> raw;
            try
            {
                raw = transport_->read_message();
            }
            catch (const JSONDecodeError& e)
            {
                logger_.warning(std::string("Skipping malformed line: ") + e.what());
                messages_->push_error(std::current_exception());
                continue;
            }

            if (!raw)
                break;
            route(*raw);
        }
    }
    catch (const std::exception& e)
    {
        reason = e.what();
        ConnectionState current = state();
        if (current != ConnectionState::Closing && current != ConnectionState::Closed)
        {
            logger_.warning(std::string("Reader stopped: ") + e.what());
            failure = std::current_exception();
        }
    }

    protocol_.fail_all_pending(with_diagnostics(reason));
    messages_->finish(failure);

    {
        std::lock_guard<std::mutex> lock(turn_mutex_);
        reader_stopped_ = true;
    }
    turn_cv_.notify_all();
    logger_.debug("Reader stopped");
}

void Engine::route(const json& raw)
{
    std::string type;
    if (raw.is_object() && raw.contains("type") && raw["type"].is_string())
        type = raw["type"].get<std::string>();

    if (type == "control_response")
    {
        try
        {
            auto response = protocol::ControlResponse::from_json(raw);
            if (!protocol_.handle_response(response))
                logger_.warning("Ignoring control response for unknown request: " +
                                response.request_id);
        }
        catch (const MessageParseError& e)
        {
            logger_.warning(std::string("Ignoring malformed control response: ") + e.what());
        }
        return;
    }

    if (type == "control_request")
    {
        try
        {
            spawn_worker(protocol::ControlRequest::from_json(raw));
        }
        catch (const MessageParseError& e)
        {
            logger_.warning(std::string("Ignoring malformed control request: ") + e.what());
        }
        return;
    }

    if (type == "control_cancel_request")
    {
        logger_.debug("Ignoring control_cancel_request");
        return;
    }

    try
    {
        Message message = protocol::MessageParser::parse(raw);
        bool is_result = is_result_message(message);
        messages_->push(std::move(message));

        if (is_result)
        {
            {
                std::lock_guard<std::mutex> lock(turn_mutex_);
                result_seen_ = true;
            }
            turn_cv_.notify_all();
        }
    }
    catch (const MessageParseError& e)
    {
        logger_.warning(std::string("Failed to decode message: ") + e.what());
        messages_->push_error(std::current_exception());
    }
}

void Engine::spawn_worker(protocol::ControlRequest request)
{
    logger_.debug("Control request " + request.subtype() + " (" + request.request_id + ")");

    std::lock_guard<std::mutex> lock(workers_mutex_);

    // Drop finished handlers
    workers_.erase(std::remove_if(workers_.begin(), workers_.end(),
                                  [](const Worker& worker)
                                  {
                                      return worker.done.wait_for(std::chrono::seconds(0)) ==
                                             std::future_status::ready;
                                  }),
                   workers_.end());

    std::uint64_t id = next_worker_id++;
    workers_.push_back(Worker{id, std::async(std::launch::async,
                                             [this, id, request = std::move(request)]
                                             {
                                                 current_worker_id = id;
                                                 dispatch_control_request(request);
                                                 current_worker_id = 0;
                                             })});
}

void Engine::wait_for_workers()
{
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }

    // A callback that closed the engine cannot wait for its own handler; its
    // future stays behind for the destructor, which runs on another thread
    std::vector<Worker> own;
    for (auto& worker : workers)
    {
        if (worker.id == current_worker_id)
            own.push_back(std::move(worker));
        else
            worker.done.wait();
    }

    if (!own.empty())
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto& worker : own)
            workers_.push_back(std::move(worker));
    }
}

// ============================================================================
// Inbound control requests
// ============================================================================

json Engine::handle_control_request(const protocol::ControlRequest& request)
{
    std::string subtype = request.subtype();

    try
    {
        json payload;
        if (subtype == "can_use_tool")
            payload = handle_can_use_tool(request.request);
        else if (subtype == "hook_callback")
            payload = handle_hook_callback(request.request);
        else
            throw std::runtime_error("Unsupported control request subtype: " + subtype);

        return protocol::ControlResponse::success(request.request_id, std::move(payload)).to_json();
    }
    catch (const std::exception& e)
    {
        logger_.debug("Control request " + request.request_id + " failed: " + e.what());
        return protocol::ControlResponse::failure(request.request_id, e.what()).to_json();
    }
}

void Engine::dispatch_control_request(const protocol::ControlRequest& request)
{
    json envelope = handle_control_request(request);

    try
    {
        write_message(envelope);
    }
    catch (const std::exception& e)
    {
        ConnectionState current = state();
        std::string line = "Failed to send control response for " + request.request_id + ": " +
                           e.what();
        if (current == ConnectionState::Closing || current == ConnectionState::Closed)
            logger_.debug(line);
        else
            logger_.warning(line);
    }
}

json Engine::handle_can_use_tool(const json& request)
{
    if (!permission_callback_)
        throw std::runtime_error("canUseTool callback is not provided");

    if (!request.contains("tool_name") || !request["tool_name"].is_string())
        throw std::runtime_error("can_use_tool request missing 'tool_name'");

    std::string tool_name = request["tool_name"].get<std::string>();
    json input = request.value("input", json::object());

    ToolPermissionContext context;
    context.cancel = cancel_source_.token();
    if (request.contains("permission_suggestions") && request["permission_suggestions"].is_array())
    {
        for (const auto& suggestion : request["permission_suggestions"])
            context.suggestions.push_back(PermissionUpdate::from_json(suggestion));
    }
    if (request.contains("blocked_path") && request["blocked_path"].is_string())
        context.blocked_path = request["blocked_path"].get<std::string>();

    PermissionResult result = (*permission_callback_)(tool_name, input, context);

    json response_data;
    if (std::holds_alternative<PermissionResultAllow>(result))
    {
        const auto& allow = std::get<PermissionResultAllow>(result);
        response_data["behavior"] = PermissionBehavior::Allow;

        // Echo the original input unless the host replaced it
        if (allow.updated_input.has_value())
            response_data["updatedInput"] = *allow.updated_input;
        else
            response_data["updatedInput"] = input;

        if (allow.updated_permissions.has_value())
        {
            json permissions_array = json::array();
            for (const auto& perm : *allow.updated_permissions)
                permissions_array.push_back(perm.to_json());
            response_data["updatedPermissions"] = permissions_array;
        }
    }
    else
    {
        const auto& deny = std::get<PermissionResultDeny>(result);
        response_data["behavior"] = PermissionBehavior::Deny;
        response_data["message"] = deny.message;
        if (deny.interrupt)
            response_data["interrupt"] = true;
    }

    return response_data;
}

json Engine::handle_hook_callback(const json& request)
{
    std::string callback_id = request.value("callback_id", "");

    auto callback = hooks_.find(callback_id);
    if (!callback)
        throw std::runtime_error("No hook callback found for ID: " + callback_id);

    HookInput input = parse_hook_input(request.value("input", json::object()));
    logger_.debug("Hook " + callback_id + " for " + to_string(hook_event_of(input)));

    std::optional<std::string> tool_use_id;
    if (request.contains("tool_use_id") && request["tool_use_id"].is_string())
        tool_use_id = request["tool_use_id"].get<std::string>();

    HookContext context{cancel_source_.token()};
    return (*callback)(input, tool_use_id, context).to_json();
}

// ============================================================================
// Outbound
// ============================================================================

json Engine::send_control_request(const std::string& subtype, const json& data,
                                  std::chrono::milliseconds timeout,
                                  const CancellationToken& cancel)
{
    require_state(subtype);

    auto write_func = [this](const std::string& line) { write_line(line); };
    return protocol_.send_request(write_func, subtype, data, timeout, cancel);
}

void Engine::write_message(const json& message)
{
    write_line(message.dump() + "\n");
}

void Engine::write_line(const std::string& line)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    transport_->write(line);
}

void Engine::interrupt(const CancellationToken& cancel)
{
    send_control_request("interrupt", json::object(), control_request_timeout_, cancel);
}

void Engine::set_permission_mode(const std::string& mode, const CancellationToken& cancel)
{
    send_control_request("set_permission_mode", {{"mode", mode}}, control_request_timeout_,
                         cancel);
}

void Engine::set_model(const std::optional<std::string>& model, const CancellationToken& cancel)
{
    // null asks the agent to fall back to its default model
    json request_data = {{"model", model ? json(*model) : json(nullptr)}};
    send_control_request("set_model", request_data, control_request_timeout_, cancel);
}

void Engine::rewind_files(const std::string& user_message_id, const CancellationToken& cancel)
{
    send_control_request("rewind_files", {{"user_message_id", user_message_id}},
                         control_request_timeout_, cancel);
}

void Engine::begin_turn()
{
    std::lock_guard<std::mutex> lock(turn_mutex_);
    result_seen_ = false;
}

bool Engine::wait_for_result(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(turn_mutex_);
    turn_cv_.wait_for(lock, timeout, [this] { return result_seen_ || reader_stopped_; });
    return result_seen_;
}

void Engine::require_state(const std::string& subtype) const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == ConnectionState::Ready)
        return;
    if (subtype == "initialize" && state_ == ConnectionState::Connecting)
        return;
    throw ConnectionError("Cannot send '" + subtype + "': connection is " + to_string(state_));
}

std::string Engine::with_diagnostics(const std::string& message) const
{
    std::string diagnostics = transport_->diagnostics();
    if (diagnostics.empty())
        return message;
    return message + "\nDiagnostics:\n" + diagnostics;
}

} // namespace internal
} // namespace agentwire

#include <agentwire/errors.hpp>
#include <agentwire/protocol/control.hpp>
#include <iomanip>
#include <random>
#include <sstream>

namespace agentwire
{
namespace protocol
{

// ============================================================================
// Envelopes
// ============================================================================

std::string ControlRequest::subtype() const
{
    if (request.is_object() && request.contains("subtype") && request["subtype"].is_string())
        return request["subtype"].get<std::string>();
    return "";
}

json ControlRequest::to_json() const
{
    return json{{"type", "control_request"}, {"request_id", request_id}, {"request", request}};
}

ControlRequest ControlRequest::from_json(const json& j)
{
    if (!j.is_object() || !j.contains("request_id") || !j["request_id"].is_string())
        throw MessageParseError("control_request missing 'request_id'", j);
    if (!j.contains("request") || !j["request"].is_object())
        throw MessageParseError("control_request missing 'request' object", j);

    ControlRequest msg;
    msg.request_id = j["request_id"].get<std::string>();
    msg.request = j["request"];
    return msg;
}

json ControlResponse::to_json() const
{
    json inner = {{"subtype", subtype}, {"request_id", request_id}};
    if (is_success())
        inner["response"] = response.is_null() ? json::object() : response;
    else
        inner["error"] = error;

    return json{{"type", "control_response"}, {"response", inner}};
}

ControlResponse ControlResponse::success(const std::string& request_id, json payload)
{
    ControlResponse msg;
    msg.subtype = "success";
    msg.request_id = request_id;
    msg.response = std::move(payload);
    return msg;
}

ControlResponse ControlResponse::failure(const std::string& request_id, const std::string& error)
{
    ControlResponse msg;
    msg.subtype = "error";
    msg.request_id = request_id;
    msg.error = error;
    return msg;
}

ControlResponse ControlResponse::from_json(const json& j)
{
    if (!j.is_object() || !j.contains("response") || !j["response"].is_object())
        throw MessageParseError("control_response missing 'response' object", j);

    const auto& response = j["response"];
    if (!response.contains("request_id") || !response["request_id"].is_string())
        throw MessageParseError("control_response missing 'request_id'", j);

    ControlResponse msg;
    msg.request_id = response["request_id"].get<std::string>();
    msg.subtype = response.value("subtype", "");

    // Response data is optional (absent or null for the error case)
    if (response.contains("response") && !response["response"].is_null())
        msg.response = response["response"];

    if (response.contains("error") && !response["error"].is_null())
    {
        const auto& error = response["error"];
        msg.error = error.is_string() ? error.get<std::string>() : error.dump();
    }

    return msg;
}

// ============================================================================
// PendingRequest
// ============================================================================

bool PendingRequest::resolve(json payload)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (resolved_)
            return false;
        resolved_ = true;
        payload_ = std::move(payload);
    }
    cv_.notify_all();
    return true;
}

bool PendingRequest::reject(std::exception_ptr error)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (resolved_)
            return false;
        resolved_ = true;
        error_ = std::move(error);
    }
    cv_.notify_all();
    return true;
}

bool PendingRequest::wait_for(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout.count() <= 0)
    {
        cv_.wait(lock, [this] { return resolved_; });
        return true;
    }
    return cv_.wait_for(lock, timeout, [this] { return resolved_; });
}

json PendingRequest::get() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!resolved_)
        throw AgentwireError("Control request '" + subtype_ + "' has not been resolved");
    if (error_)
        std::rethrow_exception(error_);
    return payload_;
}

bool PendingRequest::is_resolved() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return resolved_;
}

// ============================================================================
// ControlProtocol
// ============================================================================

ControlProtocol::ControlProtocol() {}

ControlProtocol::~ControlProtocol()
{
    fail_all_pending("Control protocol shutting down");
}

std::string ControlProtocol::generate_request_id()
{
    std::uint64_t counter = ++request_counter_;

    // Random hex suffix (4 bytes = 8 hex chars)
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    std::ostringstream oss;
    oss << "req_" << counter << "_";
    for (int i = 0; i < 4; ++i)
        oss << std::hex << std::setfill('0') << std::setw(2) << dis(gen);

    return oss.str();
}

std::string ControlProtocol::build_request_message(const std::string& request_id,
                                                   const std::string& subtype, const json& data)
{
    json request = data.is_object() ? data : json::object();
    request["subtype"] = subtype;

    ControlRequest msg;
    msg.request_id = request_id;
    msg.request = std::move(request);
    return msg.to_json().dump() + "\n";
}

std::shared_ptr<PendingRequest> ControlProtocol::register_request(const std::string& request_id,
                                                                  const std::string& subtype)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);

    if (closed_)
    {
        throw ControlRequestError("Cannot send control request '" + subtype +
                                      "': " + closed_reason_,
                                  ControlRequestError::Reason::ConnectionClosed, subtype);
    }

    auto pending = std::make_shared<PendingRequest>(subtype);
    pending_requests_[request_id] = pending;
    return pending;
}

std::shared_ptr<PendingRequest> ControlProtocol::take_request(const std::string& request_id)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);

    auto it = pending_requests_.find(request_id);
    if (it == pending_requests_.end())
        return nullptr;

    auto pending = std::move(it->second);
    pending_requests_.erase(it);
    return pending;
}

json ControlProtocol::send_request(const WriteFunc& write_func, const std::string& subtype,
                                   const json& request_data, std::chrono::milliseconds timeout,
                                   const CancellationToken& cancel)
{
    std::string request_id = generate_request_id();

    // Register pending request BEFORE sending
    auto pending = register_request(request_id, subtype);

    auto registration = cancel.on_cancel(
        [pending, subtype]
        {
            pending->reject(std::make_exception_ptr(
                ControlRequestError("Control request cancelled: " + subtype,
                                    ControlRequestError::Reason::Cancelled, subtype)));
        });

    // Cancelled before anything went out
    if (pending->is_resolved())
    {
        take_request(request_id);
        return pending->get();
    }

    try
    {
        write_func(build_request_message(request_id, subtype, request_data));
    }
    catch (...)
    {
        take_request(request_id);
        throw;
    }

    if (!pending->wait_for(timeout))
    {
        // A response racing the timeout keeps its resolution; reject() is then a no-op
        pending->reject(std::make_exception_ptr(
            ControlRequestError("Control request timed out: " + subtype,
                                ControlRequestError::Reason::Timeout, subtype)));
    }

    registration.reset();
    take_request(request_id);
    return pending->get();
}

bool ControlProtocol::handle_response(const ControlResponse& response)
{
    auto pending = take_request(response.request_id);
    if (!pending)
        return false;

    if (response.is_success())
        return pending->resolve(response.response.is_null() ? json::object() : response.response);

    std::string error = response.subtype == "error"
                            ? (response.error.empty() ? "Unknown error" : response.error)
                            : "Unknown response subtype: " + response.subtype;

    return pending->reject(std::make_exception_ptr(ControlRequestError(
        error, ControlRequestError::Reason::Remote, pending->subtype())));
}

void ControlProtocol::fail_all_pending(const std::string& reason)
{
    std::map<std::string, std::shared_ptr<PendingRequest>> pending;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        if (!closed_)
        {
            closed_ = true;
            closed_reason_ = reason;
        }
        pending.swap(pending_requests_);
    }

    for (auto& [id, request] : pending)
    {
        request->reject(std::make_exception_ptr(
            ControlRequestError("Control request '" + request->subtype() + "' failed: " + reason,
                                ControlRequestError::Reason::ConnectionClosed,
                                request->subtype())));
    }
}

std::size_t ControlProtocol::pending_count() const
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return pending_requests_.size();
}

} // namespace protocol
} // namespace agentwire

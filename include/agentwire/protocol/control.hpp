#ifndef AGENTWIRE_PROTOCOL_CONTROL_HPP
#define AGENTWIRE_PROTOCOL_CONTROL_HPP

#include <agentwire/cancellation.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace agentwire
{

using json = nlohmann::json;

namespace protocol
{

// Control request envelope: {"type":"control_request","request_id":...,"request":{...}}
struct ControlRequest
{
    std::string request_id;
    json request = json::object(); // {"subtype": ..., payload...}

    std::string subtype() const;
    json to_json() const;

    // Throws MessageParseError when request_id or request is missing
    static ControlRequest from_json(const json& j);
};

// Control response envelope:
// {"type":"control_response","response":{"subtype":"success"|"error","request_id":...,
//  "response"?:{...},"error"?:"..."}}
struct ControlResponse
{
    std::string subtype; // "success" or "error"
    std::string request_id;
    json response;     // Payload on success
    std::string error; // Message on error

    bool is_success() const
    {
        return subtype == "success";
    }

    json to_json() const;

    static ControlResponse success(const std::string& request_id, json payload);
    static ControlResponse failure(const std::string& request_id, const std::string& error);

    // Throws MessageParseError when the nested response or its request_id is missing
    static ControlResponse from_json(const json& j);
};

/**
 * Single-resolution completion slot for one outbound control request.
 *
 * The first call to resolve() or reject() wins; later calls return false and
 * leave the stored outcome untouched.
 */
class PendingRequest
{
  public:
    explicit PendingRequest(std::string subtype) : subtype_(std::move(subtype)) {}

    bool resolve(json payload);
    bool reject(std::exception_ptr error);

    // Wait for resolution; a non-positive timeout waits indefinitely.
    // Returns false on timeout.
    bool wait_for(std::chrono::milliseconds timeout);

    // Payload on success, rethrows the stored error otherwise. Requires resolution.
    json get() const;

    bool is_resolved() const;

    const std::string& subtype() const
    {
        return subtype_;
    }

  private:
    std::string subtype_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool resolved_ = false;
    json payload_;
    std::exception_ptr error_;
};

// Control protocol manager - handles request/response correlation
class ControlProtocol
{
  public:
    using WriteFunc = std::function<void(const std::string&)>;

    static constexpr std::chrono::milliseconds kDefaultTimeout{60000};

    ControlProtocol();
    ~ControlProtocol();

    // No copy
    ControlProtocol(const ControlProtocol&) = delete;
    ControlProtocol& operator=(const ControlProtocol&) = delete;

    /**
     * Send a control request and wait for the correlated response.
     *
     * The pending entry is registered before the envelope is written and is
     * removed on every exit path.
     *
     * @param write_func Writes one newline-terminated line to the peer
     * @param subtype Request subtype, e.g. "interrupt"
     * @param request_data Subtype-specific payload (merged with "subtype")
     * @param timeout Bounded wait; zero waits until response or teardown
     * @param cancel Caller-owned cancellation signal
     * @return Response payload on success
     * @throws ControlRequestError on remote error, timeout, cancellation or teardown
     */
    json send_request(const WriteFunc& write_func, const std::string& subtype,
                      const json& request_data,
                      std::chrono::milliseconds timeout = kDefaultTimeout,
                      const CancellationToken& cancel = {});

    // Resolve the pending request matching response.request_id.
    // Returns false when no request with that id is pending (stale or duplicate).
    bool handle_response(const ControlResponse& response);

    // Fail every pending request with ConnectionClosed and refuse new ones
    void fail_all_pending(const std::string& reason);

    // Generate unique request ID: req_{counter}_{8 hex chars}
    std::string generate_request_id();

    // Build control request message JSON line (newline-terminated)
    static std::string build_request_message(const std::string& request_id,
                                             const std::string& subtype, const json& data);

    std::size_t pending_count() const;

  private:
    std::atomic<std::uint64_t> request_counter_{0};

    // Pending requests - maps request_id to completion slot
    std::map<std::string, std::shared_ptr<PendingRequest>> pending_requests_;
    mutable std::mutex requests_mutex_;
    bool closed_ = false;
    std::string closed_reason_;

    std::shared_ptr<PendingRequest> register_request(const std::string& request_id,
                                                     const std::string& subtype);

    // Remove and return the entry, or null when absent
    std::shared_ptr<PendingRequest> take_request(const std::string& request_id);
};

} // namespace protocol
} // namespace agentwire

#endif // AGENTWIRE_PROTOCOL_CONTROL_HPP

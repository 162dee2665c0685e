#pragma once

#include <agentwire/memory_transport.hpp>
#include <agentwire/types.hpp>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <thread>

namespace agentwire::test
{

// Poll until predicate holds or timeout expires
inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

inline json assistant_text(const std::string& text, const std::string& model = "claude-test")
{
    json block = {{"type", "text"}, {"text", text}};
    json message = {{"content", json::array({block})}, {"model", model}};
    return {{"type", "assistant"}, {"message", message}};
}

inline json result_message(const std::string& session_id = "default", int num_turns = 1)
{
    return {{"type", "result"},     {"subtype", "success"},   {"duration_ms", 100},
            {"duration_api_ms", 80}, {"is_error", false},      {"num_turns", num_turns},
            {"session_id", session_id}, {"total_cost_usd", 0.001}};
}

inline json success_response(const std::string& request_id, const json& payload = json::object())
{
    return {{"type", "control_response"},
            {"response", {{"subtype", "success"}, {"request_id", request_id}, {"response", payload}}}};
}

inline json error_response(const std::string& request_id, const std::string& error)
{
    return {{"type", "control_response"},
            {"response", {{"subtype", "error"}, {"request_id", request_id}, {"error", error}}}};
}

inline json control_request(const std::string& request_id, const json& request)
{
    return {{"type", "control_request"}, {"request_id", request_id}, {"request", request}};
}

inline bool is_control_request(const json& written, const std::string& subtype)
{
    return written.value("type", "") == "control_request" && written.contains("request") &&
           written["request"].value("subtype", "") == subtype;
}

// Responder that answers initialize with server_info and hands every other
// write to next (if set)
inline MemoryTransport::Responder
initialize_responder(json server_info = {{"commands", json::array()}},
                     MemoryTransport::Responder next = nullptr)
{
    return [server_info, next](const json& written, MemoryTransport::Peer& peer)
    {
        if (is_control_request(written, "initialize"))
        {
            peer.push_message(
                success_response(written["request_id"].get<std::string>(), server_info));
            return;
        }
        if (next)
            next(written, peer);
    };
}

// Find the first written control_response for request_id
inline std::optional<json> find_response(const MemoryTransport::Peer& peer,
                                         const std::string& request_id)
{
    for (const auto& msg : peer.written_messages())
    {
        if (msg.value("type", "") == "control_response" && msg.contains("response") &&
            msg["response"].value("request_id", "") == request_id)
            return msg;
    }
    return std::nullopt;
}

// Set an environment variable for the lifetime of the object
class ScopedEnv
{
  public:
    ScopedEnv(const char* name, const char* value) : name_(name)
    {
        if (const char* old = std::getenv(name))
            previous_ = std::string(old);
        setenv(name, value, 1);
    }

    ~ScopedEnv()
    {
        if (previous_)
            setenv(name_.c_str(), previous_->c_str(), 1);
        else
            unsetenv(name_.c_str());
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

  private:
    std::string name_;
    std::optional<std::string> previous_;
};

} // namespace agentwire::test

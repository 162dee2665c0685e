#ifndef AGENTWIRE_ERRORS_HPP
#define AGENTWIRE_ERRORS_HPP

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace agentwire
{

// Base exception
class AgentwireError : public std::runtime_error
{
  public:
    explicit AgentwireError(const std::string& message) : std::runtime_error(message) {}
};

// Transport unreachable, closed, or used in the wrong connection state
class ConnectionError : public AgentwireError
{
  public:
    explicit ConnectionError(const std::string& message) : AgentwireError(message) {}
};

// Agent process exited with a non-zero status
class ProcessError : public AgentwireError
{
  public:
    ProcessError(const std::string& message, int exit_code, std::string stderr_output = {})
        : AgentwireError(format(message, exit_code, stderr_output)), exit_code_(exit_code),
          stderr_output_(std::move(stderr_output))
    {
    }

    int exit_code() const
    {
        return exit_code_;
    }

    const std::string& stderr_output() const
    {
        return stderr_output_;
    }

  private:
    static std::string format(const std::string& message, int exit_code,
                              const std::string& stderr_output)
    {
        std::string text = message + " (exit code: " + std::to_string(exit_code) + ")";
        if (!stderr_output.empty())
            text += "\nError output: " + stderr_output;
        return text;
    }

    int exit_code_;
    std::string stderr_output_;
};

// Malformed line on the wire
class JSONDecodeError : public AgentwireError
{
  public:
    explicit JSONDecodeError(const std::string& message) : AgentwireError(message) {}

    JSONDecodeError(const std::string& message, std::string line)
        : AgentwireError(message), line_(std::move(line))
    {
    }

    // Offending line as read from the wire
    const std::string& line() const
    {
        return line_;
    }

  private:
    std::string line_;
};

// Message parse error
class MessageParseError : public AgentwireError
{
  public:
    explicit MessageParseError(const std::string& message)
        : AgentwireError(message), data_(nullptr)
    {
    }

    MessageParseError(const std::string& message, const nlohmann::json& data)
        : AgentwireError(message), data_(std::make_shared<nlohmann::json>(data))
    {
    }

    // Get the optional data associated with the parse error
    const nlohmann::json* data() const
    {
        return data_.get();
    }

  private:
    std::shared_ptr<nlohmann::json> data_;
};

// Failure of an outbound control request
class ControlRequestError : public AgentwireError
{
  public:
    enum class Reason
    {
        Remote,           // Peer answered with an error response
        Timeout,          // No response within the allotted time
        Cancelled,        // Caller's cancellation token fired
        ConnectionClosed, // Connection torn down before a response arrived
    };

    ControlRequestError(const std::string& message, Reason reason, std::string subtype = {})
        : AgentwireError(message), reason_(reason), subtype_(std::move(subtype))
    {
    }

    Reason reason() const
    {
        return reason_;
    }

    const std::string& subtype() const
    {
        return subtype_;
    }

  private:
    Reason reason_;
    std::string subtype_;
};

} // namespace agentwire

#endif // AGENTWIRE_ERRORS_HPP

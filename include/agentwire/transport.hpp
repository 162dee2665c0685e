#ifndef AGENTWIRE_TRANSPORT_HPP
#define AGENTWIRE_TRANSPORT_HPP

#include <agentwire/types.hpp>
#include <optional>
#include <string>

namespace agentwire
{

/**
 * Abstract transport interface for the agent connection.
 *
 * Handles raw line I/O with the agent process or a stand-in. The control
 * protocol engine builds request correlation and message routing on top and
 * never assumes a particular implementation.
 *
 * Implementations include:
 * - PipeTransport: pipes of an already-launched process
 * - MemoryTransport: in-memory queues for tests
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Prepare for communication.
     * @throws ConnectionError if the transport has already been closed
     */
    virtual void connect() = 0;

    /**
     * Write one line of data.
     * @param data JSON text followed by a newline
     * @throws ConnectionError if the transport is not ready
     */
    virtual void write(const std::string& data) = 0;

    /**
     * Block until the next JSON value arrives.
     *
     * Single consumer. Returns std::nullopt once the stream has ended or the
     * transport was closed.
     *
     * @throws JSONDecodeError for a malformed line; the next call resumes with
     *         the following line
     * @throws ProcessError when the process behind the stream failed
     */
    virtual std::optional<json> read_message() = 0;

    /**
     * End the input stream (close stdin for process transports).
     * Signals to the remote end that no more input will be sent.
     */
    virtual void end_input() = 0;

    /**
     * Close the connection and release resources. Idempotent; wakes a
     * blocked read_message().
     */
    virtual void close() = 0;

    /**
     * @return True if the transport is ready to send messages
     */
    virtual bool is_ready() const = 0;

    /**
     * Captured diagnostic output (e.g. recent stderr lines) for error reports.
     */
    virtual std::string diagnostics() const
    {
        return {};
    }
};

} // namespace agentwire

#endif // AGENTWIRE_TRANSPORT_HPP

#ifndef AGENTWIRE_PIPE_TRANSPORT_HPP
#define AGENTWIRE_PIPE_TRANSPORT_HPP

#include <agentwire/transport.hpp>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace agentwire
{

/**
 * Pipes of an agent process launched by the host.
 *
 * The library never spawns processes; whoever launches the agent hands its
 * stdin/stdout/stderr over through this interface. FdChannel implements it
 * for plain POSIX file descriptors.
 */
class ProcessChannel
{
  public:
    enum class Stream
    {
        Stdout,
        Stderr
    };

    virtual ~ProcessChannel() = default;

    // Write all of data to the process stdin. Throws std::runtime_error on failure.
    virtual void write(const std::string& data) = 0;

    // True when stream has data (or reached EOF) within timeout_ms
    virtual bool poll(Stream stream, int timeout_ms) = 0;

    // Read up to size bytes. Returns 0 at EOF.
    virtual std::size_t read(Stream stream, char* buffer, std::size_t size) = 0;

    virtual bool has_stderr() const = 0;

    // Half-close: the process sees EOF on stdin. Idempotent.
    virtual void close_stdin() = 0;

    // Make a write() blocked on a full stdin pipe, and every later write(), fail.
    // Safe to call from any thread without holding the writer's lock.
    virtual void interrupt_writes() = 0;

    // Exit code if the process has exited, std::nullopt while it runs
    virtual std::optional<int> try_wait() = 0;

    // Ask the process to stop and reap it
    virtual void terminate() = 0;
};

struct PipeTransportOptions
{
    // Longest unterminated stdout line kept in memory
    std::size_t max_buffer_size = 1024 * 1024;

    // Receives each stderr line of the process (without newline)
    std::optional<std::function<void(const std::string&)>> stderr_callback;
};

/**
 * Transport over the pipes of an already-launched agent process.
 *
 * A background thread frames stdout into lines; a second thread drains stderr,
 * keeps the most recent lines for diagnostics() and forwards each line to the
 * optional stderr callback. A non-zero exit status ends the stream with a
 * ProcessError.
 */
class PipeTransport : public Transport
{
  public:
    static constexpr std::size_t kStderrTailLines = 100;

    explicit PipeTransport(std::unique_ptr<ProcessChannel> channel,
                           PipeTransportOptions options = {});
    ~PipeTransport() override;

    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;

    // Transport interface
    void connect() override;
    void write(const std::string& data) override;
    std::optional<json> read_message() override;
    void end_input() override;
    void close() override;
    bool is_ready() const override;
    std::string diagnostics() const override;

  private:
    // One framed stdout line, or a failure to hand to the consumer
    struct Entry
    {
        std::string line;
        std::exception_ptr error;
    };

    void reader_loop();
    void stderr_reader_loop();
    void report_exit_status();
    void push_line(std::string line);
    void push_error(std::exception_ptr error);
    void stop_queue();
    void join_threads();

    std::unique_ptr<ProcessChannel> channel_;
    PipeTransportOptions options_;

    // Framed stdout lines
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Entry> queue_;
    bool queue_stopped_ = false;

    // Serialize stdin writes and coordinate with close/end_input
    std::mutex write_mutex_;
    std::atomic<bool> input_ended_{false};

    // Stderr tail
    mutable std::mutex stderr_mutex_;
    std::condition_variable stderr_cv_;
    std::deque<std::string> stderr_lines_;
    bool stderr_done_ = true;

    std::thread reader_thread_;
    std::thread stderr_reader_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> ready_{false};
    std::atomic<bool> closed_{false};
};

} // namespace agentwire

#endif // AGENTWIRE_PIPE_TRANSPORT_HPP

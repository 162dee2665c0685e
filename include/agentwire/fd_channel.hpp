#ifndef AGENTWIRE_FD_CHANNEL_HPP
#define AGENTWIRE_FD_CHANNEL_HPP

#include <agentwire/pipe_transport.hpp>
#include <atomic>
#include <cstddef>
#include <optional>
#include <string>

namespace agentwire
{

/**
 * ProcessChannel over POSIX file descriptors.
 *
 * Takes ownership of the descriptors and closes them on destruction. When a
 * pid is given, exit status comes from waitpid() and terminate() sends
 * SIGTERM; without one the channel reports exit code 0 once asked.
 *
 * stdin is switched to non-blocking mode so a write stuck on a full pipe can
 * be interrupted. SIGPIPE is blocked on the writing thread for the duration of
 * a write, so a process that went away surfaces as an error instead.
 *
 * Pass -1 for stderr_fd when the process stderr is not captured.
 */
class FdChannel : public ProcessChannel
{
  public:
    FdChannel(int stdin_fd, int stdout_fd, int stderr_fd = -1, int pid = 0);
    ~FdChannel() override;

    FdChannel(const FdChannel&) = delete;
    FdChannel& operator=(const FdChannel&) = delete;

    void write(const std::string& data) override;
    bool poll(Stream stream, int timeout_ms) override;
    std::size_t read(Stream stream, char* buffer, std::size_t size) override;
    bool has_stderr() const override;
    void close_stdin() override;
    void interrupt_writes() override;
    std::optional<int> try_wait() override;
    void terminate() override;

    int pid() const
    {
        return pid_;
    }

  private:
    int fd_for(Stream stream) const;
    void wait_writable(int timeout_ms);

    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    int pid_;
    bool running_;
    int exit_code_ = -1;
    std::atomic<bool> writes_interrupted_{false};
};

} // namespace agentwire

#endif // AGENTWIRE_FD_CHANNEL_HPP

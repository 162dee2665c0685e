// POSIX file descriptor channel for Linux and macOS

#include <agentwire/fd_channel.hpp>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <stdexcept>
#include <sys/select.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace agentwire
{

namespace
{

std::string get_errno_message()
{
    return std::strerror(errno);
}

void close_fd(int& fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

// Blocks SIGPIPE on the calling thread while alive, so a write to a pipe
// without readers fails with EPIPE instead of killing the process.
class SigpipeBlock
{
  public:
    SigpipeBlock()
    {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;

        blocked_ = pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_set_) == 0;
    }

    ~SigpipeBlock()
    {
        if (blocked_)
            pthread_sigmask(SIG_SETMASK, &old_set_, nullptr);
    }

    SigpipeBlock(const SigpipeBlock&) = delete;
    SigpipeBlock& operator=(const SigpipeBlock&) = delete;

    // Discard the SIGPIPE our own write raised so unblocking does not deliver it
    void consume()
    {
        if (!blocked_ || was_pending_)
            return;

        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) != 0 || sigismember(&pending, SIGPIPE) != 1)
            return;

        int sig = 0;
        sigwait(&pipe_set_, &sig);
    }

  private:
    sigset_t pipe_set_;
    sigset_t old_set_;
    bool was_pending_ = false;
    bool blocked_ = false;
};

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

FdChannel::FdChannel(int stdin_fd, int stdout_fd, int stderr_fd, int pid)
    : stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd), pid_(pid),
      running_(pid > 0)
{
    if (stdout_fd_ < 0)
        throw std::invalid_argument("FdChannel requires a readable stdout descriptor");

    if (stdin_fd_ >= 0)
    {
        int flags = fcntl(stdin_fd_, F_GETFL);
        if (flags < 0 || fcntl(stdin_fd_, F_SETFL, flags | O_NONBLOCK) < 0)
        {
            std::string message = "Failed to make stdin non-blocking: " + get_errno_message();
            close_fd(stdin_fd_);
            close_fd(stdout_fd_);
            close_fd(stderr_fd_);
            throw std::runtime_error(message);
        }
    }
}

FdChannel::~FdChannel()
{
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void FdChannel::write(const std::string& data)
{
    if (stdin_fd_ < 0)
        throw std::runtime_error("Pipe is not open");

    SigpipeBlock sigpipe;

    const char* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0)
    {
        if (writes_interrupted_)
            throw std::runtime_error("Write interrupted: channel is closing");

        ssize_t written = ::write(stdin_fd_, ptr, remaining);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                // Pipe is full; wait for the process to drain it
                wait_writable(100);
                continue;
            }
            if (errno == EPIPE)
            {
                sigpipe.consume();
                throw std::runtime_error("Broken pipe (process closed stdin)");
            }
            throw std::runtime_error("Write failed: " + get_errno_message());
        }
        ptr += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

void FdChannel::wait_writable(int timeout_ms)
{
    fd_set write_fds;
    FD_ZERO(&write_fds);
    FD_SET(stdin_fd_, &write_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(stdin_fd_ + 1, nullptr, &write_fds, nullptr, &timeout);
    if (result < 0 && errno != EINTR)
        throw std::runtime_error("select failed: " + get_errno_message());
}

bool FdChannel::poll(Stream stream, int timeout_ms)
{
    int fd = fd_for(stream);
    if (fd < 0)
        return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw std::runtime_error("select failed: " + get_errno_message());
    }

    return result > 0 && FD_ISSET(fd, &read_fds);
}

std::size_t FdChannel::read(Stream stream, char* buffer, std::size_t size)
{
    int fd = fd_for(stream);
    if (fd < 0)
        throw std::runtime_error("Pipe is not open");

    while (true)
    {
        ssize_t bytes_read = ::read(fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<std::size_t>(bytes_read);
        if (errno == EINTR)
            continue;
        throw std::runtime_error("Read failed: " + get_errno_message());
    }
}

bool FdChannel::has_stderr() const
{
    return stderr_fd_ >= 0;
}

void FdChannel::close_stdin()
{
    close_fd(stdin_fd_);
}

void FdChannel::interrupt_writes()
{
    writes_interrupted_ = true;
}

std::optional<int> FdChannel::try_wait()
{
    if (pid_ <= 0)
        return 0;

    if (!running_)
        return exit_code_;

    int status;
    pid_t result = waitpid(pid_, &status, WNOHANG);

    if (result == pid_)
    {
        exit_code_ = decode_status(status);
        running_ = false;
        return exit_code_;
    }
    if (result == 0)
        return std::nullopt;

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

void FdChannel::terminate()
{
    if (pid_ <= 0 || !running_)
        return;

    ::kill(pid_, SIGTERM);

    // Grace period before SIGKILL
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (try_wait())
            return;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    ::kill(pid_, SIGKILL);

    int status;
    pid_t result;
    do
    {
        result = waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == pid_)
        exit_code_ = decode_status(status);
    running_ = false;
}

int FdChannel::fd_for(Stream stream) const
{
    return stream == Stream::Stdout ? stdout_fd_ : stderr_fd_;
}

} // namespace agentwire

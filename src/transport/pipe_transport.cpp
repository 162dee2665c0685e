#include "../internal/line_buffer.hpp"
#include "../internal/log.hpp"

#include <agentwire/errors.hpp>
#include <agentwire/pipe_transport.hpp>
#include <chrono>

namespace agentwire
{

namespace
{
constexpr int kPollIntervalMs = 100;
constexpr std::size_t kReadChunkSize = 4096;
} // namespace

PipeTransport::PipeTransport(std::unique_ptr<ProcessChannel> channel,
                             PipeTransportOptions options)
    : channel_(std::move(channel)), options_(std::move(options))
{
    if (!channel_)
        throw ConnectionError("PipeTransport requires a process channel");
}

PipeTransport::~PipeTransport()
{
    close();
}

void PipeTransport::connect()
{
    if (closed_)
        throw ConnectionError("Transport has been closed");
    if (ready_)
        return;

    running_ = true;
    reader_thread_ = std::thread(&PipeTransport::reader_loop, this);

    if (channel_->has_stderr())
    {
        {
            std::lock_guard<std::mutex> lock(stderr_mutex_);
            stderr_done_ = false;
        }
        stderr_reader_thread_ = std::thread(&PipeTransport::stderr_reader_loop, this);
    }

    ready_ = true;
}

void PipeTransport::write(const std::string& data)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!ready_ || input_ended_)
        throw ConnectionError("Transport is not ready for writing");

    try
    {
        channel_->write(data);
    }
    catch (const std::runtime_error& e)
    {
        throw ConnectionError(std::string("Failed to write to process stdin: ") + e.what());
    }
}

std::optional<json> PipeTransport::read_message()
{
    Entry entry;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_cv_.wait(lock, [this] { return !queue_.empty() || queue_stopped_; });

        if (queue_.empty())
            return std::nullopt;

        entry = std::move(queue_.front());
        queue_.pop_front();
    }

    if (entry.error)
        std::rethrow_exception(entry.error);

    try
    {
        return json::parse(entry.line);
    }
    catch (const json::parse_error& e)
    {
        throw JSONDecodeError(std::string("Failed to decode JSON: ") + e.what(), entry.line);
    }
}

void PipeTransport::end_input()
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (input_ended_)
        return;
    input_ended_ = true;
    channel_->close_stdin();
}

void PipeTransport::close()
{
    if (closed_.exchange(true))
        return;

    ready_ = false;

    // A writer stuck on a full pipe holds write_mutex_; release it first
    channel_->interrupt_writes();
    end_input();

    running_ = false;
    join_threads();

    try
    {
        // Give the process a moment to exit on its own after stdin closed
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
        bool exited = channel_->try_wait().has_value();
        while (!exited && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            exited = channel_->try_wait().has_value();
        }
        if (!exited)
            channel_->terminate();
    }
    catch (const std::exception& e)
    {
        internal::Logger().warning(std::string("Failed to stop agent process: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.clear();
    }
    stop_queue();
}

bool PipeTransport::is_ready() const
{
    return ready_ && !closed_ && !input_ended_;
}

std::string PipeTransport::diagnostics() const
{
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    std::string text;
    for (const auto& line : stderr_lines_)
    {
        if (!text.empty())
            text += '\n';
        text += line;
    }
    return text;
}

void PipeTransport::reader_loop()
{
    internal::LineBuffer buffer(options_.max_buffer_size);

    try
    {
        bool eof = false;
        while (running_)
        {
            // Check if stdout has data with timeout
            if (!channel_->poll(ProcessChannel::Stream::Stdout, kPollIntervalMs))
                continue;

            char chunk[kReadChunkSize];
            std::size_t n = channel_->read(ProcessChannel::Stream::Stdout, chunk, sizeof(chunk));
            if (n == 0)
            {
                eof = true;
                break;
            }

            for (auto& line : buffer.add_data(std::string(chunk, n)))
                push_line(std::move(line));

            try
            {
                buffer.check_size();
            }
            catch (const JSONDecodeError&)
            {
                // Oversized line: report it and keep reading
                push_error(std::current_exception());
            }
        }

        if (eof)
        {
            // Last line without a trailing newline
            if (auto rest = buffer.take_remainder())
                push_line(std::move(*rest));
            report_exit_status();
        }
    }
    catch (const std::exception& e)
    {
        push_error(std::make_exception_ptr(
            ConnectionError(std::string("Failed to read from process stdout: ") + e.what())));
    }

    stop_queue();
}

void PipeTransport::report_exit_status()
{
    std::optional<int> exit_code;
    while (running_)
    {
        exit_code = channel_->try_wait();
        if (exit_code)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (!exit_code || *exit_code == 0)
        return;

    // Let the stderr thread drain so the error carries the final lines
    {
        std::unique_lock<std::mutex> lock(stderr_mutex_);
        stderr_cv_.wait_for(lock, std::chrono::milliseconds(500), [this] { return stderr_done_; });
    }

    push_error(std::make_exception_ptr(
        ProcessError("Agent process exited with an error", *exit_code, diagnostics())));
}

void PipeTransport::stderr_reader_loop()
{
    internal::LineBuffer buffer(options_.max_buffer_size);

    auto handle_line = [this](const std::string& line)
    {
        {
            std::lock_guard<std::mutex> lock(stderr_mutex_);
            stderr_lines_.push_back(line);
            if (stderr_lines_.size() > kStderrTailLines)
                stderr_lines_.pop_front();
        }

        if (options_.stderr_callback.has_value())
        {
            try
            {
                (*options_.stderr_callback)(line);
            }
            catch (const std::exception& e)
            {
                internal::Logger().warning(std::string("stderr callback threw: ") + e.what());
            }
        }
    };

    try
    {
        while (running_)
        {
            if (!channel_->poll(ProcessChannel::Stream::Stderr, kPollIntervalMs))
                continue;

            char chunk[kReadChunkSize];
            std::size_t n = channel_->read(ProcessChannel::Stream::Stderr, chunk, sizeof(chunk));
            if (n == 0)
                break;

            for (const auto& line : buffer.add_data(std::string(chunk, n)))
                handle_line(line);

            try
            {
                buffer.check_size();
            }
            catch (const JSONDecodeError&)
            {
                // Overlong stderr line; the buffer was reset, keep draining
            }
        }

        if (auto rest = buffer.take_remainder())
            handle_line(*rest);
    }
    catch (const std::exception& e)
    {
        internal::Logger().warning(std::string("Failed to read process stderr: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(stderr_mutex_);
        stderr_done_ = true;
    }
    stderr_cv_.notify_all();
}

void PipeTransport::push_line(std::string line)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(Entry{std::move(line), nullptr});
    }
    queue_cv_.notify_all();
}

void PipeTransport::push_error(std::exception_ptr error)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(Entry{std::string(), std::move(error)});
    }
    queue_cv_.notify_all();
}

void PipeTransport::stop_queue()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_stopped_ = true;
    }
    queue_cv_.notify_all();
}

void PipeTransport::join_threads()
{
    if (reader_thread_.joinable())
        reader_thread_.join();
    if (stderr_reader_thread_.joinable())
        stderr_reader_thread_.join();
}

} // namespace agentwire

#include "test_utils.hpp"

#include <agentwire/client.hpp>
#include <agentwire/errors.hpp>
#include <agentwire/fd_channel.hpp>
#include <agentwire/pipe_transport.hpp>
#include <future>
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

using namespace agentwire;
using namespace agentwire::test;
using namespace std::chrono_literals;

namespace
{

void write_all(int fd, const std::string& data)
{
    std::size_t written = 0;
    while (written < data.size())
    {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n <= 0)
            return;
        written += static_cast<std::size_t>(n);
    }
}

void close_fd(int& fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

// Three pipes standing in for a launched agent. The test holds the agent's ends.
class PipeFixture : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        int in[2], out[2], err[2];
        ASSERT_EQ(::pipe(in), 0);
        ASSERT_EQ(::pipe(out), 0);
        ASSERT_EQ(::pipe(err), 0);

        agent_stdin_ = in[0];
        host_stdin_ = in[1];
        host_stdout_ = out[0];
        agent_stdout_ = out[1];
        host_stderr_ = err[0];
        agent_stderr_ = err[1];
    }

    void TearDown() override
    {
        transport_.reset();
        close_fd(agent_stdin_);
        close_fd(agent_stdout_);
        close_fd(agent_stderr_);
        close_fd(host_stdin_);
        close_fd(host_stdout_);
        close_fd(host_stderr_);
    }

    // Hand the host ends to a transport; the channel owns them from here on
    void make_transport(PipeTransportOptions options = {}, int pid = 0)
    {
        auto channel = std::make_unique<FdChannel>(host_stdin_, host_stdout_, host_stderr_, pid);
        host_stdin_ = host_stdout_ = host_stderr_ = -1;
        transport_ = std::make_unique<PipeTransport>(std::move(channel), std::move(options));
        transport_->connect();
    }

    // Read one line written by the host from the agent's stdin
    std::string read_agent_stdin()
    {
        std::string line;
        char c;
        while (::read(agent_stdin_, &c, 1) == 1)
        {
            if (c == '\n')
                break;
            line += c;
        }
        return line;
    }

    // Agent side of the handshake: read the initialize request, answer it
    bool answer_initialize()
    {
        const std::string id_key = "\"request_id\":\"";
        std::string line = read_agent_stdin();
        std::size_t start = line.find(id_key);
        if (start == std::string::npos)
            return false;
        start += id_key.size();
        std::string id = line.substr(start, line.find('"', start) - start);

        write_all(agent_stdout_,
                  "{\"type\":\"control_response\",\"response\":{\"subtype\":\"success\","
                  "\"request_id\":\"" +
                      id + "\",\"response\":{\"commands\":[]}}}\n");
        return true;
    }

    int agent_stdin_ = -1;
    int agent_stdout_ = -1;
    int agent_stderr_ = -1;
    int host_stdin_ = -1;
    int host_stdout_ = -1;
    int host_stderr_ = -1;
    std::unique_ptr<PipeTransport> transport_;
};

} // namespace

TEST_F(PipeFixture, ReadsLinesSplitAcrossWrites)
{
    make_transport();
    EXPECT_TRUE(transport_->is_ready());

    write_all(agent_stdout_, "{\"type\":\"res");
    std::this_thread::sleep_for(20ms);
    write_all(agent_stdout_, "ult\",\"n\":1}\n{\"n\":2}\n");

    auto first = transport_->read_message();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ((*first)["type"], "result");

    auto second = transport_->read_message();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ((*second)["n"], 2);
}

TEST_F(PipeFixture, EndOfStreamWithCleanExit)
{
    make_transport();
    write_all(agent_stdout_, "{\"last\":true}");
    close_fd(agent_stdout_);

    auto last = transport_->read_message();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ((*last)["last"], true);
    EXPECT_FALSE(transport_->read_message().has_value());
}

TEST_F(PipeFixture, WriteReachesAgentStdin)
{
    make_transport();
    transport_->write("{\"type\":\"user\"}\n");
    EXPECT_EQ(read_agent_stdin(), "{\"type\":\"user\"}");
}

TEST_F(PipeFixture, EndInputClosesStdin)
{
    make_transport();
    transport_->end_input();
    transport_->end_input();

    EXPECT_FALSE(transport_->is_ready());
    EXPECT_THROW(transport_->write("{}\n"), ConnectionError);

    char c;
    EXPECT_EQ(::read(agent_stdin_, &c, 1), 0);
}

TEST_F(PipeFixture, MalformedLineThenContinues)
{
    make_transport();
    write_all(agent_stdout_, "not json at all\n{\"ok\":true}\n");

    try
    {
        transport_->read_message();
        FAIL() << "Expected JSONDecodeError";
    }
    catch (const JSONDecodeError& e)
    {
        EXPECT_EQ(e.line(), "not json at all");
    }

    auto next = transport_->read_message();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ((*next)["ok"], true);
}

TEST_F(PipeFixture, OversizedLineReportedThenContinues)
{
    PipeTransportOptions options;
    options.max_buffer_size = 64;
    make_transport(options);

    // The complete line ahead of the oversized one is still delivered
    write_all(agent_stdout_, "{\"ok\":0}\n" + std::string(200, 'x'));
    auto first = transport_->read_message();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ((*first)["ok"], 0);
    EXPECT_THROW(transport_->read_message(), JSONDecodeError);

    write_all(agent_stdout_, "\n{\"ok\":1}\n");
    auto next = transport_->read_message();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ((*next)["ok"], 1);
}

TEST_F(PipeFixture, StderrTailAndCallback)
{
    auto lines = std::make_shared<std::vector<std::string>>();
    auto mutex = std::make_shared<std::mutex>();

    PipeTransportOptions options;
    options.stderr_callback = [lines, mutex](const std::string& line)
    {
        std::lock_guard<std::mutex> lock(*mutex);
        lines->push_back(line);
    };
    make_transport(options);

    std::string text;
    for (int i = 0; i < 150; ++i)
        text += "line " + std::to_string(i) + "\n";
    write_all(agent_stderr_, text);

    ASSERT_TRUE(wait_until(
        [&]
        {
            std::lock_guard<std::mutex> lock(*mutex);
            return lines->size() == 150;
        }));

    std::string diagnostics = transport_->diagnostics();
    EXPECT_EQ(diagnostics.rfind("line 50\n", 0), 0u);
    EXPECT_NE(diagnostics.find("line 149"), std::string::npos);
    EXPECT_EQ(diagnostics.find("line 49\n"), std::string::npos);
}

TEST_F(PipeFixture, CloseIsIdempotentAndBlocksReconnect)
{
    make_transport();
    transport_->close();
    transport_->close();

    EXPECT_FALSE(transport_->is_ready());
    EXPECT_FALSE(transport_->read_message().has_value());
    EXPECT_THROW(transport_->connect(), ConnectionError);
}

TEST_F(PipeFixture, NonZeroExitRaisesProcessError)
{
    pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0)
    {
        write_all(agent_stdout_, "{\"type\":\"system\",\"subtype\":\"init\"}\n");
        write_all(agent_stderr_, "fatal: model unavailable\n");
        ::_exit(3);
    }

    close_fd(agent_stdin_);
    close_fd(agent_stdout_);
    close_fd(agent_stderr_);
    make_transport({}, pid);

    auto first = transport_->read_message();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ((*first)["type"], "system");

    try
    {
        transport_->read_message();
        FAIL() << "Expected ProcessError";
    }
    catch (const ProcessError& e)
    {
        EXPECT_EQ(e.exit_code(), 3);
        EXPECT_NE(e.stderr_output().find("fatal: model unavailable"), std::string::npos);
    }

    EXPECT_FALSE(transport_->read_message().has_value());
}

TEST_F(PipeFixture, WriteAfterAgentClosedStdinRaisesConnectionError)
{
    make_transport();
    close_fd(agent_stdin_);

    try
    {
        transport_->write("{\"type\":\"user\"}\n");
        FAIL() << "Expected ConnectionError";
    }
    catch (const ConnectionError& e)
    {
        EXPECT_NE(std::string(e.what()).find("Broken pipe"), std::string::npos);
    }

    // Still usable for teardown
    transport_->close();
    EXPECT_FALSE(transport_->is_ready());
}

TEST_F(PipeFixture, CloseReleasesWriterBlockedOnFullPipe)
{
    make_transport();

    // Nothing drains the agent's stdin, so the write fills the pipe and waits
    std::promise<bool> write_failed;
    auto outcome = write_failed.get_future();
    std::thread writer(
        [&]
        {
            try
            {
                transport_->write(std::string(1 << 20, 'x') + "\n");
                write_failed.set_value(false);
            }
            catch (const ConnectionError&)
            {
                write_failed.set_value(true);
            }
        });

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(outcome.wait_for(0ms), std::future_status::timeout);

    auto closing = std::async(std::launch::async, [&] { transport_->close(); });
    EXPECT_EQ(closing.wait_for(3s), std::future_status::ready);
    ASSERT_EQ(outcome.wait_for(3s), std::future_status::ready);
    EXPECT_TRUE(outcome.get());
    writer.join();
}

TEST(FdChannelTest, RejectsMissingStdout)
{
    EXPECT_THROW(FdChannel(-1, -1), std::invalid_argument);
}

TEST(PipeTransportTest, RejectsNullChannel)
{
    EXPECT_THROW(PipeTransport(nullptr), ConnectionError);
}

// A forked stand-in agent answers initialize and one prompt over real pipes
TEST_F(PipeFixture, ClientSessionOverPipes)
{
    const std::string assistant_line = assistant_text("2 + 2 equals 4").dump() + "\n";
    const std::string result_line = result_message().dump() + "\n";

    pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0)
    {
        // Drop the host ends so stdin reaches EOF when the host ends input
        close_fd(host_stdin_);
        close_fd(host_stdout_);
        close_fd(host_stderr_);

        if (!answer_initialize())
            ::_exit(2);

        read_agent_stdin();
        write_all(agent_stdout_, assistant_line);
        write_all(agent_stdout_, result_line);

        // Exit once the host ends input
        char c;
        while (::read(agent_stdin_, &c, 1) == 1)
        {
        }
        ::_exit(0);
    }

    close_fd(agent_stdin_);
    close_fd(agent_stdout_);
    close_fd(agent_stderr_);

    auto channel = std::make_unique<FdChannel>(host_stdin_, host_stdout_, host_stderr_, pid);
    host_stdin_ = host_stdout_ = host_stderr_ = -1;

    AgentClient client(AgentOptions{}, std::make_unique<PipeTransport>(std::move(channel)));
    client.connect();
    client.send_query("What is 2 + 2?");

    std::vector<Message> messages;
    for (const auto& msg : client.receive_response())
        messages.push_back(msg);

    ASSERT_EQ(messages.size(), 2u);
    ASSERT_TRUE(is_assistant_message(messages[0]));
    EXPECT_EQ(get_text_content(std::get<AssistantMessage>(messages[0]).content), "2 + 2 equals 4");
    EXPECT_TRUE(is_result_message(messages[1]));

    client.disconnect();
    EXPECT_EQ(client.state(), ConnectionState::Closed);
}

// Disconnect must not wait behind a prompt the agent never reads
TEST_F(PipeFixture, DisconnectReleasesBlockedQuery)
{
    std::thread agent([this] { answer_initialize(); });

    auto channel = std::make_unique<FdChannel>(host_stdin_, host_stdout_, host_stderr_);
    host_stdin_ = host_stdout_ = host_stderr_ = -1;

    AgentClient client(AgentOptions{}, std::make_unique<PipeTransport>(std::move(channel)));
    client.connect();
    agent.join();

    std::promise<bool> send_failed;
    auto outcome = send_failed.get_future();
    std::thread sender(
        [&]
        {
            try
            {
                client.send_query(std::string(1 << 20, 'q'));
                send_failed.set_value(false);
            }
            catch (const ConnectionError&)
            {
                send_failed.set_value(true);
            }
        });

    std::this_thread::sleep_for(100ms);

    auto closing = std::async(std::launch::async, [&] { client.disconnect(); });
    EXPECT_EQ(closing.wait_for(3s), std::future_status::ready);
    ASSERT_EQ(outcome.wait_for(3s), std::future_status::ready);
    EXPECT_TRUE(outcome.get());
    sender.join();

    EXPECT_EQ(client.state(), ConnectionState::Closed);
}

#ifndef AGENTWIRE_MEMORY_TRANSPORT_HPP
#define AGENTWIRE_MEMORY_TRANSPORT_HPP

#include <agentwire/transport.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentwire
{

/**
 * In-memory transport for tests and embedding.
 *
 * Inbound lines are queued with push_line()/push_message() and handed out by
 * read_message() in order. Every line written by the engine is recorded and,
 * when a responder is installed, passed to it so tests can script replies.
 *
 * All state lives in a shared handle, so a test can keep a MemoryTransport::Peer
 * after the transport itself has been moved into a client.
 */
class MemoryTransport : public Transport
{
  public:
    class Peer;

    // Receives each written JSON value and the peer handle (to push replies)
    using Responder = std::function<void(const json& written, Peer& peer)>;

    class Peer
    {
      public:
        // Queue a raw inbound line (need not be valid JSON)
        void push_line(const std::string& line);

        // Queue an inbound JSON value
        void push_message(const json& message);

        // No more inbound data after the queued lines
        void finish();

        // Snapshot of written lines (without trailing newline)
        std::vector<std::string> written_lines() const;

        // Written lines parsed as JSON
        std::vector<json> written_messages() const;

        // Block until at least count lines were written; false on timeout
        bool wait_for_writes(std::size_t count, std::chrono::milliseconds timeout) const;

        // Install a callback run for every subsequent write
        void set_responder(Responder responder);

        bool input_ended() const;
        bool closed() const;
        int connect_count() const;

      private:
        friend class MemoryTransport;

        mutable std::mutex mutex_;
        mutable std::condition_variable cv_;
        std::deque<std::string> inbound_;
        std::vector<std::string> written_;
        std::shared_ptr<Responder> responder_;
        bool finished_ = false;
        bool connected_ = false;
        bool input_ended_ = false;
        bool closed_ = false;
        int connect_count_ = 0;
    };

    MemoryTransport();
    ~MemoryTransport() override;

    std::shared_ptr<Peer> peer() const
    {
        return peer_;
    }

    // Transport interface
    void connect() override;
    void write(const std::string& data) override;
    std::optional<json> read_message() override;
    void end_input() override;
    void close() override;
    bool is_ready() const override;

  private:
    std::shared_ptr<Peer> peer_;
};

} // namespace agentwire

#endif // AGENTWIRE_MEMORY_TRANSPORT_HPP

#ifndef AGENTWIRE_CONNECTION_STATE_HPP
#define AGENTWIRE_CONNECTION_STATE_HPP

namespace agentwire
{

// Lifecycle of one agent connection
enum class ConnectionState
{
    Disconnected,
    Connecting, // Transport connected, initialize handshake in flight
    Ready,
    Closing,
    Closed
};

const char* to_string(ConnectionState state);

} // namespace agentwire

#endif // AGENTWIRE_CONNECTION_STATE_HPP

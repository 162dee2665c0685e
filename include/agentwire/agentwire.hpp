#ifndef AGENTWIRE_HPP
#define AGENTWIRE_HPP

// Main header that includes the public API

#include <agentwire/cancellation.hpp>
#include <agentwire/client.hpp>
#include <agentwire/connection_state.hpp>
#include <agentwire/errors.hpp>
#include <agentwire/fd_channel.hpp>
#include <agentwire/hooks.hpp>
#include <agentwire/memory_transport.hpp>
#include <agentwire/options.hpp>
#include <agentwire/permissions.hpp>
#include <agentwire/pipe_transport.hpp>
#include <agentwire/query.hpp>
#include <agentwire/transport.hpp>
#include <agentwire/types.hpp>
#include <agentwire/version.hpp>

#endif // AGENTWIRE_HPP

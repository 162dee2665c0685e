#ifndef AGENTWIRE_INTERNAL_CONFIG_HPP
#define AGENTWIRE_INTERNAL_CONFIG_HPP

#include <agentwire/options.hpp>
#include <chrono>
#include <optional>

namespace agentwire
{
namespace internal
{

// Milliseconds from an environment variable; std::nullopt when unset or not a number
std::optional<long long> env_milliseconds(const char* name);

// options.initialize_timeout, raised by AGENTWIRE_INITIALIZE_TIMEOUT_MS
std::chrono::milliseconds initialize_timeout(const AgentOptions& options);

// options.stream_close_timeout, replaced by a positive AGENTWIRE_STREAM_CLOSE_TIMEOUT_MS
std::chrono::milliseconds stream_close_timeout(const AgentOptions& options);

} // namespace internal
} // namespace agentwire

#endif // AGENTWIRE_INTERNAL_CONFIG_HPP

#ifndef AGENTWIRE_OPTIONS_HPP
#define AGENTWIRE_OPTIONS_HPP

#include <agentwire/hooks.hpp>
#include <agentwire/permissions.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentwire
{

enum class LogLevel
{
    Debug,
    Warning
};

/// Receives library diagnostics instead of std::cerr.
/// May be called from the reader thread and from worker threads.
using LogCallback = std::function<void(LogLevel level, const std::string& line)>;

// Session configuration
struct AgentOptions
{
    /// Hook configurations organized by event type
    /// Example:
    /// ```cpp
    /// opts.hooks[HookEvent::PreToolUse] = {
    ///     HookMatcher{
    ///         "Bash",  // matcher pattern
    ///         {my_hook_callback}  // list of callbacks
    ///     }
    /// };
    /// ```
    std::map<HookEvent, std::vector<HookMatcher>> hooks;

    /// Consulted for every can_use_tool request.
    /// If not set, such requests are answered with an error response.
    std::optional<PermissionCallback> permission_callback;

    /// Bound on the initialize handshake. AGENTWIRE_INITIALIZE_TIMEOUT_MS raises it.
    std::chrono::milliseconds initialize_timeout{60000};

    /// Bound on interrupt/set_permission_mode/set_model/rewind_files. Zero waits forever.
    std::chrono::milliseconds control_request_timeout{60000};

    /// How long query() waits for the first result before ending input when hooks
    /// or a permission callback are configured. AGENTWIRE_STREAM_CLOSE_TIMEOUT_MS overrides it.
    std::chrono::milliseconds stream_close_timeout{60000};

    /// Diagnostics sink; std::cerr when unset
    std::optional<LogCallback> log_callback;
};

} // namespace agentwire

#endif // AGENTWIRE_OPTIONS_HPP

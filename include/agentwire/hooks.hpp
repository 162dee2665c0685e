#ifndef AGENTWIRE_HOOKS_HPP
#define AGENTWIRE_HOOKS_HPP

#include <agentwire/cancellation.hpp>
#include <agentwire/types.hpp>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentwire
{

// ============================================================================
// Hook events
// ============================================================================

/// Lifecycle points at which the agent invokes host hooks
enum class HookEvent
{
    PreToolUse,
    PostToolUse,
    UserPromptSubmit,
    Stop,
    SubagentStop,
    PreCompact
};

/// Wire name, e.g. "PreToolUse"
const char* to_string(HookEvent event);

/// Parse a wire name; std::nullopt when unknown
std::optional<HookEvent> hook_event_from_string(const std::string& name);

// ============================================================================
// Hook inputs (agent -> host)
// ============================================================================

/// Fields common to every hook input
struct BaseHookInput
{
    std::string session_id;
    std::string transcript_path;
    std::string cwd;
    std::optional<std::string> permission_mode;
    json raw = json::object(); // Full input object as received
};

struct PreToolUseHookInput : BaseHookInput
{
    std::string tool_name;
    json tool_input = json::object();
};

struct PostToolUseHookInput : BaseHookInput
{
    std::string tool_name;
    json tool_input = json::object();
    json tool_response;
};

struct UserPromptSubmitHookInput : BaseHookInput
{
    std::string prompt;
};

struct StopHookInput : BaseHookInput
{
    bool stop_hook_active = false;
};

struct SubagentStopHookInput : BaseHookInput
{
    bool stop_hook_active = false;
};

struct PreCompactHookInput : BaseHookInput
{
    std::string trigger; // "manual" or "auto"
    std::optional<std::string> custom_instructions;
};

using HookInput =
    std::variant<PreToolUseHookInput, PostToolUseHookInput, UserPromptSubmitHookInput,
                 StopHookInput, SubagentStopHookInput, PreCompactHookInput>;

/// Event a typed hook input belongs to
HookEvent hook_event_of(const HookInput& input);

/// Common fields of a typed hook input
const BaseHookInput& hook_base_of(const HookInput& input);

/// Build a typed hook input from its "hook_event_name".
/// @throws MessageParseError for a non-object or an unknown event name
HookInput parse_hook_input(const json& input);

// ============================================================================
// Hook outputs (host -> agent)
// ============================================================================

enum class PermissionDecision
{
    Allow,
    Deny,
    Ask
};

/// Event-specific part of a hook output
struct HookSpecificOutput
{
    std::string hook_event_name; // e.g. "PreToolUse"
    std::optional<PermissionDecision> permission_decision;
    std::optional<std::string> permission_decision_reason;
    std::optional<json> updated_input;
    std::optional<std::string> additional_context;

    json to_json() const;
};

/**
 * Value returned by a hook callback.
 *
 * Field names carry a trailing underscore where the wire name is a C++
 * keyword. to_json() produces the names the agent expects ("continue",
 * "stopReason", "hookSpecificOutput", "async", ...) and omits unset fields.
 */
struct HookOutput
{
    std::optional<bool> continue_;
    std::optional<bool> suppress_output;
    std::optional<std::string> stop_reason;
    std::optional<std::string> decision; // "block" to block the action
    std::optional<std::string> system_message;
    std::optional<std::string> reason;
    std::optional<HookSpecificOutput> hook_specific_output;

    // Deferred execution: the agent does not wait for the hook's verdict
    bool async_ = false;
    std::optional<int> async_timeout_ms;

    json to_json() const;
};

/// Context passed alongside every hook invocation
struct HookContext
{
    CancellationToken cancel; // Fires when the session is closing
};

/// Callback invoked when a registered hook is triggered.
/// Runs on a worker thread and may block.
/// @param input Typed hook input
/// @param tool_use_id Tool use identifier (PreToolUse/PostToolUse), if any
/// @param context Cancellation signal for the invocation
using HookCallback = std::function<HookOutput(
    const HookInput& input, const std::optional<std::string>& tool_use_id,
    const HookContext& context)>;

/// Hook matcher configuration
struct HookMatcher
{
    /// Tool name pattern (e.g., "Bash", "Write|Edit"); unset matches every tool
    std::optional<std::string> matcher;

    /// Callbacks to invoke when the matcher applies
    std::vector<HookCallback> hooks;

    /// Timeout in seconds the agent allows for each hook
    std::optional<double> timeout;

    HookMatcher() = default;
    HookMatcher(std::optional<std::string> m, std::vector<HookCallback> h,
                std::optional<double> t = std::nullopt)
        : matcher(std::move(m)), hooks(std::move(h)), timeout(t)
    {
    }
};

} // namespace agentwire

#endif // AGENTWIRE_HOOKS_HPP

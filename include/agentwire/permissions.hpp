#ifndef AGENTWIRE_PERMISSIONS_HPP
#define AGENTWIRE_PERMISSIONS_HPP

#include <agentwire/cancellation.hpp>
#include <agentwire/types.hpp>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentwire
{

/// Where a permission update is persisted
namespace PermissionUpdateDestination
{
constexpr const char* UserSettings = "userSettings";
constexpr const char* ProjectSettings = "projectSettings";
constexpr const char* LocalSettings = "localSettings";
constexpr const char* Session = "session";
} // namespace PermissionUpdateDestination

/// Behavior attached to a rule update
namespace PermissionBehavior
{
constexpr const char* Allow = "allow";
constexpr const char* Deny = "deny";
constexpr const char* Ask = "ask";
} // namespace PermissionBehavior

/// One tool rule, optionally narrowed by rule content
struct PermissionRuleValue
{
    std::string tool_name;
    std::optional<std::string> rule_content = std::nullopt;
};

/// Permission update, either suggested by the agent or returned by the host
struct PermissionUpdate
{
    // addRules, replaceRules, removeRules, setMode, addDirectories or removeDirectories
    std::string type;
    std::optional<std::vector<PermissionRuleValue>> rules = std::nullopt;
    std::optional<std::string> behavior = std::nullopt; // Rule updates only
    std::optional<std::string> mode = std::nullopt;     // setMode only
    std::optional<std::vector<std::string>> directories = std::nullopt;
    std::optional<std::string> destination = std::nullopt; // See PermissionUpdateDestination

    /// Convert to the wire form; only the fields relevant to `type` are emitted
    json to_json() const;

    /// Lenient parse of a suggestion sent by the agent
    static PermissionUpdate from_json(const json& j);
};

/// What the agent told us alongside a can_use_tool request
struct ToolPermissionContext
{
    std::vector<PermissionUpdate> suggestions;
    std::optional<std::string> blocked_path;
    CancellationToken cancel; // Fires when the session is closing
};

/// Let the tool run
struct PermissionResultAllow
{
    // Replacement input; the original input is echoed back when absent
    std::optional<json> updated_input = std::nullopt;
    std::optional<std::vector<PermissionUpdate>> updated_permissions = std::nullopt;
};

/// Refuse the tool; interrupt also stops the current turn
struct PermissionResultDeny
{
    std::string message;
    bool interrupt = false;
};

using PermissionResult = std::variant<PermissionResultAllow, PermissionResultDeny>;

/// Callback invoked when the agent asks whether a tool may run.
/// May block; it runs on a worker thread, not on the reader thread.
/// @param tool_name Tool name (e.g., "Read", "Write", "Bash")
/// @param input Tool-specific arguments
/// @param context Suggestions from the agent and a cancellation token
using PermissionCallback = std::function<PermissionResult(
    const std::string& tool_name, const json& input, const ToolPermissionContext& context)>;

} // namespace agentwire

#endif // AGENTWIRE_PERMISSIONS_HPP

#include <agentwire/errors.hpp>
#include <agentwire/hooks.hpp>

namespace agentwire
{

namespace
{

std::optional<std::string> optional_string(const json& j, const char* key)
{
    if (j.contains(key) && j[key].is_string())
        return j[key].get<std::string>();
    return std::nullopt;
}

void fill_base(BaseHookInput& base, const json& j)
{
    base.session_id = j.value("session_id", "");
    base.transcript_path = j.value("transcript_path", "");
    base.cwd = j.value("cwd", "");
    base.permission_mode = optional_string(j, "permission_mode");
    base.raw = j;
}

const char* to_string(PermissionDecision decision)
{
    switch (decision)
    {
    case PermissionDecision::Allow:
        return "allow";
    case PermissionDecision::Deny:
        return "deny";
    case PermissionDecision::Ask:
        break;
    }
    return "ask";
}

} // namespace

const char* to_string(HookEvent event)
{
    switch (event)
    {
    case HookEvent::PreToolUse:
        return "PreToolUse";
    case HookEvent::PostToolUse:
        return "PostToolUse";
    case HookEvent::UserPromptSubmit:
        return "UserPromptSubmit";
    case HookEvent::Stop:
        return "Stop";
    case HookEvent::SubagentStop:
        return "SubagentStop";
    case HookEvent::PreCompact:
        return "PreCompact";
    }
    return "";
}

std::optional<HookEvent> hook_event_from_string(const std::string& name)
{
    for (HookEvent event : {HookEvent::PreToolUse, HookEvent::PostToolUse,
                            HookEvent::UserPromptSubmit, HookEvent::Stop,
                            HookEvent::SubagentStop, HookEvent::PreCompact})
    {
        if (name == to_string(event))
            return event;
    }
    return std::nullopt;
}

HookEvent hook_event_of(const HookInput& input)
{
    struct Visitor
    {
        HookEvent operator()(const PreToolUseHookInput&) const { return HookEvent::PreToolUse; }
        HookEvent operator()(const PostToolUseHookInput&) const { return HookEvent::PostToolUse; }
        HookEvent operator()(const UserPromptSubmitHookInput&) const
        {
            return HookEvent::UserPromptSubmit;
        }
        HookEvent operator()(const StopHookInput&) const { return HookEvent::Stop; }
        HookEvent operator()(const SubagentStopHookInput&) const { return HookEvent::SubagentStop; }
        HookEvent operator()(const PreCompactHookInput&) const { return HookEvent::PreCompact; }
    };
    return std::visit(Visitor{}, input);
}

const BaseHookInput& hook_base_of(const HookInput& input)
{
    return std::visit([](const auto& typed) -> const BaseHookInput& { return typed; }, input);
}

HookInput parse_hook_input(const json& input)
{
    if (!input.is_object())
        throw MessageParseError("Hook input is not an object", input);

    auto event = hook_event_from_string(input.value("hook_event_name", ""));
    if (!event)
    {
        throw MessageParseError(
            "Unknown hook event name: " + input.value("hook_event_name", std::string("<missing>")),
            input);
    }

    switch (*event)
    {
    case HookEvent::PreToolUse:
    {
        PreToolUseHookInput typed;
        fill_base(typed, input);
        typed.tool_name = input.value("tool_name", "");
        typed.tool_input = input.value("tool_input", json::object());
        return typed;
    }
    case HookEvent::PostToolUse:
    {
        PostToolUseHookInput typed;
        fill_base(typed, input);
        typed.tool_name = input.value("tool_name", "");
        typed.tool_input = input.value("tool_input", json::object());
        if (input.contains("tool_response"))
            typed.tool_response = input["tool_response"];
        return typed;
    }
    case HookEvent::UserPromptSubmit:
    {
        UserPromptSubmitHookInput typed;
        fill_base(typed, input);
        typed.prompt = input.value("prompt", "");
        return typed;
    }
    case HookEvent::Stop:
    {
        StopHookInput typed;
        fill_base(typed, input);
        typed.stop_hook_active = input.value("stop_hook_active", false);
        return typed;
    }
    case HookEvent::SubagentStop:
    {
        SubagentStopHookInput typed;
        fill_base(typed, input);
        typed.stop_hook_active = input.value("stop_hook_active", false);
        return typed;
    }
    case HookEvent::PreCompact:
    {
        PreCompactHookInput typed;
        fill_base(typed, input);
        typed.trigger = input.value("trigger", "");
        typed.custom_instructions = optional_string(input, "custom_instructions");
        return typed;
    }
    }

    throw MessageParseError("Unhandled hook event", input);
}

json HookSpecificOutput::to_json() const
{
    json result = {{"hookEventName", hook_event_name}};
    if (permission_decision.has_value())
        result["permissionDecision"] = to_string(*permission_decision);
    if (permission_decision_reason.has_value())
        result["permissionDecisionReason"] = *permission_decision_reason;
    if (updated_input.has_value())
        result["updatedInput"] = *updated_input;
    if (additional_context.has_value())
        result["additionalContext"] = *additional_context;
    return result;
}

json HookOutput::to_json() const
{
    json result = json::object();

    if (async_)
    {
        result["async"] = true;
        if (async_timeout_ms.has_value())
            result["asyncTimeout"] = *async_timeout_ms;
    }

    if (continue_.has_value())
        result["continue"] = *continue_;
    if (suppress_output.has_value())
        result["suppressOutput"] = *suppress_output;
    if (stop_reason.has_value())
        result["stopReason"] = *stop_reason;
    if (decision.has_value())
        result["decision"] = *decision;
    if (system_message.has_value())
        result["systemMessage"] = *system_message;
    if (reason.has_value())
        result["reason"] = *reason;
    if (hook_specific_output.has_value())
        result["hookSpecificOutput"] = hook_specific_output->to_json();

    return result;
}

} // namespace agentwire

#ifndef AGENTWIRE_TYPES_HPP
#define AGENTWIRE_TYPES_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentwire
{

// JSON type alias - every wire value and free-form payload uses it
using json = nlohmann::json;

// ============================================================================
// Content blocks
// ============================================================================

struct TextBlock
{
    std::string text;
};

struct ThinkingBlock
{
    std::string thinking;
    std::string signature; // Integrity signature issued with the thinking text
};

struct ToolUseBlock
{
    std::string id;
    std::string name;
    json input = json::object();
};

struct ToolResultBlock
{
    std::string tool_use_id;
    std::optional<json> content; // String, array of blocks, or absent
    std::optional<bool> is_error;
};

using ContentBlock = std::variant<TextBlock, ThinkingBlock, ToolUseBlock, ToolResultBlock>;

// ============================================================================
// Output messages
// ============================================================================

// Error categories an assistant message may carry
enum class AssistantMessageError
{
    AuthenticationFailed,
    BillingError,
    RateLimit,
    InvalidRequest,
    ServerError,
    Unknown
};

const char* to_string(AssistantMessageError error);

struct UserMessage
{
    std::vector<ContentBlock> content;
    std::optional<std::string> uuid;
    std::optional<std::string> parent_tool_use_id;
    json raw_json; // Original object, kept for debugging
};

struct AssistantMessage
{
    std::vector<ContentBlock> content;
    std::string model;
    std::optional<std::string> parent_tool_use_id;
    std::optional<AssistantMessageError> error;
    json raw_json; // Original object, kept for debugging
};

struct SystemMessage
{
    std::string subtype;
    json data = json::object(); // Full raw object, extra fields included
};

struct ResultMessage
{
    std::string subtype; // "success", "error_max_turns", ...
    int duration_ms = 0;
    int duration_api_ms = 0;
    bool is_error = false;
    int num_turns = 0;
    std::string session_id;
    std::optional<double> total_cost_usd;
    std::optional<json> usage;
    std::optional<std::string> result;
    std::optional<json> structured_output; // Present when an output schema was requested
    json raw_json;
};

// Partial-message update emitted while a response is being generated
struct StreamEvent
{
    std::string uuid;
    std::string session_id;
    json event = json::object(); // Raw event, e.g. {"type":"content_block_delta",...}
    std::optional<std::string> parent_tool_use_id;
    json raw_json;

    std::string event_type() const
    {
        return event.value("type", "");
    }
};

using Message =
    std::variant<UserMessage, AssistantMessage, SystemMessage, ResultMessage, StreamEvent>;

// Helper functions for type checking
inline bool is_user_message(const Message& msg)
{
    return std::holds_alternative<UserMessage>(msg);
}

inline bool is_assistant_message(const Message& msg)
{
    return std::holds_alternative<AssistantMessage>(msg);
}

inline bool is_system_message(const Message& msg)
{
    return std::holds_alternative<SystemMessage>(msg);
}

inline bool is_result_message(const Message& msg)
{
    return std::holds_alternative<ResultMessage>(msg);
}

inline bool is_stream_event(const Message& msg)
{
    return std::holds_alternative<StreamEvent>(msg);
}

// Concatenated text of all TextBlocks
std::string get_text_content(const std::vector<ContentBlock>& content);

} // namespace agentwire

#endif // AGENTWIRE_TYPES_HPP

#include "message_parser.hpp"

#include <agentwire/errors.hpp>

namespace agentwire
{
namespace protocol
{

namespace
{

const char* kind_name(const json& j)
{
    return j.type_name();
}

[[noreturn]] void missing(const char* context, const std::string& field, const json& raw)
{
    throw MessageParseError(std::string("Missing required field in ") + context + ": " + field,
                            raw);
}

const json& require(const json& obj, const char* key, const char* context, const json& raw)
{
    if (!obj.is_object() || !obj.contains(key))
        missing(context, key, raw);
    return obj[key];
}

std::string require_string(const json& obj, const char* key, const char* context,
                           const json& raw)
{
    const auto& value = require(obj, key, context, raw);
    if (!value.is_string())
    {
        throw MessageParseError(std::string("Field '") + key + "' in " + context +
                                    " must be a string, got " + kind_name(value),
                                raw);
    }
    return value.get<std::string>();
}

int require_int(const json& obj, const char* key, const char* context, const json& raw)
{
    const auto& value = require(obj, key, context, raw);
    if (!value.is_number_integer())
    {
        throw MessageParseError(std::string("Field '") + key + "' in " + context +
                                    " must be an integer, got " + kind_name(value),
                                raw);
    }
    return value.get<int>();
}

bool require_bool(const json& obj, const char* key, const char* context, const json& raw)
{
    const auto& value = require(obj, key, context, raw);
    if (!value.is_boolean())
    {
        throw MessageParseError(std::string("Field '") + key + "' in " + context +
                                    " must be a boolean, got " + kind_name(value),
                                raw);
    }
    return value.get<bool>();
}

std::optional<std::string> optional_string(const json& obj, const char* key)
{
    if (obj.is_object() && obj.contains(key) && obj[key].is_string())
        return obj[key].get<std::string>();
    return std::nullopt;
}

AssistantMessageError parse_assistant_error(const std::string& error)
{
    if (error == "authentication_failed")
        return AssistantMessageError::AuthenticationFailed;
    if (error == "billing_error")
        return AssistantMessageError::BillingError;
    if (error == "rate_limit")
        return AssistantMessageError::RateLimit;
    if (error == "invalid_request")
        return AssistantMessageError::InvalidRequest;
    if (error == "server_error")
        return AssistantMessageError::ServerError;
    return AssistantMessageError::Unknown;
}

} // namespace

Message MessageParser::parse(const json& j)
{
    if (!j.is_object())
    {
        throw MessageParseError(
            std::string("Invalid message data type (expected object, got ") + kind_name(j) + ")",
            j);
    }

    if (!j.contains("type") || !j["type"].is_string())
        throw MessageParseError("Message missing 'type' field", j);

    std::string type = j["type"].get<std::string>();

    if (type == "assistant")
        return parse_assistant_message(j);
    if (type == "user")
        return parse_user_message(j);
    if (type == "result")
        return parse_result_message(j);
    if (type == "system")
        return parse_system_message(j);
    if (type == "stream_event")
        return parse_stream_event(j);

    throw MessageParseError("Unknown message type: " + type, j);
}

Message MessageParser::parse_line(const std::string& line)
{
    json j;
    try
    {
        j = json::parse(line);
    }
    catch (const json::parse_error& e)
    {
        throw JSONDecodeError(std::string("JSON parse error: ") + e.what(), line);
    }
    return parse(j);
}

std::vector<ContentBlock> MessageParser::parse_content_blocks(const json& content,
                                                              const json& raw,
                                                              const char* context)
{
    std::vector<ContentBlock> blocks;

    for (const auto& block : content)
    {
        // Blocks without a recognizable type are skipped for forward compatibility
        if (!block.is_object() || !block.contains("type") || !block["type"].is_string())
            continue;

        std::string type = block["type"].get<std::string>();

        if (type == "text")
        {
            TextBlock text;
            text.text = require_string(block, "text", context, raw);
            blocks.push_back(std::move(text));
        }
        else if (type == "thinking")
        {
            ThinkingBlock thinking;
            thinking.thinking = require_string(block, "thinking", context, raw);
            thinking.signature = require_string(block, "signature", context, raw);
            blocks.push_back(std::move(thinking));
        }
        else if (type == "tool_use")
        {
            ToolUseBlock tool_use;
            tool_use.id = require_string(block, "id", context, raw);
            tool_use.name = require_string(block, "name", context, raw);
            tool_use.input = require(block, "input", context, raw);
            blocks.push_back(std::move(tool_use));
        }
        else if (type == "tool_result")
        {
            ToolResultBlock tool_result;
            tool_result.tool_use_id = require_string(block, "tool_use_id", context, raw);
            if (block.contains("content") && !block["content"].is_null())
                tool_result.content = block["content"];
            if (block.contains("is_error") && block["is_error"].is_boolean())
                tool_result.is_error = block["is_error"].get<bool>();
            blocks.push_back(std::move(tool_result));
        }
    }

    return blocks;
}

UserMessage MessageParser::parse_user_message(const json& j)
{
    static const char* context = "user message";

    UserMessage msg;
    msg.raw_json = j;
    msg.uuid = optional_string(j, "uuid");
    msg.parent_tool_use_id = optional_string(j, "parent_tool_use_id");

    const auto& message = require(j, "message", context, j);
    const auto& content = require(message, "content", context, j);

    if (content.is_string())
    {
        msg.content.push_back(TextBlock{content.get<std::string>()});
    }
    else if (content.is_array())
    {
        msg.content = parse_content_blocks(content, j, context);
    }
    else
    {
        throw MessageParseError(std::string("Field 'content' in user message must be a string "
                                            "or an array, got ") +
                                    kind_name(content),
                                j);
    }

    return msg;
}

AssistantMessage MessageParser::parse_assistant_message(const json& j)
{
    static const char* context = "assistant message";

    AssistantMessage msg;
    msg.raw_json = j;

    // The actual message is wrapped in a "message" field
    const auto& message = require(j, "message", context, j);
    const auto& content = require(message, "content", context, j);
    if (!content.is_array())
    {
        throw MessageParseError(std::string("Field 'content' in assistant message must be an "
                                            "array, got ") +
                                    kind_name(content),
                                j);
    }

    msg.content = parse_content_blocks(content, j, context);
    msg.model = require_string(message, "model", context, j);
    msg.parent_tool_use_id = optional_string(j, "parent_tool_use_id");

    // Error normally sits on the inner message; older peers put it on the envelope
    auto error = optional_string(message, "error");
    if (!error)
        error = optional_string(j, "error");
    if (error)
        msg.error = parse_assistant_error(*error);

    return msg;
}

SystemMessage MessageParser::parse_system_message(const json& j)
{
    SystemMessage msg;
    msg.subtype = require_string(j, "subtype", "system message", j);
    msg.data = j;
    return msg;
}

ResultMessage MessageParser::parse_result_message(const json& j)
{
    static const char* context = "result message";

    ResultMessage msg;
    msg.raw_json = j;

    msg.subtype = require_string(j, "subtype", context, j);
    msg.duration_ms = require_int(j, "duration_ms", context, j);
    msg.duration_api_ms = require_int(j, "duration_api_ms", context, j);
    msg.is_error = require_bool(j, "is_error", context, j);
    msg.num_turns = require_int(j, "num_turns", context, j);
    msg.session_id = require_string(j, "session_id", context, j);

    if (j.contains("total_cost_usd") && j["total_cost_usd"].is_number())
        msg.total_cost_usd = j["total_cost_usd"].get<double>();
    if (j.contains("usage") && j["usage"].is_object())
        msg.usage = j["usage"];
    msg.result = optional_string(j, "result");
    if (j.contains("structured_output") && !j["structured_output"].is_null())
        msg.structured_output = j["structured_output"];

    return msg;
}

StreamEvent MessageParser::parse_stream_event(const json& j)
{
    static const char* context = "stream_event message";

    StreamEvent event;
    event.raw_json = j;
    event.uuid = require_string(j, "uuid", context, j);
    event.session_id = require_string(j, "session_id", context, j);

    const auto& payload = require(j, "event", context, j);
    if (!payload.is_object())
    {
        throw MessageParseError(std::string("Field 'event' in stream_event message must be an "
                                            "object, got ") +
                                    kind_name(payload),
                                j);
    }
    event.event = payload;
    event.parent_tool_use_id = optional_string(j, "parent_tool_use_id");

    return event;
}

} // namespace protocol
} // namespace agentwire

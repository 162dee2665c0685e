#ifndef AGENTWIRE_INTERNAL_MESSAGE_PARSER_HPP
#define AGENTWIRE_INTERNAL_MESSAGE_PARSER_HPP

#include <agentwire/types.hpp>
#include <string>
#include <vector>

namespace agentwire
{
namespace protocol
{

// Decodes agent output objects into typed messages. Stateless.
class MessageParser
{
  public:
    // Decode one JSON object.
    // Throws MessageParseError (carrying the input) on any shape violation.
    static Message parse(const json& j);

    // Decode JSON text first; throws JSONDecodeError on malformed JSON
    static Message parse_line(const std::string& line);

  private:
    static std::vector<ContentBlock> parse_content_blocks(const json& content, const json& raw,
                                                          const char* context);

    static UserMessage parse_user_message(const json& j);
    static AssistantMessage parse_assistant_message(const json& j);
    static SystemMessage parse_system_message(const json& j);
    static ResultMessage parse_result_message(const json& j);
    static StreamEvent parse_stream_event(const json& j);
};

} // namespace protocol
} // namespace agentwire

#endif // AGENTWIRE_INTERNAL_MESSAGE_PARSER_HPP

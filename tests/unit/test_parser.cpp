#include "internal/message_parser.hpp"

#include <agentwire/errors.hpp>
#include <gtest/gtest.h>

using namespace agentwire;
using namespace agentwire::protocol;

TEST(ParserTest, ParseAssistantTextMessage)
{
    std::string line =
        R"({"type":"assistant","message":{"content":[{"type":"text","text":"2 + 2 equals 4"}],"model":"claude-test"}})";

    Message msg = MessageParser::parse_line(line);

    ASSERT_TRUE(is_assistant_message(msg));
    auto& assistant = std::get<AssistantMessage>(msg);
    EXPECT_EQ(assistant.model, "claude-test");
    ASSERT_EQ(assistant.content.size(), 1u);
    EXPECT_EQ(get_text_content(assistant.content), "2 + 2 equals 4");
    EXPECT_FALSE(assistant.error.has_value());
    EXPECT_FALSE(assistant.parent_tool_use_id.has_value());
}

TEST(ParserTest, ParseThinkingBlock)
{
    json j = {{"type", "assistant"},
              {"message",
               {{"model", "m"},
                {"content",
                 json::array({{{"type", "thinking"},
                               {"thinking", "Let me think..."},
                               {"signature", "sig-1"}}})}}}};

    auto assistant = std::get<AssistantMessage>(MessageParser::parse(j));
    ASSERT_EQ(assistant.content.size(), 1u);
    auto* thinking = std::get_if<ThinkingBlock>(&assistant.content[0]);
    ASSERT_NE(thinking, nullptr);
    EXPECT_EQ(thinking->thinking, "Let me think...");
    EXPECT_EQ(thinking->signature, "sig-1");
}

TEST(ParserTest, ParseToolUseAndToolResultBlocks)
{
    std::string line = R"({
        "type":"assistant",
        "parent_tool_use_id":"toolu_parent",
        "message":{
            "model":"m",
            "content":[
                {"type":"tool_use","id":"toolu_1","name":"Read","input":{"path":"/tmp/a.txt"}},
                {"type":"tool_result","tool_use_id":"toolu_1","content":"file body","is_error":false}
            ]
        }
    })";

    auto msg = MessageParser::parse_line(line);
    auto& assistant = std::get<AssistantMessage>(msg);
    ASSERT_EQ(assistant.content.size(), 2u);
    EXPECT_EQ(assistant.parent_tool_use_id, "toolu_parent");

    auto* tool_use = std::get_if<ToolUseBlock>(&assistant.content[0]);
    ASSERT_NE(tool_use, nullptr);
    EXPECT_EQ(tool_use->id, "toolu_1");
    EXPECT_EQ(tool_use->name, "Read");
    EXPECT_EQ(tool_use->input["path"], "/tmp/a.txt");

    auto* tool_result = std::get_if<ToolResultBlock>(&assistant.content[1]);
    ASSERT_NE(tool_result, nullptr);
    EXPECT_EQ(tool_result->tool_use_id, "toolu_1");
    ASSERT_TRUE(tool_result->content.has_value());
    EXPECT_EQ(*tool_result->content, "file body");
    EXPECT_EQ(tool_result->is_error, false);
}

TEST(ParserTest, ToolResultOptionalFieldsMayBeAbsent)
{
    std::string line =
        R"({"type":"user","message":{"content":[{"type":"tool_result","tool_use_id":"t"}]}})";

    auto user = std::get<UserMessage>(MessageParser::parse_line(line));
    auto* tool_result = std::get_if<ToolResultBlock>(&user.content[0]);
    ASSERT_NE(tool_result, nullptr);
    EXPECT_FALSE(tool_result->content.has_value());
    EXPECT_FALSE(tool_result->is_error.has_value());
}

TEST(ParserTest, UnknownAndTypelessBlocksAreSkipped)
{
    std::string line = R"({"type":"assistant","message":{"model":"m","content":[
        {"type":"image","source":{}},
        {"text":"no type"},
        "not an object",
        {"type":"text","text":"kept"}
    ]}})";

    auto assistant = std::get<AssistantMessage>(MessageParser::parse_line(line));
    ASSERT_EQ(assistant.content.size(), 1u);
    EXPECT_EQ(std::get<TextBlock>(assistant.content[0]).text, "kept");
}

TEST(ParserTest, KnownBlockMissingFieldFailsWholeMessage)
{
    std::string line =
        R"({"type":"assistant","message":{"model":"m","content":[{"type":"text","text":"ok"},{"type":"tool_use","id":"t","input":{}}]}})";

    try
    {
        MessageParser::parse_line(line);
        FAIL() << "Expected MessageParseError";
    }
    catch (const MessageParseError& e)
    {
        EXPECT_NE(std::string(e.what()).find("name"), std::string::npos);
        ASSERT_NE(e.data(), nullptr);
        EXPECT_EQ((*e.data())["type"], "assistant");
    }
}

TEST(ParserTest, ThinkingWithoutSignatureIsRejected)
{
    json j = {{"type", "assistant"},
              {"message",
               {{"model", "m"},
                {"content", json::array({{{"type", "thinking"}, {"thinking", "hmm"}}})}}}};

    EXPECT_THROW(MessageParser::parse(j), MessageParseError);
}

TEST(ParserTest, AssistantRequiresModel)
{
    json j = {{"type", "assistant"}, {"message", {{"content", json::array()}}}};

    try
    {
        MessageParser::parse(j);
        FAIL() << "Expected MessageParseError";
    }
    catch (const MessageParseError& e)
    {
        EXPECT_NE(std::string(e.what()).find("model"), std::string::npos);
    }
}

TEST(ParserTest, AssistantRequiresContentArray)
{
    json missing = {{"type", "assistant"}, {"message", {{"model", "m"}}}};
    json wrong_kind = {{"type", "assistant"}, {"message", {{"model", "m"}, {"content", "text"}}}};

    EXPECT_THROW(MessageParser::parse(missing), MessageParseError);
    EXPECT_THROW(MessageParser::parse(wrong_kind), MessageParseError);
}

TEST(ParserTest, AssistantErrorMapping)
{
    auto parse_error = [](const json& error)
    {
        json j = {{"type", "assistant"},
                  {"message", {{"model", "m"}, {"content", json::array()}, {"error", error}}}};
        return std::get<AssistantMessage>(MessageParser::parse(j)).error;
    };

    EXPECT_EQ(parse_error("rate_limit"), AssistantMessageError::RateLimit);
    EXPECT_EQ(parse_error("authentication_failed"), AssistantMessageError::AuthenticationFailed);
    EXPECT_EQ(parse_error("billing_error"), AssistantMessageError::BillingError);
    EXPECT_EQ(parse_error("invalid_request"), AssistantMessageError::InvalidRequest);
    EXPECT_EQ(parse_error("server_error"), AssistantMessageError::ServerError);
    EXPECT_EQ(parse_error("something_new"), AssistantMessageError::Unknown);
}

TEST(ParserTest, AssistantErrorFallsBackToEnvelope)
{
    json j = {{"type", "assistant"},
              {"error", "billing_error"},
              {"message", {{"model", "m"}, {"content", json::array()}}}};

    auto assistant = std::get<AssistantMessage>(MessageParser::parse(j));
    EXPECT_EQ(assistant.error, AssistantMessageError::BillingError);
}

TEST(ParserTest, UserStringContentBecomesTextBlock)
{
    json j = {{"type", "user"},
              {"uuid", "msg-1"},
              {"parent_tool_use_id", "toolu_9"},
              {"message", {{"role", "user"}, {"content", "Hello"}}}};

    auto user = std::get<UserMessage>(MessageParser::parse(j));
    ASSERT_EQ(user.content.size(), 1u);
    EXPECT_EQ(std::get<TextBlock>(user.content[0]).text, "Hello");
    EXPECT_EQ(user.uuid, "msg-1");
    EXPECT_EQ(user.parent_tool_use_id, "toolu_9");
    EXPECT_EQ(user.raw_json, j);
}

TEST(ParserTest, UserRequiresContent)
{
    json no_message = {{"type", "user"}};
    json no_content = {{"type", "user"}, {"message", {{"role", "user"}}}};
    json wrong_kind = {{"type", "user"}, {"message", {{"content", 42}}}};

    EXPECT_THROW(MessageParser::parse(no_message), MessageParseError);
    EXPECT_THROW(MessageParser::parse(no_content), MessageParseError);
    EXPECT_THROW(MessageParser::parse(wrong_kind), MessageParseError);
}

TEST(ParserTest, SystemMessageKeepsRawData)
{
    json j = {{"type", "system"}, {"subtype", "init"}, {"cwd", "/work"}, {"tools", {"Read"}}};

    auto system = std::get<SystemMessage>(MessageParser::parse(j));
    EXPECT_EQ(system.subtype, "init");
    EXPECT_EQ(system.data, j);
    EXPECT_EQ(system.data["cwd"], "/work");
}

TEST(ParserTest, SystemRequiresSubtype)
{
    EXPECT_THROW(MessageParser::parse(json{{"type", "system"}}), MessageParseError);
}

TEST(ParserTest, ResultMessageRequiredAndOptionalFields)
{
    json j = {{"type", "result"},
              {"subtype", "success"},
              {"duration_ms", 1500},
              {"duration_api_ms", 1200},
              {"is_error", false},
              {"num_turns", 2},
              {"session_id", "sess-1"},
              {"total_cost_usd", 0.0123},
              {"usage", {{"input_tokens", 10}}},
              {"result", "4"},
              {"structured_output", {{"answer", 4}}}};

    auto result = std::get<ResultMessage>(MessageParser::parse(j));
    EXPECT_EQ(result.subtype, "success");
    EXPECT_EQ(result.duration_ms, 1500);
    EXPECT_EQ(result.duration_api_ms, 1200);
    EXPECT_FALSE(result.is_error);
    EXPECT_EQ(result.num_turns, 2);
    EXPECT_EQ(result.session_id, "sess-1");
    ASSERT_TRUE(result.total_cost_usd.has_value());
    EXPECT_DOUBLE_EQ(*result.total_cost_usd, 0.0123);
    ASSERT_TRUE(result.usage.has_value());
    EXPECT_EQ((*result.usage)["input_tokens"], 10);
    EXPECT_EQ(result.result, "4");
    ASSERT_TRUE(result.structured_output.has_value());
    EXPECT_EQ((*result.structured_output)["answer"], 4);
}

TEST(ParserTest, ResultOptionalFieldsAreIndependent)
{
    json j = {{"type", "result"},  {"subtype", "error_max_turns"}, {"duration_ms", 1},
              {"duration_api_ms", 1}, {"is_error", true},             {"num_turns", 9},
              {"session_id", "s"}};

    auto result = std::get<ResultMessage>(MessageParser::parse(j));
    EXPECT_TRUE(result.is_error);
    EXPECT_FALSE(result.total_cost_usd.has_value());
    EXPECT_FALSE(result.usage.has_value());
    EXPECT_FALSE(result.result.has_value());
    EXPECT_FALSE(result.structured_output.has_value());
}

TEST(ParserTest, ResultMissingEachRequiredField)
{
    json complete = {{"type", "result"},  {"subtype", "success"}, {"duration_ms", 1},
                     {"duration_api_ms", 1}, {"is_error", false},   {"num_turns", 1},
                     {"session_id", "s"}};

    for (const char* field :
         {"subtype", "duration_ms", "duration_api_ms", "is_error", "num_turns", "session_id"})
    {
        json j = complete;
        j.erase(field);
        try
        {
            MessageParser::parse(j);
            FAIL() << "Expected MessageParseError without " << field;
        }
        catch (const MessageParseError& e)
        {
            EXPECT_NE(std::string(e.what()).find(field), std::string::npos) << e.what();
        }
    }
}

TEST(ParserTest, ResultFieldOfWrongKind)
{
    json j = {{"type", "result"},  {"subtype", "success"}, {"duration_ms", "fast"},
              {"duration_api_ms", 1}, {"is_error", false},   {"num_turns", 1},
              {"session_id", "s"}};

    EXPECT_THROW(MessageParser::parse(j), MessageParseError);
}

TEST(ParserTest, StreamEvent)
{
    json j = {{"type", "stream_event"},
              {"uuid", "u-1"},
              {"session_id", "s-1"},
              {"event", {{"type", "content_block_delta"}}},
              {"parent_tool_use_id", "toolu_2"}};

    auto event = std::get<StreamEvent>(MessageParser::parse(j));
    EXPECT_EQ(event.uuid, "u-1");
    EXPECT_EQ(event.session_id, "s-1");
    EXPECT_EQ(event.event_type(), "content_block_delta");
    EXPECT_EQ(event.parent_tool_use_id, "toolu_2");
}

TEST(ParserTest, StreamEventRequiresObjectEvent)
{
    json missing = {{"type", "stream_event"}, {"uuid", "u"}, {"session_id", "s"}};
    json wrong_kind = {{"type", "stream_event"}, {"uuid", "u"}, {"session_id", "s"}, {"event", 3}};

    EXPECT_THROW(MessageParser::parse(missing), MessageParseError);
    EXPECT_THROW(MessageParser::parse(wrong_kind), MessageParseError);
}

TEST(ParserTest, UnknownTypeIsNamedInError)
{
    try
    {
        MessageParser::parse(json{{"type", "telemetry"}});
        FAIL() << "Expected MessageParseError";
    }
    catch (const MessageParseError& e)
    {
        EXPECT_NE(std::string(e.what()).find("telemetry"), std::string::npos);
    }
}

TEST(ParserTest, MissingTypeAndNonObject)
{
    EXPECT_THROW(MessageParser::parse(json{{"subtype", "x"}}), MessageParseError);
    EXPECT_THROW(MessageParser::parse(json{{"type", 7}}), MessageParseError);
    EXPECT_THROW(MessageParser::parse(json::array()), MessageParseError);
    EXPECT_THROW(MessageParser::parse(json("text")), MessageParseError);
}

TEST(ParserTest, MalformedJsonCarriesLine)
{
    try
    {
        MessageParser::parse_line("{not json");
        FAIL() << "Expected JSONDecodeError";
    }
    catch (const JSONDecodeError& e)
    {
        EXPECT_EQ(e.line(), "{not json");
    }
}

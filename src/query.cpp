#include "internal/config.hpp"

#include <agentwire/client.hpp>
#include <agentwire/errors.hpp>
#include <agentwire/query.hpp>

namespace agentwire
{

QueryResult::QueryResult(std::vector<Message> messages) : messages_(std::move(messages)) {}

std::optional<ResultMessage> QueryResult::result() const
{
    for (auto it = messages_.rbegin(); it != messages_.rend(); ++it)
    {
        if (const auto* result = std::get_if<ResultMessage>(&*it))
            return *result;
    }
    return std::nullopt;
}

QueryResult query(const std::string& prompt, const AgentOptions& options,
                  std::unique_ptr<Transport> transport)
{
    if (prompt.empty())
        throw AgentwireError("Prompt cannot be empty");

    AgentClient client(options, std::move(transport));
    client.connect();
    client.send_query(prompt);

    // Callbacks can only be answered while input is open
    bool has_callbacks = !options.hooks.empty() || options.permission_callback.has_value();
    if (has_callbacks)
        client.wait_for_result(internal::stream_close_timeout(options));
    client.end_input();

    std::vector<Message> messages;
    for (const auto& msg : client.receive_response())
        messages.push_back(msg);

    client.disconnect();
    return QueryResult(std::move(messages));
}

} // namespace agentwire

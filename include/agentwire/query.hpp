#ifndef AGENTWIRE_QUERY_HPP
#define AGENTWIRE_QUERY_HPP

#include <agentwire/options.hpp>
#include <agentwire/transport.hpp>
#include <agentwire/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentwire
{

// Messages collected by a one-shot query, in arrival order
class QueryResult
{
  public:
    using const_iterator = std::vector<Message>::const_iterator;

    QueryResult() = default;
    explicit QueryResult(std::vector<Message> messages);

    const_iterator begin() const
    {
        return messages_.begin();
    }

    const_iterator end() const
    {
        return messages_.end();
    }

    const std::vector<Message>& messages() const
    {
        return messages_;
    }

    // Final ResultMessage, if the agent sent one
    std::optional<ResultMessage> result() const;

  private:
    std::vector<Message> messages_;
};

/**
 * Run one prompt to completion.
 *
 * Connects, sends the prompt, ends input and collects messages through the
 * ResultMessage, then closes the connection. When hooks or a permission
 * callback are configured, input stays open until the first result arrives
 * (bounded by stream_close_timeout) so the agent can still reach them.
 *
 * @throws AgentwireError (or a subclass) on empty prompt or connection failure
 */
QueryResult query(const std::string& prompt, const AgentOptions& options,
                  std::unique_ptr<Transport> transport);

} // namespace agentwire

#endif // AGENTWIRE_QUERY_HPP

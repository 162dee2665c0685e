#include "config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace agentwire
{
namespace internal
{

std::optional<long long> env_milliseconds(const char* name)
{
    const char* env = std::getenv(name);
    if (!env || env[0] == '\0')
        return std::nullopt;

    try
    {
        return std::stoll(env);
    }
    catch (const std::invalid_argument&)
    {
        return std::nullopt;
    }
    catch (const std::out_of_range&)
    {
        return std::nullopt;
    }
}

std::chrono::milliseconds initialize_timeout(const AgentOptions& options)
{
    std::chrono::milliseconds timeout = options.initialize_timeout;
    if (auto parsed = env_milliseconds("AGENTWIRE_INITIALIZE_TIMEOUT_MS"))
    {
        if (*parsed > timeout.count())
            timeout = std::chrono::milliseconds(*parsed);
    }
    return timeout;
}

std::chrono::milliseconds stream_close_timeout(const AgentOptions& options)
{
    if (auto parsed = env_milliseconds("AGENTWIRE_STREAM_CLOSE_TIMEOUT_MS"))
    {
        if (*parsed > 0)
            return std::chrono::milliseconds(*parsed);
    }
    return options.stream_close_timeout;
}

} // namespace internal
} // namespace agentwire

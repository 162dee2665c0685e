#include "log.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

namespace agentwire
{
namespace internal
{

namespace
{
bool env_flag_set(const char* name)
{
    const char* value = std::getenv(name);
    return value != nullptr && value[0] != '\0' && std::string(value) != "0";
}
} // namespace

Logger::Logger(std::optional<LogCallback> callback)
    : callback_(std::move(callback)), debug_enabled_(env_flag_set("AGENTWIRE_DEBUG"))
{
}

void Logger::debug(const std::string& line) const
{
    if (debug_enabled_)
        emit(LogLevel::Debug, line);
}

void Logger::warning(const std::string& line) const
{
    emit(LogLevel::Warning, line);
}

void Logger::emit(LogLevel level, const std::string& line) const
{
    if (callback_.has_value())
    {
        try
        {
            (*callback_)(level, line);
            return;
        }
        catch (const std::exception& e)
        {
            std::cerr << "[agentwire] Warning: log callback threw: " << e.what() << "\n";
        }
    }

    std::cerr << (level == LogLevel::Debug ? "[agentwire] [DEBUG] " : "[agentwire] Warning: ")
              << line << std::endl;
}

} // namespace internal
} // namespace agentwire

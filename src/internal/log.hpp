#ifndef AGENTWIRE_INTERNAL_LOG_HPP
#define AGENTWIRE_INTERNAL_LOG_HPP

#include <agentwire/options.hpp>
#include <optional>
#include <string>

namespace agentwire
{
namespace internal
{

// Per-session diagnostics sink. Writes to std::cerr unless a LogCallback is set.
// Debug lines are dropped unless AGENTWIRE_DEBUG is set (and not "0").
class Logger
{
  public:
    explicit Logger(std::optional<LogCallback> callback = std::nullopt);

    void debug(const std::string& line) const;
    void warning(const std::string& line) const;

  private:
    void emit(LogLevel level, const std::string& line) const;

    std::optional<LogCallback> callback_;
    bool debug_enabled_;
};

} // namespace internal
} // namespace agentwire

#endif // AGENTWIRE_INTERNAL_LOG_HPP

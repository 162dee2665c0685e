#ifndef AGENTWIRE_INTERNAL_LINE_BUFFER_HPP
#define AGENTWIRE_INTERNAL_LINE_BUFFER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace agentwire
{
namespace internal
{

// Splits a byte stream into newline-terminated lines
class LineBuffer
{
  public:
    explicit LineBuffer(std::size_t max_buffer_size = 1024 * 1024);

    // Append raw bytes and return every completed line (without '\n', '\r' stripped).
    // Blank lines are dropped.
    std::vector<std::string> add_data(const std::string& data);

    // Throws JSONDecodeError when the unterminated remainder has grown past the
    // maximum size; the buffer is cleared first. Call after add_data().
    void check_size();

    // Remaining unterminated bytes, used at end of stream
    std::optional<std::string> take_remainder();

    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

  private:
    std::string buffer_;
    std::size_t max_buffer_size_;

    // Try to extract one complete line from buffer
    std::optional<std::string> extract_line();
};

} // namespace internal
} // namespace agentwire

#endif // AGENTWIRE_INTERNAL_LINE_BUFFER_HPP

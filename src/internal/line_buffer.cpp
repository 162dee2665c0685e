#include "line_buffer.hpp"

#include <agentwire/errors.hpp>

namespace agentwire
{
namespace internal
{

namespace
{
bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t\r") == std::string::npos;
}
} // namespace

LineBuffer::LineBuffer(std::size_t max_buffer_size) : max_buffer_size_(max_buffer_size) {}

std::vector<std::string> LineBuffer::add_data(const std::string& data)
{
    buffer_ += data;

    std::vector<std::string> lines;
    while (auto line = extract_line())
    {
        if (!is_blank(*line))
            lines.push_back(std::move(*line));
    }
    return lines;
}

void LineBuffer::check_size()
{
    if (buffer_.size() <= max_buffer_size_)
        return;

    std::size_t size = buffer_.size();
    buffer_.clear();
    throw JSONDecodeError("Buffer exceeded maximum size of " + std::to_string(max_buffer_size_) +
                          " bytes (was " + std::to_string(size) + ")");
}

std::optional<std::string> LineBuffer::take_remainder()
{
    if (is_blank(buffer_))
    {
        buffer_.clear();
        return std::nullopt;
    }

    std::string rest = std::move(buffer_);
    buffer_.clear();
    return rest;
}

std::optional<std::string> LineBuffer::extract_line()
{
    std::size_t pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);

    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    return line;
}

} // namespace internal
} // namespace agentwire

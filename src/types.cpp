#include <agentwire/types.hpp>

namespace agentwire
{

const char* to_string(AssistantMessageError error)
{
    switch (error)
    {
    case AssistantMessageError::AuthenticationFailed:
        return "authentication_failed";
    case AssistantMessageError::BillingError:
        return "billing_error";
    case AssistantMessageError::RateLimit:
        return "rate_limit";
    case AssistantMessageError::InvalidRequest:
        return "invalid_request";
    case AssistantMessageError::ServerError:
        return "server_error";
    case AssistantMessageError::Unknown:
        break;
    }
    return "unknown";
}

std::string get_text_content(const std::vector<ContentBlock>& content)
{
    std::string result;

    for (const auto& block : content)
    {
        if (auto* text_block = std::get_if<TextBlock>(&block))
            result += text_block->text;
    }

    return result;
}

} // namespace agentwire

#include "hook_registry.hpp"

#include <mutex>

namespace agentwire
{
namespace internal
{

HookRegistry::HookRegistry(const std::map<HookEvent, std::vector<HookMatcher>>& hooks)
{
    json hooks_config = json::object();
    int next_callback_id = 0;

    for (const auto& [event, matchers] : hooks)
    {
        if (matchers.empty())
            continue;

        json matchers_array = json::array();

        for (const auto& matcher : matchers)
        {
            // Generate callback IDs for all hooks in this matcher
            json callback_ids = json::array();

            for (const auto& callback : matcher.hooks)
            {
                std::string callback_id = "hook_" + std::to_string(next_callback_id++);
                callbacks_[callback_id] = callback;
                callback_ids.push_back(callback_id);
            }

            json matcher_entry = {{"hookCallbackIds", callback_ids}};
            if (matcher.matcher.has_value())
                matcher_entry["matcher"] = *matcher.matcher;
            else
                matcher_entry["matcher"] = nullptr;

            if (matcher.timeout.has_value())
                matcher_entry["timeout"] = *matcher.timeout;

            matchers_array.push_back(matcher_entry);
        }

        hooks_config[to_string(event)] = matchers_array;
    }

    if (!hooks_config.empty())
        config_ = std::move(hooks_config);
}

json HookRegistry::initialize_config() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return config_;
}

std::optional<HookCallback> HookRegistry::find(const std::string& callback_id) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = callbacks_.find(callback_id);
    if (it == callbacks_.end())
        return std::nullopt;
    return it->second;
}

void HookRegistry::register_callback(const std::string& callback_id, HookCallback callback)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    callbacks_[callback_id] = std::move(callback);
}

std::size_t HookRegistry::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return callbacks_.size();
}

} // namespace internal
} // namespace agentwire

#ifndef AGENTWIRE_INTERNAL_HOOK_REGISTRY_HPP
#define AGENTWIRE_INTERNAL_HOOK_REGISTRY_HPP

#include <agentwire/hooks.hpp>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace agentwire
{
namespace internal
{

/**
 * Maps hook callback ids to the host's callbacks for one session.
 *
 * Ids are assigned as hook_0, hook_1, ... in declaration order (events in
 * HookEvent order, then matchers, then callbacks). The same walk produces the
 * "hooks" object sent with the initialize request, so the agent and the
 * registry agree on every id.
 */
class HookRegistry
{
  public:
    HookRegistry() = default;
    explicit HookRegistry(const std::map<HookEvent, std::vector<HookMatcher>>& hooks);

    HookRegistry(const HookRegistry&) = delete;
    HookRegistry& operator=(const HookRegistry&) = delete;

    // {EventName: [{matcher, hookCallbackIds, timeout?}]}, or null when empty
    json initialize_config() const;

    std::optional<HookCallback> find(const std::string& callback_id) const;

    // Register a callback under an explicit id (replaces an existing one)
    void register_callback(const std::string& callback_id, HookCallback callback);

    std::size_t size() const;

  private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, HookCallback> callbacks_;
    json config_;
};

} // namespace internal
} // namespace agentwire

#endif // AGENTWIRE_INTERNAL_HOOK_REGISTRY_HPP

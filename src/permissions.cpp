#include <agentwire/permissions.hpp>

namespace agentwire
{

json PermissionUpdate::to_json() const
{
    json result = {{"type", type}};

    if (destination.has_value())
        result["destination"] = *destination;

    if (type == "addRules" || type == "replaceRules" || type == "removeRules")
    {
        if (rules.has_value())
        {
            json rules_array = json::array();
            for (const auto& rule : *rules)
            {
                rules_array.push_back(json{
                    {"toolName", rule.tool_name},
                    {"ruleContent", rule.rule_content ? json(*rule.rule_content) : json(nullptr)}});
            }
            result["rules"] = rules_array;
        }
        if (behavior.has_value())
            result["behavior"] = *behavior;
    }
    else if (type == "setMode")
    {
        if (mode.has_value())
            result["mode"] = *mode;
    }
    else if (type == "addDirectories" || type == "removeDirectories")
    {
        if (directories.has_value())
            result["directories"] = *directories;
    }

    return result;
}

PermissionUpdate PermissionUpdate::from_json(const json& j)
{
    PermissionUpdate update;
    if (!j.is_object())
        return update;

    update.type = j.value("type", "");

    if (j.contains("rules") && j["rules"].is_array())
    {
        std::vector<PermissionRuleValue> rules;
        for (const auto& rule_json : j["rules"])
        {
            if (!rule_json.is_object())
                continue;
            PermissionRuleValue rule;
            rule.tool_name = rule_json.value("toolName", "");
            if (rule_json.contains("ruleContent") && rule_json["ruleContent"].is_string())
                rule.rule_content = rule_json["ruleContent"].get<std::string>();
            rules.push_back(rule);
        }
        update.rules = rules;
    }

    if (j.contains("behavior") && j["behavior"].is_string())
        update.behavior = j["behavior"].get<std::string>();
    if (j.contains("mode") && j["mode"].is_string())
        update.mode = j["mode"].get<std::string>();
    if (j.contains("directories") && j["directories"].is_array())
    {
        std::vector<std::string> directories;
        for (const auto& dir : j["directories"])
        {
            if (dir.is_string())
                directories.push_back(dir.get<std::string>());
        }
        update.directories = directories;
    }
    if (j.contains("destination") && j["destination"].is_string())
        update.destination = j["destination"].get<std::string>();

    return update;
}

} // namespace agentwire

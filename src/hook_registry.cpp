#include "internal/guards.hpp"

#include <cmath>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <unistd.h>
#include <workhooks/errors.hpp>
#include <workhooks/hook_registry.hpp>
#include <workhooks/logging.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace workhooks
{

namespace
{

const std::set<std::string> ROOT_KEYS = {"version", "defaults", "hooks"};
const std::set<std::string> DEFAULT_KEYS = {"timeout", "shell", "fail_mode", "working_directory",
                                            "enabled"};
const std::set<std::string> HOOK_KEYS = {"name",    "description", "events",
                                         "filter",  "script",      "command",
                                         "timeout", "shell",       "working_directory",
                                         "env",     "fail_mode",   "enabled"};
const std::set<std::string> MATCHER_KEYS = {"type", "filter"};

constexpr std::chrono::seconds LONG_TIMEOUT_WARNING{300};

// Settings inherited by every hook unless it overrides them
struct HookDefaults
{
    std::chrono::milliseconds timeout{30000};
    std::string shell = "/bin/sh";
    FailMode fail_mode = FailMode::Continue;
    std::string working_directory = ".";
    bool enabled = true;
};

bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() > suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_valid_segment(const std::string& segment)
{
    static const std::regex pattern(R"(^[a-z0-9_]+$)");
    return std::regex_match(segment, pattern);
}

std::vector<std::string> split_segments(const std::string& value)
{
    std::vector<std::string> segments;
    size_t start = 0;
    while (true)
    {
        size_t dot = value.find('.', start);
        segments.push_back(value.substr(start, dot == std::string::npos ? std::string::npos
                                                                        : dot - start));
        if (dot == std::string::npos)
            break;
        start = dot + 1;
    }
    return segments;
}

// Plain YAML scalars carry no type; infer one so filters compare like JSON
json scalar_to_json(const YAML::Node& node)
{
    const std::string& text = node.Scalar();
    if (node.Tag() == "!")
        return text; // quoted
    if (text == "true" || text == "True" || text == "TRUE")
        return true;
    if (text == "false" || text == "False" || text == "FALSE")
        return false;
    if (text == "null" || text == "~")
        return nullptr;

    long long integer = 0;
    if (YAML::convert<long long>::decode(node, integer))
        return integer;
    double number = 0;
    if (YAML::convert<double>::decode(node, number))
        return number;
    return text;
}

json yaml_to_json(const YAML::Node& node)
{
    switch (node.Type())
    {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
        return nullptr;
    case YAML::NodeType::Scalar:
        return scalar_to_json(node);
    case YAML::NodeType::Sequence:
    {
        json array = json::array();
        for (const auto& item : node)
            array.push_back(yaml_to_json(item));
        return array;
    }
    case YAML::NodeType::Map:
    {
        json object = json::object();
        for (const auto& entry : node)
            object[entry.first.as<std::string>()] = yaml_to_json(entry.second);
        return object;
    }
    }
    return nullptr;
}

// Collects every problem instead of stopping at the first one
class ConfigParser
{
  public:
    std::vector<HookDefinition> parse(const YAML::Node& root)
    {
        std::vector<HookDefinition> hooks;

        if (root.IsNull())
            return hooks; // empty file
        if (!root.IsMap())
        {
            error("root must be a mapping");
            return hooks;
        }

        check_keys(root, ROOT_KEYS, "root");

        if (root["version"])
        {
            auto version = scalar(root["version"], "version");
            if (version && *version != HOOKS_CONFIG_VERSION && *version != "1")
                error("unsupported version '" + *version + "' (expected " +
                      HOOKS_CONFIG_VERSION + ")");
        }

        HookDefaults defaults = parse_defaults(root["defaults"]);

        const YAML::Node hooks_node = root["hooks"];
        if (!hooks_node || hooks_node.IsNull())
            return hooks;
        if (!hooks_node.IsSequence())
        {
            error("'hooks' must be a list");
            return hooks;
        }

        std::set<std::string> names;
        size_t index = 0;
        for (const auto& entry : hooks_node)
        {
            auto hook = parse_hook(entry, index++, defaults);
            if (!hook)
                continue;
            if (!names.insert(hook->name).second)
            {
                error("duplicate hook name '" + hook->name + "'");
                continue;
            }
            hooks.push_back(std::move(*hook));
        }
        return hooks;
    }

    const std::vector<std::string>& errors() const
    {
        return errors_;
    }

  private:
    void error(const std::string& message)
    {
        errors_.push_back(message);
    }

    void check_keys(const YAML::Node& node, const std::set<std::string>& allowed,
                    const std::string& where)
    {
        for (const auto& entry : node)
        {
            std::string key = entry.first.Scalar();
            if (key == "webhook" && where.rfind("hook", 0) == 0)
                error(where + ": webhook actions are not supported");
            else if (allowed.count(key) == 0)
                error(where + ": unknown key '" + key + "'");
        }
    }

    std::optional<std::string> scalar(const YAML::Node& node, const std::string& where)
    {
        if (!node.IsScalar())
        {
            error(where + " must be a string");
            return std::nullopt;
        }
        return node.Scalar();
    }

    std::optional<std::chrono::milliseconds> timeout(const YAML::Node& node,
                                                     const std::string& where)
    {
        double seconds = 0;
        if (!node.IsScalar() || !YAML::convert<double>::decode(node, seconds) ||
            !std::isfinite(seconds))
        {
            error(where + ": timeout must be a number of seconds");
            return std::nullopt;
        }
        if (seconds <= 0 || seconds > MAX_HOOK_TIMEOUT_SECONDS)
        {
            std::ostringstream oss;
            oss << where << ": timeout " << seconds << " out of range (0, "
                << MAX_HOOK_TIMEOUT_SECONDS << "] seconds";
            error(oss.str());
            return std::nullopt;
        }
        return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
    }

    std::optional<FailMode> fail_mode(const YAML::Node& node, const std::string& where)
    {
        auto text = scalar(node, where + ": fail_mode");
        if (!text)
            return std::nullopt;
        auto mode = fail_mode_from_string(*text);
        if (!mode)
            error(where + ": invalid fail_mode '" + *text + "' (expected continue or stop)");
        return mode;
    }

    std::optional<bool> boolean(const YAML::Node& node, const std::string& where)
    {
        bool value = false;
        if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value))
        {
            error(where + " must be true or false");
            return std::nullopt;
        }
        return value;
    }

    std::optional<json> filter(const YAML::Node& node, const std::string& where)
    {
        if (!node.IsMap())
        {
            error(where + ": filter must be a mapping");
            return std::nullopt;
        }
        return yaml_to_json(node);
    }

    HookDefaults parse_defaults(const YAML::Node& node)
    {
        HookDefaults defaults;
        if (!node || node.IsNull())
            return defaults;
        if (!node.IsMap())
        {
            error("'defaults' must be a mapping");
            return defaults;
        }

        check_keys(node, DEFAULT_KEYS, "defaults");
        if (node["timeout"])
            if (auto value = timeout(node["timeout"], "defaults"))
                defaults.timeout = *value;
        if (node["shell"])
            if (auto value = scalar(node["shell"], "defaults: shell"))
                defaults.shell = *value;
        if (node["fail_mode"])
            if (auto value = fail_mode(node["fail_mode"], "defaults"))
                defaults.fail_mode = *value;
        if (node["working_directory"])
            if (auto value = scalar(node["working_directory"], "defaults: working_directory"))
                defaults.working_directory = *value;
        if (node["enabled"])
            if (auto value = boolean(node["enabled"], "defaults: enabled"))
                defaults.enabled = *value;
        return defaults;
    }

    void parse_events(const YAML::Node& node, const std::string& where, HookDefinition& hook)
    {
        if (!node)
        {
            error(where + ": missing 'events'");
            return;
        }

        std::vector<YAML::Node> entries;
        if (node.IsScalar())
            entries.push_back(node);
        else if (node.IsSequence())
            for (const auto& entry : node)
                entries.push_back(entry);
        else
        {
            error(where + ": 'events' must be a list of event type patterns");
            return;
        }

        if (entries.empty())
            error(where + ": 'events' must not be empty");

        for (const auto& entry : entries)
        {
            EventMatcher matcher;
            if (entry.IsScalar())
            {
                matcher.type = entry.Scalar();
            }
            else if (entry.IsMap())
            {
                check_keys(entry, MATCHER_KEYS, where + ": event");
                if (!entry["type"])
                {
                    error(where + ": event entry without 'type'");
                    continue;
                }
                auto type = scalar(entry["type"], where + ": event type");
                if (!type)
                    continue;
                matcher.type = *type;
                if (entry["filter"])
                    matcher.filter = filter(entry["filter"], where + ": event '" + *type + "'");
            }
            else
            {
                error(where + ": event entry must be a pattern string or a mapping");
                continue;
            }

            if (!is_valid_pattern(matcher.type))
            {
                error(where + ": invalid event pattern '" + matcher.type + "'");
                continue;
            }
            hook.matchers.push_back(std::move(matcher));
        }
    }

    void parse_env(const YAML::Node& node, const std::string& where, HookDefinition& hook)
    {
        static const std::regex key_pattern(R"(^[A-Za-z_][A-Za-z0-9_]*$)");

        if (!node.IsMap())
        {
            error(where + ": env must be a mapping");
            return;
        }
        for (const auto& entry : node)
        {
            std::string key = entry.first.Scalar();
            if (!std::regex_match(key, key_pattern))
            {
                error(where + ": invalid env key '" + key + "'");
                continue;
            }
            if (key.rfind("HOOK_", 0) == 0)
            {
                error(where + ": env key '" + key + "' is reserved");
                continue;
            }
            if (!entry.second.IsScalar())
            {
                error(where + ": env value for '" + key + "' must be a scalar");
                continue;
            }
            hook.env[key] = entry.second.Scalar();
        }
    }

    std::optional<HookDefinition> parse_hook(const YAML::Node& node, size_t index,
                                             const HookDefaults& defaults)
    {
        std::string where = "hooks[" + std::to_string(index) + "]";
        if (!node.IsMap())
        {
            error(where + ": must be a mapping");
            return std::nullopt;
        }

        size_t errors_before = errors_.size();
        HookDefinition hook;
        hook.timeout = defaults.timeout;
        hook.shell = defaults.shell;
        hook.fail_mode = defaults.fail_mode;
        hook.working_directory = defaults.working_directory;
        hook.enabled = defaults.enabled;

        if (!node["name"])
        {
            error(where + ": missing 'name'");
        }
        else if (auto name = scalar(node["name"], where + ": name"))
        {
            static const std::regex name_pattern(R"(^[A-Za-z0-9][A-Za-z0-9_.-]*$)");
            if (!std::regex_match(*name, name_pattern))
                error(where + ": invalid hook name '" + *name + "'");
            else
            {
                hook.name = *name;
                where = "hook '" + hook.name + "'";
            }
        }

        check_keys(node, HOOK_KEYS, where);
        parse_events(node["events"], where, hook);

        if (node["filter"])
            hook.filter = filter(node["filter"], where);

        if (node["script"] && node["command"])
            error(where + ": 'script' and 'command' are mutually exclusive");
        if (node["script"])
        {
            auto script = scalar(node["script"], where + ": script");
            if (script && script->empty())
                error(where + ": script must not be empty");
            else if (script)
                hook.script = *script;
        }
        if (node["command"])
        {
            auto command = scalar(node["command"], where + ": command");
            if (command && command->empty())
                error(where + ": command must not be empty");
            else if (command)
                hook.command = *command;
        }

        if (node["description"])
            if (auto value = scalar(node["description"], where + ": description"))
                hook.description = *value;
        if (node["timeout"])
            if (auto value = timeout(node["timeout"], where))
                hook.timeout = *value;
        if (node["shell"])
            if (auto value = scalar(node["shell"], where + ": shell"))
                hook.shell = *value;
        if (node["working_directory"])
            if (auto value = scalar(node["working_directory"], where + ": working_directory"))
                hook.working_directory = *value;
        if (node["env"])
            parse_env(node["env"], where, hook);
        if (node["fail_mode"])
            if (auto value = fail_mode(node["fail_mode"], where))
                hook.fail_mode = *value;
        if (node["enabled"])
            if (auto value = boolean(node["enabled"], where + ": enabled"))
                hook.enabled = *value;

        if (errors_.size() != errors_before || hook.name.empty())
            return std::nullopt;
        return hook;
    }

    std::vector<std::string> errors_;
};

bool loose_equal(const json& expected, const json& actual)
{
    if (expected.is_number() && actual.is_number())
        return expected.get<double>() == actual.get<double>();
    if (expected.type() == actual.type())
        return expected == actual;

    // "3" in YAML against 3 in the context, or the reverse
    auto text = [](const json& v) { return v.is_string() ? v.get<std::string>() : v.dump(); };
    return text(expected) == text(actual);
}

json as_list(const json& value)
{
    return value.is_array() ? value : json::array({value});
}

bool list_contains(const json& list, const json& value)
{
    for (const auto& item : list)
        if (loose_equal(item, value))
            return true;
    return false;
}

// Any element of `actual` (scalar or array) is one of `expected`
bool any_of(const json& expected, const json& actual)
{
    json candidates = as_list(expected);
    for (const auto& value : as_list(actual))
        if (list_contains(candidates, value))
            return true;
    return false;
}

} // namespace

// ============================================================================
// Matching
// ============================================================================

bool is_valid_pattern(const std::string& pattern)
{
    if (pattern == "*")
        return true;

    auto segments = split_segments(pattern);
    size_t stars = 0;
    for (size_t i = 0; i < segments.size(); ++i)
    {
        if (segments[i] == "*")
        {
            // Only a whole leading or trailing segment may be a wildcard
            if (i != 0 && i != segments.size() - 1)
                return false;
            ++stars;
        }
        else if (!is_valid_segment(segments[i]))
        {
            return false;
        }
    }
    return stars <= 1 && segments.size() >= 2;
}

bool matches_pattern(const std::string& pattern, const std::string& event_type)
{
    if (pattern == "*")
        return true;

    if (pattern.size() > 2 && pattern.compare(pattern.size() - 2, 2, ".*") == 0)
    {
        std::string prefix = pattern.substr(0, pattern.size() - 1); // keeps the dot
        if (event_type.size() <= prefix.size() ||
            event_type.compare(0, prefix.size(), prefix) != 0)
            return false;
        return event_type.find('.', prefix.size()) == std::string::npos;
    }

    if (pattern.size() > 2 && pattern.compare(0, 2, "*.") == 0)
        return ends_with(event_type, pattern.substr(1));

    return pattern == event_type;
}

bool matches_filter(const json& filter, const json& context)
{
    if (filter.is_null())
        return true;
    if (!filter.is_object())
        return false;

    for (const auto& [key, expected] : filter.items())
    {
        if (ends_with(key, "_all"))
        {
            std::string base = key.substr(0, key.size() - 4);
            if (!context.contains(base))
                return false;
            json actual = as_list(context[base]);
            for (const auto& value : as_list(expected))
                if (!list_contains(actual, value))
                    return false;
        }
        else if (ends_with(key, "_any"))
        {
            std::string base = key.substr(0, key.size() - 4);
            if (!context.contains(base) || !any_of(expected, context[base]))
                return false;
        }
        else
        {
            if (!context.contains(key))
                return false;
            const json& actual = context[key];
            if (expected.is_array())
            {
                if (!any_of(expected, actual))
                    return false;
            }
            else if (actual.is_array())
            {
                if (!list_contains(actual, expected))
                    return false;
            }
            else if (!loose_equal(expected, actual))
            {
                return false;
            }
        }
    }
    return true;
}

bool hook_matches(const HookDefinition& hook, const Event& event)
{
    if (!hook.enabled)
        return false;
    if (hook.filter && !matches_filter(*hook.filter, event.context))
        return false;

    for (const auto& matcher : hook.matchers)
    {
        if (!matches_pattern(matcher.type, event.event_type))
            continue;
        if (matcher.filter && !matches_filter(*matcher.filter, event.context))
            continue;
        return true;
    }
    return false;
}

// ============================================================================
// HookRegistry
// ============================================================================

HookRegistry::HookRegistry(std::vector<HookDefinition> hooks) : hooks_(std::move(hooks))
{
    std::vector<std::string> errors;
    std::set<std::string> names;
    for (const auto& hook : hooks_)
    {
        if (hook.name.empty())
            errors.push_back("hook with empty name");
        else if (!names.insert(hook.name).second)
            errors.push_back("duplicate hook name '" + hook.name + "'");
        if (hook.script && hook.command)
            errors.push_back("hook '" + hook.name +
                             "': 'script' and 'command' are mutually exclusive");
        for (const auto& matcher : hook.matchers)
            if (!is_valid_pattern(matcher.type))
                errors.push_back("hook '" + hook.name + "': invalid event pattern '" +
                                 matcher.type + "'");
    }
    if (!errors.empty())
        throw ConfigurationError("Invalid hook definitions", errors);
}

HookRegistry HookRegistry::parse(const std::string& yaml_text, const std::string& source_name)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(yaml_text);
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigurationError("Invalid hooks configuration " + source_name,
                                 {std::string("YAML syntax error: ") + e.what()});
    }

    ConfigParser parser;
    std::vector<HookDefinition> hooks;
    try
    {
        hooks = parser.parse(root);
    }
    catch (const YAML::Exception& e)
    {
        std::vector<std::string> errors = parser.errors();
        errors.push_back(std::string("malformed value: ") + e.what());
        throw ConfigurationError("Invalid hooks configuration " + source_name, errors);
    }

    if (!parser.errors().empty())
        throw ConfigurationError("Invalid hooks configuration " + source_name, parser.errors());

    HookRegistry registry;
    registry.hooks_ = std::move(hooks);
    return registry;
}

HookRegistry HookRegistry::load(const fs::path& path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        log::logger()->info("No hooks configuration at {}, no hooks registered", path.string());
        return HookRegistry();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw ConfigurationError("Cannot read hooks configuration " + path.string());

    std::ostringstream content;
    content << file.rdbuf();

    HookRegistry registry = parse(content.str(), path.string());
    log::logger()->debug("Loaded {} hook(s) from {}", registry.size(), path.string());
    return registry;
}

std::vector<HookDefinition> HookRegistry::match(const Event& event) const
{
    std::vector<HookDefinition> matched;
    for (const auto& hook : hooks_)
        if (hook_matches(hook, event))
            matched.push_back(hook);
    return matched;
}

const HookDefinition* HookRegistry::find(const std::string& name) const
{
    for (const auto& hook : hooks_)
        if (hook.name == name)
            return &hook;
    return nullptr;
}

// ============================================================================
// Validation
// ============================================================================

ValidationReport validate_hooks_file(const fs::path& path, const Options& options)
{
    ValidationReport report;

    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        report.warnings.push_back("No hooks configuration found at " + path.string());
        return report;
    }
    report.config_found = true;

    HookRegistry registry;
    try
    {
        registry = HookRegistry::load(path);
    }
    catch (const ConfigurationError& e)
    {
        report.errors = e.errors();
        if (report.errors.empty())
            report.errors.push_back(e.what());
        return report;
    }

    report.hook_count = registry.size();
    const fs::path hooks_dir = options.resolve(options.hooks_dir);

    for (const auto& hook : registry.hooks())
    {
        const std::string where = "hook '" + hook.name + "'";

        if (hook.action_type() == "none")
            report.errors.push_back(where + ": no 'script' or 'command' configured");

        if (hook.script)
        {
            try
            {
                fs::path script = internal::resolve_script_path(hooks_dir, *hook.script);
                if (!fs::exists(script, ec))
                {
                    report.errors.push_back(where + ": script not found: " + script.string());
                }
                else if (!fs::is_regular_file(script, ec))
                {
                    report.errors.push_back(where + ": script is not a regular file: " +
                                            script.string());
                }
                else
                {
                    if (access(script.c_str(), X_OK) != 0)
                        report.warnings.push_back(where + ": script is not executable: " +
                                                  script.string());

                    std::ifstream file(script, std::ios::binary);
                    std::ostringstream content;
                    content << file.rdbuf();
                    for (const auto& finding : internal::scan_dangerous_content(content.str()))
                        report.warnings.push_back(where + ": " + finding);
                }
            }
            catch (const SecurityViolationError& e)
            {
                report.errors.push_back(where + ": " + e.what());
            }
        }

        try
        {
            internal::resolve_working_directory(options.project_root, hook.working_directory);
        }
        catch (const SecurityViolationError& e)
        {
            report.errors.push_back(where + ": " + e.what());
        }

        if (hook.timeout > LONG_TIMEOUT_WARNING)
            report.warnings.push_back(where + ": timeout above " +
                                      std::to_string(LONG_TIMEOUT_WARNING.count()) +
                                      " seconds");
    }

    return report;
}

} // namespace workhooks

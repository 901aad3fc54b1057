#include <cstdlib>
#include <workhooks/errors.hpp>
#include <workhooks/options.hpp>

namespace workhooks
{

namespace
{

std::string get_env(const char* name, const std::string& default_value = "")
{
    const char* value = std::getenv(name);
    return (value != nullptr && value[0] != '\0') ? std::string(value) : default_value;
}

long long get_env_number(const char* name, long long default_value)
{
    std::string value = get_env(name);
    if (value.empty())
        return default_value;

    size_t consumed = 0;
    long long parsed = 0;
    try
    {
        parsed = std::stoll(value, &consumed);
    }
    catch (const std::exception&)
    {
        consumed = 0;
    }
    if (consumed != value.size() || parsed < 0)
        throw ConfigurationError(std::string(name) + " must be a non-negative integer, got '" +
                                 value + "'");
    return parsed;
}

} // namespace

std::filesystem::path Options::resolve(const std::filesystem::path& path) const
{
    if (path.is_absolute())
        return path;
    return std::filesystem::absolute(project_root / path).lexically_normal();
}

Options Options::from_env(const std::filesystem::path& project_root)
{
    Options options;
    options.project_root =
        std::filesystem::weakly_canonical(std::filesystem::absolute(project_root));

    options.hooks_config = get_env("WORKHOOKS_CONFIG", options.hooks_config.string());
    options.audit_log = get_env("WORKHOOKS_AUDIT_LOG", options.audit_log.string());
    options.audit_max_bytes = static_cast<std::size_t>(get_env_number(
        "WORKHOOKS_AUDIT_MAX_BYTES", static_cast<long long>(options.audit_max_bytes)));
    options.audit_max_generations = static_cast<int>(
        get_env_number("WORKHOOKS_AUDIT_GENERATIONS", options.audit_max_generations));
    options.tracked_dir = get_env("WORKHOOKS_TRACKED_DIR", options.tracked_dir);
    options.id_prefix = get_env("WORKHOOKS_ID_PREFIX", options.id_prefix);
    options.terminal_status = get_env("WORKHOOKS_TERMINAL_STATUS", options.terminal_status);
    options.log_level = get_env("WORKHOOKS_LOG_LEVEL", options.log_level);
    options.grace_period = std::chrono::milliseconds(
        get_env_number("WORKHOOKS_GRACE_MS", options.grace_period.count()));

    return options;
}

} // namespace workhooks

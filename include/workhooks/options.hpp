#ifndef WORKHOOKS_OPTIONS_HPP
#define WORKHOOKS_OPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace workhooks
{

// Runtime configuration shared by every component.
// Relative paths are resolved against project_root by resolve().
struct Options
{
    std::filesystem::path project_root = ".";

    // Hook registry
    std::filesystem::path hooks_config = ".workhooks/hooks.yaml";
    std::filesystem::path hooks_dir = ".workhooks/hooks";

    // Audit log
    std::filesystem::path audit_log = ".workhooks/audit.log";
    std::size_t audit_max_bytes = 10 * 1024 * 1024;
    int audit_max_generations = 5;

    // Work items
    std::string tracked_dir = "backlog/tasks";
    std::string id_prefix = "task";
    std::string event_domain = "task";
    std::string terminal_status = "Done";

    // Executor
    std::chrono::milliseconds grace_period{5000};
    std::size_t max_output_bytes = 1024 * 1024;
    std::vector<std::string> passthrough_env = {"PATH", "HOME", "USER", "LANG", "LC_ALL"};

    // Metrics
    std::chrono::seconds metrics_period{3600};

    std::string log_level = "info";

    /// Absolute form of a path option (unchanged when already absolute)
    std::filesystem::path resolve(const std::filesystem::path& path) const;

    /// Defaults for a project, overridden by WORKHOOKS_* environment variables.
    /// Throws ConfigurationError on a malformed numeric value.
    static Options from_env(const std::filesystem::path& project_root);
};

} // namespace workhooks

#endif // WORKHOOKS_OPTIONS_HPP

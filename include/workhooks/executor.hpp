#ifndef WORKHOOKS_EXECUTOR_HPP
#define WORKHOOKS_EXECUTOR_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <workhooks/options.hpp>
#include <workhooks/types.hpp>

namespace workhooks
{

/// Runs one hook for one event and reports the finalized record.
/// Implementations never throw for hook failures; those become records.
class HookRunner
{
  public:
    virtual ~HookRunner() = default;

    virtual HookExecutionRecord run(const HookDefinition& hook, const Event& event) = 0;
};

struct ExecutorOptions
{
    std::filesystem::path project_root = ".";
    std::filesystem::path hooks_dir = ".workhooks/hooks";
    std::chrono::milliseconds grace_period{5000};
    std::chrono::milliseconds poll_interval{10};
    std::size_t max_output_bytes = 1024 * 1024;
    std::vector<std::string> passthrough_env = {"PATH", "HOME", "USER", "LANG", "LC_ALL"};

    static ExecutorOptions from(const Options& options);
};

/**
 * Process supervisor for hook actions.
 *
 * - Script references must stay inside the hooks directory; absolute paths,
 *   ".." segments and escaping symlinks are rejected before anything spawns.
 * - The event is delivered as a single JSON line on stdin. Nothing from the
 *   event reaches the command line.
 * - The child starts from an empty environment plus the pass-through keys,
 *   the hook's env and HOOK_NAME / HOOK_EVENT_TYPE / HOOK_EVENT_ID /
 *   HOOK_WORKSPACE.
 * - At the timeout the process group gets SIGTERM, then SIGKILL after the
 *   grace period.
 */
class SandboxedExecutor : public HookRunner
{
  public:
    explicit SandboxedExecutor(ExecutorOptions options);

    HookExecutionRecord run(const HookDefinition& hook, const Event& event) override;

    /// Environment the child would receive
    std::map<std::string, std::string> build_environment(const HookDefinition& hook,
                                                         const Event& event) const;

    const ExecutorOptions& options() const
    {
        return options_;
    }

  private:
    ExecutorOptions options_;
};

} // namespace workhooks

#endif // WORKHOOKS_EXECUTOR_HPP

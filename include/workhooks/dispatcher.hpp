#ifndef WORKHOOKS_DISPATCHER_HPP
#define WORKHOOKS_DISPATCHER_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <workhooks/audit.hpp>
#include <workhooks/executor.hpp>
#include <workhooks/hook_registry.hpp>
#include <workhooks/metrics.hpp>
#include <workhooks/types.hpp>

namespace workhooks
{

enum class DispatchState
{
    Idle,
    Matching,
    Executing,
    Recording
};

std::string to_string(DispatchState state);

/// Outcome of dispatching one event
struct DispatchResult
{
    std::string event_id;
    std::string event_type;
    std::vector<std::string> matched_hooks;
    std::vector<HookExecutionRecord> executions;
    std::vector<std::string> skipped_hooks; // not started because of a fail-stop block
    bool dry_run = false;

    bool blocked = false;
    std::string blocking_hook;
    std::optional<ExecutionStatus> blocking_status;
    std::string blocking_reason;

    bool succeeded() const
    {
        return !blocked;
    }
};

struct DispatchOptions
{
    bool dry_run = false; // match only: nothing runs, nothing is audited
};

/**
 * Drives Idle -> Matching -> (Executing -> Recording)* -> Idle for each event.
 *
 * Hooks of one event run one at a time in declaration order. Each record is
 * appended to the audit sink (and folded into metrics) before the next hook
 * starts. A non-success of a fail_mode: stop hook blocks the event: the
 * remaining hooks are skipped and the result names the hook, the event and
 * the failure kind. AuditError from the sink propagates.
 */
class Dispatcher
{
  public:
    using StateObserver =
        std::function<void(DispatchState from, DispatchState to, const Event& event,
                           const std::string& hook_name)>;

    Dispatcher(const HookRegistry& registry, HookRunner& runner, AuditSink& audit,
               MetricsAggregator* metrics = nullptr, DispatchOptions options = {});

    DispatchResult dispatch(const Event& event);

    /// Dispatch in order; stops after the first blocked event
    std::vector<DispatchResult> dispatch_all(const std::vector<Event>& events);

    void set_state_observer(StateObserver observer)
    {
        observer_ = std::move(observer);
    }

    DispatchState state() const
    {
        return state_;
    }

  private:
    DispatchResult run_hooks(const Event& event);
    void return_to_idle_after_failure(const Event& event);
    void transition(DispatchState next, const Event& event, const std::string& hook_name = "");
    void record(const HookExecutionRecord& execution, const Event& event);

    const HookRegistry& registry_;
    HookRunner& runner_;
    AuditSink& audit_;
    MetricsAggregator* metrics_;
    DispatchOptions options_;
    StateObserver observer_;
    DispatchState state_ = DispatchState::Idle;
};

} // namespace workhooks

#endif // WORKHOOKS_DISPATCHER_HPP

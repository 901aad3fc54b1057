#include <exception>
#include <workhooks/dispatcher.hpp>
#include <workhooks/logging.hpp>

namespace workhooks
{

std::string to_string(DispatchState state)
{
    switch (state)
    {
    case DispatchState::Idle:
        return "idle";
    case DispatchState::Matching:
        return "matching";
    case DispatchState::Executing:
        return "executing";
    case DispatchState::Recording:
        return "recording";
    }
    return "unknown";
}

Dispatcher::Dispatcher(const HookRegistry& registry, HookRunner& runner, AuditSink& audit,
                       MetricsAggregator* metrics, DispatchOptions options)
    : registry_(registry), runner_(runner), audit_(audit), metrics_(metrics),
      options_(options)
{
}

void Dispatcher::transition(DispatchState next, const Event& event, const std::string& hook_name)
{
    DispatchState previous = state_;
    state_ = next;
    if (observer_)
        observer_(previous, next, event, hook_name);
}

void Dispatcher::record(const HookExecutionRecord& execution, const Event& event)
{
    json stored = audit_.append(make_execution_record(execution, event));
    if (metrics_)
        metrics_->add(stored);
}

DispatchResult Dispatcher::dispatch(const Event& event)
{
    DispatchResult result;
    try
    {
        result = run_hooks(event);
    }
    catch (...)
    {
        // Back to Idle before the failure (usually AuditError) propagates
        return_to_idle_after_failure(event);
        throw;
    }
    transition(DispatchState::Idle, event);
    return result;
}

void Dispatcher::return_to_idle_after_failure(const Event& event)
{
    DispatchState previous = state_;
    state_ = DispatchState::Idle;
    if (!observer_)
        return;
    try
    {
        observer_(previous, DispatchState::Idle, event, "");
    }
    catch (const std::exception& e)
    {
        log::logger()->warn("State observer failed while recovering from {} ({}): {}",
                            event.event_type, event.event_id, e.what());
    }
}

DispatchResult Dispatcher::run_hooks(const Event& event)
{
    auto logger = log::logger();

    DispatchResult result;
    result.event_id = event.event_id;
    result.event_type = event.event_type;
    result.dry_run = options_.dry_run;

    transition(DispatchState::Matching, event);
    std::vector<HookDefinition> matched = registry_.match(event);
    for (const auto& hook : matched)
        result.matched_hooks.push_back(hook.name);

    if (matched.empty())
    {
        logger->info("No hooks matched {} ({})", event.event_type, event.event_id);
        if (!options_.dry_run)
            audit_.append(make_no_match_record(event));
        return result;
    }

    logger->info("{} hook(s) matched {} ({})", matched.size(), event.event_type, event.event_id);
    if (options_.dry_run)
        return result;

    for (size_t i = 0; i < matched.size(); ++i)
    {
        const HookDefinition& hook = matched[i];

        transition(DispatchState::Executing, event, hook.name);
        HookExecutionRecord execution = runner_.run(hook, event);

        transition(DispatchState::Recording, event, hook.name);
        record(execution, event);
        result.executions.push_back(execution);

        if (execution.succeeded())
            continue;

        const std::string kind = to_string(execution.status);
        if (hook.fail_mode == FailMode::Stop)
        {
            result.blocked = true;
            result.blocking_hook = hook.name;
            result.blocking_status = execution.status;
            result.blocking_reason = "hook '" + hook.name + "' " + kind + " for " +
                                     event.event_type + " (" + event.event_id + ")";
            if (!execution.error.empty())
                result.blocking_reason += ": " + execution.error;

            for (size_t j = i + 1; j < matched.size(); ++j)
                result.skipped_hooks.push_back(matched[j].name);

            logger->error("Blocking: {} [fail_mode=stop, {} hook(s) skipped]",
                          result.blocking_reason, result.skipped_hooks.size());
            break;
        }

        logger->warn("Hook '{}' {} for {} ({}), continuing: {}", hook.name, kind,
                     event.event_type, event.event_id, execution.error);
    }

    return result;
}

std::vector<DispatchResult> Dispatcher::dispatch_all(const std::vector<Event>& events)
{
    std::vector<DispatchResult> results;
    for (const auto& event : events)
    {
        results.push_back(dispatch(event));
        if (results.back().blocked)
            break;
    }
    return results;
}

} // namespace workhooks

/**
 * workhooks - command line front end
 *
 * Runs the change-detection pipeline against git (suitable as a
 * post-commit hook), emits manual events, validates and lists the hook
 * configuration and inspects the audit log and its metrics.
 *
 * Exit codes: 0 success, 1 failure (validation, configuration, fail-stop
 * block, unhealthy metrics, broken audit chain), 2 usage error.
 */

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <workhooks/workhooks.hpp>

using namespace workhooks;

namespace
{

constexpr int EXIT_CODE_OK = 0;
constexpr int EXIT_CODE_FAILURE = 1;
constexpr int EXIT_CODE_USAGE = 2;

const char* USAGE = R"(usage: workhooks [--project-root DIR] [--config FILE] [--log-level LEVEL]
                 <command> [options]

commands:
  detect [--before REV] [--after REV] [--dry-run]
  emit <event_type> [--task-id ID] [--set key=value]... [--dry-run] [--json]
  validate
  list
  test <hook> <event_type> [--task-id ID]
  audit [--tail N] [--hook NAME] [--event-type TYPE] [--status STATUS] [--json]
  verify-audit
  metrics [--period SECONDS] [--write FILE] [--json]
  health [--period SECONDS] [--min-success-rate R] [--near-timeout-ratio R]
  version
)";

class UsageError : public std::runtime_error
{
  public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// ============================================================================
// Argument parsing
// ============================================================================

struct Args
{
    std::string command;
    std::vector<std::string> positional;
    std::multimap<std::string, std::string> values;
    std::set<std::string> flags;

    bool has(const std::string& name) const
    {
        return flags.count(name) > 0 || values.count(name) > 0;
    }

    std::string get(const std::string& name, const std::string& fallback = "") const
    {
        auto it = values.find(name);
        return it == values.end() ? fallback : it->second;
    }

    std::vector<std::string> all(const std::string& name) const
    {
        std::vector<std::string> result;
        auto range = values.equal_range(name);
        for (auto it = range.first; it != range.second; ++it)
            result.push_back(it->second);
        return result;
    }
};

// Option name -> takes a value
using OptionTable = std::map<std::string, bool>;

const OptionTable GLOBAL_OPTIONS = {
    {"project-root", true}, {"config", true}, {"log-level", true}, {"help", false}};

const std::map<std::string, OptionTable> COMMAND_OPTIONS = {
    {"detect", {{"before", true}, {"after", true}, {"dry-run", false}}},
    {"emit", {{"task-id", true}, {"set", true}, {"dry-run", false}, {"json", false}}},
    {"validate", {}},
    {"list", {}},
    {"test", {{"task-id", true}}},
    {"audit",
     {{"tail", true}, {"hook", true}, {"event-type", true}, {"status", true}, {"json", false}}},
    {"verify-audit", {}},
    {"metrics", {{"period", true}, {"write", true}, {"json", false}}},
    {"health", {{"period", true}, {"min-success-rate", true}, {"near-timeout-ratio", true}}},
    {"version", {}},
};

Args parse_args(int argc, char* argv[])
{
    Args args;
    const OptionTable* command_options = nullptr;

    for (int i = 1; i < argc; ++i)
    {
        std::string token = argv[i];

        if (token.size() > 2 && token.compare(0, 2, "--") == 0)
        {
            std::string name = token.substr(2);
            std::optional<std::string> inline_value;
            auto eq = name.find('=');
            if (eq != std::string::npos)
            {
                inline_value = name.substr(eq + 1);
                name = name.substr(0, eq);
            }

            const OptionTable* table = nullptr;
            if (GLOBAL_OPTIONS.count(name))
                table = &GLOBAL_OPTIONS;
            else if (command_options && command_options->count(name))
                table = command_options;
            if (!table)
                throw UsageError("unknown option --" + name);

            if (!table->at(name))
            {
                if (inline_value)
                    throw UsageError("option --" + name + " takes no value");
                args.flags.insert(name);
                continue;
            }

            if (inline_value)
                args.values.emplace(name, *inline_value);
            else if (i + 1 < argc)
                args.values.emplace(name, argv[++i]);
            else
                throw UsageError("option --" + name + " requires a value");
            continue;
        }

        if (args.command.empty())
        {
            auto it = COMMAND_OPTIONS.find(token);
            if (it == COMMAND_OPTIONS.end())
                throw UsageError("unknown command '" + token + "'");
            args.command = token;
            command_options = &it->second;
            continue;
        }

        args.positional.push_back(token);
    }

    return args;
}

double parse_number(const std::string& option, const std::string& text)
{
    try
    {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size())
            throw std::invalid_argument(text);
        return value;
    }
    catch (const std::exception&)
    {
        throw UsageError("--" + option + " expects a number, got '" + text + "'");
    }
}

void expect_positional(const Args& args, size_t count, const std::string& what)
{
    if (args.positional.size() != count)
        throw UsageError(args.command + " expects " + what);
}

// ============================================================================
// Shared setup
// ============================================================================

Options make_options(const Args& args)
{
    std::filesystem::path root = args.get("project-root", ".");
    Options options = Options::from_env(root);
    if (args.has("config"))
        options.hooks_config = args.get("config");
    if (args.has("log-level"))
        options.log_level = args.get("log-level");
    log::set_level(options.log_level);
    return options;
}

HookRegistry load_registry(const Options& options)
{
    return HookRegistry::load(options.resolve(options.hooks_config));
}

std::string join(const std::vector<std::string>& items, const std::string& separator)
{
    std::string result;
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i)
            result += separator;
        result += items[i];
    }
    return result;
}

std::string describe_matchers(const HookDefinition& hook)
{
    std::vector<std::string> patterns;
    for (const auto& matcher : hook.matchers)
    {
        std::string text = matcher.type;
        if (matcher.filter)
            text += " " + matcher.filter->dump();
        patterns.push_back(text);
    }
    return join(patterns, ", ");
}

void print_execution(const HookExecutionRecord& execution)
{
    std::cout << "  " << execution.hook_name << ": " << to_string(execution.status);
    if (execution.exit_code)
        std::cout << " (exit " << *execution.exit_code << ")";
    if (execution.signal)
        std::cout << " (signal " << *execution.signal << ")";
    std::cout << " in " << execution.duration.count() << " ms\n";
    if (!execution.error.empty())
        std::cout << "    error: " << execution.error << "\n";
}

json dispatch_to_json(const DispatchResult& result)
{
    json executions = json::array();
    for (const auto& execution : result.executions)
    {
        json item = {{"hook", execution.hook_name},
                     {"status", to_string(execution.status)},
                     {"duration_ms", execution.duration.count()},
                     {"exit_code", execution.exit_code ? json(*execution.exit_code) : json()},
                     {"error", execution.error}};
        executions.push_back(item);
    }

    json j = {{"event_id", result.event_id},
              {"event_type", result.event_type},
              {"dry_run", result.dry_run},
              {"matched_hooks", result.matched_hooks},
              {"executions", executions},
              {"skipped_hooks", result.skipped_hooks},
              {"blocked", result.blocked}};
    if (result.blocked)
        j["blocking_reason"] = result.blocking_reason;
    return j;
}

void print_dispatch(const DispatchResult& result)
{
    std::cout << result.event_type << " (" << result.event_id << ")\n";
    if (result.matched_hooks.empty())
    {
        std::cout << "  no hooks matched\n";
        return;
    }
    if (result.dry_run)
    {
        std::cout << "  would run: " << join(result.matched_hooks, ", ") << "\n";
        return;
    }
    for (const auto& execution : result.executions)
        print_execution(execution);
    if (!result.skipped_hooks.empty())
        std::cout << "  skipped: " << join(result.skipped_hooks, ", ") << "\n";
}

// ============================================================================
// Commands
// ============================================================================

int cmd_detect(const Args& args)
{
    expect_positional(args, 0, "no arguments");
    Options options = make_options(args);

    HookRegistry registry = load_registry(options);
    GitStore store(options.project_root, options.tracked_dir);
    SandboxedExecutor executor(ExecutorOptions::from(options));
    FileAuditLog audit(AuditLogOptions::from(options));

    PipelineOptions pipeline_options = PipelineOptions::from(options);
    pipeline_options.dry_run = args.has("dry-run");

    Pipeline pipeline(store, registry, executor, audit, nullptr, pipeline_options);
    PipelineResult result = pipeline.run(args.get("before", "HEAD~1"), args.get("after", "HEAD"));

    if (result.no_changes)
    {
        std::cout << "No changes detected: " << result.reason << "\n";
        return EXIT_CODE_OK;
    }

    std::cout << result.deltas.size() << " change(s), " << result.events.size()
              << " event(s) between " << result.before_revision << " and "
              << result.after_revision << "\n";
    for (const auto& dispatch : result.dispatches)
        print_dispatch(dispatch);
    if (!result.already_processed.empty())
        std::cout << result.already_processed.size() << " event(s) already processed\n";

    if (result.blocked)
    {
        std::cerr << "Blocked: " << result.blocking_reason << "\n";
        return EXIT_CODE_FAILURE;
    }
    return EXIT_CODE_OK;
}

json parse_set_value(const std::string& text)
{
    // Numbers, booleans and JSON literals keep their type, anything else is a string
    json value = json::parse(text, nullptr, false);
    if (value.is_discarded())
        return text;
    return value;
}

int cmd_emit(const Args& args)
{
    expect_positional(args, 1, "an event type");
    Options options = make_options(args);

    json context = json::object();
    if (args.has("task-id"))
        context["task_id"] = args.get("task-id");
    for (const auto& assignment : args.all("set"))
    {
        auto eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0)
            throw UsageError("--set expects key=value, got '" + assignment + "'");
        context[assignment.substr(0, eq)] = parse_set_value(assignment.substr(eq + 1));
    }

    EmitterOptions emitter_options;
    emitter_options.domain = options.event_domain;
    emitter_options.project_root = options.project_root.string();

    Event event;
    try
    {
        event = EventEmitter(emitter_options).make_event(args.positional[0], context);
    }
    catch (const std::invalid_argument& e)
    {
        throw UsageError(e.what());
    }

    HookRegistry registry = load_registry(options);
    SandboxedExecutor executor(ExecutorOptions::from(options));
    FileAuditLog audit(AuditLogOptions::from(options));

    DispatchOptions dispatch_options;
    dispatch_options.dry_run = args.has("dry-run");
    Dispatcher dispatcher(registry, executor, audit, nullptr, dispatch_options);
    DispatchResult result = dispatcher.dispatch(event);

    if (args.has("json"))
        std::cout << json({{"event", event.to_json()}, {"dispatch", dispatch_to_json(result)}})
                         .dump(2)
                  << "\n";
    else
        print_dispatch(result);

    if (result.blocked)
    {
        std::cerr << "Blocked: " << result.blocking_reason << "\n";
        return EXIT_CODE_FAILURE;
    }
    return EXIT_CODE_OK;
}

int cmd_validate(const Args& args)
{
    expect_positional(args, 0, "no arguments");
    Options options = make_options(args);

    auto path = options.resolve(options.hooks_config);
    std::cout << "Validating: " << path.string() << "\n";
    ValidationReport report = validate_hooks_file(path, options);

    if (!report.errors.empty())
    {
        std::cout << "\nValidation failed with " << report.errors.size() << " error(s):\n";
        for (const auto& error : report.errors)
            std::cout << "  - " << error << "\n";
    }
    if (!report.warnings.empty())
    {
        std::cout << "\n" << report.warnings.size() << " warning(s):\n";
        for (const auto& warning : report.warnings)
            std::cout << "  - " << warning << "\n";
    }
    if (report.ok())
        std::cout << "\nConfiguration is valid (" << report.hook_count << " hook(s))\n";

    return report.ok() ? EXIT_CODE_OK : EXIT_CODE_FAILURE;
}

int cmd_list(const Args& args)
{
    expect_positional(args, 0, "no arguments");
    Options options = make_options(args);
    HookRegistry registry = load_registry(options);

    if (registry.empty())
    {
        std::cout << "No hooks configured\n";
        return EXIT_CODE_OK;
    }

    for (const auto& hook : registry.hooks())
    {
        std::cout << hook.name << (hook.enabled ? "" : " (disabled)") << "\n"
                  << "  events:    " << describe_matchers(hook) << "\n";
        if (hook.filter)
            std::cout << "  filter:    " << hook.filter->dump() << "\n";
        std::cout << "  " << std::left << std::setw(11) << (hook.action_type() + ":")
                  << hook.action() << "\n"
                  << "  fail_mode: " << to_string(hook.fail_mode) << "\n"
                  << "  timeout:   " << hook.timeout.count() << " ms\n";
        if (!hook.description.empty())
            std::cout << "  " << hook.description << "\n";
    }
    return EXIT_CODE_OK;
}

int cmd_test(const Args& args)
{
    expect_positional(args, 2, "a hook name and an event type");
    Options options = make_options(args);
    HookRegistry registry = load_registry(options);

    const std::string& hook_name = args.positional[0];
    const HookDefinition* hook = registry.find(hook_name);
    if (!hook)
    {
        std::vector<std::string> names;
        for (const auto& candidate : registry.hooks())
            names.push_back(candidate.name);
        std::cerr << "Hook not found: " << hook_name << "\n";
        if (!names.empty())
            std::cerr << "Available hooks: " << join(names, ", ") << "\n";
        return EXIT_CODE_FAILURE;
    }

    EmitterOptions emitter_options;
    emitter_options.domain = options.event_domain;
    emitter_options.project_root = options.project_root.string();

    json context = {{"task_id", args.get("task-id", options.id_prefix + "-0")}};
    Event event;
    try
    {
        event = EventEmitter(emitter_options).make_event(args.positional[1], context);
    }
    catch (const std::invalid_argument& e)
    {
        throw UsageError(e.what());
    }

    std::cout << "Testing hook: " << hook->name << "\n"
              << "Event type:   " << event.event_type << "\n"
              << "Event id:     " << event.event_id << "\n\n";

    SandboxedExecutor executor(ExecutorOptions::from(options));
    HookExecutionRecord execution = executor.run(*hook, event);

    print_execution(execution);
    if (!execution.stdout_summary.text.empty())
        std::cout << "\nstdout:\n" << execution.stdout_summary.text << "\n";
    if (!execution.stderr_summary.text.empty())
        std::cout << "\nstderr:\n" << execution.stderr_summary.text << "\n";

    return execution.succeeded() ? EXIT_CODE_OK : EXIT_CODE_FAILURE;
}

std::string nested_string(const json& record, const char* block, const char* key)
{
    if (!record.contains(block) || !record[block].is_object())
        return "";
    const json& value = record[block].value(key, json());
    return value.is_string() ? value.get<std::string>() : "";
}

int cmd_audit(const Args& args)
{
    expect_positional(args, 0, "no arguments");
    Options options = make_options(args);
    FileAuditLog audit(AuditLogOptions::from(options));

    std::vector<json> selected;
    for (const auto& record : audit.records())
    {
        if (args.has("hook") && nested_string(record, "hook", "name") != args.get("hook"))
            continue;
        if (args.has("event-type") &&
            nested_string(record, "event", "event_type") != args.get("event-type"))
            continue;
        if (args.has("status") &&
            nested_string(record, "execution", "status") != args.get("status"))
            continue;
        selected.push_back(record);
    }

    if (args.has("tail"))
    {
        auto tail = static_cast<size_t>(std::max(0.0, parse_number("tail", args.get("tail"))));
        if (selected.size() > tail)
            selected.erase(selected.begin(),
                           selected.begin() + static_cast<std::ptrdiff_t>(selected.size() - tail));
    }

    if (args.has("json"))
    {
        std::cout << json({{"entries", selected}, {"count", selected.size()}}).dump(2) << "\n";
        return EXIT_CODE_OK;
    }

    if (selected.empty())
    {
        std::cout << "No audit entries (" << audit.path().string() << ")\n";
        return EXIT_CODE_OK;
    }

    for (const auto& record : selected)
    {
        std::string type = record.value("record_type", std::string());
        std::cout << std::setw(6) << std::right << record.value("sequence", 0) << "  "
                  << record.value("timestamp", std::string()) << "  " << std::left
                  << std::setw(20) << nested_string(record, "event", "event_type");
        if (type == AuditRecordType::NoMatch)
        {
            std::cout << "  (no hooks matched)\n";
            continue;
        }
        std::cout << "  " << std::setw(24) << nested_string(record, "hook", "name") << "  "
                  << std::setw(8) << nested_string(record, "execution", "status");
        if (record.contains("execution"))
            std::cout << "  " << record["execution"].value("duration_ms", 0) << " ms";
        if (type == AuditRecordType::SecurityViolation)
            std::cout << "  [security: " << nested_string(record, "security", "violation")
                      << "]";
        std::cout << "\n";
    }
    return EXIT_CODE_OK;
}

int cmd_verify_audit(const Args& args)
{
    expect_positional(args, 0, "no arguments");
    Options options = make_options(args);
    FileAuditLog audit(AuditLogOptions::from(options));

    ChainVerification verification = audit.verify_chain();
    if (verification.ok)
    {
        std::cout << "Audit chain intact (" << verification.records_checked << " record(s))\n";
        return EXIT_CODE_OK;
    }

    std::cout << "Audit chain broken:\n";
    for (const auto& problem : verification.problems)
        std::cout << "  - " << problem << "\n";
    return EXIT_CODE_FAILURE;
}

MetricsAggregator aggregate(const Args& args, const Options& options)
{
    std::chrono::seconds period = options.metrics_period;
    if (args.has("period"))
        period = std::chrono::seconds(
            static_cast<std::int64_t>(parse_number("period", args.get("period"))));
    if (period.count() <= 0)
        throw UsageError("--period must be positive");

    MetricsAggregator metrics(period);
    FileAuditLog audit(AuditLogOptions::from(options));
    metrics.ingest(audit.records());
    return metrics;
}

int cmd_metrics(const Args& args)
{
    expect_positional(args, 0, "no arguments");
    Options options = make_options(args);
    MetricsAggregator metrics = aggregate(args, options);

    json artifact = metrics.to_json();
    if (args.has("write"))
    {
        auto path = options.resolve(args.get("write"));
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out)
        {
            std::cerr << "Cannot write " << path.string() << "\n";
            return EXIT_CODE_FAILURE;
        }
        out << artifact.dump(2) << "\n";
        std::cout << "Wrote " << path.string() << "\n";
    }

    if (args.has("json"))
    {
        std::cout << artifact.dump(2) << "\n";
        return EXIT_CODE_OK;
    }

    const auto& windows = metrics.windows();
    if (windows.empty())
    {
        std::cout << "No executions recorded\n";
        return EXIT_CODE_OK;
    }

    for (const auto& window : windows)
    {
        DurationStats d = window.summary.durations();
        std::cout << format_timestamp(window.start) << " .. " << format_timestamp(window.end)
                  << (window.closed ? "" : " (open)") << "\n"
                  << "  executions " << window.summary.executions << ", success rate "
                  << std::fixed << std::setprecision(1) << window.summary.success_rate() * 100.0
                  << "%, p50 " << d.p50 << " ms, p95 " << d.p95 << " ms, p99 " << d.p99
                  << " ms\n";
        for (const auto& [name, stats] : window.by_hook)
            std::cout << "    " << std::left << std::setw(24) << name << " " << stats.executions
                      << " run(s), " << stats.failures << " failed, " << stats.timeouts
                      << " timed out, " << stats.errors << " error(s)\n";
    }

    if (windows.size() >= 2)
    {
        auto trends = compare_windows(windows[windows.size() - 2], windows.back());
        std::cout << "Trend against previous window:\n";
        for (const auto& [name, trend] : trends)
            std::cout << "    " << std::left << std::setw(24) << name << " success "
                      << std::showpos << std::fixed << std::setprecision(1)
                      << trend.success_rate_delta * 100.0 << "%, p95 " << trend.p95_delta
                      << std::noshowpos << " ms\n";
    }
    return EXIT_CODE_OK;
}

int cmd_health(const Args& args)
{
    expect_positional(args, 0, "no arguments");
    Options options = make_options(args);
    MetricsAggregator metrics = aggregate(args, options);

    HealthThresholds thresholds;
    if (args.has("min-success-rate"))
        thresholds.min_success_rate =
            parse_number("min-success-rate", args.get("min-success-rate"));
    if (args.has("near-timeout-ratio"))
        thresholds.near_timeout_ratio =
            parse_number("near-timeout-ratio", args.get("near-timeout-ratio"));

    const MetricsWindow* window = metrics.current();
    if (!window)
    {
        std::cout << "Healthy (no executions recorded)\n";
        return EXIT_CODE_OK;
    }

    HealthReport report = health_check(*window, thresholds);
    if (report.healthy)
    {
        std::cout << "Healthy (" << window->summary.executions << " execution(s) since "
                  << format_timestamp(window->start) << ")\n";
        return EXIT_CODE_OK;
    }

    std::cout << "Unhealthy:\n";
    for (const auto& issue : report.issues)
        std::cout << "  - " << issue << "\n";
    return EXIT_CODE_FAILURE;
}

int dispatch_command(const Args& args)
{
    if (args.command == "detect")
        return cmd_detect(args);
    if (args.command == "emit")
        return cmd_emit(args);
    if (args.command == "validate")
        return cmd_validate(args);
    if (args.command == "list")
        return cmd_list(args);
    if (args.command == "test")
        return cmd_test(args);
    if (args.command == "audit")
        return cmd_audit(args);
    if (args.command == "verify-audit")
        return cmd_verify_audit(args);
    if (args.command == "metrics")
        return cmd_metrics(args);
    if (args.command == "health")
        return cmd_health(args);

    std::cout << TOOL_NAME << " " << version_string() << "\n";
    return EXIT_CODE_OK;
}

} // namespace

int main(int argc, char* argv[])
{
    Args args;
    try
    {
        args = parse_args(argc, argv);
    }
    catch (const UsageError& e)
    {
        std::cerr << "workhooks: " << e.what() << "\n\n" << USAGE;
        return EXIT_CODE_USAGE;
    }

    if (args.has("help") || args.command.empty())
    {
        std::cout << USAGE;
        return args.command.empty() && !args.has("help") ? EXIT_CODE_USAGE : EXIT_CODE_OK;
    }

    try
    {
        return dispatch_command(args);
    }
    catch (const UsageError& e)
    {
        std::cerr << "workhooks: " << e.what() << "\n\n" << USAGE;
        return EXIT_CODE_USAGE;
    }
    catch (const WorkhooksError& e)
    {
        log::logger()->error("{}", e.what());
        return EXIT_CODE_FAILURE;
    }
    catch (const std::exception& e)
    {
        log::logger()->error("Unexpected error: {}", e.what());
        return EXIT_CODE_FAILURE;
    }
}

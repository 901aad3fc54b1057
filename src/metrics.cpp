#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <workhooks/audit.hpp>
#include <workhooks/logging.hpp>
#include <workhooks/metrics.hpp>

namespace workhooks
{

std::int64_t percentile(std::vector<std::int64_t> samples, double p)
{
    if (samples.empty())
        return 0;
    std::sort(samples.begin(), samples.end());

    auto rank =
        static_cast<std::size_t>(std::ceil(p / 100.0 * static_cast<double>(samples.size())));
    rank = std::max<std::size_t>(1, std::min(rank, samples.size()));
    return samples[rank - 1];
}

// ============================================================================
// ExecutionStats
// ============================================================================

void ExecutionStats::add(const HookExecutionRecord& execution)
{
    ++executions;
    switch (execution.status)
    {
    case ExecutionStatus::Success:
        ++successes;
        break;
    case ExecutionStatus::Failed:
        ++failures;
        break;
    case ExecutionStatus::Timeout:
        ++timeouts;
        break;
    case ExecutionStatus::Error:
        ++errors;
        break;
    }
    if (!execution.security.passed)
        ++security_violations;

    samples.push_back(
        {execution.duration.count(), execution.timeout.count(), execution.hook_name,
         execution.event_id});
}

double ExecutionStats::success_rate() const
{
    return executions == 0 ? 0.0
                           : static_cast<double>(successes) / static_cast<double>(executions);
}

DurationStats ExecutionStats::durations() const
{
    DurationStats stats;
    if (samples.empty())
        return stats;

    std::vector<std::int64_t> values;
    values.reserve(samples.size());
    for (const auto& sample : samples)
        values.push_back(sample.duration_ms);

    auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    stats.min = *lo;
    stats.max = *hi;
    double total = 0;
    for (auto value : values)
        total += static_cast<double>(value);
    stats.mean = total / static_cast<double>(values.size());
    stats.p50 = percentile(values, 50);
    stats.p95 = percentile(values, 95);
    stats.p99 = percentile(values, 99);
    return stats;
}

json ExecutionStats::to_json() const
{
    DurationStats d = durations();
    return {{"executions", executions},
            {"successes", successes},
            {"failures", failures},
            {"timeouts", timeouts},
            {"errors", errors},
            {"security_violations", security_violations},
            {"success_rate", success_rate()},
            {"duration_ms",
             {{"min", d.min},
              {"mean", d.mean},
              {"max", d.max},
              {"p50", d.p50},
              {"p95", d.p95},
              {"p99", d.p99}}}};
}

json MetricsWindow::to_json() const
{
    json hooks = json::object();
    for (const auto& [name, stats] : by_hook)
        hooks[name] = stats.to_json();
    json event_types = json::object();
    for (const auto& [type, stats] : by_event_type)
        event_types[type] = stats.to_json();

    return {{"period_start", format_timestamp(start)},
            {"period_end", format_timestamp(end)},
            {"closed", closed},
            {"summary", summary.to_json()},
            {"hooks", hooks},
            {"event_types", event_types}};
}

// ============================================================================
// MetricsAggregator
// ============================================================================

MetricsAggregator::MetricsAggregator(std::chrono::seconds period) : period_(period)
{
    if (period_.count() <= 0)
        throw std::invalid_argument("Metrics period must be positive");
}

Timestamp MetricsAggregator::window_start(Timestamp when) const
{
    auto seconds =
        std::chrono::duration_cast<std::chrono::seconds>(when.time_since_epoch()).count();
    auto period = period_.count();
    auto aligned = seconds - (((seconds % period) + period) % period);
    return Timestamp(std::chrono::seconds(aligned));
}

bool MetricsAggregator::add(const json& record)
{
    if (!record.is_object())
        return false;

    std::int64_t sequence = record.value("sequence", std::int64_t{0});
    if (sequence <= last_sequence_)
        return false;
    last_sequence_ = sequence;

    std::string type = record.value("record_type", std::string(""));
    if (type != AuditRecordType::HookExecution && type != AuditRecordType::SecurityViolation)
        return false;

    auto when = parse_timestamp(record.value("timestamp", std::string("")));
    if (!when)
    {
        log::logger()->warn("Audit record {} has no usable timestamp, not counted", sequence);
        return false;
    }

    Timestamp start = window_start(*when);
    if (!windows_.empty() && start < windows_.back().start)
    {
        log::logger()->debug("Audit record {} belongs to a closed window, not counted", sequence);
        return false;
    }

    if (windows_.empty() || start > windows_.back().start)
    {
        if (!windows_.empty())
            windows_.back().closed = true;
        MetricsWindow window;
        window.start = start;
        window.end = start + period_;
        windows_.push_back(std::move(window));
    }

    HookExecutionRecord execution = execution_from_record(record);
    MetricsWindow& window = windows_.back();
    window.summary.add(execution);
    window.by_hook[execution.hook_name].add(execution);
    window.by_event_type[execution.event_type].add(execution);
    return true;
}

std::size_t MetricsAggregator::ingest(const std::vector<json>& records)
{
    std::size_t taken = 0;
    for (const auto& record : records)
        if (add(record))
            ++taken;
    return taken;
}

const MetricsWindow* MetricsAggregator::current() const
{
    return windows_.empty() ? nullptr : &windows_.back();
}

json MetricsAggregator::to_json() const
{
    json windows = json::array();
    for (const auto& window : windows_)
        windows.push_back(window.to_json());
    return {{"generated_at", now_timestamp()},
            {"period_seconds", period_.count()},
            {"windows", windows}};
}

// ============================================================================
// Trends and health
// ============================================================================

std::map<std::string, HookTrend> compare_windows(const MetricsWindow& previous,
                                                 const MetricsWindow& current)
{
    std::map<std::string, HookTrend> trends;

    for (const auto& [name, stats] : previous.by_hook)
    {
        HookTrend& trend = trends[name];
        trend.in_previous = true;
        trend.previous_success_rate = stats.success_rate();
        trend.previous_p95 = stats.durations().p95;
    }
    for (const auto& [name, stats] : current.by_hook)
    {
        HookTrend& trend = trends[name];
        trend.in_current = true;
        trend.current_success_rate = stats.success_rate();
        trend.current_p95 = stats.durations().p95;
    }
    for (auto& [name, trend] : trends)
    {
        trend.success_rate_delta = trend.current_success_rate - trend.previous_success_rate;
        trend.p95_delta = trend.current_p95 - trend.previous_p95;
    }
    return trends;
}

HealthReport health_check(const MetricsWindow& window, const HealthThresholds& thresholds)
{
    HealthReport report;

    for (const auto& [name, stats] : window.by_hook)
    {
        if (stats.executions > 0 && stats.success_rate() < thresholds.min_success_rate)
        {
            std::ostringstream oss;
            oss << "hook '" << name << "' success rate " << std::fixed << std::setprecision(2)
                << stats.success_rate() * 100.0 << "% below "
                << thresholds.min_success_rate * 100.0 << "%";
            report.issues.push_back(oss.str());
            report.low_success_hooks.push_back(name);
        }

        for (const auto& sample : stats.samples)
        {
            if (sample.timeout_ms <= 0)
                continue;
            double ratio =
                static_cast<double>(sample.duration_ms) / static_cast<double>(sample.timeout_ms);
            if (ratio >= thresholds.near_timeout_ratio)
            {
                std::ostringstream oss;
                oss << "hook '" << name << "' took " << sample.duration_ms << " ms of its "
                    << sample.timeout_ms << " ms timeout (event " << sample.event_id << ")";
                report.issues.push_back(oss.str());
                report.near_timeouts.push_back(sample);
            }
        }
    }

    report.healthy = report.issues.empty();
    return report;
}

json HealthReport::to_json() const
{
    json near = json::array();
    for (const auto& sample : near_timeouts)
        near.push_back({{"hook", sample.hook_name},
                        {"event_id", sample.event_id},
                        {"duration_ms", sample.duration_ms},
                        {"timeout_ms", sample.timeout_ms}});
    return {{"healthy", healthy},
            {"issues", issues},
            {"low_success_hooks", low_success_hooks},
            {"near_timeouts", near}};
}

} // namespace workhooks

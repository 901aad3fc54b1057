#ifndef WORKHOOKS_METRICS_HPP
#define WORKHOOKS_METRICS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <workhooks/types.hpp>

namespace workhooks
{

/// Nearest-rank percentile (rank = ceil(p/100 * n)) of unsorted samples; 0 when empty
std::int64_t percentile(std::vector<std::int64_t> samples, double p);

struct DurationStats
{
    std::int64_t min = 0;
    double mean = 0.0;
    std::int64_t max = 0;
    std::int64_t p50 = 0;
    std::int64_t p95 = 0;
    std::int64_t p99 = 0;
};

struct ExecutionSample
{
    std::int64_t duration_ms = 0;
    std::int64_t timeout_ms = 0;
    std::string hook_name;
    std::string event_id;
};

/// Counters for one hook, one event type or a whole window
struct ExecutionStats
{
    std::size_t executions = 0;
    std::size_t successes = 0;
    std::size_t failures = 0;
    std::size_t timeouts = 0;
    std::size_t errors = 0;
    std::size_t security_violations = 0;
    std::vector<ExecutionSample> samples;

    void add(const HookExecutionRecord& execution);

    double success_rate() const;
    DurationStats durations() const;
    json to_json() const;
};

struct MetricsWindow
{
    Timestamp start;
    Timestamp end;
    bool closed = false;
    ExecutionStats summary;
    std::map<std::string, ExecutionStats> by_hook;
    std::map<std::string, ExecutionStats> by_event_type;

    json to_json() const;
};

/**
 * Folds audit records into fixed, UTC-aligned windows.
 *
 * Records are taken once: anything with a sequence at or below the last one
 * seen is ignored, so re-ingesting the whole log is safe. A window closes
 * when a record of a later period arrives and is not modified afterwards.
 */
class MetricsAggregator
{
  public:
    explicit MetricsAggregator(std::chrono::seconds period = std::chrono::hours(1));

    /// Fold one persisted audit record. Returns false when it was skipped.
    bool add(const json& record);

    /// Fold many records; returns how many were taken
    std::size_t ingest(const std::vector<json>& records);

    const std::vector<MetricsWindow>& windows() const
    {
        return windows_;
    }

    /// Open (most recent) window, or nullptr before the first record
    const MetricsWindow* current() const;

    std::int64_t last_sequence() const
    {
        return last_sequence_;
    }

    std::chrono::seconds period() const
    {
        return period_;
    }

    /// Artifact: {generated_at, period_seconds, windows: [...]}
    json to_json() const;

  private:
    Timestamp window_start(Timestamp when) const;

    std::chrono::seconds period_;
    std::int64_t last_sequence_ = 0;
    std::vector<MetricsWindow> windows_;
};

struct HookTrend
{
    bool in_previous = false;
    bool in_current = false;
    double previous_success_rate = 0.0;
    double current_success_rate = 0.0;
    double success_rate_delta = 0.0;
    std::int64_t previous_p95 = 0;
    std::int64_t current_p95 = 0;
    std::int64_t p95_delta = 0;
};

/// Per-hook change of success rate and p95 between two windows
std::map<std::string, HookTrend> compare_windows(const MetricsWindow& previous,
                                                 const MetricsWindow& current);

struct HealthThresholds
{
    double min_success_rate = 0.9;
    double near_timeout_ratio = 0.8;
};

struct HealthReport
{
    bool healthy = true;
    std::vector<std::string> issues;
    std::vector<std::string> low_success_hooks;
    std::vector<ExecutionSample> near_timeouts;

    json to_json() const;
};

HealthReport health_check(const MetricsWindow& window, const HealthThresholds& thresholds = {});

} // namespace workhooks

#endif // WORKHOOKS_METRICS_HPP

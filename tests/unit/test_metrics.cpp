#include <gtest/gtest.h>
#include <workhooks/audit.hpp>
#include <workhooks/metrics.hpp>

using namespace workhooks;
using namespace std::chrono_literals;

namespace
{

/// Audit records stamped with sequence numbers by an in-memory sink
class RecordFactory
{
  public:
    json execution(const std::string& hook, ExecutionStatus status, std::int64_t duration_ms,
                   const std::string& completed_at, std::int64_t timeout_ms = 30000,
                   const std::string& event_type = "task.completed")
    {
        HookExecutionRecord record;
        record.hook_name = hook;
        record.status = status;
        record.executed = true;
        record.duration = std::chrono::milliseconds(duration_ms);
        record.timeout = std::chrono::milliseconds(timeout_ms);
        record.completed_at = completed_at;
        record.event_type = event_type;
        record.event_id = "evt_" + std::to_string(++counter_);

        Event event;
        event.event_id = record.event_id;
        event.event_type = event_type;
        return sink_.append(make_execution_record(record, event));
    }

    json no_match()
    {
        Event event;
        event.event_id = "evt_" + std::to_string(++counter_);
        event.event_type = "task.created";
        return sink_.append(make_no_match_record(event));
    }

  private:
    MemoryAuditSink sink_;
    int counter_ = 0;
};

} // namespace

TEST(PercentileTest, NearestRank)
{
    std::vector<std::int64_t> samples = {50, 10, 40, 20, 30};
    EXPECT_EQ(percentile(samples, 50), 30);
    EXPECT_EQ(percentile(samples, 95), 50);
    EXPECT_EQ(percentile(samples, 20), 10);
    EXPECT_EQ(percentile(samples, 0), 10);
    EXPECT_EQ(percentile({}, 95), 0);
    EXPECT_EQ(percentile({7}, 99), 7);
}

TEST(PercentileTest, HundredSamples)
{
    std::vector<std::int64_t> samples;
    for (int i = 100; i >= 1; --i)
        samples.push_back(i);
    EXPECT_EQ(percentile(samples, 50), 50);
    EXPECT_EQ(percentile(samples, 95), 95);
    EXPECT_EQ(percentile(samples, 99), 99);
}

TEST(MetricsAggregatorTest, CountsByStatusHookAndEventType)
{
    RecordFactory factory;
    MetricsAggregator aggregator(3600s);

    EXPECT_TRUE(aggregator.add(factory.execution("notify", ExecutionStatus::Success, 100,
                                                 "2025-01-01T10:05:00.000Z")));
    EXPECT_TRUE(aggregator.add(factory.execution("notify", ExecutionStatus::Failed, 300,
                                                 "2025-01-01T10:10:00.000Z")));
    EXPECT_TRUE(aggregator.add(factory.execution("deploy", ExecutionStatus::Timeout, 5000,
                                                 "2025-01-01T10:20:00.000Z", 5000,
                                                 "task.status_changed")));
    EXPECT_FALSE(aggregator.add(factory.no_match()));

    ASSERT_EQ(aggregator.windows().size(), 1u);
    const MetricsWindow* window = aggregator.current();
    ASSERT_NE(window, nullptr);
    EXPECT_EQ(format_timestamp(window->start), "2025-01-01T10:00:00.000Z");
    EXPECT_EQ(format_timestamp(window->end), "2025-01-01T11:00:00.000Z");
    EXPECT_FALSE(window->closed);

    EXPECT_EQ(window->summary.executions, 3u);
    EXPECT_EQ(window->summary.successes, 1u);
    EXPECT_EQ(window->summary.failures, 1u);
    EXPECT_EQ(window->summary.timeouts, 1u);
    EXPECT_EQ(window->by_hook.at("notify").executions, 2u);
    EXPECT_DOUBLE_EQ(window->by_hook.at("notify").success_rate(), 0.5);
    EXPECT_EQ(window->by_event_type.at("task.status_changed").executions, 1u);

    DurationStats d = window->summary.durations();
    EXPECT_EQ(d.min, 100);
    EXPECT_EQ(d.max, 5000);
    EXPECT_EQ(d.p50, 300);
    EXPECT_DOUBLE_EQ(d.mean, 1800.0);
}

TEST(MetricsAggregatorTest, SecurityViolationsCounted)
{
    HookExecutionRecord rejected;
    rejected.hook_name = "bad";
    rejected.status = ExecutionStatus::Error;
    rejected.completed_at = "2025-01-01T10:00:00.000Z";
    rejected.security.passed = false;

    MemoryAuditSink sink;
    MetricsAggregator aggregator;
    ASSERT_TRUE(aggregator.add(sink.append(make_execution_record(rejected, Event{}))));
    EXPECT_EQ(aggregator.current()->summary.errors, 1u);
    EXPECT_EQ(aggregator.current()->summary.security_violations, 1u);
}

TEST(MetricsAggregatorTest, NewPeriodClosesWindow)
{
    RecordFactory factory;
    MetricsAggregator aggregator(3600s);

    aggregator.add(factory.execution("a", ExecutionStatus::Success, 10,
                                     "2025-01-01T10:59:59.999Z"));
    aggregator.add(factory.execution("a", ExecutionStatus::Success, 10,
                                     "2025-01-01T11:00:00.000Z"));
    // Late record for the closed window
    EXPECT_FALSE(aggregator.add(factory.execution("a", ExecutionStatus::Failed, 10,
                                                  "2025-01-01T10:30:00.000Z")));

    ASSERT_EQ(aggregator.windows().size(), 2u);
    EXPECT_TRUE(aggregator.windows()[0].closed);
    EXPECT_EQ(aggregator.windows()[0].summary.executions, 1u);
    EXPECT_FALSE(aggregator.windows()[1].closed);
    EXPECT_EQ(aggregator.windows()[1].summary.failures, 0u);
}

TEST(MetricsAggregatorTest, ReingestingTakesNothingTwice)
{
    RecordFactory factory;
    std::vector<json> records = {
        factory.execution("a", ExecutionStatus::Success, 10, "2025-01-01T10:00:00.000Z"),
        factory.execution("a", ExecutionStatus::Success, 10, "2025-01-01T10:01:00.000Z"),
    };

    MetricsAggregator aggregator;
    EXPECT_EQ(aggregator.ingest(records), 2u);
    EXPECT_EQ(aggregator.ingest(records), 0u);
    EXPECT_EQ(aggregator.last_sequence(), 2);

    records.push_back(
        factory.execution("a", ExecutionStatus::Failed, 10, "2025-01-01T10:02:00.000Z"));
    EXPECT_EQ(aggregator.ingest(records), 1u);
    EXPECT_EQ(aggregator.current()->summary.executions, 3u);
}

TEST(MetricsAggregatorTest, RejectsNonPositivePeriod)
{
    EXPECT_THROW(MetricsAggregator(0s), std::invalid_argument);
}

TEST(MetricsAggregatorTest, ArtifactLayout)
{
    RecordFactory factory;
    MetricsAggregator aggregator(60s);
    aggregator.add(factory.execution("a", ExecutionStatus::Success, 10,
                                     "2025-01-01T10:00:30.000Z"));

    json artifact = aggregator.to_json();
    EXPECT_EQ(artifact["period_seconds"], 60);
    ASSERT_EQ(artifact["windows"].size(), 1u);
    EXPECT_EQ(artifact["windows"][0]["period_start"], "2025-01-01T10:00:00.000Z");
    EXPECT_EQ(artifact["windows"][0]["hooks"]["a"]["executions"], 1);
    EXPECT_EQ(artifact["windows"][0]["summary"]["duration_ms"]["p95"], 10);
}

TEST(MetricsTrendTest, ComparesHooksAcrossWindows)
{
    RecordFactory factory;
    MetricsAggregator aggregator(3600s);
    aggregator.add(factory.execution("a", ExecutionStatus::Success, 100,
                                     "2025-01-01T10:00:00.000Z"));
    aggregator.add(factory.execution("gone", ExecutionStatus::Success, 100,
                                     "2025-01-01T10:00:00.000Z"));
    aggregator.add(factory.execution("a", ExecutionStatus::Failed, 400,
                                     "2025-01-01T11:00:00.000Z"));
    aggregator.add(factory.execution("a", ExecutionStatus::Success, 200,
                                     "2025-01-01T11:00:00.000Z"));

    const auto& windows = aggregator.windows();
    ASSERT_EQ(windows.size(), 2u);
    auto trends = compare_windows(windows[0], windows[1]);

    const HookTrend& a = trends.at("a");
    EXPECT_TRUE(a.in_previous);
    EXPECT_TRUE(a.in_current);
    EXPECT_DOUBLE_EQ(a.success_rate_delta, -0.5);
    EXPECT_EQ(a.p95_delta, 300);

    EXPECT_TRUE(trends.at("gone").in_previous);
    EXPECT_FALSE(trends.at("gone").in_current);
}

TEST(HealthCheckTest, HealthyWindow)
{
    RecordFactory factory;
    MetricsAggregator aggregator;
    aggregator.add(factory.execution("a", ExecutionStatus::Success, 100,
                                     "2025-01-01T10:00:00.000Z"));

    HealthReport report = health_check(*aggregator.current());
    EXPECT_TRUE(report.healthy);
    EXPECT_TRUE(report.issues.empty());
}

TEST(HealthCheckTest, FlagsLowSuccessAndNearTimeouts)
{
    RecordFactory factory;
    MetricsAggregator aggregator;
    aggregator.add(factory.execution("flaky", ExecutionStatus::Failed, 10,
                                     "2025-01-01T10:00:00.000Z"));
    aggregator.add(factory.execution("flaky", ExecutionStatus::Success, 10,
                                     "2025-01-01T10:00:01.000Z"));
    aggregator.add(factory.execution("slow", ExecutionStatus::Success, 900,
                                     "2025-01-01T10:00:02.000Z", 1000));

    HealthReport report = health_check(*aggregator.current());
    EXPECT_FALSE(report.healthy);
    EXPECT_EQ(report.low_success_hooks, std::vector<std::string>{"flaky"});
    ASSERT_EQ(report.near_timeouts.size(), 1u);
    EXPECT_EQ(report.near_timeouts[0].hook_name, "slow");
    EXPECT_EQ(report.issues.size(), 2u);
    EXPECT_EQ(report.issues[0], "hook 'flaky' success rate 50.00% below 90.00%");

    HealthThresholds relaxed;
    relaxed.min_success_rate = 0.5;
    relaxed.near_timeout_ratio = 0.95;
    EXPECT_TRUE(health_check(*aggregator.current(), relaxed).healthy);
}

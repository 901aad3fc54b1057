#ifndef WORKHOOKS_TYPES_HPP
#define WORKHOOKS_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace workhooks
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// ============================================================================
// Work items
// ============================================================================

/// One checkbox line of a work item's acceptance criteria
struct AcceptanceItem
{
    int index = 0; // "#N" marker, or 1-based position when absent
    std::string text;
    bool checked = false;
};

/// Parsed state of one tracked work item at a revision
struct Snapshot
{
    std::string id; // e.g. "task-42" or "task-42.1"
    std::string title;
    std::string status;
    std::string priority;
    std::set<std::string> labels;
    std::vector<AcceptanceItem> acceptance_items;
    std::string path; // document path inside the store

    int checked_count() const;
    int total_count() const
    {
        return static_cast<int>(acceptance_items.size());
    }
};

/// Natural ordering of work-item ids: task-2 < task-10 < task-10.1
struct ItemIdLess
{
    bool operator()(const std::string& a, const std::string& b) const;
};

using SnapshotSet = std::map<std::string, Snapshot, ItemIdLess>;

// ============================================================================
// Deltas
// ============================================================================

enum class DeltaKind
{
    Created,
    StatusChanged,
    AcChecked,
    AcUnchecked
};

std::string to_string(DeltaKind kind);

/// A single detected change for one work item
struct Delta
{
    DeltaKind kind = DeltaKind::Created;
    std::string id;
    std::optional<std::string> from; // status before (StatusChanged)
    std::optional<std::string> to;   // status after (StatusChanged)
    int checked_delta = 0;           // after - before checked count (Ac*)
    bool completed = false;          // StatusChanged into the terminal status

    // Item context carried forward into events (taken from the "after" snapshot)
    std::string title;
    std::string status;
    std::string priority;
    std::vector<std::string> labels;
    std::string path;
    int checked_before = 0;
    int checked_after = 0;
    int total_after = 0;
};

// ============================================================================
// Events
// ============================================================================

/// Canonical event type names
namespace EventType
{
constexpr const char* Created = "created";
constexpr const char* StatusChanged = "status_changed";
constexpr const char* Completed = "completed";
constexpr const char* AcChecked = "ac_checked";
constexpr const char* AcUnchecked = "ac_unchecked";
} // namespace EventType

/// Canonical, versioned notification derived from a Delta (or emitted manually)
struct Event
{
    std::string schema_version;
    std::string event_type; // "<domain>.<action>", e.g. "task.completed"
    std::string event_id;   // "evt_" + 26 upper-case hex characters
    std::string timestamp;  // ISO 8601 UTC with 'Z' suffix
    std::string project_root;
    json context = json::object();
    json metadata = json::object();

    json to_json() const;
    static Event from_json(const json& j);
};

// ============================================================================
// Hooks
// ============================================================================

enum class FailMode
{
    Continue, // fail-open: log and carry on
    Stop      // fail-stop: abort remaining hooks, fail the triggering operation
};

std::string to_string(FailMode mode);
std::optional<FailMode> fail_mode_from_string(const std::string& value);

/// Event type pattern with an optional context filter of its own
struct EventMatcher
{
    std::string type; // "task.completed", "task.*", "*.completed" or "*"
    std::optional<json> filter;
};

/// One configured hook (an entry of hooks.yaml)
struct HookDefinition
{
    std::string name;
    std::vector<EventMatcher> matchers; // any one must match
    std::optional<json> filter;         // applies on top of the matcher's own filter
    std::optional<std::string> script; // relative to the hooks directory
    std::optional<std::string> command;
    std::string description;
    std::chrono::milliseconds timeout{30000};
    std::string working_directory = ".";
    std::string shell = "/bin/sh";
    std::map<std::string, std::string> env;
    FailMode fail_mode = FailMode::Continue;
    bool enabled = true;

    /// "script", "command" or "none"
    std::string action_type() const;
    /// Script reference or command text (empty when no action)
    std::string action() const;
};

// ============================================================================
// Execution records
// ============================================================================

enum class ExecutionStatus
{
    Success,
    Failed,  // non-zero exit
    Timeout, // escalation triggered
    Error    // signal death, spawn failure, configuration or security rejection
};

std::string to_string(ExecutionStatus status);
std::optional<ExecutionStatus> execution_status_from_string(const std::string& value);

/// Summary of one captured output stream
struct OutputSummary
{
    std::size_t lines = 0;
    std::size_t bytes = 0;
    bool truncated = false;
    std::string text; // at most the executor's output cap
};

struct SecurityOutcome
{
    bool passed = true;
    std::string violation;
    std::optional<std::string> script_sha256;
    std::vector<std::string> warnings;
};

/// One (Event, HookDefinition) execution attempt. Finalized once, then audited.
struct HookExecutionRecord
{
    std::string hook_name;
    std::string action_type;
    std::string action;
    FailMode fail_mode = FailMode::Continue;
    std::chrono::milliseconds timeout{0};
    std::string working_directory;

    std::string event_id;
    std::string event_type;

    ExecutionStatus status = ExecutionStatus::Error;
    bool executed = false; // a child process was spawned
    std::optional<int> exit_code;
    std::optional<int> signal;
    std::chrono::milliseconds duration{0};
    std::string started_at;
    std::string completed_at;

    OutputSummary stdout_summary;
    OutputSummary stderr_summary;
    SecurityOutcome security;
    std::string error;

    bool succeeded() const
    {
        return status == ExecutionStatus::Success;
    }
};

// ============================================================================
// Time helpers
// ============================================================================

/// Format as "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string format_timestamp(Timestamp tp);

/// Current time formatted with format_timestamp()
std::string now_timestamp();

/// Parse ISO 8601 UTC ("...Z" or "+00:00"; fractional seconds optional, other offsets honored)
std::optional<Timestamp> parse_timestamp(const std::string& value);

} // namespace workhooks

#endif // WORKHOOKS_TYPES_HPP

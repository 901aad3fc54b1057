#ifndef WORKHOOKS_AUDIT_HPP
#define WORKHOOKS_AUDIT_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <workhooks/options.hpp>
#include <workhooks/types.hpp>

namespace workhooks
{

namespace AuditRecordType
{
constexpr const char* HookExecution = "hook.execution";
constexpr const char* SecurityViolation = "security.violation";
constexpr const char* NoMatch = "dispatch.no_match";
} // namespace AuditRecordType

/// prev_hash of the first record in a chain
constexpr const char* GENESIS_HASH =
    "0000000000000000000000000000000000000000000000000000000000000000";

/// Persisted form of an execution (record_type hook.execution or security.violation).
/// Sequence and hashes are assigned by the sink.
json make_execution_record(const HookExecutionRecord& execution, const Event& event);

/// Persisted marker for an event that matched no hook
json make_no_match_record(const Event& event);

/// Rebuild an execution from a persisted hook.execution / security.violation record
HookExecutionRecord execution_from_record(const json& record);

/// sha256 over the record without its entry_hash field
std::string compute_entry_hash(const json& record);

/// Append-only destination for audit records.
///
/// append() assigns `sequence`, `prev_hash` and `entry_hash`, persists the
/// record before returning and throws AuditError when it cannot.
class AuditSink
{
  public:
    virtual ~AuditSink() = default;

    virtual json append(json record) = 0;

    /// All records, oldest first
    virtual std::vector<json> records() const = 0;

    /// True when any record refers to this event id
    virtual bool contains_event(const std::string& event_id) const = 0;
};

/// In-process sink for tests and embedding
class MemoryAuditSink : public AuditSink
{
  public:
    json append(json record) override;
    std::vector<json> records() const override;
    bool contains_event(const std::string& event_id) const override;

  private:
    std::vector<json> records_;
};

struct AuditLogOptions
{
    std::filesystem::path path = ".workhooks/audit.log";
    std::size_t max_bytes = 10 * 1024 * 1024;
    int max_generations = 5;

    static AuditLogOptions from(const Options& options);
};

struct ChainVerification
{
    bool ok = true;
    std::size_t records_checked = 0;
    std::vector<std::string> problems;
};

/**
 * JSONL audit log with size-based rotation and a hash chain.
 *
 * When the live file has reached max_bytes, audit.log.N (N = max_generations)
 * is dropped, the remaining generations shift up by one and the live file
 * becomes audit.log.1. Sequence numbers and the chain continue across
 * rotations and across process restarts.
 */
class FileAuditLog : public AuditSink
{
  public:
    explicit FileAuditLog(AuditLogOptions options);

    json append(json record) override;
    std::vector<json> records() const override;
    bool contains_event(const std::string& event_id) const override;

    /// Walk all generations oldest to newest and recheck sequence and hashes
    ChainVerification verify_chain() const;

    /// Existing files, oldest generation first, live file last
    std::vector<std::filesystem::path> generations() const;

    const std::filesystem::path& path() const
    {
        return options_.path;
    }

  private:
    void load_state() const;
    void rotate_if_needed();
    std::filesystem::path generation_path(int n) const;
    static std::vector<json> read_file(const std::filesystem::path& file);

    AuditLogOptions options_;

    // Chain tip and seen events, loaded lazily from disk
    mutable bool loaded_ = false;
    mutable std::int64_t last_sequence_ = 0;
    mutable std::string last_hash_;
    mutable std::set<std::string> event_ids_;
};

} // namespace workhooks

#endif // WORKHOOKS_AUDIT_HPP

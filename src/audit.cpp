#include "internal/sha256.hpp"

#include <fstream>
#include <workhooks/audit.hpp>
#include <workhooks/errors.hpp>
#include <workhooks/logging.hpp>
#include <workhooks/version.hpp>

namespace fs = std::filesystem;

namespace workhooks
{

namespace
{

// Hook output is arbitrary bytes; JSON needs valid UTF-8
std::string sanitize_utf8(const std::string& text)
{
    return json::parse(json(text).dump(-1, ' ', false, json::error_handler_t::replace))
        .get<std::string>();
}

json output_block(const OutputSummary& summary)
{
    return {{"lines", summary.lines},
            {"bytes", summary.bytes},
            {"truncated", summary.truncated},
            {"text", sanitize_utf8(summary.text)}};
}

OutputSummary output_from_block(const json& block)
{
    OutputSummary summary;
    if (!block.is_object())
        return summary;
    summary.lines = block.value("lines", std::size_t{0});
    summary.bytes = block.value("bytes", std::size_t{0});
    summary.truncated = block.value("truncated", false);
    summary.text = block.value("text", std::string(""));
    return summary;
}

json tool_block()
{
    return {{"name", TOOL_NAME}, {"version", version_string()}};
}

json event_block(const Event& event)
{
    json block = {{"event_id", event.event_id}, {"event_type", event.event_type}};
    if (event.context.contains("task_id"))
        block["task_id"] = event.context["task_id"];
    return block;
}

// Assign sequence and chain fields
void stamp(json& record, std::int64_t& last_sequence, std::string& last_hash)
{
    record.erase("entry_hash");
    record["sequence"] = last_sequence + 1;
    record["prev_hash"] = last_hash.empty() ? std::string(GENESIS_HASH) : last_hash;
    if (!record.contains("audit_version"))
        record["audit_version"] = AUDIT_FORMAT_VERSION;
    if (!record.contains("timestamp"))
        record["timestamp"] = now_timestamp();
    record["entry_hash"] = compute_entry_hash(record);

    last_sequence = record["sequence"].get<std::int64_t>();
    last_hash = record["entry_hash"].get<std::string>();
}

std::string record_event_id(const json& record)
{
    if (record.contains("event") && record["event"].is_object())
        return record["event"].value("event_id", std::string(""));
    return "";
}

} // namespace

// ============================================================================
// Record construction
// ============================================================================

json make_execution_record(const HookExecutionRecord& execution, const Event& event)
{
    json execution_block = {{"status", to_string(execution.status)},
                            {"executed", execution.executed},
                            {"exit_code", nullptr},
                            {"signal", nullptr},
                            {"duration_ms", execution.duration.count()},
                            {"started_at", execution.started_at},
                            {"completed_at", execution.completed_at},
                            {"error", execution.error}};
    if (execution.exit_code)
        execution_block["exit_code"] = *execution.exit_code;
    if (execution.signal)
        execution_block["signal"] = *execution.signal;

    json security = {{"passed", execution.security.passed},
                     {"violation", execution.security.violation},
                     {"script_sha256", nullptr},
                     {"warnings", execution.security.warnings}};
    if (execution.security.script_sha256)
        security["script_sha256"] = *execution.security.script_sha256;

    return {{"audit_version", AUDIT_FORMAT_VERSION},
            {"record_type", execution.security.passed ? AuditRecordType::HookExecution
                                                      : AuditRecordType::SecurityViolation},
            {"timestamp", execution.completed_at.empty() ? now_timestamp()
                                                         : execution.completed_at},
            {"hook",
             {{"name", execution.hook_name},
              {"action_type", execution.action_type},
              {"action", execution.action},
              {"fail_mode", to_string(execution.fail_mode)},
              {"timeout_ms", execution.timeout.count()},
              {"working_directory", execution.working_directory}}},
            {"event", event_block(event)},
            {"execution", execution_block},
            {"output",
             {{"stdout", output_block(execution.stdout_summary)},
              {"stderr", output_block(execution.stderr_summary)}}},
            {"security", security},
            {"tool", tool_block()}};
}

json make_no_match_record(const Event& event)
{
    return {{"audit_version", AUDIT_FORMAT_VERSION},
            {"record_type", AuditRecordType::NoMatch},
            {"timestamp", now_timestamp()},
            {"event", event_block(event)},
            {"tool", tool_block()}};
}

HookExecutionRecord execution_from_record(const json& record)
{
    HookExecutionRecord execution;

    const json hook = record.value("hook", json::object());
    execution.hook_name = hook.value("name", std::string(""));
    execution.action_type = hook.value("action_type", std::string(""));
    execution.action = hook.value("action", std::string(""));
    execution.fail_mode =
        fail_mode_from_string(hook.value("fail_mode", std::string("continue")))
            .value_or(FailMode::Continue);
    execution.timeout = std::chrono::milliseconds(hook.value("timeout_ms", 0LL));
    execution.working_directory = hook.value("working_directory", std::string(""));

    const json event = record.value("event", json::object());
    execution.event_id = event.value("event_id", std::string(""));
    execution.event_type = event.value("event_type", std::string(""));

    const json block = record.value("execution", json::object());
    execution.status = execution_status_from_string(block.value("status", std::string("error")))
                           .value_or(ExecutionStatus::Error);
    execution.executed = block.value("executed", false);
    if (block.contains("exit_code") && block["exit_code"].is_number_integer())
        execution.exit_code = block["exit_code"].get<int>();
    if (block.contains("signal") && block["signal"].is_number_integer())
        execution.signal = block["signal"].get<int>();
    execution.duration = std::chrono::milliseconds(block.value("duration_ms", 0LL));
    execution.started_at = block.value("started_at", std::string(""));
    execution.completed_at = block.value("completed_at", std::string(""));
    execution.error = block.value("error", std::string(""));

    const json output = record.value("output", json::object());
    execution.stdout_summary = output_from_block(output.value("stdout", json::object()));
    execution.stderr_summary = output_from_block(output.value("stderr", json::object()));

    const json security = record.value("security", json::object());
    execution.security.passed = security.value("passed", true);
    execution.security.violation = security.value("violation", std::string(""));
    if (security.contains("script_sha256") && security["script_sha256"].is_string())
        execution.security.script_sha256 = security["script_sha256"].get<std::string>();
    if (security.contains("warnings") && security["warnings"].is_array())
        execution.security.warnings = security["warnings"].get<std::vector<std::string>>();

    return execution;
}

std::string compute_entry_hash(const json& record)
{
    json copy = record;
    copy.erase("entry_hash");
    return internal::sha256_hex(copy.dump());
}

// ============================================================================
// MemoryAuditSink
// ============================================================================

json MemoryAuditSink::append(json record)
{
    std::int64_t last_sequence =
        records_.empty() ? 0 : records_.back()["sequence"].get<std::int64_t>();
    std::string last_hash =
        records_.empty() ? std::string() : records_.back()["entry_hash"].get<std::string>();
    stamp(record, last_sequence, last_hash);
    records_.push_back(record);
    return record;
}

std::vector<json> MemoryAuditSink::records() const
{
    return records_;
}

bool MemoryAuditSink::contains_event(const std::string& event_id) const
{
    for (const auto& record : records_)
        if (record_event_id(record) == event_id)
            return true;
    return false;
}

// ============================================================================
// FileAuditLog
// ============================================================================

AuditLogOptions AuditLogOptions::from(const Options& options)
{
    AuditLogOptions result;
    result.path = options.resolve(options.audit_log);
    result.max_bytes = options.audit_max_bytes;
    result.max_generations = options.audit_max_generations;
    return result;
}

FileAuditLog::FileAuditLog(AuditLogOptions options) : options_(std::move(options)) {}

fs::path FileAuditLog::generation_path(int n) const
{
    return fs::path(options_.path.string() + "." + std::to_string(n));
}

std::vector<fs::path> FileAuditLog::generations() const
{
    std::vector<fs::path> files;
    std::error_code ec;
    for (int n = options_.max_generations; n >= 1; --n)
        if (fs::exists(generation_path(n), ec))
            files.push_back(generation_path(n));
    if (fs::exists(options_.path, ec))
        files.push_back(options_.path);
    return files;
}

std::vector<json> FileAuditLog::read_file(const fs::path& file)
{
    std::ifstream in(file);
    if (!in)
        throw AuditError("Failed to open audit log: " + file.string());

    std::vector<json> records;
    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line))
    {
        ++line_number;
        if (line.empty())
            continue;
        try
        {
            records.push_back(json::parse(line));
        }
        catch (const json::parse_error& e)
        {
            throw AuditError("Corrupt audit record at " + file.string() + ":" +
                             std::to_string(line_number) + ": " + e.what());
        }
    }
    return records;
}

void FileAuditLog::load_state() const
{
    if (loaded_)
        return;

    for (const auto& record : records())
    {
        if (record.contains("sequence") && record["sequence"].is_number_integer())
            last_sequence_ = record["sequence"].get<std::int64_t>();
        last_hash_ = record.value("entry_hash", std::string(""));
        std::string event_id = record_event_id(record);
        if (!event_id.empty())
            event_ids_.insert(event_id);
    }
    loaded_ = true;
}

void FileAuditLog::rotate_if_needed()
{
    std::error_code ec;
    if (!fs::exists(options_.path, ec))
        return;
    auto size = fs::file_size(options_.path, ec);
    if (ec || size < options_.max_bytes)
        return;

    if (options_.max_generations <= 0)
    {
        fs::remove(options_.path, ec);
        if (ec)
            throw AuditError("Failed to truncate audit log " + options_.path.string() + ": " +
                             ec.message());
        return;
    }

    fs::remove(generation_path(options_.max_generations), ec);
    for (int n = options_.max_generations - 1; n >= 1; --n)
    {
        if (fs::exists(generation_path(n), ec))
        {
            fs::rename(generation_path(n), generation_path(n + 1), ec);
            if (ec)
                throw AuditError("Failed to rotate " + generation_path(n).string() + ": " +
                                 ec.message());
        }
    }
    fs::rename(options_.path, generation_path(1), ec);
    if (ec)
        throw AuditError("Failed to rotate " + options_.path.string() + ": " + ec.message());

    log::logger()->debug("Rotated audit log {}", options_.path.string());
}

json FileAuditLog::append(json record)
{
    load_state();

    std::error_code ec;
    if (options_.path.has_parent_path())
        fs::create_directories(options_.path.parent_path(), ec);
    if (ec)
        throw AuditError("Failed to create audit directory " +
                         options_.path.parent_path().string() + ": " + ec.message());

    rotate_if_needed();

    std::int64_t sequence = last_sequence_;
    std::string hash = last_hash_;
    stamp(record, sequence, hash);

    std::ofstream out(options_.path, std::ios::app);
    if (!out)
        throw AuditError("Failed to open audit log for append: " + options_.path.string());
    out << record.dump() << '\n';
    out.flush();
    if (!out)
        throw AuditError("Failed to write audit log: " + options_.path.string());

    last_sequence_ = sequence;
    last_hash_ = hash;
    std::string event_id = record_event_id(record);
    if (!event_id.empty())
        event_ids_.insert(event_id);
    return record;
}

std::vector<json> FileAuditLog::records() const
{
    std::vector<json> all;
    for (const auto& file : generations())
    {
        auto records = read_file(file);
        all.insert(all.end(), std::make_move_iterator(records.begin()),
                   std::make_move_iterator(records.end()));
    }
    return all;
}

bool FileAuditLog::contains_event(const std::string& event_id) const
{
    load_state();
    return event_ids_.count(event_id) > 0;
}

ChainVerification FileAuditLog::verify_chain() const
{
    ChainVerification result;
    std::string expected_prev;
    std::int64_t expected_sequence = 0;
    bool first = true;

    for (const auto& file : generations())
    {
        std::ifstream in(file);
        if (!in)
        {
            result.problems.push_back("cannot open " + file.string());
            continue;
        }

        std::string line;
        size_t line_number = 0;
        while (std::getline(in, line))
        {
            ++line_number;
            if (line.empty())
                continue;
            const std::string where = file.filename().string() + ":" + std::to_string(line_number);

            json record;
            try
            {
                record = json::parse(line);
            }
            catch (const json::parse_error&)
            {
                result.problems.push_back(where + ": not valid JSON");
                first = false;
                expected_prev.clear();
                continue;
            }
            ++result.records_checked;

            std::string entry_hash = record.value("entry_hash", std::string(""));
            if (entry_hash != compute_entry_hash(record))
                result.problems.push_back(where + ": entry_hash mismatch");

            std::string prev_hash = record.value("prev_hash", std::string(""));
            std::int64_t sequence = record.value("sequence", std::int64_t{0});

            // Rotation may have dropped older generations: the oldest surviving
            // record anchors the chain
            if (!first)
            {
                if (!expected_prev.empty() && prev_hash != expected_prev)
                    result.problems.push_back(where + ": prev_hash does not match previous entry");
                if (sequence != expected_sequence + 1)
                    result.problems.push_back(where + ": sequence " + std::to_string(sequence) +
                                              " after " + std::to_string(expected_sequence));
            }

            first = false;
            expected_prev = entry_hash;
            expected_sequence = sequence;
        }
    }

    result.ok = result.problems.empty();
    return result;
}

} // namespace workhooks

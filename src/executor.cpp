#include "internal/guards.hpp"
#include "internal/sha256.hpp"
#include "internal/subprocess/process.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <workhooks/errors.hpp>
#include <workhooks/executor.hpp>
#include <workhooks/logging.hpp>

namespace fs = std::filesystem;

namespace workhooks
{

namespace
{

using SteadyClock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds DRAIN_LIMIT{200};
constexpr size_t READ_CHUNK = 64 * 1024;

// Accumulates one output stream, keeping at most `cap` bytes of text
class OutputCapture
{
  public:
    explicit OutputCapture(size_t cap) : cap_(cap) {}

    void append(const char* data, size_t size)
    {
        if (size == 0)
            return;
        bytes_ += size;
        newlines_ += static_cast<size_t>(std::count(data, data + size, '\n'));
        last_ = data[size - 1];

        size_t room = cap_ > text_.size() ? cap_ - text_.size() : 0;
        if (size > room)
            truncated_ = true;
        text_.append(data, std::min(size, room));
    }

    OutputSummary summary() const
    {
        OutputSummary summary;
        summary.bytes = bytes_;
        summary.lines = newlines_ + ((bytes_ > 0 && last_ != '\n') ? 1 : 0);
        summary.truncated = truncated_;
        summary.text = text_;
        return summary;
    }

  private:
    size_t cap_;
    size_t bytes_ = 0;
    size_t newlines_ = 0;
    char last_ = '\n';
    bool truncated_ = false;
    std::string text_;
};

// Read whatever is available; closes the pipe at EOF
void drain_ready(subprocess::ReadPipe& pipe, OutputCapture& capture)
{
    char buffer[READ_CHUNK];
    size_t n = pipe.read(buffer, sizeof(buffer));
    if (n == 0)
        pipe.close();
    else
        capture.append(buffer, n);
}

void finish(HookExecutionRecord& record, SteadyClock::time_point started)
{
    record.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - started);
    record.completed_at = now_timestamp();
}

void reject(HookExecutionRecord& record, SteadyClock::time_point started,
            const SecurityViolationError& violation)
{
    record.status = ExecutionStatus::Error;
    record.executed = false;
    record.security.passed = false;
    record.security.violation = violation.what();
    record.error = std::string("security violation: ") + violation.what();
    finish(record, started);
    log::logger()->error("Hook '{}' rejected: {}", record.hook_name, violation.what());
}

void configuration_failure(HookExecutionRecord& record, SteadyClock::time_point started,
                           const std::string& message)
{
    record.status = ExecutionStatus::Error;
    record.executed = false;
    record.error = message;
    finish(record, started);
    log::logger()->error("Hook '{}' not run: {}", record.hook_name, message);
}

} // namespace

ExecutorOptions ExecutorOptions::from(const Options& options)
{
    ExecutorOptions result;
    result.project_root = fs::weakly_canonical(fs::absolute(options.project_root));
    result.hooks_dir = options.resolve(options.hooks_dir);
    result.grace_period = options.grace_period;
    result.max_output_bytes = options.max_output_bytes;
    result.passthrough_env = options.passthrough_env;
    return result;
}

SandboxedExecutor::SandboxedExecutor(ExecutorOptions options) : options_(std::move(options)) {}

std::map<std::string, std::string>
SandboxedExecutor::build_environment(const HookDefinition& hook, const Event& event) const
{
    std::map<std::string, std::string> env;
    for (const auto& key : options_.passthrough_env)
    {
        const char* value = std::getenv(key.c_str());
        if (value != nullptr)
            env[key] = value;
    }
    for (const auto& [key, value] : hook.env)
        env[key] = value;

    env["HOOK_NAME"] = hook.name;
    env["HOOK_EVENT_TYPE"] = event.event_type;
    env["HOOK_EVENT_ID"] = event.event_id;
    env["HOOK_WORKSPACE"] = fs::weakly_canonical(fs::absolute(options_.project_root)).string();
    return env;
}

HookExecutionRecord SandboxedExecutor::run(const HookDefinition& hook, const Event& event)
{
    auto logger = log::logger();
    const auto started = SteadyClock::now();

    HookExecutionRecord record;
    record.hook_name = hook.name;
    record.action_type = hook.action_type();
    record.action = hook.action();
    record.fail_mode = hook.fail_mode;
    record.timeout = hook.timeout;
    record.working_directory = hook.working_directory;
    record.event_id = event.event_id;
    record.event_type = event.event_type;
    record.started_at = now_timestamp();

    if (!hook.script && !hook.command)
    {
        configuration_failure(record, started, "no script or command configured");
        return record;
    }

    fs::path working_directory;
    try
    {
        working_directory =
            internal::resolve_working_directory(options_.project_root, hook.working_directory);
    }
    catch (const SecurityViolationError& e)
    {
        reject(record, started, e);
        return record;
    }

    std::string executable;
    std::vector<std::string> args;
    if (hook.script)
    {
        fs::path script;
        try
        {
            script = internal::resolve_script_path(options_.hooks_dir, *hook.script);
        }
        catch (const SecurityViolationError& e)
        {
            reject(record, started, e);
            return record;
        }

        std::error_code ec;
        if (!fs::is_regular_file(script, ec))
        {
            configuration_failure(record, started, "script not found: " + script.string());
            return record;
        }

        record.security.script_sha256 = internal::compute_file_sha256(script);

        std::ifstream file(script, std::ios::binary);
        std::ostringstream content;
        content << file.rdbuf();
        record.security.warnings = internal::scan_dangerous_content(content.str());
        for (const auto& warning : record.security.warnings)
            logger->warn("Hook '{}' script {}: {}", hook.name, script.string(), warning);

        executable = script.string();
    }
    else
    {
        executable = hook.shell;
        args = {"-c", *hook.command};
    }

    subprocess::ProcessOptions process_options;
    process_options.working_directory = working_directory.string();
    process_options.environment = build_environment(hook, event);
    process_options.inherit_environment = false;
    process_options.new_process_group = true;
    process_options.redirect_stdin = true;
    process_options.redirect_stdout = true;
    process_options.redirect_stderr = true;

    subprocess::Process process;
    try
    {
        process.spawn(executable, args, process_options);
    }
    catch (const std::runtime_error& e)
    {
        record.status = ExecutionStatus::Error;
        record.error = std::string("failed to start: ") + e.what();
        finish(record, started);
        logger->error("Hook '{}' failed to start: {}", hook.name, e.what());
        return record;
    }
    record.executed = true;
    logger->info("Running hook '{}' for {} ({})", hook.name, event.event_type, event.event_id);

    const std::string payload = event.to_json().dump() + "\n";
    size_t written = 0;
    auto& stdin_pipe = process.stdin_pipe();
    auto& stdout_pipe = process.stdout_pipe();
    auto& stderr_pipe = process.stderr_pipe();
    stdin_pipe.set_nonblocking();

    OutputCapture out(options_.max_output_bytes);
    OutputCapture err(options_.max_output_bytes);

    const auto deadline = started + hook.timeout;
    SteadyClock::time_point term_sent_at;
    bool term_sent = false;
    bool kill_sent = false;
    std::optional<int> exit_code;

    while (true)
    {
        if (stdin_pipe.is_open())
        {
            try
            {
                written += stdin_pipe.write(payload.data() + written, payload.size() - written);
                if (written == payload.size())
                    stdin_pipe.close();
            }
            catch (const std::runtime_error& e)
            {
                // The hook is free to ignore its input
                logger->debug("Hook '{}' did not read its payload: {}", hook.name, e.what());
                stdin_pipe.close();
            }
        }

        auto ready = subprocess::poll_readable({&stdout_pipe, &stderr_pipe},
                                               static_cast<int>(options_.poll_interval.count()));
        if (ready[0])
            drain_ready(stdout_pipe, out);
        if (ready[1])
            drain_ready(stderr_pipe, err);

        exit_code = process.try_wait();
        if (exit_code)
            break;

        auto now = SteadyClock::now();
        if (!term_sent && now >= deadline)
        {
            logger->warn("Hook '{}' exceeded its {} ms timeout, sending SIGTERM", hook.name,
                         hook.timeout.count());
            process.terminate();
            term_sent = true;
            term_sent_at = now;
        }
        else if (term_sent && !kill_sent && now >= term_sent_at + options_.grace_period)
        {
            logger->warn("Hook '{}' ignored SIGTERM, sending SIGKILL", hook.name);
            process.kill();
            kill_sent = true;
        }
    }

    // Collect what is still buffered; a lingering grandchild may hold the pipes open
    const auto drain_deadline = SteadyClock::now() + DRAIN_LIMIT;
    while ((stdout_pipe.is_open() || stderr_pipe.is_open()) &&
           SteadyClock::now() < drain_deadline)
    {
        auto ready = subprocess::poll_readable({&stdout_pipe, &stderr_pipe}, 10);
        if (!ready[0] && !ready[1])
            break;
        if (ready[0])
            drain_ready(stdout_pipe, out);
        if (ready[1])
            drain_ready(stderr_pipe, err);
    }
    stdin_pipe.close();

    record.stdout_summary = out.summary();
    record.stderr_summary = err.summary();

    if (term_sent)
    {
        record.status = ExecutionStatus::Timeout;
        if (process.signaled())
            record.signal = process.term_signal();
        else
            record.exit_code = *exit_code;
        record.error = "timed out after " + std::to_string(hook.timeout.count()) + " ms";
    }
    else if (process.signaled())
    {
        record.status = ExecutionStatus::Error;
        record.signal = process.term_signal();
        record.error = "terminated by signal " + std::to_string(process.term_signal());
    }
    else if (*exit_code == 0)
    {
        record.status = ExecutionStatus::Success;
        record.exit_code = 0;
    }
    else
    {
        record.status = ExecutionStatus::Failed;
        record.exit_code = *exit_code;
        record.error = "exited with code " + std::to_string(*exit_code);
    }

    finish(record, started);
    logger->info("Hook '{}' finished: {} in {} ms", hook.name, to_string(record.status),
                 record.duration.count());
    return record;
}

} // namespace workhooks

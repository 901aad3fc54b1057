#include <filesystem>
#include <iostream>
#include <workhooks/workhooks.hpp>

constexpr bool VERBOSE = false; // Enable to see library logging and hook output

static const char* HOOKS_YAML = R"yaml(
version: "1.0"
hooks:
  - name: announce
    events: ["task.completed"]
    command: 'echo "finished: $(head -c 200)"'
    timeout: 5
  - name: gate-on-review
    events:
      - type: task.status_changed
        filter:
          status_to: Review
    command: 'echo "review requested" >&2; exit 1'
    fail_mode: continue
)yaml";

static std::string task(const std::string& id, const std::string& title,
                        const std::string& status, bool ac_done)
{
    return "---\nid: " + id + "\ntitle: " + title + "\nstatus: " + status +
           "\n---\n\n## Acceptance Criteria\n<!-- AC:BEGIN -->\n- [" + (ac_done ? "x" : " ") +
           "] #1 Tests pass\n<!-- AC:END -->\n";
}

int main()
{
    std::cout << "workhooks version: " << workhooks::version_string() << "\n\n";
    if (VERBOSE)
        workhooks::log::set_level("debug");
    else
        workhooks::log::set_level("warn");

    // Two revisions of a small backlog
    workhooks::MemoryStore store;
    store.set_revision("v1", {{"backlog/tasks/task-1 - Login.md",
                               task("task-1", "Login", "In Progress", false)},
                              {"backlog/tasks/task-2 - Logout.md",
                               task("task-2", "Logout", "To Do", false)}});
    store.set_revision("v2", {{"backlog/tasks/task-1 - Login.md",
                               task("task-1", "Login", "Done", true)},
                              {"backlog/tasks/task-2 - Logout.md",
                               task("task-2", "Logout", "Review", false)},
                              {"backlog/tasks/task-3 - Signup.md",
                               task("task-3", "Signup", "To Do", false)}});

    try
    {
        workhooks::HookRegistry registry = workhooks::HookRegistry::parse(HOOKS_YAML, "inline");

        workhooks::Options options;
        options.project_root = std::filesystem::current_path();

        workhooks::SandboxedExecutor executor(workhooks::ExecutorOptions::from(options));
        workhooks::MemoryAuditSink audit;
        workhooks::MetricsAggregator metrics;

        workhooks::Pipeline pipeline(store, registry, executor, audit, &metrics,
                                     workhooks::PipelineOptions::from(options));
        workhooks::PipelineResult result = pipeline.run("v1", "v2");

        std::cout << result.events.size() << " event(s) between v1 and v2\n";
        for (const auto& dispatch : result.dispatches)
        {
            std::cout << "  " << dispatch.event_type << " (" << dispatch.event_id << ")";
            if (dispatch.matched_hooks.empty())
                std::cout << " -> no hooks\n";
            else
                std::cout << "\n";

            for (const auto& execution : dispatch.executions)
            {
                std::cout << "    " << execution.hook_name << ": "
                          << workhooks::to_string(execution.status) << " in "
                          << execution.duration.count() << " ms\n";
                if (VERBOSE && !execution.stdout_summary.text.empty())
                    std::cout << "      " << execution.stdout_summary.text;
            }
        }

        std::cout << "\nAudit records: " << audit.records().size() << "\n";
        if (const auto* window = metrics.current())
            std::cout << "Success rate: " << window->summary.success_rate() * 100.0 << "%\n";

        // Same revisions again: every event is already in the audit log
        workhooks::PipelineResult again = pipeline.run("v1", "v2");
        std::cout << "Re-run skipped " << again.already_processed.size()
                  << " already processed event(s)\n";
    }
    catch (const workhooks::ConfigurationError& e)
    {
        std::cerr << "Error: invalid hooks configuration - " << e.what() << "\n";
        return 1;
    }
    catch (const workhooks::WorkhooksError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

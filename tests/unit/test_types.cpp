#include <algorithm>
#include <gtest/gtest.h>
#include <workhooks/types.hpp>

using namespace workhooks;

TEST(TypesTest, ItemIdNaturalOrder)
{
    std::vector<std::string> ids = {"task-10",  "task-2",  "task-10.1", "task-1",
                                    "task-2.10", "task-2.9", "task-2.1"};
    std::sort(ids.begin(), ids.end(), ItemIdLess());

    std::vector<std::string> expected = {"task-1",   "task-2",  "task-2.1", "task-2.9",
                                         "task-2.10", "task-10", "task-10.1"};
    EXPECT_EQ(ids, expected);
}

TEST(TypesTest, ItemIdOrderIsStrict)
{
    ItemIdLess less;
    EXPECT_FALSE(less("task-3", "task-3"));
    EXPECT_TRUE(less("task-9", "task-10"));
    EXPECT_FALSE(less("task-10", "task-9"));
    // Same value, different spelling: still a strict weak order
    EXPECT_NE(less("task-01", "task-1"), less("task-1", "task-01"));
}

TEST(TypesTest, SnapshotSetIteratesInNaturalOrder)
{
    SnapshotSet set;
    for (const char* id : {"task-12", "task-3", "task-3.2"})
    {
        Snapshot snapshot;
        snapshot.id = id;
        set.emplace(id, snapshot);
    }

    std::vector<std::string> order;
    for (const auto& [id, snapshot] : set)
        order.push_back(id);
    EXPECT_EQ(order, (std::vector<std::string>{"task-3", "task-3.2", "task-12"}));
}

TEST(TypesTest, CheckedCount)
{
    Snapshot snapshot;
    snapshot.acceptance_items = {{1, "a", true}, {2, "b", false}, {3, "c", true}};
    EXPECT_EQ(snapshot.checked_count(), 2);
    EXPECT_EQ(snapshot.total_count(), 3);
}

TEST(TypesTest, EnumNames)
{
    EXPECT_EQ(to_string(DeltaKind::StatusChanged), "status_changed");
    EXPECT_EQ(to_string(DeltaKind::AcUnchecked), "ac_unchecked");
    EXPECT_EQ(to_string(FailMode::Stop), "stop");
    EXPECT_EQ(fail_mode_from_string("continue"), FailMode::Continue);
    EXPECT_FALSE(fail_mode_from_string("abort").has_value());
    EXPECT_EQ(to_string(ExecutionStatus::Timeout), "timeout");
    EXPECT_EQ(execution_status_from_string("failed"), ExecutionStatus::Failed);
    EXPECT_FALSE(execution_status_from_string("crashed").has_value());
}

TEST(TypesTest, EventJsonOmitsEmptyBlocks)
{
    Event event;
    event.schema_version = "1.0";
    event.event_type = "task.created";
    event.event_id = "evt_0123456789ABCDEF0123456789";
    event.timestamp = "2025-01-01T00:00:00.000Z";
    event.project_root = "/work";

    json j = event.to_json();
    EXPECT_FALSE(j.contains("context"));
    EXPECT_FALSE(j.contains("metadata"));

    event.context = {{"task_id", "task-1"}};
    j = event.to_json();
    ASSERT_TRUE(j.contains("context"));

    Event parsed = Event::from_json(j);
    EXPECT_EQ(parsed.event_type, "task.created");
    EXPECT_EQ(parsed.event_id, event.event_id);
    EXPECT_EQ(parsed.context["task_id"], "task-1");
    EXPECT_TRUE(parsed.metadata.empty());
}

TEST(TypesTest, EventFromJsonRequiresType)
{
    EXPECT_THROW(Event::from_json(json{{"event_id", "evt_X"}}), json::exception);
}

TEST(TypesTest, HookActionType)
{
    HookDefinition hook;
    EXPECT_EQ(hook.action_type(), "none");
    EXPECT_EQ(hook.action(), "");

    hook.command = "echo hi";
    EXPECT_EQ(hook.action_type(), "command");
    EXPECT_EQ(hook.action(), "echo hi");

    hook.script = "notify.sh";
    EXPECT_EQ(hook.action_type(), "script");
    EXPECT_EQ(hook.action(), "notify.sh");
}

TEST(TypesTest, FormatTimestamp)
{
    Timestamp tp = Timestamp(std::chrono::milliseconds(1500));
    EXPECT_EQ(format_timestamp(tp), "1970-01-01T00:00:01.500Z");
}

TEST(TypesTest, ParseTimestampForms)
{
    auto utc = parse_timestamp("2024-05-01T10:00:00Z");
    auto offset = parse_timestamp("2024-05-01T12:00:00+02:00");
    auto fraction = parse_timestamp("2024-05-01T10:00:00.25Z");
    auto bare = parse_timestamp("2024-05-01T10:00:00");

    ASSERT_TRUE(utc && offset && fraction && bare);
    EXPECT_EQ(*utc, *offset);
    EXPECT_EQ(*bare, *utc);
    EXPECT_EQ(*fraction - *utc, std::chrono::milliseconds(250));
    EXPECT_EQ(format_timestamp(*fraction), "2024-05-01T10:00:00.250Z");
}

TEST(TypesTest, ParseTimestampRejectsGarbage)
{
    EXPECT_FALSE(parse_timestamp("").has_value());
    EXPECT_FALSE(parse_timestamp("yesterday").has_value());
    EXPECT_FALSE(parse_timestamp("2024-05-01T10:00:00 trailing").has_value());
    EXPECT_FALSE(parse_timestamp("2024-05-01T10:00:00.Z").has_value());
}

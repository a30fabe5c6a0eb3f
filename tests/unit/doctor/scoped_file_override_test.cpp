#include <gtest/gtest.h>

#include <gmcp/doctor/scoped_file_override.h>

#include "../../common/test_helpers.h"

#include <sys/stat.h>
#include <unistd.h>

using namespace gmcp::doctor;
namespace fs = std::filesystem;

class ScopedFileOverrideTest : public ::testing::Test {
protected:
    void SetUp() override { root_ = gmcp::test::make_temp_dir("gmcp_override_"); }
    void TearDown() override {
        std::error_code ec;
        fs::permissions(root_, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(root_, ec);
    }

    fs::path root_;
};

TEST_F(ScopedFileOverrideTest, RestoresOriginalBytesOnDestruction) {
    const std::string original("9000\r\n\0tail", 11);
    auto path = gmcp::test::write_file(root_ / ".godot_mcp_port", original);
    {
        auto captured = ScopedFileOverride::capture(path);
        ASSERT_TRUE(captured) << captured.error().message;
        auto guard = std::move(captured).value();
        EXPECT_TRUE(guard.existedBefore());
        ASSERT_TRUE(guard.write("51234"));
        EXPECT_EQ(gmcp::test::read_file(path), "51234");
    }
    EXPECT_EQ(gmcp::test::read_file(path), original);
}

TEST_F(ScopedFileOverrideTest, DeletesFileThatDidNotExist) {
    auto path = root_ / ".godot_mcp_host";
    {
        auto captured = ScopedFileOverride::capture(path);
        ASSERT_TRUE(captured);
        auto guard = std::move(captured).value();
        EXPECT_FALSE(guard.existedBefore());
        ASSERT_TRUE(guard.write("0.0.0.0"));
        EXPECT_TRUE(fs::exists(path));
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(ScopedFileOverrideTest, RestoreIsIdempotentAndBlocksLaterWrites) {
    auto path = gmcp::test::write_file(root_ / "f.txt", "a");
    auto guard = ScopedFileOverride::capture(path).value();
    ASSERT_TRUE(guard.write("b"));
    ASSERT_TRUE(guard.restore());
    ASSERT_TRUE(guard.restore());
    EXPECT_EQ(gmcp::test::read_file(path), "a");

    auto late = guard.write("c");
    ASSERT_FALSE(late);
    EXPECT_EQ(late.error().code, gmcp::ErrorCode::InvalidState);
}

TEST_F(ScopedFileOverrideTest, MovedFromGuardDoesNotRestore) {
    auto path = gmcp::test::write_file(root_ / "f.txt", "a");
    std::optional<ScopedFileOverride> outer;
    {
        auto inner = ScopedFileOverride::capture(path).value();
        ASSERT_TRUE(inner.write("b"));
        outer.emplace(std::move(inner));
    }
    EXPECT_EQ(gmcp::test::read_file(path), "b");
    outer.reset();
    EXPECT_EQ(gmcp::test::read_file(path), "a");
}

TEST_F(ScopedFileOverrideTest, UnreadableFileFailsCaptureInsteadOfLookingAbsent) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root ignores file permissions";
    }
    auto path = gmcp::test::write_file(root_ / "secret", "x");
    fs::permissions(path, fs::perms::none);
    auto captured = ScopedFileOverride::capture(path);
    ASSERT_FALSE(captured);
    EXPECT_EQ(captured.error().code, gmcp::ErrorCode::PermissionDenied);
}

TEST_F(ScopedFileOverrideTest, ReadWholeFileDistinguishesAbsence) {
    auto missing = readWholeFile(root_ / "missing");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, gmcp::ErrorCode::FileNotFound);

    auto dir = readWholeFile(root_);
    ASSERT_FALSE(dir);
    EXPECT_NE(dir.error().code, gmcp::ErrorCode::FileNotFound);
}

TEST_F(ScopedFileOverrideTest, WriteWholeFileCreatesParents) {
    auto path = root_ / "a" / "b" / "c.txt";
    ASSERT_TRUE(writeWholeFile(path, "hello"));
    EXPECT_EQ(gmcp::test::read_file(path), "hello");
}

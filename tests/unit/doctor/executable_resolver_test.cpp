#include <gtest/gtest.h>

#include <gmcp/doctor/executable_resolver.h>

#include "../../common/test_helpers.h"

#include <map>
#include <set>

using namespace gmcp::doctor;
using gmcp::test::ScopedEnvVar;

namespace {

/// Validator that accepts a fixed set of paths and counts every probe.
struct FakeValidator {
    std::set<std::string> valid;
    std::map<std::string, int> calls;

    ExecutableValidator fn() {
        return [this](const std::string& path) {
            ++calls[path];
            return valid.count(path) > 0;
        };
    }
};

DiscoveryContext bareLinux() {
    DiscoveryContext ctx;
    ctx.platform = HostPlatform::Linux;
    ctx.wsl = false;
    return ctx;
}

class ExecutableResolverTest : public ::testing::Test {
protected:
    ScopedEnvVar godotPath_{"GODOT_PATH", std::nullopt};
    ValidityCache cache_;
    FakeValidator validator_;
};

} // namespace

TEST_F(ExecutableResolverTest, ExplicitPathIsAuthoritative) {
    validator_.valid = {"/opt/godot/Godot", "/usr/bin/godot"};
    ScopedEnvVar env("GODOT_PATH", std::string("/usr/bin/godot"));
    ExecutableResolver resolver(cache_, validator_.fn(), bareLinux());

    auto res = resolver.resolve({.explicitPath = std::string("/opt/godot/Godot")});
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.origin, "cli");
    EXPECT_EQ(*res.path, "/opt/godot/Godot");
    EXPECT_EQ(validator_.calls.count("/usr/bin/godot"), 0u);
}

TEST_F(ExecutableResolverTest, InvalidExplicitPathFailsWithoutDiscovery) {
    ExecutableResolver resolver(cache_, validator_.fn(), bareLinux());

    auto res = resolver.resolve({.explicitPath = std::string("/nope/godot")});
    EXPECT_FALSE(res.ok());
    ASSERT_TRUE(res.error.has_value());
    EXPECT_EQ(res.candidates.size(), 1u);
    EXPECT_EQ(validator_.calls.size(), 1u);
    ASSERT_FALSE(res.suggestions.empty());
    EXPECT_NE(res.suggestions.front().find("--godot-path"), std::string::npos);
}

TEST_F(ExecutableResolverTest, EmptyEnvironmentValueDisablesDiscovery) {
    validator_.valid = {"godot", "/usr/bin/godot"};
    ScopedEnvVar env("GODOT_PATH", std::string(""));
    ExecutableResolver resolver(cache_, validator_.fn(), bareLinux());

    auto res = resolver.resolve({});
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.origin, "env");
    EXPECT_EQ(*res.path, disabledSentinelPath(HostPlatform::Linux));
    EXPECT_TRUE(validator_.calls.empty());
}

TEST_F(ExecutableResolverTest, InvalidEnvironmentValueFallsThroughToDiscovery) {
    validator_.valid = {"/usr/local/bin/godot"};
    ScopedEnvVar env("GODOT_PATH", std::string("/broken/godot"));
    ExecutableResolver resolver(cache_, validator_.fn(), bareLinux());

    auto res = resolver.resolve({});
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.origin, "auto");
    EXPECT_EQ(*res.path, "/usr/local/bin/godot");
    EXPECT_EQ(res.candidates.front().origin, "env");
    EXPECT_FALSE(res.candidates.front().valid);
    ASSERT_FALSE(res.suggestions.empty());
    EXPECT_NE(res.suggestions.front().find("GODOT_PATH is invalid"), std::string::npos);
}

TEST_F(ExecutableResolverTest, ConfigFilePathIsUsedWhenEnvironmentIsUnset) {
    validator_.valid = {"/srv/Godot"};
    ExecutableResolver resolver(cache_, validator_.fn(), bareLinux());

    auto res = resolver.resolve({.configuredPath = std::string("/srv/Godot")});
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.origin, "config");
}

TEST_F(ExecutableResolverTest, DiscoveryTriesSearchPathNameFirst) {
    validator_.valid = {"godot", "/usr/bin/godot"};
    ExecutableResolver resolver(cache_, validator_.fn(), bareLinux());

    auto res = resolver.resolve({});
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(*res.path, "godot");
    ASSERT_EQ(res.candidates.size(), 1u);
    EXPECT_EQ(res.candidates[0].origin, "auto:path");
}

TEST_F(ExecutableResolverTest, StrictModeFailsWithNotFound) {
    ExecutableResolver resolver(cache_, validator_.fn(), bareLinux());

    auto res = resolver.resolve({.strictPathValidation = true});
    EXPECT_FALSE(res.ok());
    ASSERT_TRUE(res.error.has_value());
    EXPECT_EQ(res.error->code, gmcp::ErrorCode::NotFound);
    EXPECT_EQ(res.origin, "none");
    EXPECT_FALSE(res.path.has_value());
    EXPECT_GE(res.candidates.size(), 4u);
}

TEST_F(ExecutableResolverTest, LenientModeReturnsUnvalidatedDefaultAndProbesOnce) {
    ExecutableResolver resolver(cache_, validator_.fn(), bareLinux());

    auto res = resolver.resolve({});
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.origin, "auto");
    EXPECT_EQ(*res.path, defaultExecutablePath(HostPlatform::Linux));
    EXPECT_FALSE(res.validated);
    // The default is also a discovery candidate; the cache prevents a second probe
    EXPECT_EQ(validator_.calls["/usr/bin/godot"], 1);
}

TEST_F(ExecutableResolverTest, CacheIsSharedAcrossResolveCalls) {
    ExecutableResolver resolver(cache_, validator_.fn(), bareLinux());
    (void)resolver.resolve({});
    const auto probed = cache_.size();
    (void)resolver.resolve({});
    EXPECT_EQ(cache_.size(), probed);
    for (const auto& [path, count] : validator_.calls) {
        EXPECT_EQ(count, 1) << path;
    }
}

TEST_F(ExecutableResolverTest, PortableDownloadsAreDiscovered) {
    auto home = gmcp::test::make_temp_dir("gmcp_home_");
    gmcp::test::TempDirGuard guard(home);
    auto binary = gmcp::test::write_file(home / "Downloads" / "Godot_v4.3-stable_linux.x86_64", "");
    gmcp::test::write_file(home / "Downloads" / "notes.txt", "");

    auto ctx = bareLinux();
    ctx.home = home;
    validator_.valid = {binary.string()};
    ExecutableResolver resolver(cache_, validator_.fn(), ctx);

    auto res = resolver.resolve({});
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(*res.path, binary.string());
    EXPECT_EQ(res.candidates.back().origin, "auto:portable");
}

TEST(ExecutableResolverHelpers, WindowsDrivePathsAreMappedOnPosixHosts) {
    EXPECT_EQ(normalizeExecutablePathForHost("C:\\Godot\\Godot.exe", HostPlatform::Linux),
              "/mnt/c/Godot/Godot.exe");
    EXPECT_EQ(normalizeExecutablePathForHost("C:\\Godot\\Godot.exe", HostPlatform::Windows),
              "C:\\Godot\\Godot.exe");
    EXPECT_EQ(normalizeExecutablePathForHost(" godot ", HostPlatform::Linux), "godot");
}

TEST(ExecutableResolverHelpers, DiscoveryCandidatesAreUnique) {
    DiscoveryContext ctx;
    ctx.platform = HostPlatform::Windows;
    ctx.userProfile = "C:\\Users\\me";
    ctx.localAppData = "C:\\Users\\me\\AppData\\Local";
    auto candidates = discoverCandidates(ctx);
    std::set<std::string> seen;
    for (const auto& [origin, path] : candidates) {
        EXPECT_TRUE(seen.insert(path).second) << path;
    }
    EXPECT_EQ(candidates.front().second, "godot");
}

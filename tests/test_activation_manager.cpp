#include <gtest/gtest.h>

#include "testing.hpp"
#include "tz/activation_manager.hpp"
#include "tz/release.hpp"

#include <filesystem>

namespace tzupdater {

class ActivationManagerTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    testutil::FakeEnvironment env;
    ActivationManager activation{env};
    SessionContext ctx;

    std::string MakeCompiled(const std::string& release) {
        const auto dir = std::filesystem::path(tmp.Path()) / release / "compiled";
        std::filesystem::create_directories(dir);
        EXPECT_TRUE(testutil::WriteTextFile((dir / kVersionMarkerName).string(), release));
        return dir.string();
    }
};

TEST_F(ActivationManagerTest, NothingActiveYieldsPlaceholder) {
    EXPECT_EQ(activation.CurrentVersion(ctx), "-----");
}

TEST_F(ActivationManagerTest, ActivatePublishesTzDir) {
    const auto dir = MakeCompiled("2024a");
    activation.Activate(ctx, dir);

    ASSERT_TRUE(ctx.active_dataset_dir.has_value());
    EXPECT_EQ(*ctx.active_dataset_dir, dir);
    EXPECT_EQ(env.vars[kTzDirEnv], dir);
    EXPECT_EQ(activation.CurrentVersion(ctx), "2024a");
}

TEST_F(ActivationManagerTest, ReactivationReplacesPreviousDataset) {
    activation.Activate(ctx, MakeCompiled("2024a"));
    const auto second = MakeCompiled("2024b");
    activation.Activate(ctx, second);

    EXPECT_EQ(activation.CurrentVersion(ctx), "2024b");
    EXPECT_EQ(env.vars[kTzDirEnv], second);
}

TEST_F(ActivationManagerTest, DirectoryIsNotValidated) {
    const std::string bogus = tmp.Path() + "/does-not-exist";
    activation.Activate(ctx, bogus);

    EXPECT_EQ(env.vars[kTzDirEnv], bogus);
    EXPECT_EQ(activation.CurrentVersion(ctx), kNoActiveRelease);
}

TEST_F(ActivationManagerTest, EnvironmentFailureIsLoggedNotFatal) {
    env.fail_set = true;
    testutil::CapturingLogSink logs;
    const auto dir = MakeCompiled("2024a");

    activation.Activate(ctx, dir);
    EXPECT_EQ(activation.CurrentVersion(ctx), "2024a");
    EXPECT_TRUE(logs.Contains("Cannot publish TZDIR"));
}

TEST_F(ActivationManagerTest, VerboseActivationLogsVersion) {
    testutil::CapturingLogSink logs;
    activation.Activate(ctx, MakeCompiled("2023c"), /*verbose=*/true);
    EXPECT_TRUE(logs.Contains("Active tz db: 2023c"));
}

TEST_F(ActivationManagerTest, MarkerIsReadVerbatim) {
    const auto dir = MakeCompiled("2024a");
    EXPECT_EQ(ActivationManager::ReadVersionMarker(dir), "2024a");
    EXPECT_EQ(ActivationManager::ReadVersionMarker(tmp.Path()), "");
}

} // namespace tzupdater

#include <gtest/gtest.h>

#include "testing.hpp"
#include "tz/release.hpp"
#include "tz/tz_installer.hpp"

#include <filesystem>
#include <stdexcept>

namespace tzupdater {

namespace fs = std::filesystem;

namespace {

class ThrowingTransport final : public IHttpTransport {
  public:
    FetchOutcome GetText(const std::string&, std::string&) override {
        throw std::runtime_error("transport exploded");
    }
    FetchOutcome Download(const std::string&, IWriter&, IProgress*) override {
        throw std::runtime_error("transport exploded");
    }
};

} // namespace

class TzInstallerTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    testutil::FakeHttpTransport http;
    testutil::FakeZicRunner zic;
    testutil::FakeEnvironment env;
    Settings settings;
    SessionContext ctx;

    void SetUp() override {
        settings.download_base_url = "https://mirror.test/releases";
        settings.iana_website_url = "https://mirror.test/time-zones";
        settings.target_folder = tmp.Path();
        settings.verbose = false;
        env.vars[kSearchPathEnv] = "/usr/bin:/bin";
        zic.env = &env;
    }

    void Publish(const std::string& release, const std::vector<std::string>& components) {
        http.files[settings.download_base_url + "/tzdata" + release + ".tar.gz"] =
            testutil::BuildTzdataArchive(components);
    }

    void Announce(const std::string& release) {
        http.pages[settings.iana_website_url] = testutil::VersionPage(release);
    }

    InstallOptions Options() const { return InstallOptions::FromSettings(settings); }

    std::string ArchivePath(const std::string& release) const {
        return tmp.Path() + "/tzdata" + release + ".tar.gz";
    }
};

TEST_F(TzInstallerTest, InstallsAndActivatesRelease) {
    Publish("2024a", testutil::AllComponents());
    TzInstaller installer(http, zic, env, settings);

    auto res = installer.InstallVersion(ctx, "2024a", Options());
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(installer.LastState(), PipelineState::Done);
    EXPECT_EQ(installer.GetActiveVersion(ctx), "2024a");
    EXPECT_EQ(env.vars[kTzDirEnv], tmp.Path() + "/2024a/compiled");
    EXPECT_EQ(testutil::ReadFile(tmp.Path() + "/2024a/compiled/+VERSION"), "2024a");
    EXPECT_EQ(zic.invoked.size(), 12u);
}

TEST_F(TzInstallerTest, SecondInstallOfCompiledReleaseDoesNoWork) {
    Publish("2024a", testutil::AllComponents());
    TzInstaller installer(http, zic, env, settings);
    ASSERT_TRUE(installer.InstallVersion(ctx, "2024a", Options()).is_ok());

    const int downloads = http.download_calls;
    const int pages = http.get_text_calls;
    const size_t runs = zic.invoked.size();

    SessionContext fresh;
    auto res = installer.InstallVersion(fresh, "2024a", Options());
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(http.download_calls, downloads);
    EXPECT_EQ(http.get_text_calls, pages);
    EXPECT_EQ(zic.invoked.size(), runs);
    EXPECT_EQ(installer.GetActiveVersion(fresh), "2024a");
}

TEST_F(TzInstallerTest, CompiledReleaseActivatesWithoutZic) {
    Publish("2024a", testutil::AllComponents());
    TzInstaller installer(http, zic, env, settings);
    ASSERT_TRUE(installer.InstallVersion(ctx, "2024a", Options()).is_ok());

    zic.available = false;
    SessionContext fresh;
    auto res = installer.InstallVersion(fresh, "2024a", Options());
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(installer.GetActiveVersion(fresh), "2024a");
}

TEST_F(TzInstallerTest, InstallWithoutActivationLeavesActiveAlone) {
    Publish("2024a", testutil::AllComponents());
    TzInstaller installer(http, zic, env, settings);

    InstallOptions opt = Options();
    opt.activate = false;
    ASSERT_TRUE(installer.InstallVersion(ctx, "2024a", opt).is_ok());

    EXPECT_EQ(installer.GetActiveVersion(ctx), kNoActiveRelease);
    EXPECT_FALSE(env.Get(kTzDirEnv).has_value());
    EXPECT_TRUE(fs::exists(tmp.Path() + "/2024a/compiled/+VERSION"));
}

TEST_F(TzInstallerTest, InstallLatestSkipsWhenUpToDate) {
    Publish("2024a", testutil::AllComponents());
    Announce("2024a");
    TzInstaller installer(http, zic, env, settings);
    ASSERT_TRUE(installer.InstallVersion(ctx, "2024a", Options()).is_ok());

    const int downloads = http.download_calls;
    const size_t runs = zic.invoked.size();
    const int env_sets = env.set_calls;

    auto res = installer.InstallLatest(ctx, Options());
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(installer.LastState(), PipelineState::UpToDate);
    EXPECT_EQ(http.download_calls, downloads);
    EXPECT_EQ(zic.invoked.size(), runs);
    EXPECT_EQ(env.set_calls, env_sets);
}

TEST_F(TzInstallerTest, InstallLatestUpgradesOutdatedDataset) {
    Publish("2024a", testutil::AllComponents());
    Publish("2024b", testutil::AllComponents());
    Announce("2024b");
    TzInstaller installer(http, zic, env, settings);
    ASSERT_TRUE(installer.InstallVersion(ctx, "2024a", Options()).is_ok());

    InstallOptions opt = Options();
    opt.activate = false;
    auto res = installer.InstallLatest(ctx, opt);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    // Activation is forced on for the latest release.
    EXPECT_EQ(installer.GetActiveVersion(ctx), "2024b");
    EXPECT_EQ(installer.LastState(), PipelineState::Done);
}

TEST_F(TzInstallerTest, UnknownLatestReportsUnresolvableWithoutFetching) {
    http.pages[settings.iana_website_url] = "<html><body>no marker here</body></html>";
    TzInstaller installer(http, zic, env, settings);

    EXPECT_EQ(installer.GetLatestPublishedVersion(ctx), kUnknownRelease);

    auto res = installer.InstallLatest(ctx, Options());
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::VersionUnresolvable);
    EXPECT_EQ(installer.LastState(), PipelineState::Unresolvable);
    EXPECT_EQ(http.download_calls, 0);
    EXPECT_EQ(http.get_text_calls, 1);
    EXPECT_TRUE(zic.invoked.empty());
}

TEST_F(TzInstallerTest, NotFoundLeavesNoArchive) {
    TzInstaller installer(http, zic, env, settings);
    testutil::CapturingLogSink logs;

    auto res = installer.InstallVersion(ctx, "1999z", Options());
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ReleaseNotFound);
    EXPECT_EQ(installer.LastState(), PipelineState::FetchFailed);
    EXPECT_FALSE(fs::exists(ArchivePath("1999z")));
    EXPECT_TRUE(logs.Contains("1999z is not available!"));
    EXPECT_EQ(installer.GetActiveVersion(ctx), kNoActiveRelease);
}

TEST_F(TzInstallerTest, NotFoundForAnnouncedLatestBlamesTheWebsite) {
    Announce("2025a");
    TzInstaller installer(http, zic, env, settings);
    testutil::CapturingLogSink logs;

    auto res = installer.InstallLatest(ctx, Options());
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ReleaseNotFound);
    EXPECT_TRUE(logs.Contains("IANA website is not serving 2025a"));
    EXPECT_EQ(http.get_text_calls, 1);
}

TEST_F(TzInstallerTest, UnreachableSourceIsClassified) {
    http.failures[settings.download_base_url + "/tzdata2024a.tar.gz"] =
        FetchOutcome::Fail(FetchStatus::Unreachable, 0, "connection refused");
    TzInstaller installer(http, zic, env, settings);

    auto res = installer.InstallVersion(ctx, "2024a", Options());
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::SourceUnreachable);
    EXPECT_FALSE(fs::exists(ArchivePath("2024a")));
}

TEST_F(TzInstallerTest, StrictCompileFailureKeepsPreviousActive) {
    Publish("2024a", testutil::AllComponents());
    Publish("2024b", testutil::AllComponents());
    TzInstaller installer(http, zic, env, settings);
    ASSERT_TRUE(installer.InstallVersion(ctx, "2024a", Options()).is_ok());

    zic.scripted["europe"] = ZicInvocation{1, "\"europe\", line 7: invalid rule\n"};
    auto res = installer.InstallVersion(ctx, "2024b", Options());
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ComponentCompileError);
    EXPECT_EQ(installer.LastState(), PipelineState::CompileFailed);
    EXPECT_EQ(installer.GetActiveVersion(ctx), "2024a");
    EXPECT_EQ(env.vars[kTzDirEnv], tmp.Path() + "/2024a/compiled");
    EXPECT_FALSE(fs::exists(tmp.Path() + "/2024b/compiled"));
}

TEST_F(TzInstallerTest, OptionalComponentFailureIsTolerated) {
    Publish("2024a", testutil::AllComponents());
    zic.scripted["backward"] = ZicInvocation{1, "\"backward\", line 2: link failed\n"};
    TzInstaller installer(http, zic, env, settings);

    InstallOptions opt = Options();
    opt.err_stop = false;
    auto res = installer.InstallVersion(ctx, "2024a", opt);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(installer.GetActiveVersion(ctx), "2024a");
    EXPECT_EQ(zic.invoked.size(), 12u);
}

TEST_F(TzInstallerTest, MissingZicIsReportedBeforeAnyDownload) {
    Publish("2024a", testutil::AllComponents());
    zic.available = false;
    TzInstaller installer(http, zic, env, settings);
    testutil::CapturingLogSink logs;

    auto res = installer.InstallVersion(ctx, "2024a", Options());
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ToolMissing);
    EXPECT_EQ(installer.LastState(), PipelineState::ToolMissing);
    EXPECT_EQ(http.download_calls, 0);
    EXPECT_TRUE(logs.Contains("zic not found"));
}

TEST_F(TzInstallerTest, ZicPathIsPrependedForTheCallOnly) {
    Publish("2024a", {"europe"});
    settings.zic_path = "/opt/tzcode/bin";
    TzInstaller installer(http, zic, env, settings);

    ASSERT_TRUE(installer.InstallVersion(ctx, "2024a", Options()).is_ok());
    EXPECT_EQ(zic.path_seen, "/opt/tzcode/bin:/usr/bin:/bin");
    EXPECT_EQ(env.vars[kSearchPathEnv], "/usr/bin:/bin");
}

TEST_F(TzInstallerTest, SearchPathIsRestoredOnFailure) {
    settings.zic_path = "/opt/tzcode/bin";
    TzInstaller installer(http, zic, env, settings);

    EXPECT_FALSE(installer.InstallVersion(ctx, "1999z", Options()).is_ok());
    EXPECT_EQ(env.vars[kSearchPathEnv], "/usr/bin:/bin");
}

TEST_F(TzInstallerTest, CorruptArchiveIsAnExtractionFailure) {
    ASSERT_TRUE(testutil::WriteTextFile(ArchivePath("2024a"), "garbage"));
    TzInstaller installer(http, zic, env, settings);

    auto res = installer.InstallVersion(ctx, "2024a", Options());
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ExtractFailed);
    EXPECT_EQ(installer.LastState(), PipelineState::ExtractFailed);
    EXPECT_FALSE(fs::exists(tmp.Path() + "/2024a"));
}

TEST_F(TzInstallerTest, RejectsInvalidReleaseId) {
    TzInstaller installer(http, zic, env, settings);
    auto res = installer.InstallVersion(ctx, "../../etc", Options());
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(http.download_calls, 0);
}

TEST_F(TzInstallerTest, UnexpectedExceptionIsContained) {
    ThrowingTransport broken;
    TzInstaller installer(broken, zic, env, settings);
    testutil::CapturingLogSink logs;

    auto res = installer.InstallLatest(ctx, Options());
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::Internal);
    EXPECT_EQ(installer.LastState(), PipelineState::InternalError);
    EXPECT_TRUE(logs.Contains(kBugReportUrl));
    EXPECT_FALSE(ctx.latest_release.has_value());
    EXPECT_FALSE(ctx.active_dataset_dir.has_value());
}

TEST_F(TzInstallerTest, DownloadExceptionLeavesNoArchiveForTheRetry) {
    {
        ThrowingTransport broken;
        TzInstaller installer(broken, zic, env, settings);
        auto res = installer.InstallVersion(ctx, "2024a", Options());
        ASSERT_FALSE(res.is_ok());
        EXPECT_EQ(res.kind, ErrorKind::Internal);
    }
    EXPECT_FALSE(fs::exists(ArchivePath("2024a")));
    EXPECT_FALSE(fs::exists(ArchivePath("2024a") + ".part"));

    Publish("2024a", testutil::AllComponents());
    TzInstaller installer(http, zic, env, settings);
    auto res = installer.InstallVersion(ctx, "2024a", Options());
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(http.download_calls, 1);
    EXPECT_EQ(installer.GetActiveVersion(ctx), "2024a");
}

TEST_F(TzInstallerTest, InstallOptionsFromSettings) {
    settings.show_zic_log = true;
    settings.err_stop = false;
    settings.activate = false;
    settings.zic_path = "/opt/bin";

    const InstallOptions o = InstallOptions::FromSettings(settings);
    EXPECT_EQ(o.target_folder, tmp.Path());
    EXPECT_EQ(o.zic_path, "/opt/bin");
    EXPECT_TRUE(o.show_zic_log);
    EXPECT_FALSE(o.err_stop);
    EXPECT_FALSE(o.activate);
    EXPECT_FALSE(o.verbose);
}

TEST_F(TzInstallerTest, PipelineStateNames) {
    EXPECT_STREQ(ToString(PipelineState::UpToDate), "UpToDate");
    EXPECT_STREQ(ToString(PipelineState::CompileFailed), "CompileFailed");
}

} // namespace tzupdater

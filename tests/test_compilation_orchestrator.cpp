#include <gtest/gtest.h>

#include "testing.hpp"
#include "tz/compilation_orchestrator.hpp"
#include "tz/release.hpp"

#include <filesystem>

namespace tzupdater {

namespace fs = std::filesystem;

class CompilationOrchestratorTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    testutil::FakeZicRunner zic;
    CompilationOrchestrator orchestrator{zic};

    std::string WriteArchive(const std::vector<std::string>& components) {
        const std::string path = tmp.Path() + "/tzdata2099z.tar.gz";
        EXPECT_TRUE(testutil::WriteBytesFile(path, testutil::BuildTzdataArchive(components)));
        return path;
    }

    ReleaseLayout Layout() const { return ReleaseLayout::For(tmp.Path(), "2099z"); }
};

TEST_F(CompilationOrchestratorTest, ComponentOrderIsFixed) {
    EXPECT_EQ(CompilationOrchestrator::Components(), testutil::AllComponents());
}

TEST_F(CompilationOrchestratorTest, OptionalComponents) {
    EXPECT_TRUE(CompilationOrchestrator::IsOptional("backward"));
    EXPECT_TRUE(CompilationOrchestrator::IsOptional("pacificnew"));
    EXPECT_TRUE(CompilationOrchestrator::IsOptional("systemv"));
    EXPECT_TRUE(CompilationOrchestrator::IsOptional("factory"));
    EXPECT_FALSE(CompilationOrchestrator::IsOptional("europe"));
}

TEST_F(CompilationOrchestratorTest, ClassifiesWarningsAndErrors) {
    std::vector<std::string> errors, warnings;
    CompilationOrchestrator::ClassifyOutput(
        "zic: warning: \"europe\", line 12: link to link\n"
        "\n"
        "\"europe\", line 40: invalid saved time\n",
        1, errors, warnings);

    ASSERT_EQ(warnings.size(), 1u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("invalid saved time"), std::string::npos);
}

TEST_F(CompilationOrchestratorTest, SilentNonZeroExitIsAnError) {
    std::vector<std::string> errors, warnings;
    CompilationOrchestrator::ClassifyOutput("", 3, errors, warnings);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "zic exited with status 3");
}

TEST_F(CompilationOrchestratorTest, WarningsOnlyOutputIsClean) {
    std::vector<std::string> errors, warnings;
    CompilationOrchestrator::ClassifyOutput("warning: time zone abbreviation differs\n", 0, errors, warnings);
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(warnings.size(), 1u);
}

TEST_F(CompilationOrchestratorTest, CompilesEveryComponentInOrderAndWritesMarker) {
    const auto archive = WriteArchive(testutil::AllComponents());

    CompileReport report;
    auto res = orchestrator.Compile(archive, tmp.Path(), "2099z", CompileOptions{}, report);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(zic.invoked, testutil::AllComponents());
    EXPECT_EQ(report.compiled, 12);
    EXPECT_EQ(report.failed, 0);
    EXPECT_FALSE(report.aborted);
    EXPECT_EQ(report.compiled_dir, Layout().compiled_dir.string());
    EXPECT_EQ(testutil::ReadFile(Layout().version_marker), "2099z");
}

TEST_F(CompilationOrchestratorTest, MissingComponentsAreSkipped) {
    const auto archive = WriteArchive({"etcetera", "europe", "asia"});
    testutil::CapturingLogSink logs;

    CompileReport report;
    auto res = orchestrator.Compile(archive, tmp.Path(), "2099z", CompileOptions{}, report);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(zic.invoked, (std::vector<std::string>{"etcetera", "europe", "asia"}));
    EXPECT_EQ(report.compiled, 3);
    ASSERT_EQ(report.components.size(), 12u);
    EXPECT_EQ(report.components[1].name, "southamerica");
    EXPECT_EQ(report.components[1].state, ComponentState::Missing);
    EXPECT_TRUE(logs.Contains("Expected southamerica was not in 2099z!"));
    EXPECT_FALSE(logs.Contains("Expected pacificnew"));
}

TEST_F(CompilationOrchestratorTest, StrictModeStopsAtFirstFailure) {
    const auto archive = WriteArchive(testutil::AllComponents());
    zic.scripted["northamerica"] = ZicInvocation{1, "\"northamerica\", line 3: syntax error\n"};

    CompileReport report;
    auto res = orchestrator.Compile(archive, tmp.Path(), "2099z", CompileOptions{}, report);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ComponentCompileError);

    EXPECT_EQ(zic.invoked, (std::vector<std::string>{"etcetera", "southamerica", "northamerica"}));
    EXPECT_TRUE(report.aborted);
    EXPECT_EQ(report.failed, 1);
    EXPECT_FALSE(fs::exists(Layout().compiled_dir));
    EXPECT_FALSE(fs::exists(Layout().version_marker));
}

TEST_F(CompilationOrchestratorTest, LenientModeContinuesPastFailures) {
    const auto archive = WriteArchive(testutil::AllComponents());
    zic.scripted["northamerica"] = ZicInvocation{1, "\"northamerica\", line 3: syntax error\n"};

    CompileOptions opt;
    opt.strict_on_error = false;
    CompileReport report;
    auto res = orchestrator.Compile(archive, tmp.Path(), "2099z", opt, report);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(zic.invoked.size(), 12u);
    EXPECT_EQ(report.compiled, 11);
    EXPECT_EQ(report.failed, 1);
    EXPECT_EQ(report.components[2].state, ComponentState::Failed);
    EXPECT_EQ(testutil::ReadFile(Layout().version_marker), "2099z");
}

TEST_F(CompilationOrchestratorTest, WarningsDoNotFailAComponent) {
    const auto archive = WriteArchive({"europe"});
    zic.scripted["europe"] = ZicInvocation{0, "warning: link to link\n"};

    CompileReport report;
    auto res = orchestrator.Compile(archive, tmp.Path(), "2099z", CompileOptions{}, report);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(report.compiled, 1);
}

TEST_F(CompilationOrchestratorTest, NothingCompiledIsAFailure) {
    const auto archive = WriteArchive({"europe"});
    zic.scripted["europe"] = ZicInvocation{1, "bad input\n"};

    CompileOptions opt;
    opt.strict_on_error = false;
    CompileReport report;
    auto res = orchestrator.Compile(archive, tmp.Path(), "2099z", opt, report);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ComponentCompileError);
    EXPECT_FALSE(fs::exists(Layout().version_marker));
}

TEST_F(CompilationOrchestratorTest, ShowsCompilerOutputWhenAsked) {
    const auto archive = WriteArchive({"europe"});
    zic.scripted["europe"] = ZicInvocation{0, "warning: europe line 1\n"};
    testutil::CapturingLogSink logs;

    CompileOptions opt;
    opt.show_compiler_log = true;
    CompileReport report;
    ASSERT_TRUE(orchestrator.Compile(archive, tmp.Path(), "2099z", opt, report).is_ok());
    EXPECT_TRUE(logs.Contains("zic[europe]: warning: europe line 1"));
}

TEST_F(CompilationOrchestratorTest, CorruptArchiveRemovesSourceDirectory) {
    const std::string archive = tmp.Path() + "/tzdata2099z.tar.gz";
    ASSERT_TRUE(testutil::WriteTextFile(archive, "not gzip at all"));

    CompileReport report;
    auto res = orchestrator.Compile(archive, tmp.Path(), "2099z", CompileOptions{}, report);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ExtractFailed);
    EXPECT_FALSE(fs::exists(Layout().source_dir));
    EXPECT_TRUE(zic.invoked.empty());
}

} // namespace tzupdater

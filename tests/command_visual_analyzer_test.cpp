#include <sitecheck/command_runner.h>
#include <sitecheck/command_visual_analyzer.h>
#include <sitecheck/errors.h>
#include <sitecheck/screenshot_renderer.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/stub_components.h"
#include "test_support/temporary_directory.h"

namespace sitecheck {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using test::TemporaryDirectory;

using namespace std::chrono_literals;

TEST(CommandRunnerTest, CapturesOutputAndExitCode) {
  const auto result = RunCommand("printf 'hello'; exit 4");

  EXPECT_EQ(result.output, "hello");
  EXPECT_EQ(result.exit_code, 4);
}

TEST(CommandRunnerTest, QuotesValuesForTheShell) {
  EXPECT_EQ(ShellQuote("plain"), "'plain'");
  EXPECT_EQ(ShellQuote("it's"), "'it'\\''s'");
  EXPECT_EQ(RunCommand("printf '%s' " + ShellQuote("a b'c; d")).output,
            "a b'c; d");
}

TEST(CommandRunnerTest, ExpandsEveryPlaceholderOccurrence) {
  std::string command = "render {url} --to {output} --log {output}";

  EXPECT_TRUE(ExpandPlaceholders(
      command, {{"url", "https://example.com"}, {"output", "/tmp/a.png"}}));
  EXPECT_EQ(command, "render 'https://example.com' --to '/tmp/a.png' --log "
                     "'/tmp/a.png'");

  std::string untouched = "classify";
  EXPECT_FALSE(ExpandPlaceholders(untouched, {{"image", "x.png"}}));
  EXPECT_EQ(untouched, "classify");
}

TEST(CommandRunnerTest, BoundsACommandWithTimeout) {
  EXPECT_EQ(WithTimeLimit("render x", 1500ms),
            "timeout -k 2 1.500 sh -c 'render x'");
  EXPECT_EQ(WithTimeLimit("render x", 0ms), "render x");

  const auto started = std::chrono::steady_clock::now();
  const auto result = RunCommand(WithTimeLimit("sleep 5", 100ms));

  EXPECT_EQ(result.exit_code, 124);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
}

TEST(ClassifierVerdictTest, ParsesScoreConfidenceAndTypedFindings) {
  const auto outcome = ParseClassifierVerdict(
      "score: 7.5\n"
      "confidence: 0.8\n"
      "findings:\n"
      "  logo_match: paypal\n"
      "  similarity: 0.92\n"
      "  regions: [header, form]\n"
      "  login_boxes: 2\n"
      "  layout:\n"
      "    login_box: true\n"
      "  note: \"42\"\n");

  EXPECT_EQ(outcome.source, AnalyzerSource::kVisual);
  EXPECT_EQ(outcome.status, OutcomeStatus::kOk);
  EXPECT_DOUBLE_EQ(outcome.sub_score.value(), 7.5);
  EXPECT_DOUBLE_EQ(outcome.confidence.value(), 0.8);
  EXPECT_EQ(std::get<std::string>(outcome.findings.at("logo_match")),
            "paypal");
  EXPECT_DOUBLE_EQ(std::get<double>(outcome.findings.at("similarity")), 0.92);
  EXPECT_EQ(std::get<std::int64_t>(outcome.findings.at("login_boxes")), 2);
  EXPECT_THAT(std::get<std::vector<std::string>>(outcome.findings.at("regions")),
              ElementsAre("header", "form"));
  EXPECT_TRUE(std::get<bool>(outcome.findings.at("layout.login_box")));
  EXPECT_EQ(std::get<std::string>(outcome.findings.at("note")), "42");
}

TEST(ClassifierVerdictTest, RejectsOutputWithoutANumericScore) {
  EXPECT_THROW(ParseClassifierVerdict("confidence: 0.5\n"),
               PermanentAnalyzerError);
  EXPECT_THROW(ParseClassifierVerdict("score: high\nconfidence: 0.5\n"),
               PermanentAnalyzerError);
}

TEST(ClassifierVerdictTest, RejectsMalformedOutput) {
  EXPECT_THROW(ParseClassifierVerdict("score: [1, 2\n"),
               PermanentAnalyzerError);
  EXPECT_THROW(ParseClassifierVerdict("- 1\n- 2\n"), PermanentAnalyzerError);
  EXPECT_THROW(
      ParseClassifierVerdict("score: 1\nconfidence: 1\nfindings: [a]\n"),
      PermanentAnalyzerError);
}

class CommandVisualAnalyzerTest : public ::testing::Test {
protected:
  FetchedContent WithScreenshot() {
    auto content = test::SampleContent();
    content.screenshot_ref = directory_.AddFile("shot.png", "png").string();
    return content;
  }

  AnalyzerOutcome Classify(const std::string &command,
                           const FetchedContent &content) {
    CommandVisualAnalyzer analyzer(command);
    return analyzer.Evaluate(content, CancellationToken());
  }

  TemporaryDirectory directory_;
};

TEST_F(CommandVisualAnalyzerTest, PassesTheScreenshotToTheClassifier) {
  const auto script = directory_.AddScript(
      "classify.sh",
      "printf 'score: 6\\nconfidence: 0.5\\nfindings:\\n  seen: %s\\n' "
      "\"$2\"\n");
  const auto content = WithScreenshot();

  const auto outcome =
      Classify(script.string() + " --image {image}", content);

  EXPECT_DOUBLE_EQ(outcome.sub_score.value(), 6.0);
  EXPECT_EQ(std::get<std::string>(outcome.findings.at("seen")),
            *content.screenshot_ref);
  EXPECT_EQ(std::get<std::string>(outcome.findings.at("screenshot")),
            *content.screenshot_ref);
}

TEST_F(CommandVisualAnalyzerTest, AppendsTheScreenshotWithoutAPlaceholder) {
  const auto script = directory_.AddScript(
      "classify.sh",
      "printf 'score: 1\\nconfidence: 0.9\\nfindings:\\n  seen: %s\\n' "
      "\"$1\"\n");
  const auto content = WithScreenshot();

  const auto outcome = Classify(script.string(), content);

  EXPECT_EQ(std::get<std::string>(outcome.findings.at("seen")),
            *content.screenshot_ref);
}

TEST_F(CommandVisualAnalyzerTest, TemporaryFailureExitCodeIsTransient) {
  const auto script = directory_.AddScript("busy.sh", "exit 75\n");

  EXPECT_THROW(Classify(script.string(), WithScreenshot()),
               TransientAnalyzerError);
}

TEST_F(CommandVisualAnalyzerTest, OtherFailingExitCodesArePermanent) {
  const auto script = directory_.AddScript("broken.sh", "exit 3\n");

  try {
    Classify(script.string(), WithScreenshot());
    FAIL() << "expected PermanentAnalyzerError";
  } catch (const PermanentAnalyzerError &error) {
    EXPECT_THAT(error.what(), HasSubstr("status 3"));
  }
}

TEST_F(CommandVisualAnalyzerTest, IsNotApplicableWithoutAClassifier) {
  EXPECT_THROW(Classify("  ", WithScreenshot()), AnalyzerNotApplicable);
}

TEST_F(CommandVisualAnalyzerTest, IsNotApplicableWithoutAScreenshot) {
  EXPECT_THROW(Classify("true", test::SampleContent()), AnalyzerNotApplicable);

  auto missing = test::SampleContent();
  missing.screenshot_ref = (directory_.root() / "gone.png").string();
  EXPECT_THROW(Classify("true", missing), AnalyzerNotApplicable);
}

TEST(CommandScreenshotRendererTest, ReturnsThePathTheCommandWrote) {
  TemporaryDirectory directory;
  const auto script =
      directory.AddScript("shoot.sh", "printf '%s' \"$1\" > \"$2\"\n");
  CommandScreenshotRenderer renderer(script.string() + " {url} {output}",
                                     directory.root() / "shots");

  const auto path = renderer.Render("https://example.com/login");

  ASSERT_TRUE(path);
  EXPECT_EQ(test::LoadFile(*path), "https://example.com/login");
  EXPECT_EQ(std::filesystem::path(*path).parent_path(),
            directory.root() / "shots");
}

TEST(CommandScreenshotRendererTest, ReturnsNothingWhenTheCommandFails) {
  TemporaryDirectory directory;
  const auto script = directory.AddScript("fail.sh", "exit 1\n");
  CommandScreenshotRenderer renderer(script.string() + " {url} {output}",
                                     directory.root());

  EXPECT_FALSE(renderer.Render("https://example.com"));
}

TEST(CommandScreenshotRendererTest, GivesUpOnACommandThatHangs) {
  TemporaryDirectory directory;
  const auto script =
      directory.AddScript("hang.sh", "sleep 5\nprintf late > \"$2\"\n");
  CommandScreenshotRenderer renderer(script.string() + " {url} {output}",
                                     directory.root() / "shots", 200ms);

  const auto started = std::chrono::steady_clock::now();
  const auto path = renderer.Render("https://example.com");

  EXPECT_FALSE(path);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
}

TEST(CommandScreenshotRendererTest, ReturnsNothingWhenNoImageAppears) {
  TemporaryDirectory directory;
  CommandScreenshotRenderer renderer("true {url} {output}", directory.root());

  EXPECT_FALSE(renderer.Render("https://example.com"));
}

} // namespace
} // namespace sitecheck

#include <cstdlib>
#include <filesystem>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_directory.h"

namespace sitecheck {
namespace {

using ::testing::HasSubstr;
using test::LoadFile;
using test::TemporaryDirectory;

constexpr const char kPhishingPage[] =
    "<html><head><title>PayPal - Verify your account</title></head><body>"
    "<p>Your account has been suspended. Act now to restore access.</p>"
    "<form action=\"collect.php\" method=\"post\">"
    "<input type=\"email\" name=\"email\">"
    "<input type=\"password\" name=\"password\">"
    "</form></body></html>";

constexpr const char kRecipePage[] =
    "<html><head><title>Recipes</title></head>"
    "<body><p>Tomato soup</p></body></html>";

std::filesystem::path ExecutableUnderTest() {
  if (const char *configured = std::getenv("SITECHECK_CLI")) {
    return configured;
  }
  return std::filesystem::current_path() / "sitecheck";
}

int ExitCode(const std::string &command) {
  return WEXITSTATUS(std::system((command + " >/dev/null 2>&1").c_str()));
}

class CliIntegrationTest : public ::testing::Test {
protected:
  void SetUp() override {
    cli_ = ExecutableUnderTest();
    ASSERT_TRUE(std::filesystem::exists(cli_))
        << "Expected CLI executable at " << cli_;
  }

  TemporaryDirectory directory_;
  std::filesystem::path cli_;
};

TEST_F(CliIntegrationTest, WritesBothReportsForAHighRiskPage) {
  directory_.AddFile("login.html", kPhishingPage);
  const auto output_directory = directory_.root() / "artifacts";

  const std::string command = cli_.string() + " analyze " +
                              directory_.FileUrl("login.html") +
                              " --format json,markdown --out " +
                              output_directory.string();

  ASSERT_EQ(ExitCode(command), 2);

  const auto json = LoadFile(output_directory / "site_report.json");
  const auto markdown = LoadFile(output_directory / "site_report.md");
  EXPECT_THAT(json, HasSubstr("\"risk_score\": 10.0"));
  EXPECT_THAT(json, HasSubstr("\"recommendation\": \"HIGH RISK\""));
  EXPECT_THAT(json, HasSubstr("\"brand_impersonation\": \"paypal\""));
  EXPECT_THAT(json, HasSubstr("\"visual_analysis\": null"));
  EXPECT_THAT(markdown, HasSubstr("# Site Risk Report"));
  EXPECT_THAT(markdown, HasSubstr("| visual | skipped |"));
}

TEST_F(CliIntegrationTest, DefaultsToJsonOnly) {
  directory_.AddFile("recipes.html", kRecipePage);
  const auto output_directory = directory_.root() / "out";

  const std::string command = cli_.string() + " " +
                              directory_.FileUrl("recipes.html") + " --out " +
                              output_directory.string();

  ASSERT_EQ(ExitCode(command), 0);
  EXPECT_TRUE(std::filesystem::exists(output_directory / "site_report.json"));
  EXPECT_FALSE(std::filesystem::exists(output_directory / "site_report.md"));
}

TEST_F(CliIntegrationTest, UsesTheConfigFile) {
  directory_.AddFile("recipes.html", kRecipePage);
  const auto output_directory = directory_.root() / "configured";
  const auto config = directory_.AddFile(
      "sitecheck.yaml", "url: " + directory_.FileUrl("recipes.html") +
                            "\nout: " + output_directory.string() +
                            "\nformats: [markdown]\n"
                            "analyzers:\n  disabled: [visual, reputation]\n");

  ASSERT_EQ(ExitCode(cli_.string() + " --config " + config.string()), 0);

  const auto markdown = LoadFile(output_directory / "site_report.md");
  EXPECT_THAT(markdown, HasSubstr("| Risk Score | 3.0/10 |"));
  EXPECT_THAT(markdown, HasSubstr("| reputation | skipped |"));
  EXPECT_FALSE(std::filesystem::exists(output_directory / "site_report.json"));
}

TEST_F(CliIntegrationTest, ExitsWithUnknownWhenFetchFails) {
  const auto output_directory = directory_.root() / "failed";

  ASSERT_EQ(ExitCode(cli_.string() + " " + directory_.FileUrl("absent.html") +
                     " --out " + output_directory.string()),
            3);

  const auto json = LoadFile(output_directory / "site_report.json");
  EXPECT_THAT(json, HasSubstr("\"recommendation\": \"UNKNOWN\""));
  EXPECT_THAT(json, HasSubstr("\"confidence\": 0.00"));
}

TEST_F(CliIntegrationTest, UsageErrorsExitWithOne) {
  EXPECT_EQ(ExitCode(cli_.string() + " --bogus"), 1);
  EXPECT_EQ(ExitCode(cli_.string() + " example.com --weights 1,1,1"), 1);
  EXPECT_EQ(ExitCode(cli_.string()), 1);
  EXPECT_EQ(ExitCode(cli_.string() + " --help"), 0);
}

} // namespace
} // namespace sitecheck

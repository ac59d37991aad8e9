#include <sitecheck/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  sitecheck::StructuredLogger logger(stream, {sitecheck::LogLevel::kInfo});

  logger.Log(sitecheck::LogLevel::kDebug, "debug message", {});
  logger.Log(sitecheck::LogLevel::kInfo, "info message", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("debug message"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("info message"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  sitecheck::StructuredLogger logger(stream, {sitecheck::LogLevel::kDebug});

  logger.Log(sitecheck::LogLevel::kDebug, "analyzer.complete",
             {{"source", "visual"}, {"duration_ms", "42"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"source\": \"visual\""));
  EXPECT_NE(std::string::npos, output.find("\"duration_ms\": \"42\"}"));
  EXPECT_NE(std::string::npos, output.find("message=\"analyzer.complete\""));
}

TEST(LoggingTest, QuotesEmbeddedQuotesAndNewlines) {
  std::stringstream stream;
  sitecheck::StructuredLogger logger(stream, {sitecheck::LogLevel::kWarn});

  logger.Log(sitecheck::LogLevel::kError, "fetch.failed",
             {{"error", "said \"no\"\nthen hung up"}});

  EXPECT_NE(std::string::npos,
            stream.str().find("\"said \\\"no\\\"\\nthen hung up\""));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = sitecheck::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr,
            std::dynamic_pointer_cast<sitecheck::NullLogger>(provided));

  auto custom = std::make_shared<sitecheck::StructuredLogger>(
      std::cout, sitecheck::LoggingConfig{});
  EXPECT_EQ(custom, sitecheck::EnsureLogger(custom));
}

TEST(LoggingTest, ParsesLevelNamesCaseInsensitively) {
  EXPECT_EQ(sitecheck::LogLevel::kDebug, sitecheck::ParseLogLevel("DEBUG"));
  EXPECT_EQ(sitecheck::LogLevel::kWarn, sitecheck::ParseLogLevel("warning"));
  EXPECT_EQ(sitecheck::LogLevel::kError, sitecheck::ParseLogLevel(" error "));
  EXPECT_THROW(sitecheck::ParseLogLevel("verbose"), std::invalid_argument);
}

} // namespace

#include <sitecheck/curl_content_fetcher.h>
#include <sitecheck/errors.h>

#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_directory.h"

namespace sitecheck {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using test::TemporaryDirectory;

class RecordingRenderer : public ScreenshotRenderer {
public:
  explicit RecordingRenderer(std::optional<std::string> result)
      : result_(std::move(result)) {}

  std::optional<std::string> Render(const std::string &url) override {
    urls.push_back(url);
    return result_;
  }

  std::vector<std::string> urls;

private:
  std::optional<std::string> result_;
};

TEST(DescribeDomainTest, DerivesHostFacts) {
  const auto metadata = DescribeDomain("https://Login.Example.com:8443/x");

  EXPECT_EQ(metadata.scheme, "https");
  EXPECT_EQ(metadata.host, "login.example.com");
  EXPECT_EQ(metadata.port, 8443);
  EXPECT_EQ(metadata.tld, "com");
  EXPECT_EQ(metadata.registrable_domain, "example.com");
  EXPECT_TRUE(metadata.uses_https);
  EXPECT_FALSE(metadata.is_ip_literal);
  EXPECT_EQ(metadata.final_url, "https://Login.Example.com:8443/x");
}

TEST(DescribeDomainTest, RecognizesIpHostsOverPlainHttp) {
  const auto metadata = DescribeDomain("http://10.0.0.1/admin");

  EXPECT_TRUE(metadata.is_ip_literal);
  EXPECT_FALSE(metadata.uses_https);
  EXPECT_EQ(metadata.port, 80);
}

class CurlContentFetcherTest : public ::testing::Test {
protected:
  TemporaryDirectory directory_;
};

TEST_F(CurlContentFetcherTest, ReadsALocalPage) {
  directory_.AddFile("page.html", "<html><title>Local</title></html>");
  std::ostringstream log;
  CurlContentFetcher fetcher(FetchSettings{}, nullptr,
                             MakeLogger(LoggingConfig{LogLevel::kInfo}, log));

  const auto content = fetcher.Fetch(directory_.FileUrl("page.html"));

  EXPECT_EQ(content.html, "<html><title>Local</title></html>");
  EXPECT_EQ(content.url, directory_.FileUrl("page.html"));
  EXPECT_EQ(content.domain_metadata.scheme, "file");
  EXPECT_FALSE(content.domain_metadata.uses_https);
  EXPECT_FALSE(content.screenshot_ref);
  EXPECT_THAT(log.str(), HasSubstr("fetch.complete"));
}

TEST_F(CurlContentFetcherTest, TruncatesBodiesAtTheByteLimit) {
  directory_.AddFile("large.html", std::string(4096, 'x'));
  FetchSettings settings;
  settings.max_bytes = 100;
  CurlContentFetcher fetcher(settings);

  const auto content = fetcher.Fetch(directory_.FileUrl("large.html"));

  EXPECT_EQ(content.html.size(), 100u);
}

TEST_F(CurlContentFetcherTest, AsksTheRendererForAScreenshot) {
  directory_.AddFile("page.html", "<p>hi</p>");
  auto renderer = std::make_shared<RecordingRenderer>("/tmp/shot.png");
  CurlContentFetcher fetcher(FetchSettings{}, renderer);

  const auto url = directory_.FileUrl("page.html");
  const auto content = fetcher.Fetch(url);

  EXPECT_THAT(renderer->urls, ElementsAre(url));
  EXPECT_EQ(content.screenshot_ref.value_or(""), "/tmp/shot.png");
}

TEST_F(CurlContentFetcherTest, MissingScreenshotLeavesTheReferenceEmpty) {
  directory_.AddFile("page.html", "<p>hi</p>");
  CurlContentFetcher fetcher(FetchSettings{},
                             std::make_shared<RecordingRenderer>(std::nullopt));

  EXPECT_FALSE(fetcher.Fetch(directory_.FileUrl("page.html")).screenshot_ref);
}

TEST_F(CurlContentFetcherTest, MissingFilesAreFetchErrors) {
  std::ostringstream log;
  CurlContentFetcher fetcher(FetchSettings{}, nullptr,
                             MakeLogger(LoggingConfig{LogLevel::kWarn}, log));

  EXPECT_THROW(fetcher.Fetch(directory_.FileUrl("absent.html")), FetchError);
  EXPECT_THAT(log.str(), HasSubstr("fetch.failed"));
}

TEST_F(CurlContentFetcherTest, MalformedUrlsAreFetchErrors) {
  CurlContentFetcher fetcher;

  EXPECT_THROW(fetcher.Fetch("not a url"), FetchError);
  EXPECT_THROW(fetcher.Fetch("nosuchscheme://example.com/"), FetchError);
}

} // namespace
} // namespace sitecheck

#pragma once

#include <sitecheck/interfaces.h>
#include <sitecheck/logging.h>
#include <sitecheck/screenshot_renderer.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace sitecheck {

struct FetchSettings {
  std::chrono::milliseconds timeout{30000};
  std::chrono::milliseconds connect_timeout{10000};
  std::size_t max_bytes = 5 * 1024 * 1024;
  long max_redirects = 10;
  std::string user_agent = "sitecheck/1.0";
  // Responses with a status above this are treated as a failed fetch.
  long max_acceptable_status = 399;
};

// Acquires a page over HTTP(S) with libcurl and, when a renderer is
// configured, a screenshot of it.
class CurlContentFetcher : public ContentFetcher {
public:
  explicit CurlContentFetcher(
      FetchSettings settings = {},
      std::shared_ptr<ScreenshotRenderer> screenshot_renderer = nullptr,
      std::shared_ptr<Logger> logger = nullptr);

  FetchedContent Fetch(const std::string &url) override;

private:
  FetchSettings settings_;
  std::shared_ptr<ScreenshotRenderer> screenshot_renderer_;
  std::shared_ptr<Logger> logger_;
};

// Fills the host-derived fields of DomainMetadata from `url`.
DomainMetadata DescribeDomain(const std::string &url);

} // namespace sitecheck

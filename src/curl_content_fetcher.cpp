#include <sitecheck/curl_content_fetcher.h>

#include <sitecheck/errors.h>
#include <sitecheck/url.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <curl/curl.h>

namespace sitecheck {
namespace {

struct ResponseBuffer {
  std::string data;
  std::size_t max_bytes = 0;
  bool truncated = false;
};

std::size_t WriteCallback(void *contents, std::size_t size, std::size_t nmemb,
                          void *userp) {
  const auto real_size = size * nmemb;
  auto *buffer = static_cast<ResponseBuffer *>(userp);
  if (buffer == nullptr) {
    return 0;
  }
  if (buffer->data.size() + real_size > buffer->max_bytes) {
    const auto room = buffer->max_bytes - buffer->data.size();
    buffer->data.append(static_cast<char *>(contents), room);
    buffer->truncated = true;
    // Returning less than real_size makes curl abort with CURLE_WRITE_ERROR.
    return room;
  }
  buffer->data.append(static_cast<char *>(contents), real_size);
  return real_size;
}

void EnsureCurlInitialized() {
  static std::once_flag once;
  static CURLcode status = CURLE_OK;
  std::call_once(once, [] { status = curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (status != CURLE_OK) {
    throw FetchError(std::string("curl_global_init failed: ") +
                     curl_easy_strerror(status));
  }
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

} // namespace

DomainMetadata DescribeDomain(const std::string &url) {
  const auto parts = ParseUrl(url);
  DomainMetadata metadata;
  metadata.scheme = parts.scheme;
  metadata.host = parts.host;
  metadata.port = parts.port;
  metadata.is_ip_literal = IsIpLiteral(parts.host);
  metadata.tld = TopLevelDomain(parts.host);
  metadata.registrable_domain = RegistrableDomain(parts.host);
  metadata.uses_https = parts.scheme == "https";
  metadata.final_url = url;
  return metadata;
}

CurlContentFetcher::CurlContentFetcher(
    FetchSettings settings,
    std::shared_ptr<ScreenshotRenderer> screenshot_renderer,
    std::shared_ptr<Logger> logger)
    : settings_(std::move(settings)),
      screenshot_renderer_(std::move(screenshot_renderer)),
      logger_(EnsureLogger(std::move(logger))) {}

FetchedContent CurlContentFetcher::Fetch(const std::string &url) {
  DomainMetadata requested;
  try {
    requested = DescribeDomain(url);
  } catch (const std::invalid_argument &error) {
    throw FetchError(error.what());
  }

  EnsureCurlInitialized();
  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw FetchError("curl_easy_init failed");
  }

  ResponseBuffer buffer;
  buffer.max_bytes = settings_.max_bytes;
  char error_buffer[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, settings_.max_redirects);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT,
                   settings_.user_agent.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                   static_cast<long>(settings_.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(settings_.connect_timeout.count()));

  logger_->Log(LogLevel::kDebug, "fetch.start", {{"url", url}});
  const auto started = std::chrono::steady_clock::now();
  const auto code = curl_easy_perform(curl.get());
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (code != CURLE_OK && !(code == CURLE_WRITE_ERROR && buffer.truncated)) {
    const std::string detail =
        error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(code);
    logger_->Log(LogLevel::kWarn, "fetch.failed",
                 {{"url", url}, {"error", detail}});
    throw FetchError("Failed to fetch " + url + ": " + detail);
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  char *effective_url = nullptr;
  curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective_url);
  char *content_type = nullptr;
  curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);

  if (status > settings_.max_acceptable_status) {
    logger_->Log(LogLevel::kWarn, "fetch.failed",
                 {{"url", url}, {"status", std::to_string(status)}});
    throw FetchError("Fetching " + url + " returned HTTP status " +
                     std::to_string(status));
  }

  FetchedContent content;
  content.url = url;
  content.html = std::move(buffer.data);
  content.fetched_at = std::chrono::system_clock::now();

  const std::string final_url =
      effective_url != nullptr ? effective_url : url;
  try {
    content.domain_metadata = DescribeDomain(final_url);
  } catch (const std::invalid_argument &) {
    content.domain_metadata = requested;
  }
  content.domain_metadata.final_url = final_url;
  content.domain_metadata.status_code = status;
  content.domain_metadata.response_time_ms = elapsed.count();
  content.domain_metadata.content_type =
      content_type != nullptr ? content_type : "";

  if (screenshot_renderer_) {
    content.screenshot_ref = screenshot_renderer_->Render(final_url);
  }

  logger_->Log(LogLevel::kInfo, "fetch.complete",
               {{"url", url},
                {"final_url", final_url},
                {"status", std::to_string(status)},
                {"bytes", std::to_string(content.html.size())},
                {"truncated", buffer.truncated ? "true" : "false"},
                {"elapsed_ms", std::to_string(elapsed.count())}});
  return content;
}

} // namespace sitecheck

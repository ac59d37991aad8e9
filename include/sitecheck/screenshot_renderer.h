#pragma once

#include <sitecheck/logging.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace sitecheck {

class ScreenshotRenderer {
public:
  virtual ~ScreenshotRenderer() = default;
  // Path of the rendered image, or nullopt when no screenshot could be made.
  virtual std::optional<std::string> Render(const std::string &url) = 0;
};

// Renders through an external command template with `{url}` and `{output}`
// placeholders, e.g. "chromium --headless --screenshot={output} {url}".
// A positive `time_limit` kills a command that runs longer.
class CommandScreenshotRenderer : public ScreenshotRenderer {
public:
  CommandScreenshotRenderer(
      std::string command_template, std::filesystem::path output_directory,
      std::chrono::milliseconds time_limit = std::chrono::milliseconds{0},
      std::shared_ptr<Logger> logger = nullptr);

  std::optional<std::string> Render(const std::string &url) override;

private:
  std::string command_template_;
  std::filesystem::path output_directory_;
  std::chrono::milliseconds time_limit_;
  std::shared_ptr<Logger> logger_;
};

} // namespace sitecheck

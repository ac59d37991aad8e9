#include <sitecheck/screenshot_renderer.h>

#include <sitecheck/command_runner.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace sitecheck {
namespace {

constexpr int kTimeLimitExitCode = 124;

std::filesystem::path UniqueScreenshotPath(const std::filesystem::path &dir) {
  static std::atomic<unsigned long> counter{0};
  const auto stamp =
      std::chrono::steady_clock::now().time_since_epoch().count();
  return dir / ("sitecheck-" + std::to_string(stamp) + "-" +
                std::to_string(counter++) + ".png");
}

} // namespace

CommandScreenshotRenderer::CommandScreenshotRenderer(
    std::string command_template, std::filesystem::path output_directory,
    std::chrono::milliseconds time_limit, std::shared_ptr<Logger> logger)
    : command_template_(std::move(command_template)),
      output_directory_(std::move(output_directory)), time_limit_(time_limit),
      logger_(EnsureLogger(std::move(logger))) {}

std::optional<std::string>
CommandScreenshotRenderer::Render(const std::string &url) {
  std::error_code error;
  std::filesystem::create_directories(output_directory_, error);
  if (error) {
    logger_->Log(LogLevel::kWarn, "screenshot.failed",
                 {{"reason", "cannot create " + output_directory_.string()},
                  {"error", error.message()}});
    return std::nullopt;
  }

  const auto output = UniqueScreenshotPath(output_directory_);
  auto command = command_template_;
  ExpandPlaceholders(command, {{"url", url}, {"output", output.string()}});

  CommandResult result;
  try {
    result = RunCommand(WithTimeLimit(command, time_limit_) +
                        " >/dev/null 2>&1");
  } catch (const std::runtime_error &failure) {
    logger_->Log(LogLevel::kWarn, "screenshot.failed",
                 {{"url", url}, {"reason", failure.what()}});
    return std::nullopt;
  }

  if (result.exit_code == kTimeLimitExitCode) {
    logger_->Log(LogLevel::kWarn, "screenshot.failed",
                 {{"url", url},
                  {"reason", "command exceeded " +
                                 std::to_string(time_limit_.count()) + " ms"}});
    return std::nullopt;
  }
  if (result.exit_code != 0 || !std::filesystem::exists(output)) {
    logger_->Log(LogLevel::kWarn, "screenshot.failed",
                 {{"url", url},
                  {"exit_code", std::to_string(result.exit_code)},
                  {"output", output.string()}});
    return std::nullopt;
  }

  logger_->Log(LogLevel::kDebug, "screenshot.rendered",
               {{"url", url}, {"path", output.string()}});
  return output.string();
}

} // namespace sitecheck

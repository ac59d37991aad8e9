#include <sitecheck/analyzer_supervisor.h>

#include <sitecheck/errors.h>

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace sitecheck {
namespace {

using Clock = std::chrono::steady_clock;

// Granularity at which a waiting supervisor notices run-level cancellation.
constexpr std::chrono::milliseconds kCancellationPollInterval{20};

// Shared between the supervisor and a detached attempt thread; outlives
// whichever side finishes first.
struct AttemptState {
  std::mutex mutex;
  std::condition_variable finished;
  bool done = false;
  std::optional<AnalyzerOutcome> outcome;
  std::exception_ptr failure;
};

struct ClassifiedFailure {
  FailureKind kind = FailureKind::kPermanent;
  std::string detail;
};

ClassifiedFailure Classify(const std::exception_ptr &failure) {
  try {
    std::rethrow_exception(failure);
  } catch (const AnalyzerFailure &error) {
    return {error.kind(), error.what()};
  } catch (const std::exception &error) {
    return {FailureKind::kPermanent, error.what()};
  } catch (...) {
    return {FailureKind::kPermanent, "analyzer raised a non-standard exception"};
  }
}

std::shared_ptr<AttemptState>
LaunchAttempt(const std::shared_ptr<AnalyzerAdapter> &adapter,
              const std::shared_ptr<const FetchedContent> &content,
              const CancellationToken &attempt_token) {
  auto state = std::make_shared<AttemptState>();
  std::thread([adapter, content, state, attempt_token]() {
    std::optional<AnalyzerOutcome> outcome;
    std::exception_ptr failure;
    try {
      outcome = adapter->Evaluate(*content, attempt_token);
    } catch (...) {
      failure = std::current_exception();
    }
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->outcome = std::move(outcome);
      state->failure = failure;
      state->done = true;
    }
    state->finished.notify_all();
  }).detach();
  return state;
}

// Waits until the attempt finishes, the deadline passes or the run is
// cancelled. Returns true when the attempt finished.
bool AwaitAttempt(AttemptState &state, Clock::time_point deadline,
                  const CancellationToken &run_cancellation) {
  std::unique_lock<std::mutex> lock(state.mutex);
  while (!state.done) {
    if (run_cancellation.IsCancelled()) {
      return false;
    }
    const auto now = Clock::now();
    if (now >= deadline) {
      return false;
    }
    const auto slice = std::min<Clock::duration>(deadline - now,
                                                 kCancellationPollInterval);
    state.finished.wait_for(lock, slice);
  }
  return true;
}

std::optional<std::string> ValidateOutcome(const AnalyzerOutcome &outcome) {
  if (outcome.status != OutcomeStatus::kOk) {
    return "adapter returned non-ok status " + StatusName(outcome.status);
  }
  if (!outcome.sub_score || !outcome.confidence) {
    return std::string("adapter result is missing score or confidence");
  }
  const auto score = *outcome.sub_score;
  const auto confidence = *outcome.confidence;
  if (!std::isfinite(score) || score < 0.0 || score > 10.0) {
    return "sub-score out of range: " + std::to_string(score);
  }
  if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0) {
    return "confidence out of range: " + std::to_string(confidence);
  }
  return std::nullopt;
}

std::chrono::milliseconds ElapsedSince(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                               start);
}

} // namespace

std::chrono::milliseconds BackoffDelay(const RetryPolicy &policy,
                                       int attempt) {
  if (attempt < 1) {
    return std::chrono::milliseconds{0};
  }
  const auto base = static_cast<double>(policy.initial_backoff.count());
  const auto scaled =
      base * std::pow(policy.backoff_multiplier, attempt - 1);
  const auto capped =
      std::min(scaled, static_cast<double>(policy.max_backoff.count()));
  return std::chrono::milliseconds{static_cast<std::int64_t>(capped)};
}

AnalyzerOutcome MakeFailedOutcome(AnalyzerSource source, OutcomeStatus status,
                                  std::string detail) {
  AnalyzerOutcome outcome;
  outcome.source = source;
  outcome.status = status;
  outcome.error_detail = std::move(detail);
  return outcome;
}

AnalyzerSupervisor::AnalyzerSupervisor(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

AnalyzerOutcome
AnalyzerSupervisor::Run(AnalyzerSource source,
                        std::shared_ptr<AnalyzerAdapter> adapter,
                        std::shared_ptr<const FetchedContent> content,
                        std::chrono::milliseconds timeout,
                        const RetryPolicy &retry,
                        const CancellationToken &run_cancellation) const {
  const auto start = Clock::now();
  const auto deadline = start + timeout;
  const auto source_name = SourceName(source);

  // Once the run is cancelled its caller may already have returned, and the
  // logger's stream with it.
  const auto log = [&](LogLevel level, std::string_view message,
                       const LogFields &fields) {
    if (!run_cancellation.IsCancelled()) {
      logger_->Log(level, message, fields);
    }
  };

  const auto finish = [&](AnalyzerOutcome outcome, int attempts) {
    outcome.source = source;
    outcome.attempts = attempts;
    outcome.elapsed = ElapsedSince(start);
    log(LogLevel::kDebug, "analyzer.complete",
                 {{"source", source_name},
                  {"status", StatusName(outcome.status)},
                  {"attempts", std::to_string(attempts)},
                  {"elapsed_ms", std::to_string(outcome.elapsed.count())}});
    return outcome;
  };

  if (!adapter || !content) {
    return finish(MakeFailedOutcome(source, OutcomeStatus::kError,
                                    "no adapter or content supplied"),
                  0);
  }

  const int max_attempts = std::max(1, retry.max_attempts);
  std::string last_error;
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    CancellationToken attempt_token;
    auto state = LaunchAttempt(adapter, content, attempt_token);

    if (!AwaitAttempt(*state, deadline, run_cancellation)) {
      attempt_token.Cancel();
      const auto reason = run_cancellation.IsCancelled()
                              ? std::string("run cancelled")
                              : "deadline of " +
                                    std::to_string(timeout.count()) +
                                    " ms exceeded";
      log(LogLevel::kWarn, "analyzer.timeout",
                   {{"source", source_name},
                    {"adapter", adapter->Name()},
                    {"attempt", std::to_string(attempt)},
                    {"reason", reason}});
      return finish(MakeFailedOutcome(source, OutcomeStatus::kTimeout,
                                      adapter->Name() + ": " + reason),
                    attempt);
    }

    std::optional<AnalyzerOutcome> outcome;
    std::exception_ptr failure;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      outcome = std::move(state->outcome);
      failure = state->failure;
    }

    if (!failure && outcome) {
      if (const auto problem = ValidateOutcome(*outcome)) {
        log(LogLevel::kWarn, "analyzer.malformed",
                     {{"source", source_name}, {"detail", *problem}});
        return finish(MakeFailedOutcome(source, OutcomeStatus::kError,
                                        adapter->Name() +
                                            ": malformed result: " + *problem),
                      attempt);
      }
      outcome->error_detail.reset();
      return finish(std::move(*outcome), attempt);
    }

    const auto classified = failure ? Classify(failure)
                                    : ClassifiedFailure{FailureKind::kPermanent,
                                                        "adapter returned no result"};
    last_error = adapter->Name() + ": " + classified.detail;
    log(LogLevel::kInfo, "analyzer.attempt.failed",
                 {{"source", source_name},
                  {"attempt", std::to_string(attempt)},
                  {"transient", classified.kind == FailureKind::kTransient
                                    ? "true"
                                    : "false"},
                  {"detail", classified.detail}});

    if (classified.kind == FailureKind::kNotApplicable) {
      return finish(
          MakeFailedOutcome(source, OutcomeStatus::kSkipped, last_error),
          attempt);
    }
    if (classified.kind == FailureKind::kPermanent) {
      return finish(
          MakeFailedOutcome(source, OutcomeStatus::kError, last_error),
          attempt);
    }
    if (attempt == max_attempts) {
      break;
    }

    const auto delay = BackoffDelay(retry, attempt);
    if (Clock::now() + delay >= deadline) {
      return finish(MakeFailedOutcome(
                        source, OutcomeStatus::kTimeout,
                        "deadline reached before retry; last error: " +
                            last_error),
                    attempt);
    }
    if (!run_cancellation.SleepFor(delay)) {
      return finish(MakeFailedOutcome(source, OutcomeStatus::kTimeout,
                                      "run cancelled during backoff; last "
                                      "error: " +
                                          last_error),
                    attempt);
    }
  }

  return finish(MakeFailedOutcome(source, OutcomeStatus::kError,
                                  "gave up after " +
                                      std::to_string(max_attempts) +
                                      " attempts; last error: " + last_error),
                max_attempts);
}

} // namespace sitecheck

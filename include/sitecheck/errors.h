#pragma once

#include <stdexcept>
#include <string>

namespace sitecheck {

// Content could not be acquired; no analyzer can run.
class FetchError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class FailureKind { kTransient, kPermanent, kNotApplicable };

class AnalyzerFailure : public std::runtime_error {
public:
  AnalyzerFailure(FailureKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  FailureKind kind() const { return kind_; }

private:
  FailureKind kind_;
};

// Network errors, rate limiting: worth another attempt.
class TransientAnalyzerError : public AnalyzerFailure {
public:
  explicit TransientAnalyzerError(const std::string &message)
      : AnalyzerFailure(FailureKind::kTransient, message) {}
};

// Malformed input, authentication failure, bad collaborator response.
class PermanentAnalyzerError : public AnalyzerFailure {
public:
  explicit PermanentAnalyzerError(const std::string &message)
      : AnalyzerFailure(FailureKind::kPermanent, message) {}
};

// The fetched content lacks what this analyzer needs (e.g. no screenshot).
class AnalyzerNotApplicable : public AnalyzerFailure {
public:
  explicit AnalyzerNotApplicable(const std::string &message)
      : AnalyzerFailure(FailureKind::kNotApplicable, message) {}
};

} // namespace sitecheck

#include <sitecheck/cli_exit_codes.h>

namespace sitecheck {

int RiskExitCode(Recommendation recommendation) {
  switch (recommendation) {
  case Recommendation::kLow:
  case Recommendation::kMedium:
    return 0;
  case Recommendation::kHigh:
    return 2;
  case Recommendation::kUnknown:
    return 3;
  }
  return kExitUsageError;
}

} // namespace sitecheck

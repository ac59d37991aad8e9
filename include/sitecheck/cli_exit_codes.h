#pragma once

#include <sitecheck/models.h>

namespace sitecheck {

inline constexpr int kExitUsageError = 1;

// 0 for low and medium risk, 2 for high risk, 3 when no verdict was reached.
int RiskExitCode(Recommendation recommendation);

} // namespace sitecheck

#pragma once

#include <sitecheck/models.h>

#include <chrono>
#include <string>
#include <vector>

namespace sitecheck {

// Assembles the published RiskReport. Findings of analyzers whose status is
// not ok (or that never reported) are left null.
RiskReport BuildRiskReport(const std::string &url,
                           std::chrono::system_clock::time_point timestamp,
                           const FusedResult &fused,
                           const std::vector<AnalyzerOutcome> &outcomes);

// Report for a run that ended in FAILED: UNKNOWN, confidence 0, no findings.
RiskReport BuildUnknownReport(const std::string &url,
                              std::chrono::system_clock::time_point timestamp);

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point time);

} // namespace sitecheck

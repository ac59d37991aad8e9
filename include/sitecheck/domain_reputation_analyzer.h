#pragma once

#include <sitecheck/interfaces.h>

#include <set>
#include <string>
#include <vector>

namespace sitecheck {

struct ReputationSettings {
  // Domains (or parent domains) that are known bad.
  std::vector<std::string> blocklist;
  std::vector<std::string> brands;
};

// Scores the host of the fetched page from its shape and a configured
// blocklist: IP-literal hosts, punycode labels, risky TLDs, deep subdomain
// chains, hyphenated brand look-alikes, plain HTTP, failing status codes.
class DomainReputationAnalyzer : public AnalyzerAdapter {
public:
  explicit DomainReputationAnalyzer(ReputationSettings settings = {});

  AnalyzerOutcome Evaluate(const FetchedContent &content,
                           const CancellationToken &cancellation) override;
  std::string Name() const override { return "domain-reputation"; }

private:
  std::set<std::string> blocklist_;
  std::vector<std::string> brands_;
};

const std::set<std::string> &RiskyTopLevelDomains();

} // namespace sitecheck

#include <sitecheck/domain_reputation_analyzer.h>

#include <sitecheck/errors.h>
#include <sitecheck/escaping.h>
#include <sitecheck/heuristic_content_analyzer.h>
#include <sitecheck/url.h>

#include <algorithm>
#include <utility>

namespace sitecheck {
namespace {

constexpr double kBlocklistedScore = 10.0;
constexpr double kBlocklistedConfidence = 0.95;
constexpr double kHeuristicConfidence = 0.65;
constexpr int kDeepSubdomainLevels = 3;
constexpr int kManyHyphens = 2;
constexpr std::size_t kLongHostLength = 40;

bool MatchesDomain(const std::string &host, const std::string &domain) {
  if (host == domain) {
    return true;
  }
  return host.size() > domain.size() &&
         host.compare(host.size() - domain.size(), domain.size(), domain) == 0 &&
         host[host.size() - domain.size() - 1] == '.';
}

int SubdomainDepth(const std::string &host, const std::string &registrable) {
  if (host.size() <= registrable.size()) {
    return 0;
  }
  const auto prefix = host.substr(0, host.size() - registrable.size());
  return static_cast<int>(std::count(prefix.begin(), prefix.end(), '.'));
}

std::string CompactBrand(const std::string &brand) {
  std::string compact;
  for (const auto character : ToLower(brand)) {
    if (character != ' ' && character != '-') {
      compact.push_back(character);
    }
  }
  return compact;
}

// True when `token` starts a host label or follows a hyphen, so "chase"
// matches "chase-login.example" but not "purchase.example".
bool ContainsAtLabelBoundary(const std::string &host, const std::string &token) {
  for (auto position = host.find(token); position != std::string::npos;
       position = host.find(token, position + 1)) {
    if (position == 0 || host[position - 1] == '.' ||
        host[position - 1] == '-') {
      return true;
    }
  }
  return false;
}

} // namespace

const std::set<std::string> &RiskyTopLevelDomains() {
  static const std::set<std::string> tlds = {
      "zip", "mov", "xyz", "top", "tk",  "ml",    "ga",    "cf",
      "gq",  "work", "click", "country", "kim", "loan", "support", "rest"};
  return tlds;
}

DomainReputationAnalyzer::DomainReputationAnalyzer(ReputationSettings settings)
    : brands_(std::move(settings.brands)) {
  for (const auto &entry : settings.blocklist) {
    auto domain = ToLower(Trim(entry));
    if (!domain.empty()) {
      blocklist_.insert(std::move(domain));
    }
  }
  if (brands_.empty()) {
    brands_ = DefaultBrandNames();
  }
}

AnalyzerOutcome
DomainReputationAnalyzer::Evaluate(const FetchedContent &content,
                                   const CancellationToken &) {
  const auto &metadata = content.domain_metadata;
  const auto host = ToLower(metadata.host);
  if (host.empty()) {
    throw PermanentAnalyzerError("no host to check reputation for");
  }

  const auto registrable = metadata.registrable_domain.empty()
                               ? RegistrableDomain(host)
                               : metadata.registrable_domain;
  const auto tld = metadata.tld.empty() ? TopLevelDomain(host) : metadata.tld;

  const auto blocked = std::find_if(
      blocklist_.begin(), blocklist_.end(),
      [&](const std::string &domain) { return MatchesDomain(host, domain); });
  const bool is_blacklisted = blocked != blocklist_.end();

  double score = 0.0;
  std::vector<std::string> suspicious;
  std::vector<std::string> legitimate;

  const bool ip_literal = metadata.is_ip_literal || IsIpLiteral(host);
  if (ip_literal) {
    score += 3.0;
    suspicious.push_back("Host is a raw IP address");
  }

  const bool punycode = host.find("xn--") != std::string::npos;
  if (punycode) {
    score += 2.0;
    suspicious.push_back("Internationalized (punycode) host name");
  }

  const bool risky_tld = RiskyTopLevelDomains().count(tld) != 0;
  if (risky_tld) {
    score += 2.0;
    suspicious.push_back("Top-level domain often used for abuse: ." + tld);
  }

  const int depth = ip_literal ? 0 : SubdomainDepth(host, registrable);
  if (depth >= kDeepSubdomainLevels) {
    score += 1.5;
    suspicious.push_back("Deep subdomain chain (" + std::to_string(depth) +
                         " levels)");
  }

  const auto hyphens =
      static_cast<int>(std::count(host.begin(), host.end(), '-'));
  if (hyphens >= kManyHyphens) {
    score += 1.0;
    suspicious.push_back("Host contains " + std::to_string(hyphens) +
                         " hyphens");
  }

  if (host.size() > kLongHostLength) {
    score += 1.0;
    suspicious.push_back("Unusually long host name");
  }

  std::string lookalike;
  const auto owner = registrable.substr(0, registrable.find('.'));
  for (const auto &brand : brands_) {
    const auto token = CompactBrand(brand);
    if (!token.empty() && ContainsAtLabelBoundary(host, token) &&
        owner != token) {
      lookalike = brand;
      break;
    }
  }
  if (!lookalike.empty()) {
    score += 3.0;
    suspicious.push_back("Host mentions '" + lookalike +
                         "' outside its registered domain");
  }

  if (metadata.uses_https) {
    legitimate.push_back("Served over HTTPS");
  } else {
    score += 1.5;
    suspicious.push_back("Served without HTTPS");
  }

  if (metadata.status_code >= 400) {
    score += 1.0;
    suspicious.push_back("Server answered with status " +
                         std::to_string(metadata.status_code));
  }

  if (is_blacklisted) {
    suspicious.insert(suspicious.begin(),
                      "Domain is on the blocklist (" + *blocked + ")");
  } else if (suspicious.empty()) {
    legitimate.push_back("No reputation warnings for " + registrable);
  }

  AnalyzerOutcome outcome;
  outcome.source = AnalyzerSource::kReputation;
  outcome.status = OutcomeStatus::kOk;
  outcome.sub_score = is_blacklisted ? kBlocklistedScore
                                     : std::min(score, 10.0);
  outcome.confidence =
      is_blacklisted ? kBlocklistedConfidence : kHeuristicConfidence;
  outcome.findings["host"] = host;
  outcome.findings["registrable_domain"] = registrable;
  outcome.findings["is_blacklisted"] = is_blacklisted;
  outcome.findings["uses_https"] = metadata.uses_https;
  outcome.findings["is_ip_literal"] = ip_literal;
  outcome.findings["punycode"] = punycode;
  outcome.findings["risky_tld"] = risky_tld;
  outcome.findings["subdomain_depth"] = static_cast<std::int64_t>(depth);
  outcome.findings["hyphen_count"] = static_cast<std::int64_t>(hyphens);
  outcome.findings["status_code"] =
      static_cast<std::int64_t>(metadata.status_code);
  outcome.findings["suspicious_elements"] = suspicious;
  outcome.findings["legitimate_indicators"] = legitimate;
  if (!lookalike.empty()) {
    outcome.findings["brand_lookalike"] = lookalike;
  }
  return outcome;
}

} // namespace sitecheck

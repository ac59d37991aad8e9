#include <sitecheck/heuristic_content_analyzer.h>

#include <sitecheck/errors.h>
#include <sitecheck/escaping.h>
#include <sitecheck/html_features.h>

#include <algorithm>
#include <set>
#include <utility>

namespace sitecheck {
namespace {

constexpr double kPointsPerRiskFactor = 1.5;
constexpr double kHeuristicConfidence = 0.7;
constexpr std::size_t kPaymentFieldThreshold = 2;

bool HasPasswordField(const FormInfo &form) {
  return std::any_of(form.fields.begin(), form.fields.end(),
                     [](const FormField &field) {
                       return field.type == "password";
                     });
}

bool LooksLikePaymentForm(const FormInfo &form) {
  static const std::set<std::string> kPersonalFieldTypes = {
      "email", "text", "password", "tel"};
  const auto personal = std::count_if(
      form.fields.begin(), form.fields.end(), [](const FormField &field) {
        return kPersonalFieldTypes.count(field.type) != 0;
      });
  return static_cast<std::size_t>(personal) > kPaymentFieldThreshold;
}

std::string BrandToken(const std::string &brand) {
  std::string token;
  for (const auto character : brand) {
    if (character != ' ' && character != '-') {
      token.push_back(character);
    }
  }
  return token;
}

} // namespace

const std::vector<std::string> &DefaultBrandNames() {
  static const std::vector<std::string> brands = {
      "paypal",    "apple",     "microsoft", "google",   "amazon",
      "facebook",  "instagram", "netflix",   "linkedin", "dropbox",
      "office 365", "outlook",  "dhl",       "fedex",    "wells fargo",
      "chase",     "bank of america", "coinbase", "binance", "steam"};
  return brands;
}

const std::vector<std::string> &SuspiciousKeywords() {
  static const std::vector<std::string> keywords = {
      "urgent",  "verify", "suspended",      "limited time", "act now",
      "confirm", "update", "security alert", "locked",       "expires"};
  return keywords;
}

HeuristicContentAnalyzer::HeuristicContentAnalyzer()
    : brands_(DefaultBrandNames()) {}

HeuristicContentAnalyzer::HeuristicContentAnalyzer(
    std::vector<std::string> brands)
    : brands_(std::move(brands)) {}

AnalyzerOutcome
HeuristicContentAnalyzer::Evaluate(const FetchedContent &content,
                                   const CancellationToken &cancellation) {
  if (Trim(content.html).empty()) {
    throw AnalyzerNotApplicable("page returned no HTML to analyze");
  }

  const auto page = ExtractPageFeatures(content.html);
  if (cancellation.IsCancelled()) {
    throw TransientAnalyzerError("content analysis cancelled");
  }

  int risk_factors = 0;
  std::vector<std::string> suspicious;
  std::vector<std::string> legitimate;

  const bool has_https = content.domain_metadata.uses_https;
  if (has_https) {
    legitimate.push_back("HTTPS encryption present");
  } else {
    risk_factors += 2;
    suspicious.push_back("No HTTPS encryption");
  }

  const auto text = ToLower(page.title + " " + page.text);
  std::vector<std::string> found_keywords;
  for (const auto &keyword : SuspiciousKeywords()) {
    if (text.find(keyword) != std::string::npos) {
      found_keywords.push_back(keyword);
      suspicious.push_back("Suspicious keyword: " + keyword);
    }
  }
  risk_factors += static_cast<int>(found_keywords.size());

  const bool has_login_forms =
      std::any_of(page.forms.begin(), page.forms.end(), HasPasswordField);
  if (has_login_forms) {
    risk_factors += 1;
    suspicious.push_back("Password input forms detected");
  }

  const bool has_payment_forms =
      std::any_of(page.forms.begin(), page.forms.end(), LooksLikePaymentForm);
  if (has_payment_forms) {
    risk_factors += 1;
    suspicious.push_back("Form collecting several personal data fields");
  }

  std::string impersonated;
  const auto title = ToLower(page.title);
  const auto host = content.domain_metadata.host;
  for (const auto &brand : brands_) {
    const auto lowered = ToLower(brand);
    if (title.find(lowered) != std::string::npos &&
        host.find(BrandToken(lowered)) == std::string::npos) {
      impersonated = brand;
      break;
    }
  }
  if (!impersonated.empty()) {
    risk_factors += 2;
    suspicious.push_back("Page title names '" + impersonated +
                         "' but the host does not belong to it");
  }

  if (suspicious.empty()) {
    legitimate.push_back("No phishing indicators in page content");
  }

  const double score =
      std::min(risk_factors * kPointsPerRiskFactor, 10.0);

  AnalyzerOutcome outcome;
  outcome.source = AnalyzerSource::kContent;
  outcome.status = OutcomeStatus::kOk;
  outcome.sub_score = score;
  outcome.confidence = kHeuristicConfidence;
  outcome.findings["suspicious_elements"] = suspicious;
  outcome.findings["legitimate_indicators"] = legitimate;
  outcome.findings["has_https"] = has_https;
  outcome.findings["has_suspicious_keywords"] = !found_keywords.empty();
  outcome.findings["has_login_forms"] = has_login_forms;
  outcome.findings["has_payment_forms"] = has_payment_forms;
  outcome.findings["title"] = page.title;
  outcome.findings["forms_count"] =
      static_cast<std::int64_t>(page.forms.size());
  outcome.findings["links_count"] =
      static_cast<std::int64_t>(page.links.size());
  outcome.findings["explanation"] =
      "Rule-based analysis found " + std::to_string(risk_factors) +
      " risk factors";
  if (!impersonated.empty()) {
    outcome.findings["brand_impersonation"] = impersonated;
  }
  return outcome;
}

} // namespace sitecheck

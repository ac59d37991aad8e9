#include <sitecheck/domain_reputation_analyzer.h>
#include <sitecheck/errors.h>

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/stub_components.h"

namespace sitecheck {
namespace {

using ::testing::Contains;
using ::testing::HasSubstr;

FetchedContent ContentFor(const std::string &host, bool https = true,
                          long status = 200) {
  auto content = test::SampleContent((https ? "https://" : "http://") + host);
  content.domain_metadata = DomainMetadata{};
  content.domain_metadata.host = host;
  content.domain_metadata.uses_https = https;
  content.domain_metadata.status_code = status;
  return content;
}

AnalyzerOutcome Check(const FetchedContent &content,
                      ReputationSettings settings = {}) {
  DomainReputationAnalyzer analyzer(std::move(settings));
  return analyzer.Evaluate(content, CancellationToken());
}

std::vector<std::string> Suspicious(const AnalyzerOutcome &outcome) {
  return std::get<std::vector<std::string>>(
      outcome.findings.at("suspicious_elements"));
}

TEST(DomainReputationAnalyzerTest, FindsNothingWrongWithAnOrdinaryDomain) {
  const auto outcome = Check(ContentFor("www.example.com"));

  EXPECT_EQ(outcome.status, OutcomeStatus::kOk);
  EXPECT_EQ(outcome.source, AnalyzerSource::kReputation);
  EXPECT_DOUBLE_EQ(outcome.sub_score.value(), 0.0);
  EXPECT_DOUBLE_EQ(outcome.confidence.value(), 0.65);
  EXPECT_FALSE(std::get<bool>(outcome.findings.at("is_blacklisted")));
  EXPECT_EQ(std::get<std::string>(outcome.findings.at("registrable_domain")),
            "example.com");
  EXPECT_THAT(std::get<std::vector<std::string>>(
                  outcome.findings.at("legitimate_indicators")),
              Contains("No reputation warnings for example.com"));
}

TEST(DomainReputationAnalyzerTest, BlocklistedDomainsScoreTheMaximum) {
  ReputationSettings settings;
  settings.blocklist = {" Evil.Example ", ""};

  const auto outcome = Check(ContentFor("login.evil.example"), settings);

  EXPECT_DOUBLE_EQ(outcome.sub_score.value(), 10.0);
  EXPECT_DOUBLE_EQ(outcome.confidence.value(), 0.95);
  EXPECT_TRUE(std::get<bool>(outcome.findings.at("is_blacklisted")));
  EXPECT_EQ(Suspicious(outcome).front(),
            "Domain is on the blocklist (evil.example)");
}

TEST(DomainReputationAnalyzerTest, BlocklistMatchesWholeLabelsOnly) {
  ReputationSettings settings;
  settings.blocklist = {"evil.example"};

  const auto outcome = Check(ContentFor("notevil.example"), settings);

  EXPECT_FALSE(std::get<bool>(outcome.findings.at("is_blacklisted")));
}

TEST(DomainReputationAnalyzerTest, PenalizesRawIpHostsWithoutHttps) {
  const auto outcome = Check(ContentFor("192.168.0.10", false));

  EXPECT_TRUE(std::get<bool>(outcome.findings.at("is_ip_literal")));
  EXPECT_FALSE(std::get<bool>(outcome.findings.at("uses_https")));
  EXPECT_DOUBLE_EQ(outcome.sub_score.value(), 4.5);
  EXPECT_THAT(Suspicious(outcome), Contains("Host is a raw IP address"));
  EXPECT_THAT(Suspicious(outcome), Contains("Served without HTTPS"));
}

TEST(DomainReputationAnalyzerTest, FlagsBrandLookalikesOnRiskyDomains) {
  const auto outcome = Check(ContentFor("paypal-secure-login.example.tk"));

  EXPECT_EQ(std::get<std::string>(outcome.findings.at("brand_lookalike")),
            "paypal");
  EXPECT_TRUE(std::get<bool>(outcome.findings.at("risky_tld")));
  EXPECT_EQ(std::get<std::int64_t>(outcome.findings.at("hyphen_count")), 2);
  EXPECT_DOUBLE_EQ(outcome.sub_score.value(), 6.0);
}

TEST(DomainReputationAnalyzerTest, BrandOwnDomainIsNotALookalike) {
  const auto outcome = Check(ContentFor("www.paypal.com"));

  EXPECT_EQ(outcome.findings.count("brand_lookalike"), 0u);
}

TEST(DomainReputationAnalyzerTest, CountryCodeBrandDomainIsNotALookalike) {
  const auto outcome = Check(ContentFor("www.amazon.co.uk"));

  EXPECT_EQ(std::get<std::string>(outcome.findings.at("registrable_domain")),
            "amazon.co.uk");
  EXPECT_EQ(outcome.findings.count("brand_lookalike"), 0u);
  EXPECT_EQ(std::get<std::int64_t>(outcome.findings.at("subdomain_depth")), 1);
  EXPECT_DOUBLE_EQ(outcome.sub_score.value(), 0.0);
}

TEST(DomainReputationAnalyzerTest, FlagsBrandsUnderAForeignCountryCodeOwner) {
  const auto outcome = Check(ContentFor("amazon.account-check.co.uk"));

  EXPECT_EQ(std::get<std::string>(outcome.findings.at("brand_lookalike")),
            "amazon");
}

TEST(DomainReputationAnalyzerTest, BrandMustStartALabel) {
  const auto outcome = Check(ContentFor("purchase.example.com"));

  EXPECT_EQ(outcome.findings.count("brand_lookalike"), 0u);
}

TEST(DomainReputationAnalyzerTest, UsesTheConfiguredBrandList) {
  ReputationSettings settings;
  settings.brands = {"Contoso"};

  const auto outcome =
      Check(ContentFor("contoso-support.example.net"), settings);

  EXPECT_EQ(std::get<std::string>(outcome.findings.at("brand_lookalike")),
            "Contoso");
}

TEST(DomainReputationAnalyzerTest, FlagsPunycodeAndDeepSubdomains) {
  const auto outcome = Check(ContentFor("a.b.c.xn--pple-43d.com"));

  EXPECT_TRUE(std::get<bool>(outcome.findings.at("punycode")));
  EXPECT_EQ(std::get<std::int64_t>(outcome.findings.at("subdomain_depth")), 3);
  EXPECT_DOUBLE_EQ(outcome.sub_score.value(), 4.5);
}

TEST(DomainReputationAnalyzerTest, CountsFailingStatusCodes) {
  const auto outcome = Check(ContentFor("example.com", true, 404));

  EXPECT_DOUBLE_EQ(outcome.sub_score.value(), 1.0);
  EXPECT_THAT(Suspicious(outcome), Contains(HasSubstr("status 404")));
}

TEST(DomainReputationAnalyzerTest, CapsTheScoreAtTen) {
  const auto outcome =
      Check(ContentFor("paypal-verify-account.secure.login.xn--bnk-8ka.tk",
                       false, 500));

  EXPECT_DOUBLE_EQ(outcome.sub_score.value(), 10.0);
  EXPECT_DOUBLE_EQ(outcome.confidence.value(), 0.65);
}

TEST(DomainReputationAnalyzerTest, RejectsContentWithoutAHost) {
  EXPECT_THROW(Check(ContentFor("")), PermanentAnalyzerError);
}

} // namespace
} // namespace sitecheck

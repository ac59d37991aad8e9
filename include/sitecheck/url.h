#pragma once

#include <string>

namespace sitecheck {

struct UrlParts {
  std::string scheme;
  std::string host;
  int port = 0;
  std::string path;
};

// Prefixes "https://" when the URL carries no scheme; trims whitespace.
std::string NormalizeUrl(const std::string &url);

// Splits an absolute URL. Throws std::invalid_argument for URLs without a
// scheme or, for network schemes, without a host.
UrlParts ParseUrl(const std::string &url);

bool IsIpLiteral(const std::string &host);
std::string TopLevelDomain(const std::string &host);
// Owner label plus public suffix ("login.example.com" -> "example.com",
// "www.amazon.co.uk" -> "amazon.co.uk"); the host itself for IP literals and
// single-label hosts.
std::string RegistrableDomain(const std::string &host);
int DefaultPort(const std::string &scheme);

} // namespace sitecheck

#include <sitecheck/url.h>

#include <sitecheck/escaping.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>
#include <vector>

namespace sitecheck {
namespace {

std::vector<std::string> SplitLabels(const std::string &host) {
  std::vector<std::string> labels;
  std::string current;
  for (const auto character : host) {
    if (character == '.') {
      if (!current.empty()) {
        labels.push_back(current);
      }
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  if (!current.empty()) {
    labels.push_back(current);
  }
  return labels;
}

bool IsIpv4(const std::string &host) {
  const auto labels = SplitLabels(host);
  if (labels.size() != 4 ||
      std::count(host.begin(), host.end(), '.') != 3) {
    return false;
  }
  return std::all_of(labels.begin(), labels.end(), [](const std::string &label) {
    if (label.empty() || label.size() > 3 ||
        !std::all_of(label.begin(), label.end(), [](unsigned char c) {
          return std::isdigit(c) != 0;
        })) {
      return false;
    }
    return std::stoi(label) <= 255;
  });
}

// Second-level public suffixes under which registrations happen one label
// further down ("amazon.co.uk", not "co.uk").
const std::set<std::string> &MultiLabelPublicSuffixes() {
  static const std::set<std::string> suffixes = {
      "co.uk",  "org.uk", "ac.uk",  "gov.uk", "ltd.uk", "plc.uk", "me.uk",
      "com.au", "net.au", "org.au", "edu.au", "gov.au", "co.nz",  "org.nz",
      "co.jp",  "ne.jp",  "or.jp",  "ac.jp",  "co.kr",  "or.kr",  "co.in",
      "net.in", "org.in", "co.za",  "org.za", "co.il",  "co.id",  "co.th",
      "com.br", "net.br", "org.br", "com.mx", "com.ar", "com.co", "com.tr",
      "com.cn", "net.cn", "org.cn", "com.hk", "com.tw", "com.sg", "com.my",
      "com.ph", "com.vn", "com.pk", "com.ng", "com.eg", "com.sa", "com.ua"};
  return suffixes;
}

} // namespace

std::string NormalizeUrl(const std::string &url) {
  auto trimmed = Trim(url);
  if (trimmed.empty()) {
    throw std::invalid_argument("URL must not be empty");
  }
  if (trimmed.find("://") == std::string::npos) {
    trimmed = "https://" + trimmed;
  }
  return trimmed;
}

int DefaultPort(const std::string &scheme) {
  if (scheme == "https") {
    return 443;
  }
  if (scheme == "http") {
    return 80;
  }
  return 0;
}

UrlParts ParseUrl(const std::string &url) {
  const auto separator = url.find("://");
  if (separator == std::string::npos || separator == 0) {
    throw std::invalid_argument("URL has no scheme: " + url);
  }

  UrlParts parts;
  parts.scheme = ToLower(url.substr(0, separator));
  const auto authority_start = separator + 3;
  const auto path_start = url.find_first_of("/?#", authority_start);
  auto authority = url.substr(authority_start, path_start == std::string::npos
                                                   ? std::string::npos
                                                   : path_start -
                                                         authority_start);
  parts.path = path_start == std::string::npos ? "/" : url.substr(path_start);

  if (const auto at = authority.rfind('@'); at != std::string::npos) {
    authority = authority.substr(at + 1);
  }

  std::string port_text;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos) {
      throw std::invalid_argument("Malformed IPv6 host in URL: " + url);
    }
    parts.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size() && authority[close + 1] == ':') {
      port_text = authority.substr(close + 2);
    }
  } else if (const auto colon = authority.rfind(':');
             colon != std::string::npos) {
    parts.host = authority.substr(0, colon);
    port_text = authority.substr(colon + 1);
  } else {
    parts.host = authority;
  }
  parts.host = ToLower(parts.host);
  if (!parts.host.empty() && parts.host.back() == '.') {
    parts.host.pop_back();
  }

  if (!port_text.empty()) {
    if (!std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) {
          return std::isdigit(c) != 0;
        }) ||
        port_text.size() > 5) {
      throw std::invalid_argument("Invalid port in URL: " + url);
    }
    parts.port = std::stoi(port_text);
  } else {
    parts.port = DefaultPort(parts.scheme);
  }

  if (parts.host.empty() && parts.scheme != "file") {
    throw std::invalid_argument("URL has no host: " + url);
  }
  return parts;
}

bool IsIpLiteral(const std::string &host) {
  if (host.find(':') != std::string::npos) {
    return true;
  }
  return IsIpv4(host);
}

std::string TopLevelDomain(const std::string &host) {
  if (host.empty() || IsIpLiteral(host)) {
    return "";
  }
  const auto labels = SplitLabels(host);
  if (labels.size() < 2) {
    return "";
  }
  return labels.back();
}

std::string RegistrableDomain(const std::string &host) {
  if (IsIpLiteral(host)) {
    return host;
  }
  const auto labels = SplitLabels(host);
  if (labels.size() < 2) {
    return host;
  }
  const auto suffix = labels[labels.size() - 2] + "." + labels.back();
  if (labels.size() >= 3 && MultiLabelPublicSuffixes().count(suffix) != 0) {
    return labels[labels.size() - 3] + "." + suffix;
  }
  return suffix;
}

} // namespace sitecheck

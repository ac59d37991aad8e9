#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sitecheck {

struct FormField {
  std::string type;
  std::string name;
};

struct FormInfo {
  std::string action;
  std::string method;
  std::vector<FormField> fields;
};

struct PageFeatures {
  std::string title;
  std::string meta_description;
  std::vector<std::string> meta_keywords;
  std::string text;
  std::vector<FormInfo> forms;
  std::vector<std::string> links;
};

inline constexpr std::size_t kMaxExtractedLinks = 50;

// Tolerant scan of raw HTML; never throws on malformed markup.
PageFeatures ExtractPageFeatures(const std::string &html);

} // namespace sitecheck

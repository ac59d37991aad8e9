#pragma once

#include <string>

namespace sitecheck {

std::string EscapeJsonString(const std::string &value);
std::string EscapeMarkdownCell(const std::string &value);
std::string DecodeHtmlEntities(const std::string &value);

std::string Trim(std::string value);
std::string ToLower(std::string value);
// Collapses runs of whitespace into single spaces and trims the ends.
std::string CollapseWhitespace(const std::string &value);

} // namespace sitecheck

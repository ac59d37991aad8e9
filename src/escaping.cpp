#include <sitecheck/escaping.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <unordered_map>

namespace sitecheck {
namespace {

void AppendUtf8(std::string &target, unsigned long code_point) {
  if (code_point < 0x80) {
    target.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    target.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    target.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    target.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    target.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    target.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x110000) {
    target.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    target.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    target.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    target.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool IsSpace(char character) {
  return std::isspace(static_cast<unsigned char>(character)) != 0;
}

} // namespace

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""}, {'\\', "\\\\"}, {'\n', "\\n"}, {'\r', "\\r"},
      {'\t', "\\t"}, {'\b', "\\b"},  {'\f', "\\f"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else if (static_cast<unsigned char>(character) < 0x20) {
      char buffer[8];
      std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                    static_cast<unsigned>(character));
      escaped.append(buffer);
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string EscapeMarkdownCell(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '|') {
      escaped.append("\\|");
    } else if (character == '\n' || character == '\r') {
      escaped.push_back(' ');
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string DecodeHtmlEntities(const std::string &value) {
  static const std::unordered_map<std::string, std::string> named{
      {"amp", "&"},  {"lt", "<"},   {"gt", ">"},
      {"quot", "\""}, {"apos", "'"}, {"nbsp", " "}};

  std::string decoded;
  decoded.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '&') {
      decoded.push_back(value[i]);
      continue;
    }
    const auto end = value.find(';', i + 1);
    if (end == std::string::npos || end - i > 10) {
      decoded.push_back(value[i]);
      continue;
    }
    const auto entity = value.substr(i + 1, end - i - 1);
    if (entity.size() > 1 && entity[0] == '#') {
      const bool hex = entity[1] == 'x' || entity[1] == 'X';
      const auto digits = entity.substr(hex ? 2 : 1);
      const auto valid = !digits.empty() &&
                         std::all_of(digits.begin(), digits.end(),
                                     [hex](unsigned char c) {
                                       return hex ? std::isxdigit(c) != 0
                                                  : std::isdigit(c) != 0;
                                     });
      if (valid) {
        AppendUtf8(decoded, std::stoul(digits, nullptr, hex ? 16 : 10));
        i = end;
        continue;
      }
    }
    const auto found = named.find(entity);
    if (found != named.end()) {
      decoded.append(found->second);
      i = end;
      continue;
    }
    decoded.push_back(value[i]);
  }
  return decoded;
}

std::string Trim(std::string value) {
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [](char ch) { return !IsSpace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [](char ch) { return !IsSpace(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string CollapseWhitespace(const std::string &value) {
  std::string collapsed;
  collapsed.reserve(value.size());
  bool pending_space = false;
  for (const auto character : value) {
    if (IsSpace(character)) {
      pending_space = !collapsed.empty();
      continue;
    }
    if (pending_space) {
      collapsed.push_back(' ');
      pending_space = false;
    }
    collapsed.push_back(character);
  }
  return collapsed;
}

} // namespace sitecheck

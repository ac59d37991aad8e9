#include <sitecheck/html_features.h>

#include <sitecheck/escaping.h>

#include <cctype>
#include <map>
#include <optional>

namespace sitecheck {
namespace {

struct Tag {
  std::string name;
  bool closing = false;
  std::map<std::string, std::string> attributes;
};

bool IsNameChar(char character) {
  const auto c = static_cast<unsigned char>(character);
  return std::isalnum(c) != 0 || character == '-' || character == '_' ||
         character == ':';
}

void SkipSpaces(const std::string &text, std::size_t &position,
                std::size_t end) {
  while (position < end &&
         std::isspace(static_cast<unsigned char>(text[position])) != 0) {
    ++position;
  }
}

// Parses the tag body between '<' and '>' (exclusive).
Tag ParseTag(const std::string &html, std::size_t begin, std::size_t end) {
  Tag tag;
  auto position = begin;
  if (position < end && html[position] == '/') {
    tag.closing = true;
    ++position;
  }
  while (position < end && IsNameChar(html[position])) {
    tag.name.push_back(html[position]);
    ++position;
  }
  tag.name = ToLower(tag.name);

  while (position < end) {
    SkipSpaces(html, position, end);
    std::string key;
    while (position < end && html[position] != '=' && html[position] != '/' &&
           std::isspace(static_cast<unsigned char>(html[position])) == 0) {
      key.push_back(html[position]);
      ++position;
    }
    if (key.empty()) {
      ++position;
      continue;
    }
    SkipSpaces(html, position, end);
    std::string value;
    if (position < end && html[position] == '=') {
      ++position;
      SkipSpaces(html, position, end);
      if (position < end && (html[position] == '"' || html[position] == '\'')) {
        const auto quote = html[position++];
        while (position < end && html[position] != quote) {
          value.push_back(html[position++]);
        }
        ++position;
      } else {
        while (position < end &&
               std::isspace(static_cast<unsigned char>(html[position])) == 0) {
          value.push_back(html[position++]);
        }
      }
    }
    tag.attributes[ToLower(key)] = DecodeHtmlEntities(value);
  }
  return tag;
}

std::string Attribute(const Tag &tag, const std::string &name,
                      const std::string &fallback = "") {
  const auto found = tag.attributes.find(name);
  return found == tag.attributes.end() ? fallback : found->second;
}

std::vector<std::string> SplitKeywords(const std::string &content) {
  std::vector<std::string> keywords;
  std::string current;
  for (const auto character : content + ",") {
    if (character == ',') {
      auto keyword = Trim(current);
      if (!keyword.empty()) {
        keywords.push_back(std::move(keyword));
      }
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  return keywords;
}

// Position just past the closing tag for raw-text elements (script, style).
std::size_t SkipRawText(const std::string &lower_html, const std::string &name,
                        std::size_t from) {
  const auto close = lower_html.find("</" + name, from);
  if (close == std::string::npos) {
    return lower_html.size();
  }
  const auto end = lower_html.find('>', close);
  return end == std::string::npos ? lower_html.size() : end + 1;
}

} // namespace

PageFeatures ExtractPageFeatures(const std::string &html) {
  PageFeatures features;
  const auto lower_html = ToLower(html);
  std::string raw_text;
  std::string raw_title;
  bool in_title = false;
  std::optional<FormInfo> open_form;

  std::size_t position = 0;
  while (position < html.size()) {
    const auto open = html.find('<', position);
    const auto text_end = open == std::string::npos ? html.size() : open;
    if (text_end > position) {
      const auto chunk = html.substr(position, text_end - position);
      if (in_title) {
        raw_title += chunk;
      } else {
        raw_text += chunk;
        raw_text.push_back(' ');
      }
    }
    if (open == std::string::npos) {
      break;
    }

    if (lower_html.compare(open, 4, "<!--") == 0) {
      const auto close = html.find("-->", open + 4);
      position = close == std::string::npos ? html.size() : close + 3;
      continue;
    }

    const auto close = html.find('>', open + 1);
    if (close == std::string::npos) {
      break;
    }
    const auto tag = ParseTag(html, open + 1, close);
    position = close + 1;
    if (tag.name.empty()) {
      continue;
    }

    if (!tag.closing && (tag.name == "script" || tag.name == "style")) {
      position = SkipRawText(lower_html, tag.name, position);
      continue;
    }
    if (tag.name == "title") {
      in_title = !tag.closing;
      continue;
    }
    if (tag.closing) {
      if (tag.name == "form" && open_form) {
        features.forms.push_back(std::move(*open_form));
        open_form.reset();
      }
      continue;
    }

    if (tag.name == "meta") {
      const auto name = ToLower(Attribute(tag, "name"));
      if (name == "description") {
        features.meta_description = Trim(Attribute(tag, "content"));
      } else if (name == "keywords") {
        features.meta_keywords = SplitKeywords(Attribute(tag, "content"));
      }
    } else if (tag.name == "a") {
      const auto href = Trim(Attribute(tag, "href"));
      if (!href.empty() && features.links.size() < kMaxExtractedLinks) {
        features.links.push_back(href);
      }
    } else if (tag.name == "form") {
      if (open_form) {
        features.forms.push_back(std::move(*open_form));
      }
      open_form = FormInfo{Attribute(tag, "action"),
                           ToLower(Attribute(tag, "method", "get")),
                           {}};
    } else if (open_form && (tag.name == "input" || tag.name == "select" ||
                             tag.name == "textarea")) {
      const auto type = tag.name == "input"
                            ? ToLower(Attribute(tag, "type", "text"))
                            : tag.name;
      open_form->fields.push_back(FormField{type, Attribute(tag, "name")});
    }
  }

  if (open_form) {
    features.forms.push_back(std::move(*open_form));
  }
  features.title = CollapseWhitespace(DecodeHtmlEntities(raw_title));
  features.text = CollapseWhitespace(DecodeHtmlEntities(raw_text));
  return features;
}

} // namespace sitecheck

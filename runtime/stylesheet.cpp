#include "runtime/stylesheet.hpp"

#include <ctype.h>
#include <string.h>

#include <set>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/strip.h"

namespace runtime {

namespace {

std::string StripComments(const std::string& css) {
  std::string out;
  size_t i = 0;
  while (i < css.size()) {
    if (css.compare(i, 2, "/*") == 0) {
      size_t end = css.find("*/", i + 2);
      if (end == std::string::npos) break;
      i = end + 2;
      out += ' ';
      continue;
    }
    out += css[i++];
  }
  return out;
}

// Returns the position of the first unquoted, unnested occurrence of any of
// stops at or after start, or npos.
size_t FindTopLevel(const std::string& text, size_t start, const char* stops) {
  int depth = 0;
  char quote = 0;
  for (size_t i = start; i < text.size(); i++) {
    char c = text[i];
    if (quote) {
      if (c == '\\') {
        i++;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (depth == 0 && strchr(stops, c) != nullptr) return i;
    if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '(' || c == '[') {
      depth++;
    } else if ((c == ')' || c == ']') && depth > 0) {
      depth--;
    }
  }
  return std::string::npos;
}

// Position just after the block whose '{' is at open, or the end of text.
size_t SkipBlock(const std::string& text, size_t open) {
  int depth = 0;
  for (size_t i = open; i < text.size(); i++) {
    size_t next = FindTopLevel(text, i, "{}");
    if (next == std::string::npos) return text.size();
    if (text[next] == '{') {
      depth++;
    } else if (--depth == 0) {
      return next + 1;
    }
    i = next;
  }
  return text.size();
}

const std::unordered_map<std::string, std::string>& DefaultDisplay() {
  static const auto* display = new std::unordered_map<std::string, std::string>{
      {"html", "block"},       {"body", "block"},
      {"div", "block"},        {"p", "block"},
      {"h1", "block"},         {"h2", "block"},
      {"h3", "block"},         {"h4", "block"},
      {"h5", "block"},         {"h6", "block"},
      {"ul", "block"},         {"ol", "block"},
      {"dl", "block"},         {"dt", "block"},
      {"dd", "block"},         {"section", "block"},
      {"article", "block"},    {"header", "block"},
      {"footer", "block"},     {"nav", "block"},
      {"main", "block"},       {"aside", "block"},
      {"form", "block"},       {"fieldset", "block"},
      {"figure", "block"},     {"figcaption", "block"},
      {"blockquote", "block"}, {"pre", "block"},
      {"address", "block"},    {"hr", "block"},
      {"details", "block"},    {"summary", "block"},
      {"li", "list-item"},     {"table", "table"},
      {"caption", "table-caption"},
      {"thead", "table-header-group"},
      {"tbody", "table-row-group"},
      {"tfoot", "table-footer-group"},
      {"tr", "table-row"},     {"td", "table-cell"},
      {"th", "table-cell"},    {"head", "none"},
      {"script", "none"},      {"style", "none"},
      {"title", "none"},       {"meta", "none"},
      {"link", "none"},        {"base", "none"},
      {"template", "none"},    {"noscript", "none"},
      {"button", "inline-block"}, {"input", "inline-block"},
      {"select", "inline-block"}, {"textarea", "inline-block"},
      {"img", "inline-block"}};
  return *display;
}

const std::unordered_map<std::string, std::string>& InitialValues() {
  static const auto* values = new std::unordered_map<std::string, std::string>{
      {"color", "rgb(0, 0, 0)"},
      {"background-color", "rgba(0, 0, 0, 0)"},
      {"visibility", "visible"},
      {"position", "static"},
      {"float", "none"},
      {"opacity", "1"},
      {"font-style", "normal"},
      {"font-weight", "400"},
      {"text-align", "start"},
      {"text-decoration", "none"},
      {"text-transform", "none"},
      {"white-space", "normal"},
      {"list-style-type", "disc"}};
  return *values;
}

}  // namespace

std::vector<Declaration> ParseDeclarations(const std::string& text) {
  std::string body = StripComments(text);
  std::vector<Declaration> declarations;
  size_t start = 0;
  while (start < body.size()) {
    size_t end = FindTopLevel(body, start, ";");
    if (end == std::string::npos) end = body.size();
    std::string item = body.substr(start, end - start);
    start = end + 1;
    size_t colon = item.find(':');
    if (colon == std::string::npos) continue;
    Declaration declaration;
    declaration.property = absl::AsciiStrToLower(
        absl::StripAsciiWhitespace(item.substr(0, colon)));
    std::string value(absl::StripAsciiWhitespace(item.substr(colon + 1)));
    size_t bang = value.rfind('!');
    if (bang != std::string::npos &&
        absl::EqualsIgnoreCase(
            absl::StripAsciiWhitespace(value.substr(bang + 1)), "important")) {
      declaration.important = true;
      value = std::string(absl::StripAsciiWhitespace(value.substr(0, bang)));
    }
    declaration.value = value;
    if (declaration.property.empty() || declaration.value.empty()) continue;
    declarations.push_back(std::move(declaration));
  }
  return declarations;
}

std::string SerializeDeclarations(
    const std::vector<Declaration>& declarations) {
  std::string out;
  for (const Declaration& declaration : declarations) {
    if (!out.empty()) out += " ";
    out += declaration.property + ": " + declaration.value;
    if (declaration.important) out += " !important";
    out += ";";
  }
  return out;
}

void Stylesheet::Append(const std::string& css) {
  std::string text = StripComments(css);
  size_t pos = 0;
  while (pos < text.size()) {
    size_t open = FindTopLevel(text, pos, "{;");
    if (open == std::string::npos) break;
    std::string prelude(
        absl::StripAsciiWhitespace(text.substr(pos, open - pos)));
    if (text[open] == ';') {
      // Statement at-rules such as @import, or garbage.
      pos = open + 1;
      continue;
    }
    size_t after = SkipBlock(text, open);
    if (prelude.empty() || prelude[0] == '@') {
      pos = after;
      continue;
    }
    size_t close = text[after - 1] == '}' && after - 1 > open ? after - 1
                                                               : after;
    std::string body = text.substr(open + 1, close - open - 1);
    pos = after;
    try {
      StyleRule rule{SelectorList::Parse(prelude), ParseDeclarations(body)};
      rules_.push_back(std::move(rule));
    } catch (const SelectorError&) {
      // An invalid selector invalidates the whole rule.
      continue;
    }
  }
}

bool StyleResolver::IsInherited(const std::string& property) {
  static const auto* inherited = new std::unordered_set<std::string>{
      "color",          "cursor",         "direction",
      "font",           "font-family",    "font-size",
      "font-style",     "font-variant",   "font-weight",
      "letter-spacing", "line-height",    "list-style",
      "list-style-position", "list-style-type", "quotes",
      "text-align",     "text-indent",    "text-transform",
      "visibility",     "white-space",    "word-spacing"};
  return inherited->count(property) != 0;
}

std::string StyleResolver::InitialValue(const Node* element,
                                        const std::string& property) {
  if (property == "display") {
    if (element->GetAttribute("hidden") != nullptr) return "none";
    auto it = DefaultDisplay().find(element->tag());
    return it == DefaultDisplay().end() ? "inline" : it->second;
  }
  auto it = InitialValues().find(property);
  return it == InitialValues().end() ? "" : it->second;
}

std::string StyleResolver::CascadedValue(const Node* element,
                                         const std::string& property) const {
  // (important, inline, specificity, source order)
  using Rank = std::tuple<bool, bool, int, size_t>;
  bool found = false;
  Rank best;
  std::string value;
  auto consider = [&](const Declaration& declaration, bool is_inline,
                      int specificity, size_t order) {
    if (declaration.property != property) return;
    Rank rank(declaration.important, is_inline, specificity, order);
    if (!found || rank >= best) {
      found = true;
      best = rank;
      value = declaration.value;
    }
  };
  size_t order = 0;
  if (stylesheet_ != nullptr) {
    for (const StyleRule& rule : stylesheet_->rules()) {
      int specificity = rule.selectors.MatchingSpecificity(element);
      if (specificity < 0) {
        order += rule.declarations.size();
        continue;
      }
      for (const Declaration& declaration : rule.declarations) {
        consider(declaration, false, specificity, order++);
      }
    }
  }
  const std::string* style = element->GetAttribute("style");
  if (style != nullptr) {
    for (const Declaration& declaration : ParseDeclarations(*style)) {
      consider(declaration, true, 0, order++);
    }
  }
  return value;
}

std::string StyleResolver::ComputedValue(const Node* element,
                                         const std::string& property) const {
  std::string value = CascadedValue(element, property);
  if (value == "initial") return InitialValue(element, property);
  bool unset = value.empty() || value == "unset";
  if (value == "inherit" || (unset && IsInherited(property))) {
    const Node* parent = element->ParentElement();
    if (parent != nullptr) return ComputedValue(parent, property);
    return InitialValue(element, property);
  }
  if (unset) return InitialValue(element, property);
  return value;
}

std::map<std::string, std::string> StyleResolver::ComputedStyle(
    const Node* element) const {
  std::set<std::string> properties{"display"};
  for (const Node* node = element; node != nullptr;
       node = node->ParentElement()) {
    auto collect = [&](const std::vector<Declaration>& declarations) {
      for (const Declaration& declaration : declarations) {
        if (node == element || IsInherited(declaration.property)) {
          properties.insert(declaration.property);
        }
      }
    };
    if (stylesheet_ != nullptr) {
      for (const StyleRule& rule : stylesheet_->rules()) {
        if (rule.selectors.Matches(node)) collect(rule.declarations);
      }
    }
    const std::string* style = node->GetAttribute("style");
    if (style != nullptr) collect(ParseDeclarations(*style));
  }
  std::map<std::string, std::string> style;
  for (const std::string& property : properties) {
    style[property] = ComputedValue(element, property);
  }
  return style;
}

}  // namespace runtime

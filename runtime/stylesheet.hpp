#ifndef RUNTIME_STYLESHEET_HPP
#define RUNTIME_STYLESHEET_HPP

#include <map>
#include <string>
#include <vector>

#include "runtime/dom.hpp"
#include "runtime/selector.hpp"

namespace runtime {

struct Declaration {
  std::string property;  // Lowercase.
  std::string value;
  bool important = false;
};

struct StyleRule {
  SelectorList selectors;
  std::vector<Declaration> declarations;
};

// Parses the body of a rule or a style attribute. Malformed declarations are
// skipped.
std::vector<Declaration> ParseDeclarations(const std::string& text);

// Serializes declarations in the format of a style attribute.
std::string SerializeDeclarations(const std::vector<Declaration>& declarations);

// Author style rules, in source order. Rules with a selector that cannot be
// parsed and at-rules are dropped, as browsers do.
class Stylesheet {
 public:
  void Append(const std::string& css);
  const std::vector<StyleRule>& rules() const { return rules_; }

 private:
  std::vector<StyleRule> rules_;
};

// Computes styles from a stylesheet, the style attributes of the elements and
// the default style of each element.
class StyleResolver {
 public:
  explicit StyleResolver(const Stylesheet* stylesheet)
      : stylesheet_(stylesheet) {}

  // Computed value of a property, following cascade order (importance,
  // origin, specificity, source order) and inheritance. Empty if the property
  // is not set and has no known initial value.
  std::string ComputedValue(const Node* element,
                            const std::string& property) const;

  // Every property that is set on the element or inherited, with display.
  std::map<std::string, std::string> ComputedStyle(const Node* element) const;

  static bool IsInherited(const std::string& property);
  static std::string InitialValue(const Node* element,
                                  const std::string& property);

 private:
  // Value that wins the cascade for the element, or empty.
  std::string CascadedValue(const Node* element,
                            const std::string& property) const;

  const Stylesheet* stylesheet_;
};

}  // namespace runtime

#endif

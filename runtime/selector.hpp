#ifndef RUNTIME_SELECTOR_HPP
#define RUNTIME_SELECTOR_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "runtime/dom.hpp"

namespace runtime {

class SelectorError : public std::runtime_error {
 public:
  explicit SelectorError(const std::string& msg) : std::runtime_error(msg) {}
};

// A list of complex selectors, as accepted by querySelector and used in style
// rules. Supported: universal, type, #id, .class, [attr], [attr=value],
// compound selectors, the descendant and child combinators and lists.
class SelectorList {
 public:
  // Throws SelectorError if the selector is not valid or not supported.
  static SelectorList Parse(const std::string& text);

  bool Matches(const Node* element) const;

  // Specificity of the most specific selector of the list matching element,
  // encoded as ids * 10000 + classes * 100 + types. Negative if none matches.
  int MatchingSpecificity(const Node* element) const;

  // Elements below root (root excluded) matching the list, in document order.
  std::vector<Node*> QueryAll(const Node* root) const;
  // First such element, or nullptr.
  Node* QueryFirst(const Node* root) const;

 private:
  struct AttributeTest {
    std::string name;
    bool has_value = false;
    std::string value;
  };

  struct Compound {
    std::string tag;  // Empty for any element.
    std::vector<std::string> ids;
    std::vector<std::string> classes;
    std::vector<AttributeTest> attributes;
    bool Matches(const Node* element) const;
  };

  enum class Combinator { DESCENDANT, CHILD };

  struct Complex {
    // compounds[i] is joined to compounds[i + 1] by combinators[i].
    std::vector<Compound> compounds;
    std::vector<Combinator> combinators;
    int specificity = 0;
    bool Matches(const Node* element) const;
    bool MatchesFrom(const Node* element, size_t index) const;
  };

  std::vector<Complex> selectors_;
};

}  // namespace runtime

#endif

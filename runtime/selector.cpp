#include "runtime/selector.hpp"

#include <ctype.h>

#include <algorithm>

#include "absl/strings/ascii.h"

namespace runtime {

namespace {

bool IsNameChar(char c) {
  return isalnum(c) || c == '-' || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

class SelectorParser {
 public:
  explicit SelectorParser(const std::string& text) : text_(text) {}

  bool AtEnd() const { return pos_ >= text_.size(); }
  char Peek() const { return AtEnd() ? '\0' : text_[pos_]; }
  void Advance() { pos_++; }

  // Returns true if any whitespace was skipped.
  bool SkipWhitespace() {
    size_t start = pos_;
    while (!AtEnd() && isspace(text_[pos_])) pos_++;
    return pos_ != start;
  }

  std::string ReadName() {
    size_t start = pos_;
    while (!AtEnd() && IsNameChar(text_[pos_])) pos_++;
    if (start == pos_) Fail();
    return text_.substr(start, pos_ - start);
  }

  std::string ReadValue() {
    char quote = Peek();
    if (quote == '"' || quote == '\'') {
      size_t end = text_.find(quote, pos_ + 1);
      if (end == std::string::npos) Fail();
      std::string value = text_.substr(pos_ + 1, end - pos_ - 1);
      pos_ = end + 1;
      return value;
    }
    return ReadName();
  }

  [[noreturn]] void Fail() const {
    throw SelectorError("'" + text_ + "' is not a valid selector");
  }

 private:
  const std::string& text_;
  size_t pos_ = 0;
};

}  // namespace

SelectorList SelectorList::Parse(const std::string& text) {
  SelectorParser parser(text);
  SelectorList list;
  parser.SkipWhitespace();
  if (parser.AtEnd()) parser.Fail();
  while (true) {
    Complex complex;
    while (true) {
      Compound compound;
      bool any = false;
      if (parser.Peek() == '*') {
        parser.Advance();
        any = true;
      } else if (IsNameChar(parser.Peek())) {
        compound.tag = absl::AsciiStrToLower(parser.ReadName());
        any = true;
        complex.specificity += 1;
      }
      while (true) {
        char c = parser.Peek();
        if (c == '#') {
          parser.Advance();
          compound.ids.push_back(parser.ReadName());
          complex.specificity += 10000;
        } else if (c == '.') {
          parser.Advance();
          compound.classes.push_back(parser.ReadName());
          complex.specificity += 100;
        } else if (c == '[') {
          parser.Advance();
          parser.SkipWhitespace();
          AttributeTest test;
          test.name = absl::AsciiStrToLower(parser.ReadName());
          parser.SkipWhitespace();
          if (parser.Peek() == '=') {
            parser.Advance();
            parser.SkipWhitespace();
            test.has_value = true;
            test.value = parser.ReadValue();
            parser.SkipWhitespace();
          }
          if (parser.Peek() != ']') parser.Fail();
          parser.Advance();
          compound.attributes.push_back(std::move(test));
          complex.specificity += 100;
        } else {
          break;
        }
        any = true;
      }
      if (!any) parser.Fail();
      complex.compounds.push_back(std::move(compound));

      bool space = parser.SkipWhitespace();
      char c = parser.Peek();
      if (parser.AtEnd() || c == ',') break;
      if (c == '>') {
        parser.Advance();
        parser.SkipWhitespace();
        complex.combinators.push_back(Combinator::CHILD);
      } else if (space) {
        complex.combinators.push_back(Combinator::DESCENDANT);
      } else {
        parser.Fail();
      }
    }
    list.selectors_.push_back(std::move(complex));
    if (parser.AtEnd()) break;
    parser.Advance();  // ','
    parser.SkipWhitespace();
    if (parser.AtEnd()) parser.Fail();
  }
  return list;
}

bool SelectorList::Compound::Matches(const Node* element) const {
  if (!element->IsElement()) return false;
  if (!tag.empty() && element->tag() != tag) return false;
  for (const std::string& id : ids) {
    const std::string* value = element->GetAttribute("id");
    if (value == nullptr || *value != id) return false;
  }
  if (!classes.empty()) {
    std::vector<std::string> element_classes = element->Classes();
    for (const std::string& name : classes) {
      if (std::find(element_classes.begin(), element_classes.end(), name) ==
          element_classes.end()) {
        return false;
      }
    }
  }
  for (const AttributeTest& test : attributes) {
    const std::string* value = element->GetAttribute(test.name);
    if (value == nullptr) return false;
    if (test.has_value && *value != test.value) return false;
  }
  return true;
}

// Matches compounds[0..index] with compounds[index] on element, right to left.
bool SelectorList::Complex::MatchesFrom(const Node* element,
                                        size_t index) const {
  if (!compounds[index].Matches(element)) return false;
  if (index == 0) return true;
  Combinator combinator = combinators[index - 1];
  for (const Node* ancestor = element->ParentElement(); ancestor != nullptr;
       ancestor = ancestor->ParentElement()) {
    if (MatchesFrom(ancestor, index - 1)) return true;
    if (combinator == Combinator::CHILD) return false;
  }
  return false;
}

bool SelectorList::Complex::Matches(const Node* element) const {
  return MatchesFrom(element, compounds.size() - 1);
}

bool SelectorList::Matches(const Node* element) const {
  return MatchingSpecificity(element) >= 0;
}

int SelectorList::MatchingSpecificity(const Node* element) const {
  int best = -1;
  for (const Complex& complex : selectors_) {
    if (complex.specificity > best && complex.Matches(element)) {
      best = complex.specificity;
    }
  }
  return best;
}

std::vector<Node*> SelectorList::QueryAll(const Node* root) const {
  std::vector<Node*> found;
  root->ForEachDescendantElement([this, &found](Node* element) {
    if (Matches(element)) found.push_back(element);
  });
  return found;
}

Node* SelectorList::QueryFirst(const Node* root) const {
  std::vector<Node*> found = QueryAll(root);
  return found.empty() ? nullptr : found.front();
}

}  // namespace runtime

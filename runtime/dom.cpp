#include "runtime/dom.hpp"

#include <algorithm>

#include "absl/strings/ascii.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

namespace runtime {

const std::string* Node::GetAttribute(const std::string& name) const {
  for (const Attribute& attribute : attributes_) {
    if (attribute.first == name) return &attribute.second;
  }
  return nullptr;
}

void Node::SetAttribute(const std::string& name, const std::string& value) {
  for (Attribute& attribute : attributes_) {
    if (attribute.first == name) {
      attribute.second = value;
      return;
    }
  }
  attributes_.emplace_back(name, value);
}

bool Node::RemoveAttribute(const std::string& name) {
  auto it = std::find_if(
      attributes_.begin(), attributes_.end(),
      [&name](const Attribute& attribute) { return attribute.first == name; });
  if (it == attributes_.end()) return false;
  attributes_.erase(it);
  return true;
}

std::vector<std::string> Node::Classes() const {
  const std::string* value = GetAttribute("class");
  if (value == nullptr) return {};
  return absl::StrSplit(*value, absl::ByAnyChar(" \t\n\r\f"),
                        absl::SkipEmpty());
}

bool Node::HasClass(const std::string& name) const {
  std::vector<std::string> classes = Classes();
  return std::find(classes.begin(), classes.end(), name) != classes.end();
}

Node* Node::ParentElement() const {
  if (parent_ != nullptr && parent_->IsElement()) return parent_;
  return nullptr;
}

std::vector<Node*> Node::ElementChildren() const {
  std::vector<Node*> elements;
  for (Node* child : children_) {
    if (child->IsElement()) elements.push_back(child);
  }
  return elements;
}

Node* Node::FirstElementChild() const {
  for (Node* child : children_) {
    if (child->IsElement()) return child;
  }
  return nullptr;
}

Node* Node::LastElementChild() const {
  for (auto it = children_.rbegin(); it != children_.rend(); ++it) {
    if ((*it)->IsElement()) return *it;
  }
  return nullptr;
}

bool Node::IsInclusiveAncestorOf(const Node* node) const {
  for (; node != nullptr; node = node->parent_) {
    if (node == this) return true;
  }
  return false;
}

bool Node::AppendChild(Node* child) {
  if (child->IsInclusiveAncestorOf(this)) return false;
  child->Remove();
  child->parent_ = this;
  children_.push_back(child);
  return true;
}

void Node::RemoveChildren() {
  for (Node* child : children_) child->parent_ = nullptr;
  children_.clear();
}

void Node::Remove() {
  if (parent_ == nullptr) return;
  std::vector<Node*>& siblings = parent_->children_;
  siblings.erase(std::find(siblings.begin(), siblings.end(), this));
  parent_ = nullptr;
}

std::string Node::TextContent() const {
  if (type_ == Type::TEXT || type_ == Type::COMMENT) return data_;
  std::string text;
  for (Node* child : children_) {
    if (child->type_ == Type::COMMENT) continue;
    text += child->TextContent();
  }
  return text;
}

void Node::SetTextContent(const std::string& text) {
  if (type_ == Type::TEXT || type_ == Type::COMMENT) {
    data_ = text;
    return;
  }
  RemoveChildren();
  if (!text.empty()) AppendChild(document_->CreateText(text));
}

Document::Document() { root_ = NewNode(Node::Type::DOCUMENT); }

Node* Document::NewNode(Node::Type type) {
  nodes_.emplace_back(new Node(this, type));
  return nodes_.back().get();
}

Node* Document::CreateElement(const std::string& tag) {
  Node* node = NewNode(Node::Type::ELEMENT);
  node->tag_ = absl::AsciiStrToLower(tag);
  return node;
}

Node* Document::CreateText(const std::string& text) {
  Node* node = NewNode(Node::Type::TEXT);
  node->data_ = text;
  return node;
}

Node* Document::CreateComment(const std::string& text) {
  Node* node = NewNode(Node::Type::COMMENT);
  node->data_ = text;
  return node;
}

Node* Document::FindChild(const Node* parent, const std::string& tag) const {
  if (parent == nullptr) return nullptr;
  for (Node* child : parent->children()) {
    if (child->IsElement() && child->tag() == tag) return child;
  }
  return nullptr;
}

Node* Document::DocumentElement() const { return root_->FirstElementChild(); }

Node* Document::Head() const { return FindChild(DocumentElement(), "head"); }

Node* Document::Body() const { return FindChild(DocumentElement(), "body"); }

Node* Document::GetElementById(const std::string& id) const {
  Node* found = nullptr;
  root_->ForEachDescendantElement([&found, &id](Node* element) {
    if (found != nullptr) return;
    const std::string* value = element->GetAttribute("id");
    if (value != nullptr && *value == id) found = element;
  });
  return found;
}

std::string Document::Title() const {
  Node* title = FindChild(Head(), "title");
  if (title == nullptr) return "";
  std::string text = title->TextContent();
  // Whitespace is collapsed, as browsers do.
  std::vector<std::string> words = absl::StrSplit(
      text, absl::ByAnyChar(" \t\n\r\f"), absl::SkipEmpty());
  return absl::StrJoin(words, " ");
}

}  // namespace runtime

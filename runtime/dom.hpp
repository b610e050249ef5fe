#ifndef RUNTIME_DOM_HPP
#define RUNTIME_DOM_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace runtime {

class Document;

// A node of the document tree. Nodes are owned by their Document and stay
// alive as long as it does, even when detached from the tree.
class Node {
 public:
  enum class Type { DOCUMENT, ELEMENT, TEXT, COMMENT };
  using Attribute = std::pair<std::string, std::string>;

  Type type() const { return type_; }
  bool IsElement() const { return type_ == Type::ELEMENT; }
  Document* document() const { return document_; }

  // Lowercase tag name, empty for nodes that are not elements.
  const std::string& tag() const { return tag_; }
  // Contents of text and comment nodes.
  const std::string& data() const { return data_; }
  void set_data(std::string data) { data_ = std::move(data); }

  const std::vector<Attribute>& attributes() const { return attributes_; }
  // Returns nullptr if the attribute is not present.
  const std::string* GetAttribute(const std::string& name) const;
  void SetAttribute(const std::string& name, const std::string& value);
  bool RemoveAttribute(const std::string& name);
  bool HasClass(const std::string& name) const;
  std::vector<std::string> Classes() const;

  Node* parent() const { return parent_; }
  // Parent if it is an element.
  Node* ParentElement() const;
  const std::vector<Node*>& children() const { return children_; }
  std::vector<Node*> ElementChildren() const;
  Node* FirstElementChild() const;
  Node* LastElementChild() const;

  // Detaches child from its current parent and appends it to this node.
  // Returns false if child is this node or one of its ancestors.
  bool AppendChild(Node* child);
  void RemoveChildren();
  // Detaches this node from its parent.
  void Remove();
  bool IsInclusiveAncestorOf(const Node* node) const;

  std::string TextContent() const;
  // Replaces all the children with a single text node.
  void SetTextContent(const std::string& text);

  // Calls visitor on every element below this node, in document order.
  template <typename Visitor>
  void ForEachDescendantElement(const Visitor& visitor) const {
    for (Node* child : children_) {
      if (child->IsElement()) visitor(child);
      child->ForEachDescendantElement(visitor);
    }
  }

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

 private:
  friend class Document;
  Node(Document* document, Type type) : document_(document), type_(type) {}

  Document* document_;
  Type type_;
  std::string tag_;
  std::string data_;
  std::vector<Attribute> attributes_;
  Node* parent_ = nullptr;
  std::vector<Node*> children_;
};

class Document {
 public:
  Document();

  Node* root() const { return root_; }
  Node* CreateElement(const std::string& tag);
  Node* CreateText(const std::string& text);
  Node* CreateComment(const std::string& text);

  Node* DocumentElement() const;
  Node* Head() const;
  Node* Body() const;
  Node* GetElementById(const std::string& id) const;
  std::string Title() const;

  size_t NodeCount() const { return nodes_.size(); }

  Document(const Document&) = delete;
  Document& operator=(const Document&) = delete;

 private:
  Node* NewNode(Node::Type type);
  Node* FindChild(const Node* parent, const std::string& tag) const;

  std::vector<std::unique_ptr<Node>> nodes_;
  Node* root_;
};

}  // namespace runtime

#endif

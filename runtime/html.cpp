#include "runtime/html.hpp"

#include <ctype.h>
#include <stdlib.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"

namespace runtime {

namespace {

const std::unordered_set<std::string>& VoidElements() {
  static const auto* elements = new std::unordered_set<std::string>{
      "area", "base",  "br",   "col",   "embed", "hr",  "img",
      "input", "link", "meta", "param", "source", "track", "wbr"};
  return *elements;
}

// Elements that belong to the head when they appear before the body.
const std::unordered_set<std::string>& HeadElements() {
  static const auto* elements = new std::unordered_set<std::string>{
      "title", "meta", "link", "style", "script", "base", "noscript"};
  return *elements;
}

// Elements whose start tag closes an open paragraph.
const std::unordered_set<std::string>& ClosesParagraph() {
  static const auto* elements = new std::unordered_set<std::string>{
      "address", "article", "aside",  "blockquote", "details", "div",
      "dl",      "fieldset", "figure", "footer",    "form",    "h1",
      "h2",      "h3",      "h4",     "h5",         "h6",      "header",
      "hr",      "main",    "nav",    "ol",         "p",       "pre",
      "section", "table",   "ul"};
  return *elements;
}

bool IsRawText(const std::string& tag) {
  return tag == "script" || tag == "style";
}

bool IsEscapableRawText(const std::string& tag) {
  return tag == "textarea" || tag == "title";
}

void AppendUtf8(uint32_t code_point, std::string* out) {
  if (code_point == 0 || code_point > 0x10FFFF ||
      (code_point >= 0xD800 && code_point <= 0xDFFF)) {
    code_point = 0xFFFD;
  }
  if (code_point < 0x80) {
    out->push_back(code_point);
  } else if (code_point < 0x800) {
    out->push_back(0xC0 | (code_point >> 6));
    out->push_back(0x80 | (code_point & 0x3F));
  } else if (code_point < 0x10000) {
    out->push_back(0xE0 | (code_point >> 12));
    out->push_back(0x80 | ((code_point >> 6) & 0x3F));
    out->push_back(0x80 | (code_point & 0x3F));
  } else {
    out->push_back(0xF0 | (code_point >> 18));
    out->push_back(0x80 | ((code_point >> 12) & 0x3F));
    out->push_back(0x80 | ((code_point >> 6) & 0x3F));
    out->push_back(0x80 | (code_point & 0x3F));
  }
}

const std::unordered_map<std::string, uint32_t>& NamedReferences() {
  static const auto* references = new std::unordered_map<std::string, uint32_t>{
      {"amp", '&'},     {"lt", '<'},        {"gt", '>'},
      {"quot", '"'},    {"apos", '\''},     {"nbsp", 0xA0},
      {"copy", 0xA9},   {"reg", 0xAE},      {"laquo", 0xAB},
      {"raquo", 0xBB},  {"middot", 0xB7},   {"times", 0xD7},
      {"divide", 0xF7}, {"ndash", 0x2013},  {"mdash", 0x2014},
      {"lsquo", 0x2018}, {"rsquo", 0x2019}, {"ldquo", 0x201C},
      {"rdquo", 0x201D}, {"bull", 0x2022},  {"hellip", 0x2026},
      {"euro", 0x20AC}};
  return *references;
}

struct Token {
  enum class Type { TEXT, START_TAG, END_TAG, COMMENT, END_OF_FILE };
  Type type = Type::END_OF_FILE;
  std::string name;
  std::string data;
  std::vector<Node::Attribute> attributes;
  bool self_closing = false;
};

class Tokenizer {
 public:
  explicit Tokenizer(const std::string& input) : input_(input) {}

  Token Next() {
    Token token;
    if (!raw_text_end_.empty()) return ReadRawText();
    if (pos_ >= input_.size()) return token;
    if (input_[pos_] == '<') {
      if (absl::StartsWith(Rest(), "<!--")) return ReadComment();
      if (pos_ + 1 < input_.size()) {
        char next = input_[pos_ + 1];
        if (next == '!' || next == '?') return ReadBogusComment();
        if (next == '/' && pos_ + 2 < input_.size() &&
            isalpha(input_[pos_ + 2])) {
          return ReadTag(/*end=*/true);
        }
        if (isalpha(next)) return ReadTag(/*end=*/false);
      }
    }
    size_t end = input_.find('<', pos_ + 1);
    if (end == std::string::npos) end = input_.size();
    token.type = Token::Type::TEXT;
    token.data = DecodeCharacterReferences(input_.substr(pos_, end - pos_));
    pos_ = end;
    return token;
  }

 private:
  absl::string_view Rest() const {
    return absl::string_view(input_).substr(pos_);
  }

  Token ReadComment() {
    Token token;
    token.type = Token::Type::COMMENT;
    size_t end = input_.find("-->", pos_ + 4);
    if (end == std::string::npos) {
      token.data = input_.substr(pos_ + 4);
      pos_ = input_.size();
    } else {
      token.data = input_.substr(pos_ + 4, end - pos_ - 4);
      pos_ = end + 3;
    }
    return token;
  }

  // Doctypes and processing instructions are dropped.
  Token ReadBogusComment() {
    size_t end = input_.find('>', pos_);
    pos_ = end == std::string::npos ? input_.size() : end + 1;
    return Next();
  }

  void SkipWhitespace() {
    while (pos_ < input_.size() && isspace(input_[pos_])) pos_++;
  }

  std::string ReadName() {
    size_t start = pos_;
    while (pos_ < input_.size() && !isspace(input_[pos_]) &&
           input_[pos_] != '>' && input_[pos_] != '/' &&
           input_[pos_] != '=') {
      pos_++;
    }
    return absl::AsciiStrToLower(input_.substr(start, pos_ - start));
  }

  Token ReadTag(bool end) {
    Token token;
    token.type = end ? Token::Type::END_TAG : Token::Type::START_TAG;
    pos_ += end ? 2 : 1;
    token.name = ReadName();
    while (pos_ < input_.size()) {
      SkipWhitespace();
      if (pos_ >= input_.size()) break;
      if (input_[pos_] == '>') {
        pos_++;
        break;
      }
      if (input_[pos_] == '/') {
        pos_++;
        if (pos_ < input_.size() && input_[pos_] == '>') {
          token.self_closing = true;
          pos_++;
          break;
        }
        continue;
      }
      std::string name = ReadName();
      if (name.empty()) {
        // A lone '=' is skipped.
        pos_++;
        continue;
      }
      std::string value;
      SkipWhitespace();
      if (pos_ < input_.size() && input_[pos_] == '=') {
        pos_++;
        SkipWhitespace();
        value = ReadAttributeValue();
      }
      if (end) continue;
      bool duplicate = std::any_of(
          token.attributes.begin(), token.attributes.end(),
          [&name](const Node::Attribute& a) { return a.first == name; });
      if (!duplicate) token.attributes.emplace_back(name, value);
    }
    if (!end && (IsRawText(token.name) || IsEscapableRawText(token.name))) {
      raw_text_end_ = "</" + token.name;
      raw_text_tag_ = token.name;
    }
    return token;
  }

  std::string ReadAttributeValue() {
    if (pos_ >= input_.size()) return "";
    char quote = input_[pos_];
    size_t start = pos_;
    size_t end = 0;
    if (quote == '"' || quote == '\'') {
      start = pos_ + 1;
      end = input_.find(quote, start);
      if (end == std::string::npos) end = input_.size();
      pos_ = std::min(end + 1, input_.size());
    } else {
      while (pos_ < input_.size() && !isspace(input_[pos_]) &&
             input_[pos_] != '>') {
        pos_++;
      }
      end = pos_;
    }
    return DecodeCharacterReferences(input_.substr(start, end - start));
  }

  // Text of script, style, textarea and title runs until the matching end
  // tag.
  Token ReadRawText() {
    Token token;
    token.type = Token::Type::TEXT;
    size_t end = pos_;
    while (true) {
      end = input_.find("</", end);
      if (end == std::string::npos) {
        end = input_.size();
        break;
      }
      if (absl::StartsWithIgnoreCase(
              absl::string_view(input_).substr(end), raw_text_end_)) {
        size_t after = end + raw_text_end_.size();
        if (after >= input_.size() || isspace(input_[after]) ||
            input_[after] == '>' || input_[after] == '/') {
          break;
        }
      }
      end += 2;
    }
    token.data = input_.substr(pos_, end - pos_);
    if (IsEscapableRawText(raw_text_tag_)) {
      token.data = DecodeCharacterReferences(token.data);
    }
    pos_ = end;
    raw_text_end_.clear();
    raw_text_tag_.clear();
    if (token.data.empty()) return Next();
    return token;
  }

  const std::string& input_;
  size_t pos_ = 0;
  std::string raw_text_end_;
  std::string raw_text_tag_;
};

class TreeBuilder {
 public:
  // Document mode.
  TreeBuilder(Document* document, std::vector<std::string>* style_blocks)
      : document_(document), style_blocks_(style_blocks) {}

  // Fragment mode: nodes are inserted below context.
  explicit TreeBuilder(Node* context)
      : document_(context->document()), fragment_(true) {
    stack_.push_back(context);
  }

  void Build(const std::string& markup) {
    Tokenizer tokenizer(markup);
    for (Token token = tokenizer.Next();
         token.type != Token::Type::END_OF_FILE; token = tokenizer.Next()) {
      switch (token.type) {
        case Token::Type::TEXT:
          InsertText(token.data);
          break;
        case Token::Type::COMMENT:
          Current()->AppendChild(document_->CreateComment(token.data));
          break;
        case Token::Type::START_TAG:
          StartTag(token);
          break;
        case Token::Type::END_TAG:
          EndTag(token.name);
          break;
        case Token::Type::END_OF_FILE:
          break;
      }
    }
    if (!fragment_) EnsureBody();
  }

 private:
  Node* Current() const {
    return stack_.empty() ? document_->root() : stack_.back();
  }

  void EnsureHtml() {
    if (html_ != nullptr) return;
    html_ = document_->CreateElement("html");
    document_->root()->AppendChild(html_);
    stack_ = {html_};
  }

  void EnsureHead() {
    EnsureHtml();
    if (head_ != nullptr) return;
    head_ = document_->CreateElement("head");
    html_->AppendChild(head_);
  }

  void EnsureBody() {
    EnsureHead();
    if (body_ == nullptr) {
      body_ = document_->CreateElement("body");
      html_->AppendChild(body_);
      stack_ = {html_, body_};
    }
  }

  // Moves the insertion point to the body if it is still in the head.
  void EnterBody() {
    EnsureBody();
    if (std::find(stack_.begin(), stack_.end(), body_) == stack_.end()) {
      stack_ = {html_, body_};
    }
  }

  static bool IsWhitespace(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return isspace(c); });
  }

  void InsertText(const std::string& text) {
    if (!fragment_) {
      if (Current()->tag() == "style" && style_blocks_ != nullptr) {
        style_blocks_->push_back(text);
      }
      if (body_ == nullptr && !IsRawTextContext()) {
        if (IsWhitespace(text)) return;
        EnterBody();
      }
    }
    Node* parent = Current();
    if (!parent->children().empty() &&
        parent->children().back()->type() == Node::Type::TEXT) {
      Node* last = parent->children().back();
      last->set_data(last->data() + text);
      return;
    }
    parent->AppendChild(document_->CreateText(text));
  }

  bool IsRawTextContext() const {
    const std::string& tag = Current()->tag();
    return IsRawText(tag) || IsEscapableRawText(tag);
  }

  void MergeAttributes(Node* element, const Token& token) {
    for (const Node::Attribute& attribute : token.attributes) {
      if (element->GetAttribute(attribute.first) == nullptr) {
        element->SetAttribute(attribute.first, attribute.second);
      }
    }
  }

  void StartTag(const Token& token) {
    if (!fragment_) {
      if (token.name == "html") {
        EnsureHtml();
        MergeAttributes(html_, token);
        return;
      }
      if (token.name == "head") {
        if (body_ == nullptr) {
          EnsureHead();
          MergeAttributes(head_, token);
          stack_ = {html_, head_};
        }
        return;
      }
      if (token.name == "body") {
        EnterBody();
        MergeAttributes(body_, token);
        return;
      }
      if (body_ == nullptr && HeadElements().count(token.name)) {
        EnsureHead();
        if (Current() != head_) stack_ = {html_, head_};
      } else {
        EnterBody();
      }
    }
    CloseImplied(token.name);
    Node* element = document_->CreateElement(token.name);
    for (const Node::Attribute& attribute : token.attributes) {
      element->SetAttribute(attribute.first, attribute.second);
    }
    Current()->AppendChild(element);
    if (IsVoidElement(token.name)) return;
    if (stack_.size() >= kMaxTreeDepth) {
      // Raw text still needs a home: the tokenizer emits it next.
      if (!IsRawText(token.name) && !IsEscapableRawText(token.name)) return;
    }
    stack_.push_back(element);
  }

  // Pops the stack through the innermost element named tag, without crossing
  // any of the boundaries. Returns false if no such element is open.
  bool CloseUpTo(const std::string& tag,
                 const std::unordered_set<std::string>& boundaries) {
    for (size_t i = stack_.size(); i > MinDepth(); i--) {
      const std::string& open = stack_[i - 1]->tag();
      if (open == tag) {
        stack_.resize(i - 1);
        return true;
      }
      if (boundaries.count(open)) return false;
    }
    return false;
  }

  void CloseImplied(const std::string& tag) {
    static const auto* paragraph_scope = new std::unordered_set<std::string>{
        "html", "body", "table", "td", "th", "button", "template"};
    static const auto* list_scope =
        new std::unordered_set<std::string>{"ul", "ol", "table"};
    static const auto* definition_scope =
        new std::unordered_set<std::string>{"dl", "table"};
    static const auto* row_scope =
        new std::unordered_set<std::string>{"table"};
    static const auto* cell_scope =
        new std::unordered_set<std::string>{"tr", "table"};
    if (ClosesParagraph().count(tag)) CloseUpTo("p", *paragraph_scope);
    if (tag == "li") CloseUpTo("li", *list_scope);
    if (tag == "dt" || tag == "dd") {
      if (!CloseUpTo("dt", *definition_scope)) {
        CloseUpTo("dd", *definition_scope);
      }
    }
    if (tag == "option" && Current()->tag() == "option") stack_.pop_back();
    if (tag == "tr") CloseUpTo("tr", *row_scope);
    if (tag == "td" || tag == "th") {
      if (!CloseUpTo("td", *cell_scope)) CloseUpTo("th", *cell_scope);
    }
  }

  void EndTag(const std::string& tag) {
    if (!fragment_) {
      // Content after </body> or </html> still goes into the body.
      if (tag == "html" || tag == "body") return;
      if (tag == "head") {
        if (Current() == head_) stack_ = {html_};
        return;
      }
    }
    static const auto* no_boundaries = new std::unordered_set<std::string>();
    CloseUpTo(tag, *no_boundaries);
  }

  // Elements below this depth are never closed: html and body in document
  // mode, the context in fragment mode.
  size_t MinDepth() const {
    if (fragment_) return 1;
    if (!stack_.empty() && stack_.size() >= 2 && stack_[1] == body_) return 2;
    return 1;
  }

  Document* document_;
  std::vector<std::string>* style_blocks_ = nullptr;
  bool fragment_ = false;
  Node* html_ = nullptr;
  Node* head_ = nullptr;
  Node* body_ = nullptr;
  std::vector<Node*> stack_;
};

std::string Escape(const std::string& text, bool attribute) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += attribute ? "<" : "&lt;";
        break;
      case '>':
        out += attribute ? ">" : "&gt;";
        break;
      case '"':
        out += attribute ? "&quot;" : "\"";
        break;
      default:
        out += c;
    }
  }
  return out;
}

void SerializeNode(const Node* node, std::string* out) {
  switch (node->type()) {
    case Node::Type::TEXT: {
      const Node* parent = node->parent();
      if (parent != nullptr && IsRawText(parent->tag())) {
        *out += node->data();
      } else {
        *out += Escape(node->data(), /*attribute=*/false);
      }
      break;
    }
    case Node::Type::COMMENT:
      *out += "<!--" + node->data() + "-->";
      break;
    case Node::Type::ELEMENT:
      *out += "<" + node->tag();
      for (const Node::Attribute& attribute : node->attributes()) {
        *out += " " + attribute.first + "=\"" +
                Escape(attribute.second, /*attribute=*/true) + "\"";
      }
      *out += ">";
      if (IsVoidElement(node->tag())) break;
      for (const Node* child : node->children()) SerializeNode(child, out);
      *out += "</" + node->tag() + ">";
      break;
    case Node::Type::DOCUMENT:
      for (const Node* child : node->children()) SerializeNode(child, out);
      break;
  }
}

}  // namespace

bool IsVoidElement(const std::string& tag) {
  return VoidElements().count(tag) != 0;
}

std::string DecodeCharacterReferences(const std::string& text) {
  if (text.find('&') == std::string::npos) return text;
  std::string out;
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '&') {
      out += text[i++];
      continue;
    }
    size_t j = i + 1;
    if (j < text.size() && text[j] == '#') {
      j++;
      bool hex = j < text.size() && (text[j] == 'x' || text[j] == 'X');
      if (hex) j++;
      size_t digits_start = j;
      while (j < text.size() &&
             (hex ? isxdigit(text[j]) : isdigit(text[j])) &&
             j - digits_start < 8) {
        j++;
      }
      if (j > digits_start) {
        uint32_t code_point = strtoul(
            text.substr(digits_start, j - digits_start).c_str(), nullptr,
            hex ? 16 : 10);
        AppendUtf8(code_point, &out);
        if (j < text.size() && text[j] == ';') j++;
        i = j;
        continue;
      }
    } else {
      while (j < text.size() && isalnum(text[j]) && j - i <= 8) j++;
      auto it = NamedReferences().find(text.substr(i + 1, j - i - 1));
      if (it != NamedReferences().end() && j < text.size() &&
          text[j] == ';') {
        AppendUtf8(it->second, &out);
        i = j + 1;
        continue;
      }
    }
    out += text[i++];
  }
  return out;
}

void ParseHtml(const std::string& markup, Document* document,
               std::vector<std::string>* style_blocks) {
  TreeBuilder builder(document, style_blocks);
  builder.Build(markup);
}

void ParseHtmlFragment(const std::string& markup, Node* context) {
  context->RemoveChildren();
  if (IsRawText(context->tag())) {
    context->SetTextContent(markup);
    return;
  }
  TreeBuilder builder(context);
  builder.Build(markup);
}

std::string SerializeChildren(const Node* node) {
  std::string out;
  for (const Node* child : node->children()) SerializeNode(child, &out);
  return out;
}

}  // namespace runtime

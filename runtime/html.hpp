#ifndef RUNTIME_HTML_HPP
#define RUNTIME_HTML_HPP

#include <string>
#include <vector>

#include "runtime/dom.hpp"

namespace runtime {

// Elements deeper than this are attached to the deepest allowed ancestor.
static const constexpr size_t kMaxTreeDepth = 512;

// Parses a whole document into document, leniently: html, head and body are
// created when missing, stray end tags are ignored and elements left open are
// closed at the end. The contents of the <style> elements are appended to
// style_blocks in document order.
void ParseHtml(const std::string& markup, Document* document,
               std::vector<std::string>* style_blocks);

// Replaces the children of context with the nodes described by markup.
void ParseHtmlFragment(const std::string& markup, Node* context);

// Serializes the children of node as markup.
std::string SerializeChildren(const Node* node);

std::string DecodeCharacterReferences(const std::string& text);

bool IsVoidElement(const std::string& tag);

}  // namespace runtime

#endif

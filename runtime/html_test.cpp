#include "runtime/html.hpp"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/dom.hpp"

namespace {

using runtime::Document;
using runtime::Node;
using ::testing::ElementsAre;

class HtmlTest : public ::testing::Test {
 protected:
  Node* Parse(const std::string& markup) {
    runtime::ParseHtml(markup, &document_, &style_blocks_);
    return document_.Body();
  }

  std::vector<std::string> Tags(const Node* node) {
    std::vector<std::string> tags;
    for (const Node* child : node->ElementChildren()) {
      tags.push_back(child->tag());
    }
    return tags;
  }

  Document document_;
  std::vector<std::string> style_blocks_;
};

TEST_F(HtmlTest, SynthesizesDocumentStructure) {
  Node* body = Parse("<p>Hello <b>world</b></p>");
  ASSERT_NE(body, nullptr);
  ASSERT_NE(document_.Head(), nullptr);
  EXPECT_EQ(document_.DocumentElement()->tag(), "html");
  EXPECT_THAT(Tags(document_.DocumentElement()), ElementsAre("head", "body"));
  EXPECT_THAT(Tags(body), ElementsAre("p"));
  EXPECT_EQ(body->TextContent(), "Hello world");
}

TEST_F(HtmlTest, EmptyMarkupStillHasBody) {
  Node* body = Parse("");
  ASSERT_NE(body, nullptr);
  EXPECT_TRUE(body->children().empty());
}

TEST_F(HtmlTest, BareTextGoesToBody) {
  Node* body = Parse("hello");
  EXPECT_EQ(body->TextContent(), "hello");
}

TEST_F(HtmlTest, ExplicitStructureIsKept) {
  Node* body = Parse(
      "<!DOCTYPE html><html lang=en><head><title>T</title></head>"
      "<body class=main><div>x</div></body></html>");
  ASSERT_NE(body, nullptr);
  EXPECT_EQ(*document_.DocumentElement()->GetAttribute("lang"), "en");
  EXPECT_EQ(*body->GetAttribute("class"), "main");
  EXPECT_THAT(Tags(body), ElementsAre("div"));
  EXPECT_EQ(document_.Title(), "T");
}

TEST_F(HtmlTest, ImpliedEndTags) {
  Node* body = Parse("<ul><li>a<li>b</ul><p>one<p>two<div>three</div>");
  EXPECT_THAT(Tags(body), ElementsAre("ul", "p", "p", "div"));
  EXPECT_THAT(Tags(body->FirstElementChild()), ElementsAre("li", "li"));
}

TEST_F(HtmlTest, VoidElementsHaveNoChildren) {
  Node* body = Parse("<p>a<br>b<img src=x.png>c</p>");
  Node* p = body->FirstElementChild();
  EXPECT_EQ(p->children().size(), 5u);
  EXPECT_EQ(p->TextContent(), "abc");
}

TEST_F(HtmlTest, StrayEndTagsAreIgnored) {
  Node* body = Parse("<div></span>text</div></p>");
  EXPECT_THAT(Tags(body), ElementsAre("div"));
  EXPECT_EQ(body->FirstElementChild()->TextContent(), "text");
}

TEST_F(HtmlTest, UnclosedElementsAreClosedAtEnd) {
  Node* body = Parse("<div><span>text");
  Node* div = body->FirstElementChild();
  ASSERT_NE(div, nullptr);
  EXPECT_THAT(Tags(div), ElementsAre("span"));
  EXPECT_EQ(div->TextContent(), "text");
}

TEST_F(HtmlTest, Attributes) {
  Node* body = Parse(
      "<a href=\"x.html\" class='one two' data-n=3 disabled HREF=dup>l</a>");
  Node* a = body->FirstElementChild();
  EXPECT_EQ(*a->GetAttribute("href"), "x.html");
  EXPECT_EQ(*a->GetAttribute("data-n"), "3");
  EXPECT_EQ(*a->GetAttribute("disabled"), "");
  EXPECT_THAT(a->Classes(), ElementsAre("one", "two"));
  EXPECT_TRUE(a->HasClass("two"));
  EXPECT_EQ(a->attributes().size(), 4u);
}

TEST_F(HtmlTest, CharacterReferences) {
  Node* body = Parse("<p>a &amp; b &lt;c&gt; &#65;&#x42; &unknown; &amp</p>");
  EXPECT_EQ(body->TextContent(), "a & b <c> AB &unknown; &amp");
  EXPECT_EQ(runtime::DecodeCharacterReferences("&copy;"), "\xC2\xA9");
}

TEST_F(HtmlTest, CommentsAreKeptButHaveNoText) {
  Node* body = Parse("<div>a<!-- hidden -->b</div>");
  Node* div = body->FirstElementChild();
  ASSERT_EQ(div->children().size(), 3u);
  EXPECT_EQ(div->children()[1]->type(), Node::Type::COMMENT);
  EXPECT_EQ(div->TextContent(), "ab");
}

TEST_F(HtmlTest, StyleAndScriptAreRawText) {
  Node* body = Parse(
      "<style>p > b { color: red }</style>"
      "<p>x</p><script>if (a < b) {}</script>");
  ASSERT_EQ(style_blocks_.size(), 1u);
  EXPECT_EQ(style_blocks_[0], "p > b { color: red }");
  EXPECT_THAT(Tags(document_.Head()), ElementsAre("style"));
  EXPECT_THAT(Tags(body), ElementsAre("p", "script"));
  EXPECT_EQ(body->LastElementChild()->TextContent(), "if (a < b) {}");
}

TEST_F(HtmlTest, StyleInBodyIsCollected) {
  Parse("<p>x</p><style>.a{}</style><style>.b{}</style>");
  EXPECT_THAT(style_blocks_, ElementsAre(".a{}", ".b{}"));
}

TEST_F(HtmlTest, TitleWhitespaceIsCollapsed) {
  Parse("<title>  My \n  Page </title>");
  EXPECT_EQ(document_.Title(), "My Page");
}

TEST_F(HtmlTest, DeepNestingIsBounded) {
  std::string markup;
  for (int i = 0; i < 2000; i++) markup += "<div>";
  markup += "x";
  Node* body = Parse(markup);
  int divs = 0;
  body->ForEachDescendantElement([&divs](Node*) { divs++; });
  EXPECT_EQ(divs, 2000);
  EXPECT_EQ(body->TextContent(), "x");
}

TEST_F(HtmlTest, SerializeChildren) {
  Node* body = Parse(
      "<div><p class=\"a\">x &amp; y</p><br><!--c--><input value='\"'></div>");
  EXPECT_EQ(runtime::SerializeChildren(body->FirstElementChild()),
            "<p class=\"a\">x &amp; y</p><br><!--c--><input value=\"&quot;\">");
}

TEST_F(HtmlTest, ParseFragmentReplacesChildren) {
  Node* body = Parse("<div id=target><p>old</p></div>");
  Node* div = document_.GetElementById("target");
  ASSERT_NE(div, nullptr);
  runtime::ParseHtmlFragment("<span>a</span>b<li>c", div);
  EXPECT_THAT(Tags(div), ElementsAre("span", "li"));
  EXPECT_EQ(div->children().size(), 3u);
  EXPECT_EQ(body->TextContent(), "abc");
}

TEST(DomTest, AppendChildRejectsCycles) {
  Document document;
  Node* outer = document.CreateElement("DIV");
  Node* inner = document.CreateElement("span");
  EXPECT_EQ(outer->tag(), "div");
  EXPECT_TRUE(outer->AppendChild(inner));
  EXPECT_FALSE(inner->AppendChild(outer));
  EXPECT_FALSE(outer->AppendChild(outer));
  EXPECT_EQ(inner->ParentElement(), outer);
}

TEST(DomTest, AppendChildMovesNode) {
  Document document;
  Node* a = document.CreateElement("div");
  Node* b = document.CreateElement("div");
  Node* child = document.CreateText("t");
  a->AppendChild(child);
  b->AppendChild(child);
  EXPECT_TRUE(a->children().empty());
  EXPECT_EQ(b->TextContent(), "t");
  child->Remove();
  EXPECT_EQ(child->parent(), nullptr);
  EXPECT_EQ(b->TextContent(), "");
}

TEST(DomTest, SetTextContentReplacesChildren) {
  Document document;
  Node* div = document.CreateElement("div");
  div->AppendChild(document.CreateElement("span"));
  div->SetTextContent("plain");
  ASSERT_EQ(div->children().size(), 1u);
  EXPECT_EQ(div->children()[0]->type(), Node::Type::TEXT);
  div->SetTextContent("");
  EXPECT_TRUE(div->children().empty());
}

}  // namespace

#include "document/HtmlParser.hpp"
#include <gtest/gtest.h>

using namespace lfx;

TEST(HtmlParser, BuildsTreeWithAttributeSpans) {
  std::string html = "<div id=\"a\" class=\"p-4 z-10\"><button class='btn'>Go</button></div>";
  Dom dom;
  std::string err;
  ASSERT_TRUE(parseHtml(html, dom, &err)) << err;

  auto els = dom.elements();
  ASSERT_EQ(els.size(), 2u);
  const Node* div = els[0];
  EXPECT_EQ(div->tag, "div");
  ASSERT_EQ(div->children.size(), 1u);
  EXPECT_EQ(div->children[0]->tag, "button");
  EXPECT_EQ(div->children[0]->parent, div);

  const Attribute* cls = div->attr("class");
  ASSERT_NE(cls, nullptr);
  EXPECT_EQ(html.substr(cls->valueBegin, cls->valueEnd - cls->valueBegin), "p-4 z-10");
  EXPECT_EQ(div->classes(), (std::vector<std::string>{"p-4", "z-10"}));
  EXPECT_TRUE(div->children[0]->hasText);
  EXPECT_EQ(dom.byId("a"), div);
}

TEST(HtmlParser, VoidElementsDoNotNest) {
  Dom dom;
  ASSERT_TRUE(parseHtml("<p><img src=x><input type=text><span>t</span></p>", dom, nullptr));
  auto els = dom.elements();
  ASSERT_EQ(els.size(), 4u);
  EXPECT_EQ(els[3]->tag, "span");
  EXPECT_EQ(els[3]->parent->tag, "p");
  EXPECT_TRUE(isVoidElement("img"));
  EXPECT_FALSE(isVoidElement("div"));
}

TEST(HtmlParser, ScriptIsRawText) {
  Dom dom;
  ASSERT_TRUE(parseHtml("<body><script>if (a < b) { go('<div>'); }</script><a href=#>x</a></body>",
                        dom, nullptr));
  auto els = dom.elements();
  ASSERT_EQ(els.size(), 3u);
  EXPECT_EQ(els[1]->tag, "script");
  EXPECT_EQ(els[1]->rawText, "if (a < b) { go('<div>'); }");
  EXPECT_EQ(els[2]->tag, "a");
}

TEST(HtmlParser, ToleratesStrayEndTagsAndComments) {
  Dom dom;
  std::string err;
  ASSERT_TRUE(parseHtml("<!DOCTYPE html><!-- <b> --><div></span>text</div><p>open", dom, &err))
      << err;
  auto els = dom.elements();
  ASSERT_EQ(els.size(), 2u);
  EXPECT_EQ(els[0]->tag, "div");
  EXPECT_EQ(els[1]->tag, "p");
}

TEST(HtmlParser, RejectsUnterminatedMarkup) {
  Dom dom;
  std::string err;
  EXPECT_FALSE(parseHtml("<div class=\"a", dom, &err));
  EXPECT_FALSE(err.empty());

  Dom dom2;
  EXPECT_FALSE(parseHtml("<div><!-- never closed", dom2, nullptr));

  Dom dom3;
  EXPECT_FALSE(parseHtml("<script>var a = 1;", dom3, nullptr));
}

TEST(HtmlParser, DeepNestingWalksInDocumentOrder) {
  const int depth = 200000;
  std::string html;
  for (int i = 0; i < depth; ++i) html += "<div>";
  html += "<button id=\"leaf\">x</button>";
  for (int i = 0; i < depth; ++i) html += "</div>";
  html += "<p id=\"after\"></p>";

  Dom dom;
  std::string err;
  ASSERT_TRUE(parseHtml(html, dom, &err)) << err;
  auto els = dom.elements();
  ASSERT_EQ(els.size(), (size_t)depth + 2);
  EXPECT_EQ(els[depth]->tag, "button");
  EXPECT_EQ(els.back()->tag, "p");
  EXPECT_EQ(dom.byId("after"), els.back());
}

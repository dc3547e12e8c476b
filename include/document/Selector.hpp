#pragma once
#include "document/HtmlParser.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lfx {

struct AttributeTest {
  std::string name;
  std::optional<std::string> value;   // presence test when empty
};

struct CompoundSelector {
  bool        universal = false;
  std::string tag;
  std::vector<std::string> ids;
  std::vector<std::string> classes;
  std::vector<AttributeTest> attributes;
  int         nthChild = 0;           // 1-based, 0 = unconstrained
  int         nthOfType = 0;
  bool        root = false;           // :root, element directly under the document
};

enum class Combinator { Descendant, Child };

struct ComplexSelector {
  std::vector<CompoundSelector> compounds;
  std::vector<Combinator> combinators;  // combinators[i] joins compounds[i] and compounds[i+1]
};

// The selector subset patches are written in: type, #id, .class, [attr],
// [attr="v"], *, :nth-child(n), :nth-of-type(n), :root, descendant and
// child combinators, and comma separated lists.
class Selector {
public:
  static bool parse(std::string_view text, Selector& out, std::string* error);

  bool matches(const Node& el) const;
  std::vector<const Node*> select(const Dom& dom) const;
  const std::string& text() const { return text_; }

private:
  std::string text_;
  std::vector<ComplexSelector> alternatives_;
};

// Stable selector for an element: #id, then a unique [data-*] attribute,
// then a child-combinator path of tag:nth-of-type steps. The result never
// depends on the class list, so it still matches after class patches.
std::string selectorFor(const Dom& dom, const Node& el);

// Escapes a class name or identifier for use inside a selector.
std::string escapeIdent(std::string_view ident);

} // namespace lfx

#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lfx {

enum class NodeType { Document, Element };

struct Attribute {
  std::string name;            // lower-cased
  std::string value;           // raw text between the quotes
  std::size_t valueBegin = 0;  // byte span of the value in the source
  std::size_t valueEnd = 0;
  bool        hasValue = false;
  bool        quoted = false;
};

struct Node {
  NodeType    type = NodeType::Element;
  std::string tag;             // lower-cased, "#document" for the root
  std::vector<Attribute> attributes;
  std::vector<Node*> children; // element children only, in document order
  Node*       parent = nullptr;
  std::size_t begin = 0;       // offset of '<'
  std::size_t nameEnd = 0;     // offset just past the tag name
  std::size_t openEnd = 0;     // offset just past the closing '>' of the start tag
  std::string rawText;         // content of script/style elements
  bool        hasText = false; // non-whitespace character data directly inside

  const Attribute* attr(std::string_view name) const;
  std::optional<std::string> attrValue(std::string_view name) const;
  bool hasAttr(std::string_view name) const { return attr(name) != nullptr; }
  std::vector<std::string> classes() const;
  bool isElement() const { return type == NodeType::Element; }
};

// Owns every node of one parse. Nodes are stable for the lifetime of the Dom.
class Dom {
public:
  Dom();
  Dom(const Dom&) = delete;
  Dom& operator=(const Dom&) = delete;
  Dom(Dom&&) = default;
  Dom& operator=(Dom&&) = default;

  const Node& root() const { return *root_; }
  Node& root() { return *root_; }
  Node* create();

  // All elements in document (pre-)order
  std::vector<const Node*> elements() const;
  const Node* byId(std::string_view id) const;

private:
  std::vector<std::unique_ptr<Node>> nodes_;
  Node* root_ = nullptr;
};

// Tolerant HTML tree builder. Stray end tags are ignored and unclosed
// elements are closed at end of input; only unterminated tags, comments,
// attribute values and raw-text elements make the parse fail.
bool parseHtml(std::string_view source, Dom& out, std::string* error);

bool isVoidElement(std::string_view tag);

} // namespace lfx

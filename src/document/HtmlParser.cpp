#include "document/HtmlParser.hpp"
#include <algorithm>
#include <cctype>

namespace lfx {

static bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

static std::string toLower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = (char)std::tolower((unsigned char)c);
  return out;
}

const Attribute* Node::attr(std::string_view name) const {
  for (const auto& a : attributes)
    if (a.name == name) return &a;
  return nullptr;
}

std::optional<std::string> Node::attrValue(std::string_view name) const {
  if (const Attribute* a = attr(name)) return a->value;
  return std::nullopt;
}

std::vector<std::string> Node::classes() const {
  std::vector<std::string> out;
  const Attribute* a = attr("class");
  if (!a) return out;
  const std::string& v = a->value;
  std::size_t i = 0;
  while (i < v.size()) {
    while (i < v.size() && isSpace(v[i])) ++i;
    std::size_t start = i;
    while (i < v.size() && !isSpace(v[i])) ++i;
    if (i > start) out.emplace_back(v.substr(start, i - start));
  }
  return out;
}

Dom::Dom() {
  root_ = create();
  root_->type = NodeType::Document;
  root_->tag = "#document";
}

Node* Dom::create() {
  nodes_.push_back(std::make_unique<Node>());
  return nodes_.back().get();
}

std::vector<const Node*> Dom::elements() const {
  // Document order without recursion
  std::vector<const Node*> out;
  std::vector<const Node*> stack(root_->children.rbegin(), root_->children.rend());
  while (!stack.empty()) {
    const Node* n = stack.back();
    stack.pop_back();
    out.push_back(n);
    stack.insert(stack.end(), n->children.rbegin(), n->children.rend());
  }
  return out;
}

const Node* Dom::byId(std::string_view id) const {
  for (const Node* n : elements()) {
    const Attribute* a = n->attr("id");
    if (a && a->value == id) return n;
  }
  return nullptr;
}

bool isVoidElement(std::string_view tag) {
  static const char* kVoid[] = {"area", "base", "br", "col", "embed", "hr", "img", "input",
                                "link", "meta", "param", "source", "track", "wbr"};
  for (const char* v : kVoid)
    if (tag == v) return true;
  return false;
}

static bool isRawText(std::string_view tag) {
  return tag == "script" || tag == "style";
}

namespace {

class TreeBuilder {
  std::string_view src;
  std::size_t pos = 0;
  Dom& dom;
  std::vector<Node*> open;
  std::string* error;

public:
  TreeBuilder(std::string_view s, Dom& d, std::string* e) : src(s), dom(d), error(e) {
    open.push_back(&dom.root());
  }

  bool run() {
    while (pos < src.size()) {
      if (src[pos] != '<') {
        text();
        continue;
      }
      if (startsWith("<!--")) {
        if (!comment()) return false;
      } else if (startsWith("</")) {
        if (!endTag()) return false;
      } else if (startsWith("<!") || startsWith("<?")) {
        if (!declaration()) return false;
      } else if (pos + 1 < src.size() && std::isalpha((unsigned char)src[pos + 1])) {
        if (!startTag()) return false;
      } else {
        text();
      }
    }
    return true;
  }

private:
  bool fail(const std::string& msg) {
    if (error) *error = msg + " at byte " + std::to_string(pos);
    return false;
  }

  bool startsWith(std::string_view s) const {
    return src.substr(pos, s.size()) == s;
  }

  void text() {
    std::size_t start = pos;
    ++pos;
    while (pos < src.size() && src[pos] != '<') ++pos;
    for (std::size_t i = start; i < pos; ++i) {
      if (!isSpace(src[i])) {
        open.back()->hasText = true;
        break;
      }
    }
  }

  bool comment() {
    auto end = src.find("-->", pos + 4);
    if (end == std::string_view::npos) return fail("unterminated comment");
    pos = end + 3;
    return true;
  }

  bool declaration() {
    auto end = src.find('>', pos + 2);
    if (end == std::string_view::npos) return fail("unterminated declaration");
    pos = end + 1;
    return true;
  }

  std::string name() {
    std::size_t start = pos;
    while (pos < src.size() && !isSpace(src[pos]) && src[pos] != '>' && src[pos] != '/' &&
           src[pos] != '=')
      ++pos;
    return toLower(src.substr(start, pos - start));
  }

  void skipSpace() {
    while (pos < src.size() && isSpace(src[pos])) ++pos;
  }

  bool endTag() {
    pos += 2;
    std::string tag = name();
    auto end = src.find('>', pos);
    if (end == std::string_view::npos) return fail("unterminated end tag");
    pos = end + 1;
    for (std::size_t i = open.size(); i-- > 1;) {
      if (open[i]->tag == tag) {
        open.resize(i);
        break;
      }
    }
    return true;
  }

  bool startTag() {
    Node* el = dom.create();
    el->begin = pos;
    ++pos;
    el->tag = name();
    el->nameEnd = pos;
    bool selfClosing = false;

    for (;;) {
      skipSpace();
      if (pos >= src.size()) return fail("unterminated <" + el->tag + "> tag");
      if (src[pos] == '>') {
        ++pos;
        break;
      }
      if (src[pos] == '/') {
        ++pos;
        if (pos < src.size() && src[pos] == '>') {
          selfClosing = true;
          ++pos;
          break;
        }
        continue;
      }
      Attribute a;
      a.name = name();
      if (a.name.empty()) {
        ++pos;
        continue;
      }
      std::size_t afterName = pos;
      skipSpace();
      if (pos < src.size() && src[pos] == '=') {
        ++pos;
        skipSpace();
        if (pos >= src.size()) return fail("unterminated attribute");
        a.hasValue = true;
        char q = src[pos];
        if (q == '"' || q == '\'') {
          auto close = src.find(q, pos + 1);
          if (close == std::string_view::npos)
            return fail("unterminated value for attribute '" + a.name + "'");
          a.quoted = true;
          a.valueBegin = pos + 1;
          a.valueEnd = close;
          pos = close + 1;
        } else {
          a.valueBegin = pos;
          while (pos < src.size() && !isSpace(src[pos]) && src[pos] != '>') ++pos;
          a.valueEnd = pos;
        }
        a.value = std::string(src.substr(a.valueBegin, a.valueEnd - a.valueBegin));
      } else {
        a.valueBegin = a.valueEnd = afterName;
      }
      el->attributes.push_back(std::move(a));
    }
    el->openEnd = pos;

    Node* parent = open.back();
    el->parent = parent;
    parent->children.push_back(el);

    if (selfClosing || isVoidElement(el->tag)) return true;

    if (isRawText(el->tag)) {
      std::string closeTag = "</" + el->tag;
      std::size_t scan = pos;
      for (;;) {
        auto hit = src.find("</", scan);
        if (hit == std::string_view::npos) return fail("unterminated <" + el->tag + "> element");
        if (toLower(src.substr(hit, closeTag.size())) == closeTag) {
          el->rawText = std::string(src.substr(pos, hit - pos));
          auto end = src.find('>', hit);
          if (end == std::string_view::npos) return fail("unterminated end tag");
          pos = end + 1;
          return true;
        }
        scan = hit + 2;
      }
    }

    open.push_back(el);
    return true;
  }
};

} // namespace

bool parseHtml(std::string_view source, Dom& out, std::string* error) {
  TreeBuilder builder(source, out, error);
  return builder.run();
}

} // namespace lfx

#include "document/Selector.hpp"
#include <algorithm>
#include <cctype>

namespace lfx {

static bool isIdentChar(char c) {
  unsigned char u = (unsigned char)c;
  return std::isalnum(u) || c == '-' || c == '_' || u >= 0x80;
}

static void appendUtf8(std::string& out, unsigned cp) {
  if (cp < 0x80) {
    out.push_back((char)cp);
  } else if (cp < 0x800) {
    out.push_back((char)(0xC0 | (cp >> 6)));
    out.push_back((char)(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back((char)(0xE0 | (cp >> 12)));
    out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back((char)(0x80 | (cp & 0x3F)));
  } else {
    out.push_back((char)(0xF0 | (cp >> 18)));
    out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back((char)(0x80 | (cp & 0x3F)));
  }
}

namespace {

class SelectorParser {
  std::string_view src;
  std::size_t pos = 0;
  std::string* error;

public:
  SelectorParser(std::string_view s, std::string* e) : src(s), error(e) {}

  bool parseList(std::vector<ComplexSelector>& out) {
    for (;;) {
      ComplexSelector cs;
      if (!parseComplex(cs)) return false;
      out.push_back(std::move(cs));
      skipSpace();
      if (pos >= src.size()) return true;
      if (src[pos] != ',') return fail("unexpected character");
      ++pos;
    }
  }

private:
  bool fail(const std::string& msg) {
    if (error) *error = msg + " at offset " + std::to_string(pos) + " in '" + std::string(src) + "'";
    return false;
  }

  void skipSpace() {
    while (pos < src.size() && std::isspace((unsigned char)src[pos])) ++pos;
  }

  bool atCompoundStart() const {
    if (pos >= src.size()) return false;
    char c = src[pos];
    return c == '*' || c == '#' || c == '.' || c == '[' || c == ':' || c == '\\' ||
           isIdentChar(c);
  }

  bool parseComplex(ComplexSelector& cs) {
    skipSpace();
    CompoundSelector first;
    if (!parseCompound(first)) return false;
    cs.compounds.push_back(std::move(first));
    for (;;) {
      std::size_t before = pos;
      skipSpace();
      bool sawSpace = pos > before;
      Combinator comb = Combinator::Descendant;
      if (pos < src.size() && src[pos] == '>') {
        comb = Combinator::Child;
        ++pos;
        skipSpace();
      } else if (!sawSpace || !atCompoundStart()) {
        return true;
      }
      CompoundSelector next;
      if (!parseCompound(next)) return false;
      cs.combinators.push_back(comb);
      cs.compounds.push_back(std::move(next));
    }
  }

  bool parseIdent(std::string& out) {
    std::size_t start = pos;
    while (pos < src.size()) {
      char c = src[pos];
      if (c == '\\') {
        ++pos;
        if (pos >= src.size()) return fail("dangling escape");
        if (std::isxdigit((unsigned char)src[pos])) {
          unsigned cp = 0;
          int n = 0;
          while (pos < src.size() && n < 6 && std::isxdigit((unsigned char)src[pos])) {
            cp = cp * 16 + (unsigned)std::stoi(std::string(1, src[pos]), nullptr, 16);
            ++pos;
            ++n;
          }
          if (pos < src.size() && src[pos] == ' ') ++pos;
          appendUtf8(out, cp);
        } else {
          out.push_back(src[pos++]);
        }
      } else if (isIdentChar(c)) {
        out.push_back(c);
        ++pos;
      } else {
        break;
      }
    }
    if (pos == start) return fail("expected identifier");
    return true;
  }

  bool parseInt(int& out) {
    skipSpace();
    std::size_t start = pos;
    while (pos < src.size() && std::isdigit((unsigned char)src[pos])) ++pos;
    if (pos == start) return fail("expected integer");
    out = std::stoi(std::string(src.substr(start, pos - start)));
    skipSpace();
    if (pos >= src.size() || src[pos] != ')') return fail("expected ')'");
    ++pos;
    return out > 0 ? true : fail("index must be positive");
  }

  bool parseAttribute(AttributeTest& out) {
    ++pos;  // '['
    skipSpace();
    if (!parseIdent(out.name)) return false;
    std::transform(out.name.begin(), out.name.end(), out.name.begin(),
                   [](char c) { return (char)std::tolower((unsigned char)c); });
    skipSpace();
    if (pos < src.size() && src[pos] == '=') {
      ++pos;
      skipSpace();
      std::string value;
      if (pos < src.size() && (src[pos] == '"' || src[pos] == '\'')) {
        char q = src[pos++];
        while (pos < src.size() && src[pos] != q) {
          if (src[pos] == '\\' && pos + 1 < src.size()) ++pos;
          value.push_back(src[pos++]);
        }
        if (pos >= src.size()) return fail("unterminated attribute value");
        ++pos;
      } else if (!parseIdent(value)) {
        return false;
      }
      out.value = std::move(value);
      skipSpace();
    }
    if (pos >= src.size() || src[pos] != ']') return fail("expected ']'");
    ++pos;
    return true;
  }

  bool parseCompound(CompoundSelector& c) {
    bool any = false;
    if (pos < src.size() && src[pos] == '*') {
      c.universal = true;
      ++pos;
      any = true;
    } else if (pos < src.size() && (isIdentChar(src[pos]) || src[pos] == '\\')) {
      if (!parseIdent(c.tag)) return false;
      std::transform(c.tag.begin(), c.tag.end(), c.tag.begin(),
                     [](char ch) { return (char)std::tolower((unsigned char)ch); });
      any = true;
    }
    while (pos < src.size()) {
      char ch = src[pos];
      if (ch == '#') {
        ++pos;
        std::string id;
        if (!parseIdent(id)) return false;
        c.ids.push_back(std::move(id));
      } else if (ch == '.') {
        ++pos;
        std::string cls;
        if (!parseIdent(cls)) return false;
        c.classes.push_back(std::move(cls));
      } else if (ch == '[') {
        AttributeTest at;
        if (!parseAttribute(at)) return false;
        c.attributes.push_back(std::move(at));
      } else if (ch == ':') {
        ++pos;
        std::string pseudo;
        if (!parseIdent(pseudo)) return false;
        if (pseudo == "root") {
          c.root = true;
        } else if (pseudo == "nth-child" || pseudo == "nth-of-type") {
          if (pos >= src.size() || src[pos] != '(') return fail("expected '('");
          ++pos;
          int n = 0;
          if (!parseInt(n)) return false;
          (pseudo == "nth-child" ? c.nthChild : c.nthOfType) = n;
        } else {
          return fail("unsupported pseudo-class ':" + pseudo + "'");
        }
      } else {
        break;
      }
      any = true;
    }
    if (!any) return fail("empty selector");
    return true;
  }
};

bool matchCompound(const CompoundSelector& c, const Node& n) {
  if (!n.isElement()) return false;
  if (!c.tag.empty() && c.tag != n.tag) return false;
  for (const auto& id : c.ids) {
    auto v = n.attrValue("id");
    if (!v || *v != id) return false;
  }
  if (!c.classes.empty()) {
    auto have = n.classes();
    for (const auto& cls : c.classes)
      if (std::find(have.begin(), have.end(), cls) == have.end()) return false;
  }
  for (const auto& at : c.attributes) {
    const Attribute* a = n.attr(at.name);
    if (!a) return false;
    if (at.value && a->value != *at.value) return false;
  }
  if (c.root && (!n.parent || n.parent->type != NodeType::Document)) return false;
  if (c.nthChild || c.nthOfType) {
    if (!n.parent) return false;
    int child = 0, ofType = 0;
    for (const Node* sib : n.parent->children) {
      ++child;
      if (sib->tag == n.tag) ++ofType;
      if (sib == &n) break;
    }
    if (c.nthChild && c.nthChild != child) return false;
    if (c.nthOfType && c.nthOfType != ofType) return false;
  }
  return true;
}

bool matchComplex(const ComplexSelector& cs, std::size_t idx, const Node& n) {
  if (!matchCompound(cs.compounds[idx], n)) return false;
  if (idx == 0) return true;
  const Node* parent = n.parent;
  if (cs.combinators[idx - 1] == Combinator::Child)
    return parent && parent->isElement() && matchComplex(cs, idx - 1, *parent);
  for (const Node* anc = parent; anc && anc->isElement(); anc = anc->parent)
    if (matchComplex(cs, idx - 1, *anc)) return true;
  return false;
}

} // namespace

bool Selector::parse(std::string_view text, Selector& out, std::string* error) {
  Selector s;
  s.text_ = std::string(text);
  SelectorParser p(text, error);
  if (!p.parseList(s.alternatives_)) return false;
  out = std::move(s);
  return true;
}

bool Selector::matches(const Node& el) const {
  for (const auto& cs : alternatives_)
    if (matchComplex(cs, cs.compounds.size() - 1, el)) return true;
  return false;
}

std::vector<const Node*> Selector::select(const Dom& dom) const {
  std::vector<const Node*> out;
  for (const Node* n : dom.elements())
    if (matches(*n)) out.push_back(n);
  return out;
}

std::string escapeIdent(std::string_view ident) {
  std::string out;
  for (std::size_t i = 0; i < ident.size(); ++i) {
    char c = ident[i];
    if (i == 0 && std::isdigit((unsigned char)c)) {
      static const char* hex = "0123456789abcdef";
      out += '\\';
      out += hex[((unsigned char)c >> 4) & 0xF];
      out += hex[(unsigned char)c & 0xF];
      out += ' ';
    } else if (isIdentChar(c)) {
      out += c;
    } else {
      out += '\\';
      out += c;
    }
  }
  return out;
}

static std::string quoteValue(const std::string& v) {
  std::string out = "\"";
  for (char c : v) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  return out + "\"";
}

static bool uniqueMatch(const Dom& dom, const std::string& text) {
  Selector sel;
  if (!Selector::parse(text, sel, nullptr)) return false;
  return sel.select(dom).size() == 1;
}

std::string selectorFor(const Dom& dom, const Node& el) {
  if (auto id = el.attrValue("id")) {
    if (!id->empty()) {
      std::string s = "#" + escapeIdent(*id);
      if (uniqueMatch(dom, s)) return s;
    }
  }
  for (const auto& a : el.attributes) {
    if (a.name.compare(0, 5, "data-") != 0) continue;
    std::string s = "[" + a.name + (a.hasValue && !a.value.empty() ? "=" + quoteValue(a.value) : "") + "]";
    if (uniqueMatch(dom, s)) return s;
  }

  std::vector<std::string> steps;
  for (const Node* cur = &el; cur && cur->isElement(); cur = cur->parent) {
    if (cur != &el) {
      if (auto id = cur->attrValue("id")) {
        std::string anchor = "#" + escapeIdent(*id);
        if (!id->empty() && uniqueMatch(dom, anchor)) {
          steps.push_back(anchor);
          break;
        }
      }
    }
    if (cur->tag == "body" || cur->tag == "html") {
      steps.push_back(cur->tag);
      break;
    }
    int ofType = 0;
    for (const Node* sib : cur->parent->children) {
      if (sib->tag == cur->tag) ++ofType;
      if (sib == cur) break;
    }
    std::string step = cur->tag + ":nth-of-type(" + std::to_string(ofType) + ")";
    if (cur->parent->type == NodeType::Document) step += ":root";
    steps.push_back(step);
  }
  std::string out;
  for (auto it = steps.rbegin(); it != steps.rend(); ++it) {
    if (!out.empty()) out += " > ";
    out += *it;
  }
  return out;
}

} // namespace lfx

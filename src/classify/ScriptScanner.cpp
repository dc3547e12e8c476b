#include "classify/ScriptScanner.hpp"
#include "support/Log.hpp"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Regex.h"
#include <algorithm>

namespace lfx {

// POSIX ERE, as llvm::Regex expects
static const char* kIdent = "[A-Za-z_$][A-Za-z0-9_$]*";

static const llvm::StringSet<> kBuiltins = {
  "alert", "confirm", "prompt", "setTimeout", "setInterval", "clearTimeout", "clearInterval",
  "requestAnimationFrame", "fetch", "parseInt", "parseFloat", "Number", "String", "Boolean",
  "Array", "Object", "Date", "Math", "JSON", "encodeURIComponent", "decodeURIComponent",
  "isNaN", "eval", "event", "if", "return", "function", "typeof", "new", "void", "for",
  "while", "switch", "catch"};

static void forEachMatch(const llvm::Regex& re, llvm::StringRef text,
                         llvm::function_ref<void(llvm::ArrayRef<llvm::StringRef>)> fn) {
  llvm::SmallVector<llvm::StringRef, 8> m;
  while (!text.empty() && re.match(text, &m)) {
    fn(m);
    size_t next = (size_t)(m[0].data() - text.data()) + std::max<size_t>(m[0].size(), 1);
    text = text.drop_front(next);
  }
}

ScriptScanner::ScriptScanner(const Dom& dom) : dom_(dom) {
  for (const Node* n : dom.elements())
    if (n->tag == "script") scripts_.push_back(n);

  const std::string ident(kIdent);
  llvm::Regex fnDecl("function[[:space:]]+(" + ident + ")");
  llvm::Regex varDecl("(const|let|var)[[:space:]]+(" + ident + ")[[:space:]]*=");
  llvm::Regex winAssign("window\\.(" + ident + ")[[:space:]]*=");
  llvm::Regex byId("getElementById\\([[:space:]]*['\"]([^'\"]+)['\"][[:space:]]*\\)");
  llvm::Regex byQuery("querySelector(All)?\\([[:space:]]*['\"]#([A-Za-z0-9_-]+)['\"][[:space:]]*\\)");
  llvm::Regex direct("getElementById\\([[:space:]]*['\"]([^'\"]+)['\"][[:space:]]*\\)[[:space:]]*\\."
                     "[[:space:]]*(addEventListener|onclick|onpointerdown|onmousedown)");
  llvm::Regex held("(const|let|var)[[:space:]]+(" + ident + ")[[:space:]]*=[[:space:]]*document\\."
                   "(getElementById\\([[:space:]]*['\"]([^'\"]+)['\"]|"
                   "querySelector\\([[:space:]]*['\"]#([A-Za-z0-9_-]+)['\"])");
  llvm::Regex created("(\\.id[[:space:]]*=[[:space:]]*|setAttribute\\([[:space:]]*['\"]id['\"]"
                      "[[:space:]]*,[[:space:]]*)['\"]([^'\"]+)['\"]");

  for (const Node* s : scripts_) {
    llvm::StringRef text(s->rawText);
    forEachMatch(fnDecl, text, [&](llvm::ArrayRef<llvm::StringRef> m) { defined_.insert(m[1]); });
    forEachMatch(varDecl, text, [&](llvm::ArrayRef<llvm::StringRef> m) { defined_.insert(m[2]); });
    forEachMatch(winAssign, text, [&](llvm::ArrayRef<llvm::StringRef> m) { defined_.insert(m[1]); });
    forEachMatch(byId, text, [&](llvm::ArrayRef<llvm::StringRef> m) {
      lookups_.try_emplace(m[1], s);
    });
    forEachMatch(byQuery, text, [&](llvm::ArrayRef<llvm::StringRef> m) {
      lookups_.try_emplace(m[2], s);
    });
    forEachMatch(direct, text, [&](llvm::ArrayRef<llvm::StringRef> m) { boundIds_.insert(m[1]); });
    forEachMatch(held, text, [&](llvm::ArrayRef<llvm::StringRef> m) {
      llvm::StringRef var = m[2];
      llvm::StringRef id = m[4].empty() ? m[5] : m[4];
      if (text.contains((var + ".addEventListener").str()) || text.contains((var + ".onclick").str()))
        boundIds_.insert(id);
    });
    forEachMatch(created, text, [&](llvm::ArrayRef<llvm::StringRef> m) { createdIds_.insert(m[2]); });
  }
  log::debug() << "scripts: " << scripts_.size() << " definitions: " << defined_.size()
               << " lookups: " << lookups_.size() << "\n";
}

bool ScriptScanner::isBound(const Node& el) const {
  auto id = el.attrValue("id");
  return id && boundIds_.count(*id);
}

std::vector<ScriptFault> ScriptScanner::faults() const {
  std::vector<ScriptFault> out;

  // Functions may come from an external script we cannot see
  bool external = llvm::any_of(scripts_, [](const Node* s) { return s->hasAttr("src"); });
  if (!external) {
    llvm::Regex call("(" + std::string(kIdent) + ")[[:space:]]*\\(");
    for (const Node* el : dom_.elements()) {
      for (const auto& a : el->attributes) {
        if (a.name.size() <= 2 || a.name.compare(0, 2, "on") != 0) continue;
        llvm::StringRef value(a.value);
        forEachMatch(call, value, [&](llvm::ArrayRef<llvm::StringRef> m) {
          size_t at = (size_t)(m[0].data() - value.data());
          if (at > 0 && value[at - 1] == '.') return;    // method call
          llvm::StringRef name = m[1];
          if (kBuiltins.count(name) || defines(name)) return;
          bool seen = llvm::any_of(out, [&](const ScriptFault& f) {
            return f.where == el && f.symbol == name;
          });
          if (!seen) out.push_back({ScriptDefect::Cause::UndefinedHandler, name.str(), el});
        });
      }
    }
  }

  for (const auto& entry : lookups_) {
    llvm::StringRef id = entry.getKey();
    if (dom_.byId(id) || createdIds_.count(id)) continue;
    out.push_back({ScriptDefect::Cause::MissingReference, id.str(), entry.getValue()});
  }
  // StringMap iteration order is unspecified
  std::stable_sort(out.begin(), out.end(), [](const ScriptFault& a, const ScriptFault& b) {
    if (a.where->begin != b.where->begin) return a.where->begin < b.where->begin;
    return a.symbol < b.symbol;
  });
  return out;
}

} // namespace lfx

#include "patch/PatchApplier.hpp"
#include "document/HtmlParser.hpp"
#include "document/Selector.hpp"
#include "support/Log.hpp"
#include <algorithm>
#include <unordered_map>

namespace lfx {

namespace {

struct Step {
  const Patch* patch = nullptr;
  std::vector<const Node*> hits;
  bool changed = false;
  std::string skipReason;
};

// Replays every patch against the running class lists of the elements it
// matches. Later patches see the effect of earlier ones.
class ClassPlan {
public:
  explicit ClassPlan(const Dom& dom) : dom_(dom) {}

  std::vector<std::string>& classesOf(const Node* n) {
    auto it = current_.find(n);
    if (it == current_.end()) {
      it = current_.emplace(n, n->classes()).first;
      order_.push_back(n);
    }
    return it->second;
  }

  Step run(const Patch& p, std::vector<ClassChange>* changes) {
    Step step;
    step.patch = &p;
    std::string bad = firstInvalidClass(p);
    if (!bad.empty()) {
      step.skipReason = "invalid class token '" + bad + "'";
      return step;
    }
    Selector sel;
    std::string err;
    if (!Selector::parse(p.selector, sel, &err)) {
      step.skipReason = "invalid selector: " + err;
      return step;
    }
    step.hits = sel.select(dom_);
    if (step.hits.empty()) {
      step.skipReason = "selector matches nothing";
      return step;
    }
    for (const Node* n : step.hits) {
      auto& classes = classesOf(n);
      auto next = p.applyTo(classes);
      if (changes) changes->push_back({p.selector, selectorFor(dom_, *n), classes, next});
      if (next != classes) {
        classes = std::move(next);
        step.changed = true;
      }
    }
    if (!step.changed) step.skipReason = "already in effect";
    return step;
  }

  const std::vector<const Node*>& touched() const { return order_; }
  const std::vector<std::string>& finalClasses(const Node* n) const { return current_.at(n); }

private:
  const Dom& dom_;
  std::unordered_map<const Node*, std::vector<std::string>> current_;
  std::vector<const Node*> order_;
};

std::string join(const std::vector<std::string>& classes) {
  std::string out;
  for (const auto& c : classes) {
    if (!out.empty()) out += ' ';
    out += c;
  }
  return out;
}

// Quote character that can hold `value`, or 0 when neither can
char quoteFor(const std::string& value, char preferred) {
  if (value.find(preferred) == std::string::npos) return preferred;
  char other = preferred == '"' ? '\'' : '"';
  return value.find(other) == std::string::npos ? other : 0;
}

bool editFor(const std::string& text, const Node& n, const std::vector<std::string>& classes,
             TextEdit& out, std::string* error) {
  std::string value = join(classes);
  const Attribute* a = n.attr("class");
  if (!a) {
    char q = quoteFor(value, '"');
    if (!q) {
      if (error) *error = "class list of <" + n.tag + "> needs both quote kinds";
      return false;
    }
    out = TextEdit{n.nameEnd, 0, std::string(" class=") + q + value + q};
    return true;
  }
  if (!a->hasValue) {
    char q = quoteFor(value, '"');
    if (!q) {
      if (error) *error = "class list of <" + n.tag + "> needs both quote kinds";
      return false;
    }
    out = TextEdit{a->valueBegin, 0, std::string("=") + q + value + q};
    return true;
  }
  char current = a->quoted ? text[a->valueBegin - 1] : '"';
  char q = quoteFor(value, current);
  if (!q) {
    if (error) *error = "class list of <" + n.tag + "> needs both quote kinds";
    return false;
  }
  if (a->quoted && q == current) {
    out = TextEdit{a->valueBegin, a->valueEnd - a->valueBegin, value};
  } else if (a->quoted) {
    out = TextEdit{a->valueBegin - 1, a->valueEnd - a->valueBegin + 2, q + value + q};
  } else {
    out = TextEdit{a->valueBegin, a->valueEnd - a->valueBegin, q + value + q};
  }
  return true;
}

} // namespace

bool PatchApplier::applyEdits(std::string& text, std::vector<TextEdit> edits, std::string* error) {
  // apply from highest offset -> lowest to keep offsets valid
  std::sort(edits.begin(), edits.end(), [](const TextEdit& a, const TextEdit& b) {
    return a.offset > b.offset;
  });
  size_t limit = text.size();
  for (const auto& e : edits) {
    if (e.offset + e.length > limit) {
      if (error) *error = "overlapping or out-of-range edit at byte " + std::to_string(e.offset);
      return false;
    }
    limit = e.offset;
  }
  for (const auto& e : edits) text.replace(e.offset, e.length, e.replacement);
  return true;
}

InjectResult PatchApplier::inject(const Document& doc, const PatchSet& patches) {
  InjectResult r;
  r.document = doc;
  if (patches.empty()) {
    r.ok = true;
    return r;
  }

  Dom dom;
  std::string err;
  if (!parseHtml(doc.html, dom, &err)) {
    r.error = "cannot parse document: " + err;
    return r;
  }

  ClassPlan plan(dom);
  const auto list = patches.patches();
  for (const auto& p : list) {
    Step step = plan.run(p, nullptr);
    if (step.changed) {
      ++r.appliedCount;
      r.applied.push_back(p.selector);
    } else {
      log::debug() << "skipping patch for '" << p.selector << "': " << step.skipReason << "\n";
      if (step.skipReason.compare(0, 7, "invalid") == 0)
        log::warn() << "skipping patch: " << step.skipReason << "\n";
      r.skipped.push_back({p.selector, step.skipReason});
    }
  }

  std::vector<TextEdit> edits;
  for (const Node* n : plan.touched()) {
    const auto& classes = plan.finalClasses(n);
    if (classes == n->classes()) continue;
    TextEdit e;
    if (!editFor(doc.html, *n, classes, e, &err)) {
      r.appliedCount = 0;
      r.error = err;
      return r;
    }
    edits.push_back(std::move(e));
  }
  if (edits.empty()) {
    r.ok = true;
    return r;
  }

  std::string text = doc.html;
  if (!applyEdits(text, std::move(edits), &err)) {
    r.appliedCount = 0;
    r.error = err;
    return r;
  }
  Dom check;
  if (!parseHtml(text, check, &err)) {
    r.appliedCount = 0;
    r.error = "patched document does not parse: " + err;
    return r;
  }

  r.ok = true;
  r.document.html = std::move(text);
  r.document.version = doc.version + 1;
  return r;
}

bool PatchApplier::preview(const Document& doc, const PatchSet& patches,
                           std::vector<ClassChange>& out, std::string* error) {
  Dom dom;
  std::string err;
  if (!parseHtml(doc.html, dom, &err)) {
    if (error) *error = "cannot parse document: " + err;
    return false;
  }
  ClassPlan plan(dom);
  const auto list = patches.patches();
  for (const auto& p : list) {
    Step step = plan.run(p, &out);
    if (step.hits.empty()) out.push_back({p.selector, "", {}, {}});
  }
  return true;
}

} // namespace lfx

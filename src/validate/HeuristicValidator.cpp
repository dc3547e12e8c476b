#include "validate/Validator.hpp"
#include "classify/ScriptScanner.hpp"
#include "classify/Stacking.hpp"
#include "classify/StyleAnalyzer.hpp"
#include "document/HtmlParser.hpp"
#include "document/Selector.hpp"
#include "llvm/ADT/StringSet.h"
#include <algorithm>

namespace lfx {

namespace {

// Estimated pixel-delta coverage per interaction. A strong active-state
// pair or a page-changing handler clears the default thresholds; hover or
// focus styling alone does not.
constexpr double kStrongLocal = 0.35;
constexpr double kWeakLocal = 0.10;
constexpr double kFieldLocal = 0.30;
constexpr double kHandlerGlobal = 0.025;

bool hiddenInTree(const Node& el) {
  for (const Node* p = &el; p && p->isElement(); p = p->parent)
    if (analyzeStyle(*p).isHidden()) return true;
  return false;
}

bool backfaceLost(const Node& el, const StyleSnapshot& s) {
  if (!s.backfaceHidden || !isFlipped(s)) return false;
  for (const Node* p = el.parent; p && p->isElement(); p = p->parent)
    if (analyzeStyle(*p).preserve3d) return false;
  return true;
}

class HeuristicValidator final : public Validator {
public:
  bool validate(const Document& doc, ValidationReport& out, std::string* error) override {
    Dom dom;
    std::string err;
    if (!parseHtml(doc.html, dom, &err)) {
      if (error) *error = "cannot render document: " + err;
      return false;
    }
    ScriptScanner scripts(dom);
    llvm::StringSet<> broken;
    ValidationReport report;
    for (const auto& f : scripts.faults()) {
      if (f.cause == ScriptDefect::Cause::UndefinedHandler) {
        report.scriptErrors.push_back("ReferenceError: " + f.symbol + " is not defined");
        broken.insert(selectorFor(dom, *f.where));
      } else {
        report.scriptErrors.push_back("TypeError: element #" + f.symbol + " is null");
      }
    }

    for (const Node* el : dom.elements()) {
      if (!isInteractive(*el)) continue;
      ElementCapture c;
      c.selector = selectorFor(dom, *el);
      StyleSnapshot s = analyzeStyle(*el);

      if (hiddenInTree(*el) || backfaceLost(*el, s) || !offscreenClasses(s).empty()) {
        report.elements.push_back(std::move(c));
        continue;
      }
      if (auto b = findBlockage(dom, *el)) {
        c.intercepted = true;
        c.blocker = selectorFor(dom, *b->blocker);
      } else if (auto b = findLayerConflict(dom, *el)) {
        c.intercepted = true;
        c.blocker = selectorFor(dom, *b->blocker);
      } else if (const Node* p = passThroughAncestor(*el)) {
        c.intercepted = true;
        if (p != el) c.blocker = selectorFor(dom, *p);
      }
      if (c.intercepted) {
        report.elements.push_back(std::move(c));
        continue;
      }

      if (s.feedback == FeedbackLevel::Strong) c.localDelta = kStrongLocal;
      else if (s.feedback == FeedbackLevel::Weak) c.localDelta = kWeakLocal;
      if (el->tag == "input" || el->tag == "select" || el->tag == "textarea")
        c.localDelta = std::max(c.localDelta, kFieldLocal);

      bool acts = (hasInlineHandler(*el) && !broken.count(c.selector)) || scripts.isBound(*el);
      auto href = el->attrValue("href");
      if (el->tag == "a" && href && !href->empty() && *href != "#") acts = true;
      if (acts) c.globalDelta = kHandlerGlobal;
      report.elements.push_back(std::move(c));
    }
    out = std::move(report);
    return true;
  }
};

} // namespace

Validator* makeHeuristicValidator() { return new HeuristicValidator(); }

} // namespace lfx

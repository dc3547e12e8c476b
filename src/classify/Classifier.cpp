#include "classify/Classifier.hpp"
#include "classify/ScriptScanner.hpp"
#include "classify/Stacking.hpp"
#include "classify/StyleAnalyzer.hpp"
#include "document/HtmlParser.hpp"
#include "document/Selector.hpp"
#include "support/Log.hpp"
#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/Regex.h"
#include <algorithm>
#include <unordered_map>

namespace lfx {

namespace {

// Static evidence never exceeds kStaticCeiling; a failed capture that
// agrees with it lifts the defect to kConfirmed.
constexpr double kStaticCeiling = 0.8;
constexpr double kConfirmed = 0.95;
constexpr double kReportOnly = 0.85;
constexpr double kUnattributed = 0.4;

struct Context {
  const Dom* dom = nullptr;
  const ScriptScanner* scripts = nullptr;
  std::vector<ClassifiedError>* out = nullptr;
};

class Detector {
public:
  explicit Detector(Context& c) : Ctx(c) {}
  virtual ~Detector() = default;
  virtual void run(const Node& el, const std::string& selector, const StyleSnapshot& style) = 0;

protected:
  Context& Ctx;

  ClassifiedError& emit(ErrorKind kind, const Node& el, const std::string& selector,
                        const StyleSnapshot& style, double confidence, std::string rationale) {
    ClassifiedError e = makeError(std::move(kind), selector, el.tag,
                                  std::min(confidence, kStaticCeiling), std::move(rationale));
    e.style = style;
    Ctx.out->push_back(std::move(e));
    return Ctx.out->back();
  }
};

class HiddenDetector : public Detector {
public:
  using Detector::Detector;
  void run(const Node& el, const std::string& selector, const StyleSnapshot& s) override {
    if (s.opacity <= 0.0) {
      VisibilityDefect d{VisibilityDefect::Cause::Opacity, s.opacityClass, s.inlineHidden};
      emit(d, el, selector, s, 0.8, "opacity is 0");
    }
    if (s.display == "none") {
      VisibilityDefect d{VisibilityDefect::Cause::Display, s.displayClass, s.inlineHidden};
      emit(d, el, selector, s, 0.8, "display is none");
    }
    if (s.visibilityHidden) {
      VisibilityDefect d{VisibilityDefect::Cause::Visibility, s.visibilityClass, s.inlineHidden};
      emit(d, el, selector, s, 0.8, "visibility is hidden");
    }
  }
};

// At most one cover per element: an overlay on top, a higher layer that
// may overlap, or pass-through inherited from an ancestor.
class CoverDetector : public Detector {
public:
  using Detector::Detector;
  void run(const Node& el, const std::string& selector, const StyleSnapshot& s) override {
    if (auto b = findBlockage(*Ctx.dom, el)) {
      PointerDefect d{b->decorative ? PointerDefect::Cause::Overlay : PointerDefect::Cause::Blocked,
                      b->blockerLayer};
      auto& e = emit(d, el, selector, s, 0.8,
                     std::string(b->decorative ? "decorative overlay" : "overlay") +
                       " at layer " + std::to_string(b->blockerLayer) + " covers it");
      e.blocker = selectorFor(*Ctx.dom, *b->blocker);
      return;
    }
    if (auto b = findLayerConflict(*Ctx.dom, el)) {
      StackingDefect d{StackingDefect::Cause::Conflict, b->blockerLayer, roleOf(el)};
      auto& e = emit(d, el, selector, s, 0.7,
                     "positioned element at layer " + std::to_string(b->blockerLayer) +
                       " may overlap it");
      e.blocker = selectorFor(*Ctx.dom, *b->blocker);
      return;
    }
    if (const Node* p = passThroughAncestor(el)) {
      PointerDefect d{PointerDefect::Cause::Intercepted, std::nullopt};
      auto& e = emit(d, el, selector, s, 0.75,
                     p == &el ? "pointer-events-none on the element"
                              : "inherits pointer-events-none");
      if (p != &el) e.blocker = selectorFor(*Ctx.dom, *p);
    }
  }
};

// Out-of-flow element without a layer among layered siblings
class LayerGapDetector : public Detector {
public:
  using Detector::Detector;
  void run(const Node& el, const std::string& selector, const StyleSnapshot& s) override {
    if (!s.isOutOfFlow() || s.layer || s.isHidden() || !el.parent) return;
    bool covered = llvm::any_of(*Ctx.out, [&](const ClassifiedError& e) {
      return e.selector == selector &&
             (e.family() == Family::Pointer || e.family() == Family::Stacking);
    });
    if (covered) return;
    for (const Node* sib : el.parent->children) {
      if (sib == &el) continue;
      StyleSnapshot o = analyzeStyle(*sib);
      if (o.isPositioned() && o.layer) {
        StackingDefect d{StackingDefect::Cause::Missing, std::nullopt, roleOf(el)};
        emit(d, el, selector, s, 0.6, "no layer index beside layered siblings");
        return;
      }
    }
  }
};

class TransformDetector : public Detector {
public:
  using Detector::Detector;
  void run(const Node& el, const std::string& selector, const StyleSnapshot& s) override {
    if (s.backfaceHidden && isFlipped(s)) {
      bool preserved = false;
      for (const Node* p = el.parent; p && p->isElement(); p = p->parent)
        if (analyzeStyle(*p).preserve3d) preserved = true;
      if (!preserved) {
        TransformDefect d;
        d.cause = TransformDefect::Cause::Backface;
        if (el.parent && el.parent->isElement())
          d.containerSelector = selectorFor(*Ctx.dom, *el.parent);
        emit(d, el, selector, s, 0.7, "flipped with backface hidden outside a 3-D context");
      }
    }
    auto off = offscreenClasses(s);
    if (!off.empty()) {
      TransformDefect d;
      d.cause = TransformDefect::Cause::Offscreen;
      d.offendingClasses = off;
      emit(d, el, selector, s, 0.7, "translated out of view by " + off.front());
    }
  }
};

// Click targets with no behavior of their own rely on visual feedback
class FeedbackDetector : public Detector {
public:
  using Detector::Detector;
  void run(const Node& el, const std::string& selector, const StyleSnapshot& s) override {
    if (!isClickType(el) || el.tag == "input" || s.isHidden()) return;
    if (hasInlineHandler(el) || Ctx.scripts->isBound(el)) return;
    if (el.tag == "a" && el.hasAttr("href")) return;
    if (s.feedback == FeedbackLevel::Strong) return;
    FeedbackDefect d;
    d.cause = s.feedback == FeedbackLevel::Weak ? FeedbackDefect::Cause::TooSubtle
                                                : FeedbackDefect::Cause::Missing;
    emit(d, el, selector, s, 0.6,
         s.feedback == FeedbackLevel::Weak ? "only hover/focus feedback" : "no visible feedback");
  }
};

class LayoutClassifier final : public Classifier {
public:
  bool classify(const Document& doc, const ValidationReport* report, const Thresholds& t,
                std::vector<ClassifiedError>& out, std::string* error) const override {
    Dom dom;
    std::string parseError;
    if (!parseHtml(doc.html, dom, &parseError)) {
      if (error) *error = "cannot parse document: " + parseError;
      return false;
    }
    ScriptScanner scripts(dom);
    auto faults = scripts.faults();

    std::unordered_map<const Node*, const ElementCapture*> captures;
    if (report) mapCaptures(dom, *report, captures);

    std::vector<ClassifiedError> found;
    Context ctx;
    ctx.dom = &dom;
    ctx.scripts = &scripts;

    std::vector<std::unique_ptr<Detector>> detectors;
    detectors.push_back(std::make_unique<HiddenDetector>(ctx));
    detectors.push_back(std::make_unique<CoverDetector>(ctx));
    detectors.push_back(std::make_unique<LayerGapDetector>(ctx));
    detectors.push_back(std::make_unique<TransformDetector>(ctx));
    detectors.push_back(std::make_unique<FeedbackDetector>(ctx));

    size_t interactive = 0;
    for (const Node* el : dom.elements()) {
      if (!isInteractive(*el)) continue;
      ++interactive;
      std::string selector = selectorFor(dom, *el);
      StyleSnapshot style = analyzeStyle(*el);
      auto cap = captures.find(el);
      const ElementCapture* capture = cap == captures.end() ? nullptr : cap->second;
      if (capture && capture->box) style.boundingBox = capture->box;

      std::vector<ClassifiedError> local;
      ctx.out = &local;
      for (auto& d : detectors) d->run(*el, selector, style);
      for (const auto& f : faults)
        if (f.where == el) local.push_back(scriptError(f, selector, el->tag, style));

      if (capture) resolve(dom, *el, selector, style, *capture, t, local);
      for (auto& e : local) found.push_back(std::move(e));
    }

    // Faults outside interactive elements: script lookups, handlers on
    // elements that are not otherwise interactive
    for (const auto& f : faults) {
      if (isInteractive(*f.where)) continue;
      found.push_back(scriptError(f, selectorFor(dom, *f.where), f.where->tag, analyzeStyle(*f.where)));
    }
    if (report) applyScriptErrors(dom, scripts, *report, found);

    prioritize(found);
    log::debug() << "classified " << found.size() << " defect(s) over " << interactive
                 << " interactive element(s)\n";
    out = std::move(found);
    return true;
  }

private:
  static void mapCaptures(const Dom& dom, const ValidationReport& report,
                          std::unordered_map<const Node*, const ElementCapture*>& out) {
    for (const auto& c : report.elements) {
      Selector sel;
      std::string err;
      if (!Selector::parse(c.selector, sel, &err)) {
        log::warn() << "ignoring capture with bad selector: " << err << "\n";
        continue;
      }
      auto hits = sel.select(dom);
      if (hits.empty()) log::debug() << "capture '" << c.selector << "' matches nothing\n";
      for (const Node* n : hits) out.emplace(n, &c);
    }
  }

  static ClassifiedError scriptError(const ScriptFault& f, const std::string& selector,
                                     const std::string& tag, const StyleSnapshot& style) {
    ScriptDefect d{f.cause, f.symbol};
    std::string why = f.cause == ScriptDefect::Cause::UndefinedHandler
                        ? "handler calls undefined function '" + f.symbol + "'"
                        : "script looks up missing element #" + f.symbol;
    ClassifiedError e = makeError(d, selector, tag, kStaticCeiling, why);
    e.style = style;
    return e;
  }

  // Folds one capture into the static findings for the same element.
  static void resolve(const Dom& dom, const Node& el, const std::string& selector,
                      const StyleSnapshot& style, const ElementCapture& c, const Thresholds& t,
                      std::vector<ClassifiedError>& local) {
    if (elementPasses(c, t)) {
      // The interaction works; only script faults stay relevant
      local.erase(std::remove_if(local.begin(), local.end(),
                                 [](const ClassifiedError& e) { return e.family() != Family::Script; }),
                  local.end());
      return;
    }

    for (auto& e : local) e.setConfidence(kConfirmed);
    bool pointerKnown = llvm::any_of(local, [](const ClassifiedError& e) {
      return e.family() == Family::Pointer || e.family() == Family::Stacking;
    });

    if (c.intercepted && !pointerKnown) {
      PointerDefect d{PointerDefect::Cause::Blocked, std::nullopt};
      const Node* blocker = nullptr;
      if (!c.blocker.empty()) {
        Selector sel;
        if (Selector::parse(c.blocker, sel, nullptr)) {
          auto hits = sel.select(dom);
          if (!hits.empty()) blocker = hits.front();
        }
      }
      if (blocker) d.blockerLayer = analyzeStyle(*blocker).layer.value_or(0);
      ClassifiedError e = makeError(d, selector, el.tag, kReportOnly,
                                    "click intercepted" + (c.blocker.empty() ? std::string()
                                                                             : " by " + c.blocker));
      if (!c.blocker.empty()) e.blocker = c.blocker;
      e.style = style;
      local.push_back(std::move(e));
      return;
    }
    if (!local.empty()) return;

    if (!c.error.empty() || style.feedback == FeedbackLevel::Strong) {
      UnknownDefect d{c.error.empty() ? "strong feedback but no visible change" : c.error};
      ClassifiedError e = makeError(d, selector, el.tag, kUnattributed,
                                    "interaction failed with no attributable cause");
      e.style = style;
      local.push_back(std::move(e));
      return;
    }

    FeedbackDefect d;
    d.cause = FeedbackDefect::Cause::TooSubtle;
    d.localDelta = c.localDelta;
    d.globalDelta = c.globalDelta;
    d.hasHandler = hasInlineHandler(el);
    ClassifiedError e = makeError(d, selector, el.tag, kReportOnly, "no qualifying visible change");
    e.style = style;
    local.push_back(std::move(e));
  }

  // Runtime errors confirm static script faults or add report-only ones
  static void applyScriptErrors(const Dom& dom, const ScriptScanner& scripts,
                                const ValidationReport& report, std::vector<ClassifiedError>& found) {
    llvm::Regex undefinedRe("([A-Za-z_$][A-Za-z0-9_$]*) is not defined");
    for (const auto& msg : report.scriptErrors) {
      llvm::SmallVector<llvm::StringRef, 2> m;
      bool undefinedName = undefinedRe.match(msg, &m);
      std::string symbol = undefinedName ? m[1].str() : std::string();
      bool confirmed = false;
      for (auto& e : found) {
        const auto* d = std::get_if<ScriptDefect>(&e.kind);
        if (!d) continue;
        if ((undefinedName && d->cause == ScriptDefect::Cause::UndefinedHandler && d->symbol == symbol) ||
            (!undefinedName && d->cause == ScriptDefect::Cause::MissingReference)) {
          e.setConfidence(kConfirmed);
          confirmed = true;
        }
      }
      if (confirmed) continue;
      const Node* script = scripts.firstScript();
      if (!script) {
        log::debug() << "script error without a script element: " << msg << "\n";
        continue;
      }
      ClassifiedError e = undefinedName
        ? makeError(ScriptDefect{ScriptDefect::Cause::UndefinedHandler, symbol},
                    selectorFor(dom, *script), script->tag, kReportOnly, msg)
        : makeError(UnknownDefect{msg}, selectorFor(dom, *script), script->tag, kUnattributed, msg);
      found.push_back(std::move(e));
    }
  }
};

} // namespace

static int familyRank(Family f) { return static_cast<int>(f); }

void prioritize(std::vector<ClassifiedError>& errors) {
  std::stable_sort(errors.begin(), errors.end(),
                   [](const ClassifiedError& a, const ClassifiedError& b) {
                     int fa = familyRank(a.family()), fb = familyRank(b.family());
                     if (fa != fb) return fa < fb;
                     if (a.confidence != b.confidence) return a.confidence > b.confidence;
                     return a.selector < b.selector;
                   });
}

std::unique_ptr<Classifier> makeLayoutClassifier() { return std::make_unique<LayoutClassifier>(); }

} // namespace lfx

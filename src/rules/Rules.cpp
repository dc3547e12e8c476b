#include "rules/Rule.hpp"
#include "classify/StyleAnalyzer.hpp"
#include "rules/Tailwind.hpp"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringRef.h"
#include <algorithm>

namespace lfx {

bool Rule::declares(KindId id) const {
  return llvm::is_contained(handles(), id);
}

namespace {

Patch patchFor(const ClassifiedError& e, const char* rule) {
  Patch p;
  p.selector = e.selector;
  p.rationale = std::string(rule) + ": " + kindName(e.id());
  return p;
}

// Layer classes currently on the element
void dropLayers(Patch& p, const StyleSnapshot& s) {
  for (const auto& c : s.classes)
    if (isLayerClass(c)) p.removeClass(c);
}

void raiseAbove(Patch& p, const StyleSnapshot& s, std::optional<int> blockerLayer) {
  std::optional<int> floor = s.layer;
  if (blockerLayer && (!floor || *blockerLayer > *floor)) floor = blockerLayer;
  dropLayers(p, s);
  p.addClass(tw::layerClass(tw::layerAbove(floor)));
  if (!s.isPositioned()) p.addClass(tw::Relative);
}

class VisibilityRule final : public Rule {
  std::vector<KindId> kinds{KindId::HiddenOpacity, KindId::HiddenDisplay, KindId::HiddenVisibility};

public:
  const char* name() const override { return "visibility-restore"; }
  int priority() const override { return 5; }
  const std::vector<KindId>& handles() const override { return kinds; }

  std::vector<Patch> generateFix(const ClassifiedError& e) const override {
    const auto& d = std::get<VisibilityDefect>(e.kind);
    const StyleSnapshot& s = e.style;
    // Inline declarations only lose to !important utilities
    std::string bang = d.fromInlineStyle ? "!" : "";
    Patch p = patchFor(e, name());
    switch (d.cause) {
    case VisibilityDefect::Cause::Opacity:
      for (const auto& c : s.classes) {
        llvm::StringRef u(baseClass(c).data(), baseClass(c).size());
        if (u.startswith("opacity-") && u != "opacity-100") p.removeClass(c);
      }
      p.addClass(bang + "opacity-100");
      break;
    case VisibilityDefect::Cause::Display: {
      for (const auto& c : s.classes)
        if (baseClass(c) == "hidden") p.removeClass(c);
      bool inlineTag = e.tag == "a" || e.tag == "span" || e.tag == "button" ||
                       e.tag == "label" || e.tag == "input" || e.tag == "select" ||
                       e.tag == "textarea";
      p.addClass(bang + (inlineTag ? "inline-block" : "block"));
      break;
    }
    case VisibilityDefect::Cause::Visibility:
      for (const auto& c : s.classes)
        if (baseClass(c) == "invisible") p.removeClass(c);
      p.addClass(bang + "visible");
      break;
    }
    return {p};
  }
};

class StackingRule final : public Rule {
  std::vector<KindId> kinds{KindId::LayerConflict, KindId::LayerMissing};

public:
  const char* name() const override { return "stacking-fix"; }
  int priority() const override { return 15; }
  const std::vector<KindId>& handles() const override { return kinds; }

  std::vector<Patch> generateFix(const ClassifiedError& e) const override {
    const auto& d = std::get<StackingDefect>(e.kind);
    Patch p = patchFor(e, name());
    if (d.blockerLayer) {
      raiseAbove(p, e.style, d.blockerLayer);
    } else {
      dropLayers(p, e.style);
      int level = tw::roleLayer(d.role);
      if (e.style.layer && *e.style.layer >= level) level = tw::layerAbove(e.style.layer);
      p.addClass(tw::layerClass(level));
      if (!e.style.isPositioned()) p.addClass(tw::Relative);
    }
    return {p};
  }
};

// Victim is routed explicitly and lifted; a covering element becomes
// pass-through.
class PointerRule final : public Rule {
  std::vector<KindId> kinds{KindId::PointerBlocked, KindId::PointerIntercepted};

public:
  const char* name() const override { return "pointer-routing-fix"; }
  int priority() const override { return 25; }
  const std::vector<KindId>& handles() const override { return kinds; }

  std::vector<Patch> generateFix(const ClassifiedError& e) const override {
    const auto& d = std::get<PointerDefect>(e.kind);
    Patch victim = patchFor(e, name());
    victim.addClass(tw::PointerAuto);
    victim.removeClass(tw::PointerNone);
    if (d.cause == PointerDefect::Cause::Intercepted) return {victim};

    raiseAbove(victim, e.style, d.blockerLayer);
    std::vector<Patch> out{victim};
    if (e.blocker && *e.blocker != e.selector) {
      Patch cover;
      cover.selector = *e.blocker;
      cover.addClass(tw::PointerNone);
      cover.removeClass(tw::PointerAuto);
      cover.rationale = std::string(name()) + ": pass-through for " + e.selector;
      out.push_back(std::move(cover));
    }
    return out;
  }
};

class PassthroughRule final : public Rule {
  std::vector<KindId> kinds{KindId::OverlayIntercept};

public:
  const char* name() const override { return "passthrough"; }
  int priority() const override { return 26; }
  const std::vector<KindId>& handles() const override { return kinds; }

  std::vector<Patch> generateFix(const ClassifiedError& e) const override {
    std::vector<Patch> out;
    if (e.blocker && *e.blocker != e.selector) {
      Patch overlay;
      overlay.selector = *e.blocker;
      overlay.addClass(tw::PointerNone);
      overlay.removeClass(tw::PointerAuto);
      overlay.rationale = std::string(name()) + ": decorative overlay";
      out.push_back(std::move(overlay));
    }
    Patch victim = patchFor(e, name());
    victim.addClass(tw::PointerAuto);
    victim.removeClass(tw::PointerNone);
    out.push_back(std::move(victim));
    return out;
  }
};

class TransformRule final : public Rule {
  std::vector<KindId> kinds{KindId::BackfaceHidden, KindId::Offscreen};

public:
  const char* name() const override { return "spatial-transform-fix"; }
  int priority() const override { return 30; }
  const std::vector<KindId>& handles() const override { return kinds; }

  std::vector<Patch> generateFix(const ClassifiedError& e) const override {
    const auto& d = std::get<TransformDefect>(e.kind);
    std::vector<Patch> out;
    Patch p = patchFor(e, name());
    if (d.cause == TransformDefect::Cause::Backface) {
      if (!d.containerSelector.empty()) {
        Patch container;
        container.selector = d.containerSelector;
        container.addClass(tw::Preserve3d);
        container.addClass(tw::Perspective);
        container.rationale = std::string(name()) + ": 3-D context for " + e.selector;
        out.push_back(std::move(container));
      }
      for (const auto& c : e.style.classes) {
        auto b = baseClass(c);
        if (b == "backface-hidden" || b == "[backface-visibility:hidden]") p.removeClass(c);
      }
      p.addClass(tw::BackfaceVisible);
    } else {
      for (const auto& c : d.offendingClasses) p.removeClass(c);
      p.addClass("translate-x-0");
      p.addClass("translate-y-0");
    }
    out.push_back(std::move(p));
    return out;
  }
};

class FeedbackRule final : public Rule {
  std::vector<KindId> kinds{KindId::FeedbackTooSubtle};

public:
  const char* name() const override { return "feedback-amplifier"; }
  int priority() const override { return 50; }
  const std::vector<KindId>& handles() const override { return kinds; }

  std::vector<Patch> generateFix(const ClassifiedError& e) const override {
    Patch p = patchFor(e, name());
    for (const char* c : {"active:scale-95", "active:brightness-75", "focus:ring-4",
                          "focus:ring-blue-500", "transition-all", "duration-150"})
      p.addClass(c);
    return {p};
  }
};

} // namespace

std::unique_ptr<Rule> makeVisibilityRule() { return std::make_unique<VisibilityRule>(); }
std::unique_ptr<Rule> makeStackingRule() { return std::make_unique<StackingRule>(); }
std::unique_ptr<Rule> makePointerRule() { return std::make_unique<PointerRule>(); }
std::unique_ptr<Rule> makePassthroughRule() { return std::make_unique<PassthroughRule>(); }
std::unique_ptr<Rule> makeTransformRule() { return std::make_unique<TransformRule>(); }
std::unique_ptr<Rule> makeFeedbackRule() { return std::make_unique<FeedbackRule>(); }

} // namespace lfx

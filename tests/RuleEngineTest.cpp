#include "classify/Classifier.hpp"
#include "patch/PatchApplier.hpp"
#include "rules/RuleEngine.hpp"
#include "rules/Tailwind.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace lfx;

namespace {

bool has(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

const ElementCapture* captureFor(const ValidationReport& r, const std::string& selector) {
  for (const auto& c : r.elements)
    if (c.selector == selector) return &c;
  return nullptr;
}

ClassifiedError sampleFor(KindId id) {
  switch (id) {
  case KindId::HiddenOpacity:
    return makeError(VisibilityDefect{VisibilityDefect::Cause::Opacity, "opacity-0", false},
                     "#e", "button", 0.8, "");
  case KindId::HiddenDisplay:
    return makeError(VisibilityDefect{VisibilityDefect::Cause::Display, "hidden", false},
                     "#e", "div", 0.8, "");
  case KindId::HiddenVisibility:
    return makeError(VisibilityDefect{VisibilityDefect::Cause::Visibility, "invisible", false},
                     "#e", "button", 0.8, "");
  case KindId::LayerConflict:
    return makeError(StackingDefect{StackingDefect::Cause::Conflict, 40, LayerRole::Content},
                     "#e", "button", 0.7, "");
  case KindId::LayerMissing:
    return makeError(StackingDefect{StackingDefect::Cause::Missing, std::nullopt, LayerRole::Overlay},
                     "#e", "div", 0.6, "");
  case KindId::PointerBlocked:
    return makeError(PointerDefect{PointerDefect::Cause::Blocked, 20}, "#e", "button", 0.8, "");
  case KindId::PointerIntercepted:
    return makeError(PointerDefect{PointerDefect::Cause::Intercepted, std::nullopt}, "#e",
                     "button", 0.75, "");
  case KindId::OverlayIntercept:
    return makeError(PointerDefect{PointerDefect::Cause::Overlay, 0}, "#e", "button", 0.8, "");
  case KindId::BackfaceHidden: {
    TransformDefect d;
    d.cause = TransformDefect::Cause::Backface;
    return makeError(d, "#e", "button", 0.7, "");
  }
  case KindId::Offscreen: {
    TransformDefect d;
    d.cause = TransformDefect::Cause::Offscreen;
    d.offendingClasses = {"-translate-x-full"};
    return makeError(d, "#e", "button", 0.7, "");
  }
  case KindId::FeedbackTooSubtle:
    return makeError(FeedbackDefect{}, "#e", "button", 0.6, "");
  case KindId::FeedbackMissing: {
    FeedbackDefect d;
    d.cause = FeedbackDefect::Cause::Missing;
    return makeError(d, "#e", "button", 0.6, "");
  }
  case KindId::UndefinedHandler:
    return makeError(ScriptDefect{ScriptDefect::Cause::UndefinedHandler, "f"}, "#e", "button", 0.8, "");
  case KindId::MissingReference:
    return makeError(ScriptDefect{ScriptDefect::Cause::MissingReference, "x"}, "#e", "script", 0.8, "");
  case KindId::Unknown:
    return makeError(UnknownDefect{}, "#e", "button", 0.4, "");
  }
  return makeError(UnknownDefect{}, "#e", "button", 0.4, "");
}

} // namespace

TEST(RuleEngine, EveryDeterministicKindGetsAPatchOnItsSelector) {
  RuleEngine engine = makeDefaultRuleEngine();
  EXPECT_EQ(engine.size(), 6u);
  for (int i = 0; i <= static_cast<int>(KindId::Unknown); ++i) {
    KindId id = static_cast<KindId>(i);
    ClassifiedError e = sampleFor(id);
    PatchSet set = engine.applySingle(e);
    if (isDeterministicFixable(id)) {
      ASSERT_NE(engine.ruleFor(id), nullptr) << kindName(id);
      EXPECT_FALSE(set.empty()) << kindName(id);
      EXPECT_NE(set.find("#e"), nullptr) << kindName(id);
    } else {
      EXPECT_TRUE(set.empty()) << kindName(id);
    }
  }
}

TEST(RuleEngine, RejectsOverlappingRegistration) {
  RuleEngine engine;
  std::string err;
  ASSERT_TRUE(engine.registerRule(makeFeedbackRule(), &err));
  ASSERT_TRUE(engine.registerRule(makeVisibilityRule(), &err));
  EXPECT_FALSE(engine.registerRule(makeFeedbackRule(), &err));
  EXPECT_NE(err.find("feedback-amplifier"), std::string::npos);
  EXPECT_EQ(engine.size(), 2u);
}

TEST(RuleEngine, RulesRunInFamilyOrder) {
  RuleEngine engine = makeDefaultRuleEngine();
  ClassifiedError feedback = sampleFor(KindId::FeedbackTooSubtle);
  feedback.selector = "#late";
  ClassifiedError hidden = sampleFor(KindId::HiddenOpacity);
  hidden.selector = "#early";
  PatchSet set = engine.applyRules({feedback, hidden});
  auto list = set.patches();
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].selector, "#early");
  EXPECT_EQ(list[1].selector, "#late");
}

TEST(RuleEngine, StackingLevels) {
  EXPECT_EQ(tw::layerAbove(std::nullopt), 20);
  EXPECT_EQ(tw::layerAbove(5), 20);
  EXPECT_EQ(tw::layerAbove(20), 50);
  EXPECT_EQ(tw::layerAbove(50), 60);
  EXPECT_EQ(tw::layerClass(50), "z-50");
  EXPECT_EQ(tw::layerClass(60), "z-[60]");

  ClassifiedError missing = sampleFor(KindId::LayerMissing);
  PatchSet set = makeDefaultRuleEngine().applySingle(missing);
  ASSERT_NE(set.find("#e"), nullptr);
  EXPECT_TRUE(has(set.find("#e")->add, "z-40"));
}

TEST(RuleEngine, VisibilityRuleUsesImportantAgainstInlineStyle) {
  ClassifiedError e = makeError(VisibilityDefect{VisibilityDefect::Cause::Display, "", true},
                                "#e", "button", 0.8, "");
  PatchSet set = makeDefaultRuleEngine().applySingle(e);
  ASSERT_NE(set.find("#e"), nullptr);
  EXPECT_TRUE(has(set.find("#e")->add, "!inline-block"));
}

// An element at layer 10 behind an overlay at layer 20
TEST(RuleEngine, RaisesBlockedElementAndRoutesOverlay) {
  Document doc{R"html(<html><body>
<div class="relative">
  <button id="buy" class="relative z-10 active:scale-95 active:brightness-75" onclick="buy()">Buy</button>
  <div id="shade" class="absolute inset-0 z-20 bg-white"><p>Loading</p></div>
</div>
<script>function buy() { document.title = 'bought'; }</script>
</body></html>)html", 0};

  auto classifier = makeLayoutClassifier();
  std::vector<ClassifiedError> errors;
  std::string err;
  ASSERT_TRUE(classifier->classify(doc, nullptr, Thresholds(), errors, &err)) << err;
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].id(), KindId::PointerBlocked);
  EXPECT_EQ(*errors[0].blocker, "#shade");

  PatchSet set = makeDefaultRuleEngine().applyRules(errors);
  const Patch* victim = set.find("#buy");
  ASSERT_NE(victim, nullptr);
  EXPECT_TRUE(has(victim->add, "z-50"));
  EXPECT_TRUE(has(victim->remove, "z-10"));
  const Patch* overlay = set.find("#shade");
  ASSERT_NE(overlay, nullptr);
  EXPECT_TRUE(has(overlay->add, "pointer-events-none"));

  InjectResult fixed = PatchApplier::inject(doc, set);
  ASSERT_TRUE(fixed.ok) << fixed.error;
  EXPECT_EQ(fixed.appliedCount, 2u);

  std::unique_ptr<Validator> validator(makeHeuristicValidator());
  ValidationReport report;
  ASSERT_TRUE(validator->validate(fixed.document, report, &err)) << err;
  const ElementCapture* c = captureFor(report, "#buy");
  ASSERT_NE(c, nullptr);
  EXPECT_FALSE(c->intercepted);
  EXPECT_TRUE(elementPasses(*c, Thresholds()));
}

// Weak feedback with high confidence gets an active-state pair
TEST(RuleEngine, AmplifiesWeakFeedbackPastLocalThreshold) {
  Document doc{"<html><body><button id=\"save\" class=\"px-4 hover:bg-blue-600\">Save</button>"
               "</body></html>", 0};
  ClassifiedError e = makeError(FeedbackDefect{}, "#save", "button", 0.9, "weak feedback");
  ASSERT_FALSE(e.requiresGenerative);

  PatchSet set = makeDefaultRuleEngine().applySingle(e);
  const Patch* p = set.find("#save");
  ASSERT_NE(p, nullptr);
  EXPECT_TRUE(has(p->add, "active:scale-95"));
  EXPECT_TRUE(has(p->add, "active:brightness-75"));

  std::unique_ptr<Validator> validator(makeHeuristicValidator());
  std::string err;
  ValidationReport before;
  ASSERT_TRUE(validator->validate(doc, before, &err)) << err;
  ASSERT_NE(captureFor(before, "#save"), nullptr);
  EXPECT_LT(captureFor(before, "#save")->localDelta, 0.30);

  InjectResult fixed = PatchApplier::inject(doc, set);
  ASSERT_TRUE(fixed.ok) << fixed.error;
  ValidationReport after;
  ASSERT_TRUE(validator->validate(fixed.document, after, &err)) << err;
  const ElementCapture* c = captureFor(after, "#save");
  ASSERT_NE(c, nullptr);
  EXPECT_GE(c->localDelta, 0.30);
}

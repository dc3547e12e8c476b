#include "classify/Classifier.hpp"
#include "classify/StyleAnalyzer.hpp"
#include "document/HtmlParser.hpp"
#include <gtest/gtest.h>

using namespace lfx;

namespace {

std::vector<ClassifiedError> classify(const std::string& html,
                                      const ValidationReport* report = nullptr) {
  auto classifier = makeLayoutClassifier();
  std::vector<ClassifiedError> out;
  std::string err;
  Document doc{html, 0};
  EXPECT_TRUE(classifier->classify(doc, report, Thresholds(), out, &err)) << err;
  return out;
}

const ClassifiedError* findKind(const std::vector<ClassifiedError>& errors, KindId id,
                                const std::string& selector) {
  for (const auto& e : errors)
    if (e.id() == id && e.selector == selector) return &e;
  return nullptr;
}

const char* kCoveredButton = R"html(<html><body>
<div class="relative">
  <button id="buy" class="relative z-10 active:scale-95 active:brightness-75" onclick="buy()">Buy</button>
  <div id="shade" class="absolute inset-0 z-20 bg-white"><p>Loading</p></div>
</div>
<script>function buy() { document.title = 'bought'; }</script>
</body></html>)html";

} // namespace

TEST(StyleAnalyzer, ReadsUtilityClassesAndInlineStyle) {
  Dom dom;
  ASSERT_TRUE(parseHtml("<button class=\"absolute z-[15] opacity-50 pointer-events-none "
                        "active:scale-95 active:bg-blue-700\" style=\"opacity: 0\">x</button>",
                        dom, nullptr));
  StyleSnapshot s = analyzeStyle(*dom.elements().front());
  EXPECT_EQ(s.position, Position::Absolute);
  ASSERT_TRUE(s.layer.has_value());
  EXPECT_EQ(*s.layer, 15);
  EXPECT_EQ(s.pointer, PointerMode::None);
  EXPECT_EQ(s.feedback, FeedbackLevel::Strong);
  EXPECT_DOUBLE_EQ(s.opacity, 0.0);
  EXPECT_TRUE(s.inlineHidden);

  EXPECT_EQ(parseLayerClass("z-10"), 10);
  EXPECT_EQ(parseLayerClass("-z-10"), -10);
  EXPECT_FALSE(parseLayerClass("z-auto").has_value());
  EXPECT_TRUE(isLayerClass("z-auto"));
}

TEST(StyleAnalyzer, HighestOfSeveralLayerClassesApplies) {
  Dom dom;
  ASSERT_TRUE(parseHtml("<div class=\"z-50 relative z-20\">x</div>", dom, nullptr));
  StyleSnapshot s = analyzeStyle(*dom.elements().front());
  ASSERT_TRUE(s.layer.has_value());
  EXPECT_EQ(*s.layer, 50);
}

TEST(Classifier, HiddenElementIsVisibilityDefect) {
  auto errors = classify(
      "<button id=\"b\" class=\"opacity-0\" onclick=\"go()\">x</button>"
      "<script>function go() {}</script>");
  const ClassifiedError* e = findKind(errors, KindId::HiddenOpacity, "#b");
  ASSERT_NE(e, nullptr);
  EXPECT_LE(e->confidence, 0.8);
  EXPECT_FALSE(e->requiresGenerative);
  EXPECT_EQ(std::get<VisibilityDefect>(e->kind).suppressingClass, "opacity-0");
}

TEST(Classifier, OverlayAtHigherLayerBlocksPointer) {
  auto errors = classify(kCoveredButton);
  const ClassifiedError* e = findKind(errors, KindId::PointerBlocked, "#buy");
  ASSERT_NE(e, nullptr);
  ASSERT_TRUE(e->blocker.has_value());
  EXPECT_EQ(*e->blocker, "#shade");
  EXPECT_EQ(std::get<PointerDefect>(e->kind).blockerLayer, 20);
  EXPECT_LE(e->confidence, 0.8);
  EXPECT_FALSE(e->requiresGenerative);
}

TEST(Classifier, DecorativeOverlayIsOverlayIntercept) {
  auto errors = classify(R"html(<div class="relative">
    <button id="go" class="relative" onclick="go()">Go</button>
    <div id="glow" class="absolute inset-0 bg-gradient-to-r from-white/0 to-white/40"></div>
  </div><script>function go() {}</script>)html");
  const ClassifiedError* e = findKind(errors, KindId::OverlayIntercept, "#go");
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(*e->blocker, "#glow");
}

TEST(Classifier, PassThroughAncestorIntercepts) {
  auto errors = classify(R"html(<div id="panel" class="pointer-events-none">
    <button id="ok" onclick="ok()">OK</button></div><script>function ok() {}</script>)html");
  const ClassifiedError* e = findKind(errors, KindId::PointerIntercepted, "#ok");
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(*e->blocker, "#panel");
}

TEST(Classifier, FlippedBackfaceAndOffscreenTransforms) {
  auto errors = classify(R"html(<div id="card">
    <button id="back" class="rotate-y-180 backface-hidden" onclick="f()">Back</button>
    <button id="away" class="-translate-x-full" onclick="f()">Away</button>
  </div><script>function f() {}</script>)html");
  const ClassifiedError* back = findKind(errors, KindId::BackfaceHidden, "#back");
  ASSERT_NE(back, nullptr);
  EXPECT_EQ(std::get<TransformDefect>(back->kind).containerSelector, "#card");
  const ClassifiedError* away = findKind(errors, KindId::Offscreen, "#away");
  ASSERT_NE(away, nullptr);
  EXPECT_EQ(std::get<TransformDefect>(away->kind).offendingClasses,
            std::vector<std::string>{"-translate-x-full"});
}

TEST(Classifier, FeedbackWeakOrMissing) {
  auto errors = classify("<button id=\"a\" class=\"hover:bg-blue-600\">A</button>"
                         "<button id=\"b\">B</button>");
  EXPECT_NE(findKind(errors, KindId::FeedbackTooSubtle, "#a"), nullptr);
  const ClassifiedError* missing = findKind(errors, KindId::FeedbackMissing, "#b");
  ASSERT_NE(missing, nullptr);
  EXPECT_TRUE(missing->requiresGenerative);
}

TEST(Classifier, ScriptFaultsNeedGenerativeFix) {
  auto errors = classify(R"html(<button id="s" onclick="submitForm()">Send</button>
    <script>document.getElementById('result').textContent = 'x';</script>)html");
  const ClassifiedError* handler = findKind(errors, KindId::UndefinedHandler, "#s");
  ASSERT_NE(handler, nullptr);
  EXPECT_TRUE(handler->requiresGenerative);
  EXPECT_EQ(std::get<ScriptDefect>(handler->kind).symbol, "submitForm");

  bool missingRef = false;
  for (const auto& e : errors)
    if (e.id() == KindId::MissingReference) {
      missingRef = true;
      EXPECT_EQ(std::get<ScriptDefect>(e.kind).symbol, "result");
    }
  EXPECT_TRUE(missingRef);
}

TEST(Classifier, ExternalScriptSuppressesHandlerFaults) {
  auto errors = classify("<script src=\"app.js\"></script>"
                         "<button id=\"s\" onclick=\"submitForm()\">Send</button>");
  EXPECT_EQ(findKind(errors, KindId::UndefinedHandler, "#s"), nullptr);
}

TEST(Classifier, FailedCaptureConfirmsStaticFinding) {
  ValidationReport report;
  ElementCapture c;
  c.selector = "#a";
  c.localDelta = 0.1;
  report.elements.push_back(c);

  auto errors = classify("<button id=\"a\" class=\"hover:bg-blue-600\">A</button>", &report);
  const ClassifiedError* e = findKind(errors, KindId::FeedbackTooSubtle, "#a");
  ASSERT_NE(e, nullptr);
  EXPECT_GE(e->confidence, 0.9);
}

TEST(Classifier, PassingCaptureDropsStaticFinding) {
  ValidationReport report;
  ElementCapture c;
  c.selector = "#a";
  c.localDelta = 0.5;
  report.elements.push_back(c);

  auto errors = classify("<button id=\"a\" class=\"hover:bg-blue-600\">A</button>", &report);
  EXPECT_TRUE(errors.empty());
}

TEST(Classifier, ReportOnlyInterceptionBecomesPointerDefect) {
  ValidationReport report;
  ElementCapture c;
  c.selector = "#go";
  c.intercepted = true;
  c.blocker = "#toast";
  report.elements.push_back(c);

  auto errors = classify(R"html(<button id="go" class="active:scale-95 active:brightness-75" onclick="go()">Go</button>
    <div id="toast" class="fixed bottom-4 right-4 z-30">Saved</div>
    <script>function go() {}</script>)html", &report);
  const ClassifiedError* e = findKind(errors, KindId::PointerBlocked, "#go");
  ASSERT_NE(e, nullptr);
  EXPECT_DOUBLE_EQ(e->confidence, 0.85);
  EXPECT_EQ(*e->blocker, "#toast");
  EXPECT_EQ(std::get<PointerDefect>(e->kind).blockerLayer, 30);
}

TEST(Classifier, UnattributedFailureIsUnknown) {
  ValidationReport report;
  ElementCapture c;
  c.selector = "#go";
  report.elements.push_back(c);

  auto errors = classify("<button id=\"go\" class=\"active:scale-95 active:brightness-75\" "
                         "onclick=\"go()\">Go</button><script>function go() {}</script>",
                         &report);
  const ClassifiedError* e = findKind(errors, KindId::Unknown, "#go");
  ASSERT_NE(e, nullptr);
  EXPECT_TRUE(e->requiresGenerative);
  EXPECT_LE(e->confidence, 0.5);
}

TEST(Classifier, RuntimeErrorConfirmsUndefinedHandler) {
  ValidationReport report;
  report.scriptErrors.push_back("ReferenceError: submitForm is not defined");
  auto errors = classify("<button id=\"s\" onclick=\"submitForm()\">Send</button>"
                         "<script>var x = 1;</script>",
                         &report);
  const ClassifiedError* e = findKind(errors, KindId::UndefinedHandler, "#s");
  ASSERT_NE(e, nullptr);
  EXPECT_GE(e->confidence, 0.9);
}

TEST(Classifier, UnparseableDocumentFails) {
  auto classifier = makeLayoutClassifier();
  std::vector<ClassifiedError> out;
  std::string err;
  EXPECT_FALSE(classifier->classify(Document{"<div class=\"x", 0}, nullptr, Thresholds(), out, &err));
  EXPECT_FALSE(err.empty());
}

TEST(Classifier, PrioritizeOrdersByFamilyThenConfidence) {
  std::vector<ClassifiedError> errors;
  errors.push_back(makeError(FeedbackDefect{}, "#f", "button", 0.9, ""));
  errors.push_back(makeError(VisibilityDefect{}, "#b", "button", 0.5, ""));
  errors.push_back(makeError(VisibilityDefect{}, "#a", "button", 0.7, ""));
  errors.push_back(makeError(VisibilityDefect{}, "#c", "button", 0.7, ""));
  prioritize(errors);
  ASSERT_EQ(errors.size(), 4u);
  EXPECT_EQ(errors[0].selector, "#a");
  EXPECT_EQ(errors[1].selector, "#c");
  EXPECT_EQ(errors[2].selector, "#b");
  EXPECT_EQ(errors[3].selector, "#f");
}

TEST(Classifier, ConfidenceIsClamped) {
  ClassifiedError e = makeError(UnknownDefect{}, "#x", "div", 1.7, "");
  EXPECT_DOUBLE_EQ(e.confidence, 1.0);
  e.setConfidence(-3);
  EXPECT_DOUBLE_EQ(e.confidence, 0.0);
}

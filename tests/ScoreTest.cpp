#include "validate/Validator.hpp"
#include <gtest/gtest.h>
#include <memory>

using namespace lfx;

namespace {

ElementCapture capture(const std::string& selector, double global, double local) {
  ElementCapture c;
  c.selector = selector;
  c.globalDelta = global;
  c.localDelta = local;
  return c;
}

} // namespace

TEST(Score, EitherThresholdPasses) {
  Thresholds t;
  EXPECT_TRUE(elementPasses(capture("#a", 0.02, 0.0), t));
  EXPECT_TRUE(elementPasses(capture("#a", 0.0, 0.30), t));
  EXPECT_FALSE(elementPasses(capture("#a", 0.019, 0.29), t));

  ElementCapture blocked = capture("#a", 0.5, 0.5);
  blocked.intercepted = true;
  EXPECT_FALSE(elementPasses(blocked, t));

  ElementCapture failed = capture("#a", 0.5, 0.5);
  failed.error = "timeout";
  EXPECT_FALSE(elementPasses(failed, t));
}

TEST(Score, GlobalScoreIsPassingFraction) {
  ValidationReport r;
  r.elements = {capture("#a", 0.05, 0), capture("#b", 0, 0), capture("#c", 0, 0.4),
                capture("#d", 0, 0.1)};
  ValidationScore s = scoreReport(r, Thresholds());
  EXPECT_DOUBLE_EQ(s.global, 0.5);
  EXPECT_EQ(s.passed(), 2u);
  EXPECT_FALSE(s.passes(Thresholds()));
  EXPECT_TRUE(s.elements[0].pass);
  EXPECT_FALSE(s.elements[1].pass);
}

TEST(Score, EmptyReportScoresOne) {
  ValidationScore s = scoreReport(ValidationReport(), Thresholds());
  EXPECT_DOUBLE_EQ(s.global, 1.0);
  EXPECT_TRUE(s.passes(Thresholds()));
}

TEST(Score, ReportReadsFromJson) {
  llvm::Expected<llvm::json::Value> v = llvm::json::parse(R"({
    "elements": [
      {"selector": "#a", "globalDelta": 0.03},
      {"selector": "#b", "intercepted": true, "blocker": "#shade",
       "box": {"x": 0, "y": 0, "width": 100, "height": 40}}
    ],
    "scriptErrors": ["ReferenceError: go is not defined"]
  })");
  ASSERT_TRUE(bool(v)) << llvm::toString(v.takeError());
  ValidationReport r;
  llvm::json::Path::Root root("report");
  ASSERT_TRUE(fromJSON(*v, r, root));
  ASSERT_EQ(r.elements.size(), 2u);
  EXPECT_DOUBLE_EQ(r.elements[0].globalDelta, 0.03);
  EXPECT_TRUE(r.elements[1].intercepted);
  EXPECT_EQ(r.elements[1].blocker, "#shade");
  ASSERT_TRUE(r.elements[1].box.has_value());
  EXPECT_DOUBLE_EQ(r.elements[1].box->width, 100);
  ASSERT_EQ(r.scriptErrors.size(), 1u);

  ValidationReport missing;
  llvm::json::Path::Root root2("report");
  llvm::Expected<llvm::json::Value> bad = llvm::json::parse(R"({"elements":[{"globalDelta":1}]})");
  ASSERT_TRUE(bool(bad));
  EXPECT_FALSE(fromJSON(*bad, missing, root2));
  llvm::consumeError(root2.getError());
}

TEST(HeuristicValidator, EstimatesFromMarkup) {
  std::unique_ptr<Validator> v(makeHeuristicValidator());
  Document doc{R"html(<button id="a" class="active:scale-95 active:brightness-75">A</button>
<button id="b" class="hidden" onclick="go()">B</button>
<a id="c" href="/next">C</a>
<button id="d" onclick="missing()">D</button>
<script>function go() {}</script>)html", 0};
  ValidationReport r;
  std::string err;
  ASSERT_TRUE(v->validate(doc, r, &err)) << err;
  ASSERT_EQ(r.elements.size(), 4u);
  Thresholds t;
  EXPECT_TRUE(elementPasses(r.elements[0], t));
  EXPECT_FALSE(elementPasses(r.elements[1], t));
  EXPECT_TRUE(elementPasses(r.elements[2], t));
  EXPECT_FALSE(elementPasses(r.elements[3], t));
  ASSERT_EQ(r.scriptErrors.size(), 1u);
  EXPECT_EQ(r.scriptErrors[0], "ReferenceError: missing is not defined");
}

#include "rules/Patch.hpp"
#include <gtest/gtest.h>

using namespace lfx;

namespace {

Patch make(const std::string& selector, std::vector<std::string> add,
           std::vector<std::string> remove = {}) {
  Patch p;
  p.selector = selector;
  for (const auto& c : add) p.addClass(c);
  for (const auto& c : remove) p.removeClass(c);
  return p;
}

} // namespace

TEST(Patch, ApplyKeepsOrderAndRemovalWins) {
  Patch p = make("#a", {"pointer-events-auto", "block"}, {"hidden", "block"});
  auto out = p.applyTo({"px-4", "hidden", "text-sm"});
  EXPECT_EQ(out, (std::vector<std::string>{"px-4", "text-sm", "pointer-events-auto"}));
}

TEST(Patch, LayersChangeOnlyThroughExplicitRemoves) {
  Patch p = make("#a", {"z-20", "z-50"});
  EXPECT_EQ(p.applyTo({"relative", "z-10"}),
            (std::vector<std::string>{"relative", "z-10", "z-20", "z-50"}));

  Patch q = make("#a", {"z-50"}, {"z-10", "z-auto"});
  EXPECT_EQ(q.applyTo({"relative", "z-10", "z-auto"}),
            (std::vector<std::string>{"relative", "z-50"}));
}

TEST(PatchSet, MergedLayerAddsAllSurvive) {
  PatchSet set;
  set.add(make("#a", {"z-20"}), 15);
  set.add(make("#a", {"z-50"}), 25);
  const Patch* a = set.find("#a");
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->applyTo({}), (std::vector<std::string>{"z-20", "z-50"}));
}

TEST(PatchSet, MergeOnSameSelectorIsStrictUnion) {
  PatchSet set;
  set.add(make("#a", {"x", "y"}, {"old"}), 30);
  set.add(make("#b", {"q"}), 20);
  set.add(make("#a", {"y", "z"}, {"older"}), 10);

  ASSERT_EQ(set.size(), 2u);
  const Patch* a = set.find("#a");
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->add, (std::vector<std::string>{"x", "y", "z"}));
  EXPECT_EQ(a->remove, (std::vector<std::string>{"old", "older"}));

  // merged entry took the lower priority and now sorts first
  auto list = set.patches();
  EXPECT_EQ(list[0].selector, "#a");
  EXPECT_EQ(list[1].selector, "#b");
}

TEST(PatchSet, OrderedByPriorityThenInsertion) {
  PatchSet set;
  set.add(make("#c", {"c"}), 50);
  set.add(make("#a", {"a"}), 5);
  set.add(make("#b", {"b"}), 50);
  set.add(make("#d", {"d"}), 5);
  auto list = set.patches();
  ASSERT_EQ(list.size(), 4u);
  EXPECT_EQ(list[0].selector, "#a");
  EXPECT_EQ(list[1].selector, "#d");
  EXPECT_EQ(list[2].selector, "#c");
  EXPECT_EQ(list[3].selector, "#b");
}

TEST(PatchSet, JsonShape) {
  PatchSet set;
  set.source = "rules";
  Patch p = make("#a", {"z-50"}, {"z-10"});
  p.rationale = "raise";
  set.add(p, 15);

  llvm::json::Value v = toJSON(set);
  const llvm::json::Object* o = v.getAsObject();
  ASSERT_NE(o, nullptr);
  EXPECT_EQ(o->getString("source"), llvm::Optional<llvm::StringRef>("rules"));
  const llvm::json::Array* patches = o->getArray("patches");
  ASSERT_NE(patches, nullptr);
  ASSERT_EQ(patches->size(), 1u);
  const llvm::json::Object* first = (*patches)[0].getAsObject();
  EXPECT_EQ(first->getString("selector"), llvm::Optional<llvm::StringRef>("#a"));
  EXPECT_EQ(first->getString("reason"), llvm::Optional<llvm::StringRef>("raise"));

  PatchSet back;
  llvm::json::Path::Root root("patches");
  ASSERT_TRUE(fromJSON(v, back, root));
  ASSERT_NE(back.find("#a"), nullptr);
  EXPECT_EQ(back.find("#a")->remove, std::vector<std::string>{"z-10"});
}

TEST(PatchSet, RejectsEmptySelector) {
  llvm::Expected<llvm::json::Value> v =
      llvm::json::parse(R"({"source":"x","patches":[{"selector":"","add":["a"]}]})");
  ASSERT_TRUE(bool(v));
  PatchSet set;
  llvm::json::Path::Root root("patches");
  EXPECT_FALSE(fromJSON(*v, set, root));
  llvm::consumeError(root.getError());
}

TEST(PatchSet, RejectsMalformedClassTokens) {
  for (const char* text : {R"({"patches":[{"selector":"#a","add":["foo bar"]}]})",
                           R"({"patches":[{"selector":"#a","remove":["x\"y"]}]})",
                           R"({"patches":[{"selector":"#a","add":[""]}]})"}) {
    llvm::Expected<llvm::json::Value> v = llvm::json::parse(text);
    ASSERT_TRUE(bool(v));
    PatchSet set;
    llvm::json::Path::Root root("patches");
    EXPECT_FALSE(fromJSON(*v, set, root)) << text;
    llvm::consumeError(root.getError());
  }
  EXPECT_TRUE(isClassToken("active:scale-95"));
  EXPECT_TRUE(isClassToken("[transform-style:preserve-3d]"));
  EXPECT_TRUE(isClassToken("!inline-block"));
  EXPECT_FALSE(isClassToken("a\tb"));
  EXPECT_FALSE(isClassToken("<b>"));
}

#include "patch/ProposalValidator.hpp"
#include <gtest/gtest.h>

using namespace lfx;

namespace {

const char* kPage = R"(<html><body>
<button id="buy" class="px-4">Buy</button>
<div id="veil" class="absolute inset-0 bg-black/40"></div>
<a id="more" href="/more">More</a>
</body></html>)";

Patch make(const std::string& selector, std::vector<std::string> add,
           std::vector<std::string> remove = {}) {
  Patch p;
  p.selector = selector;
  for (const auto& c : add) p.addClass(c);
  for (const auto& c : remove) p.removeClass(c);
  return p;
}

} // namespace

TEST(ProposalValidator, KeepsWellFormedPatchesInOrder) {
  PatchSet proposal;
  proposal.source = "heuristic-fixer";
  proposal.add(make("#more", {"underline"}));
  proposal.add(make("#buy", {"active:scale-95", "z-50"}, {"hidden"}));

  std::vector<SkippedPatch> rejected;
  PatchSet ok = validateProposal(Document{kPage, 0}, proposal, &rejected);
  EXPECT_TRUE(rejected.empty());
  EXPECT_EQ(ok.source, "heuristic-fixer");
  auto list = ok.patches();
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].selector, "#more");
  EXPECT_EQ(list[1].selector, "#buy");
}

TEST(ProposalValidator, RejectsDisablingClassesOnInteractiveElements) {
  PatchSet proposal;
  proposal.add(make("#buy", {"hidden", "pointer-events-none"}));
  proposal.add(make("#more", {"sr-only"}));
  proposal.add(make("#veil", {"pointer-events-none"}));

  std::vector<SkippedPatch> rejected;
  PatchSet ok = validateProposal(Document{kPage, 0}, proposal, &rejected);
  ASSERT_EQ(ok.size(), 1u);
  EXPECT_NE(ok.find("#veil"), nullptr);
  ASSERT_EQ(rejected.size(), 2u);
  EXPECT_EQ(rejected[0].selector, "#buy");
  EXPECT_EQ(rejected[0].reason, "would disable interactive <button>: hidden");
  EXPECT_EQ(rejected[1].reason, "would disable interactive <a>: sr-only");
}

TEST(ProposalValidator, RejectsMalformedOrUnmatchedPatches) {
  PatchSet proposal;
  Patch spaced;
  spaced.selector = "#buy";
  spaced.add.push_back("foo bar");
  proposal.add(spaced);
  proposal.add(make("#gone", {"ring-2"}));
  proposal.add(make("button:hover", {"ring-2"}));

  std::vector<SkippedPatch> rejected;
  PatchSet ok = validateProposal(Document{kPage, 0}, proposal, &rejected);
  EXPECT_TRUE(ok.empty());
  ASSERT_EQ(rejected.size(), 3u);
  EXPECT_EQ(rejected[0].reason, "invalid class token 'foo bar'");
  EXPECT_EQ(rejected[1].reason, "selector matches nothing");
  EXPECT_EQ(rejected[2].reason.compare(0, 16, "invalid selector"), 0);
}

TEST(ProposalValidator, UnparseableDocumentRejectsEverything) {
  PatchSet proposal;
  proposal.add(make("div", {"ring-2"}));
  std::vector<SkippedPatch> rejected;
  PatchSet ok = validateProposal(Document{"<div class=\"a", 0}, proposal, &rejected);
  EXPECT_TRUE(ok.empty());
  ASSERT_EQ(rejected.size(), 1u);
  EXPECT_EQ(rejected[0].reason.compare(0, 21, "cannot parse document"), 0);
}

#include "patch/ProposalValidator.hpp"
#include "classify/StyleAnalyzer.hpp"
#include "document/HtmlParser.hpp"
#include "document/Selector.hpp"
#include "support/Log.hpp"

namespace lfx {

bool isDisablingClass(const std::string& cls) {
  static const char* kDisabling[] = {"hidden", "invisible", "opacity-0", "pointer-events-none",
                                     "sr-only"};
  for (const char* d : kDisabling)
    if (cls == d) return true;
  return false;
}

namespace {

std::string screen(const Dom& dom, const Patch& p) {
  std::string bad = firstInvalidClass(p);
  if (!bad.empty()) return "invalid class token '" + bad + "'";

  Selector sel;
  std::string err;
  if (!Selector::parse(p.selector, sel, &err)) return "invalid selector: " + err;
  auto hits = sel.select(dom);
  if (hits.empty()) return "selector matches nothing";

  for (const Node* n : hits) {
    if (!isInteractive(*n)) continue;
    for (const auto& c : p.add)
      if (isDisablingClass(c)) return "would disable interactive <" + n->tag + ">: " + c;
  }
  return "";
}

} // namespace

PatchSet validateProposal(const Document& doc, const PatchSet& proposal,
                          std::vector<SkippedPatch>* rejected) {
  PatchSet accepted;
  accepted.source = proposal.source;
  const auto list = proposal.patches();

  Dom dom;
  std::string err;
  if (!parseHtml(doc.html, dom, &err)) {
    if (rejected)
      for (const auto& p : list) rejected->push_back({p.selector, "cannot parse document: " + err});
    return accepted;
  }

  for (const auto& p : list) {
    std::string reason = screen(dom, p);
    if (reason.empty()) {
      accepted.add(p);
      continue;
    }
    log::debug() << "rejecting proposed patch for '" << p.selector << "': " << reason << "\n";
    if (rejected) rejected->push_back({p.selector, reason});
  }
  return accepted;
}

} // namespace lfx

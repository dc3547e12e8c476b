#include "ai/GenerativeFixer.hpp"
#include "rules/Tailwind.hpp"
#include "support/Log.hpp"
#include <chrono>

namespace lfx {

namespace {

class HeuristicFixer final : public GenerativeFixer {
public:
  bool proposeFix(const Document& doc,
                  const std::vector<ClassifiedError>& unresolved,
                  int attemptsRemaining,
                  FixProposal& out,
                  std::string* error) override
  {
    (void)doc; (void)error;
    auto start = std::chrono::steady_clock::now();
    FixProposal proposal;
    proposal.patches.source = "heuristic-fixer";
    proposal.usage.calls = 1;

    if (attemptsRemaining > 0) {
      for (const auto& e : unresolved) {
        if (!e.requiresGenerative) continue;
        proposal.usage.costUnits += 1.0;
        Patch p;
        p.selector = e.selector;
        switch (e.id()) {
        case KindId::FeedbackMissing:
          feedbackPair(p, attemptsRemaining);
          p.rationale = "heuristic: add active-state feedback";
          break;
        case KindId::Unknown:
          // No attributed cause: make it reachable and visibly responsive
          if (e.tag == "script") break;
          p.addClass(tw::PointerAuto);
          if (!e.style.isPositioned()) p.addClass(tw::Relative);
          if (!e.style.layer) p.addClass(tw::layerClass(tw::LayerContent));
          feedbackPair(p, attemptsRemaining);
          p.rationale = "heuristic: route and amplify";
          break;
        default:
          // script faults need code changes, not classes
          break;
        }
        if (!p.empty()) proposal.patches.add(std::move(p));
      }
    }

    proposal.usage.latencyMs = std::chrono::duration<double, std::milli>(
                                 std::chrono::steady_clock::now() - start).count();
    log::debug() << "heuristic fixer proposed " << proposal.patches.size() << " patch(es)\n";
    out = std::move(proposal);
    return true;
  }

private:
  // Stronger pair on the last attempt
  static void feedbackPair(Patch& p, int attemptsRemaining) {
    bool last = attemptsRemaining <= 1;
    p.addClass(last ? "active:scale-90" : "active:scale-95");
    p.addClass(last ? "active:brightness-75" : "active:brightness-90");
    p.addClass("transition");
    p.addClass("duration-150");
  }
};

} // namespace

GenerativeFixer* makeHeuristicFixer() { return new HeuristicFixer(); }

// If ONNX isn't enabled, provide a fallback factory here
// When ONNX is enabled, OnnxFixer.cpp provides the real one
#ifndef ENABLE_ONNXRUNTIME
GenerativeFixer* makeOnnxFixer(const std::string&) { return makeHeuristicFixer(); }
#endif

} // namespace lfx

#include "rules/RuleEngine.hpp"
#include "support/Log.hpp"
#include <algorithm>

namespace lfx {

bool RuleEngine::registerRule(std::unique_ptr<Rule> rule, std::string* error) {
  if (!rule) {
    if (error) *error = "null rule";
    return false;
  }
  for (const auto& existing : rules_) {
    for (KindId id : rule->handles()) {
      if (existing->declares(id)) {
        if (error)
          *error = std::string("rule '") + rule->name() + "' overlaps '" + existing->name() +
                   "' on kind " + kindName(id);
        return false;
      }
    }
  }
  auto at = std::upper_bound(rules_.begin(), rules_.end(), rule->priority(),
                             [](int prio, const std::unique_ptr<Rule>& r) {
                               return prio < r->priority();
                             });
  rules_.insert(at, std::move(rule));
  return true;
}

const Rule* RuleEngine::ruleFor(KindId id) const {
  for (const auto& r : rules_)
    if (r->declares(id)) return r.get();
  return nullptr;
}

PatchSet RuleEngine::applyRules(const std::vector<ClassifiedError>& errors) const {
  PatchSet set;
  set.source = "rules";

  std::vector<const ClassifiedError*> eligible;
  for (const auto& e : errors) {
    if (!isDeterministicFixable(e.id())) continue;
    if (!ruleFor(e.id())) {
      log::warn() << "no rule handles " << kindName(e.id()) << " on " << e.selector << "\n";
      continue;
    }
    eligible.push_back(&e);
  }

  for (const auto& rule : rules_) {
    for (const ClassifiedError* e : eligible) {
      if (!rule->declares(e->id())) continue;
      for (auto& p : rule->generateFix(*e)) {
        if (p.empty()) continue;
        log::debug() << rule->name() << " -> " << p.selector << "\n";
        set.add(std::move(p), rule->priority());
      }
    }
  }
  return set;
}

PatchSet RuleEngine::applySingle(const ClassifiedError& e) const {
  return applyRules(std::vector<ClassifiedError>{e});
}

RuleEngine makeDefaultRuleEngine() {
  RuleEngine engine;
  std::string error;
  using MakeRule = std::unique_ptr<Rule> (*)();
  const MakeRule catalog[] = {makeVisibilityRule, makeStackingRule, makePointerRule,
                              makePassthroughRule, makeTransformRule, makeFeedbackRule};
  for (MakeRule make : catalog)
    if (!engine.registerRule(make(), &error)) log::error() << error << "\n";
  return engine;
}

} // namespace lfx

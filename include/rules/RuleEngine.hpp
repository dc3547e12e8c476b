#pragma once
#include "classify/Defect.hpp"
#include "rules/Patch.hpp"
#include "rules/Rule.hpp"
#include <memory>
#include <string>
#include <vector>

namespace lfx {

class RuleEngine {
public:
  RuleEngine() = default;
  RuleEngine(RuleEngine&&) = default;
  RuleEngine& operator=(RuleEngine&&) = default;

  // Keeps the catalog sorted by priority. Fails when the new rule declares
  // a kind another registered rule already handles.
  bool registerRule(std::unique_ptr<Rule> rule, std::string* error);

  // Deterministic-fixable errors only; one pass over the catalog in
  // priority order, each rule fed the errors it declares.
  PatchSet applyRules(const std::vector<ClassifiedError>& errors) const;
  PatchSet applySingle(const ClassifiedError& e) const;

  const Rule* ruleFor(KindId id) const;
  size_t size() const { return rules_.size(); }

private:
  std::vector<std::unique_ptr<Rule>> rules_;
};

// visibility 5, stacking 15, pointer-routing 25, passthrough 26,
// spatial-transform 30, feedback-amplifier 50
RuleEngine makeDefaultRuleEngine();

} // namespace lfx

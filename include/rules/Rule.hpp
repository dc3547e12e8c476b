#pragma once
#include "classify/Defect.hpp"
#include "rules/Patch.hpp"
#include <memory>
#include <vector>

namespace lfx {

// A deterministic fix for a fixed set of kinds. generateFix is a pure
// function of the error; it may patch more than one element (eg. the
// victim and the overlay covering it).
class Rule {
public:
  virtual ~Rule() = default;
  virtual const char* name() const = 0;
  virtual int priority() const = 0;            // lower runs first
  virtual const std::vector<KindId>& handles() const = 0;
  virtual std::vector<Patch> generateFix(const ClassifiedError& e) const = 0;

  bool declares(KindId id) const;
};

std::unique_ptr<Rule> makeVisibilityRule();
std::unique_ptr<Rule> makeStackingRule();
std::unique_ptr<Rule> makePointerRule();
std::unique_ptr<Rule> makePassthroughRule();
std::unique_ptr<Rule> makeTransformRule();
std::unique_ptr<Rule> makeFeedbackRule();

} // namespace lfx

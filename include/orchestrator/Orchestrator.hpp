#pragma once
#include "ai/GenerativeFixer.hpp"
#include "classify/Classifier.hpp"
#include "metrics/Metrics.hpp"
#include "orchestrator/DecisionEngine.hpp"
#include "orchestrator/History.hpp"
#include "orchestrator/RepairOptions.hpp"
#include "rules/RuleEngine.hpp"
#include "validate/Validator.hpp"
#include <memory>
#include <string>
#include <vector>

namespace lfx {

struct OrchestratorResult {
  RunState    state = RunState::Fail;
  std::string reason;
  Document    original;
  Document    document;            // best snapshot, or the original
  double      score = 0.0;
  bool        rollbackOccurred = false;
  unsigned    phasesCompleted = 0;
  size_t      defectsFound = 0;
  size_t      defectsFixed = 0;
  std::vector<ClassifiedError> remaining;
  unsigned    validatorCalls = 0;
  unsigned    fixerCalls = 0;
  FixerUsage  fixerUsage;
  PatchSet    deterministicPatches;
  double      durationMs = 0.0;
  History     history;

  bool passed() const { return state == RunState::Pass; }
  unsigned collaboratorCalls() const { return validatorCalls + fixerCalls; }
};

// Drives one document through classify, deterministic fix, validation and
// bounded generative retries. `run` keeps all of its state on the stack, so
// one Orchestrator may serve concurrent runs as long as the collaborators
// tolerate concurrent calls.
class Orchestrator {
public:
  Orchestrator(std::shared_ptr<const Classifier> classifier,
               RuleEngine rules,
               std::shared_ptr<Validator> validator,
               std::shared_ptr<GenerativeFixer> fixer,
               std::shared_ptr<MetricsSink> metrics = nullptr);

  OrchestratorResult run(const Document& doc, const RepairOptions& opts,
                         const std::string& runId) const;

private:
  std::shared_ptr<const Classifier> classifier_;
  RuleEngine rules_;
  std::shared_ptr<Validator> validator_;
  std::shared_ptr<GenerativeFixer> fixer_;
  std::shared_ptr<MetricsSink> metrics_;
};

// Defects handed to one generative call: requires-generative ones at or
// above the floor (all of them when none qualify), highest confidence
// first, at most `maxDefectsPerGenerativeCall`.
std::vector<ClassifiedError> selectForGenerative(const std::vector<ClassifiedError>& errors,
                                                 const RepairOptions& opts);

} // namespace lfx

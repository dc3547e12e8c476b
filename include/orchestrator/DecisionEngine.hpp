#pragma once
#include "orchestrator/RepairOptions.hpp"
#include <cstddef>
#include <optional>

namespace lfx {

enum class RunState {
  Classify,
  DeterministicFix,
  Validate1,
  GenerativeFix,
  Validate2,
  Pass,
  Fail,
  Timeout
};

const char* stateName(RunState s);
bool isTerminal(RunState s);

struct DecisionInput {
  RunState              state = RunState::Classify;
  std::optional<double> lastScore;     // unset when the last validation failed
  std::optional<double> bestScore;
  int                   attemptsRemaining = 0;
  bool                  generativeEligible = false;
  size_t                defectsFound = 0;
  bool                  deadlineExpired = false;
};

// Pure transition function of the repair loop. Entering a state that
// waits on a collaborator after the deadline yields Timeout.
RunState nextState(const DecisionInput& in, const RepairOptions& opts);

} // namespace lfx

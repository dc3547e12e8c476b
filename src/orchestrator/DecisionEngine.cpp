#include "orchestrator/DecisionEngine.hpp"

namespace lfx {

const char* stateName(RunState s) {
  switch (s) {
  case RunState::Classify: return "CLASSIFY";
  case RunState::DeterministicFix: return "DETERMINISTIC_FIX";
  case RunState::Validate1: return "VALIDATE_1";
  case RunState::GenerativeFix: return "GENERATIVE_FIX";
  case RunState::Validate2: return "VALIDATE_2";
  case RunState::Pass: return "PASS";
  case RunState::Fail: return "FAIL";
  case RunState::Timeout: return "TIMEOUT";
  }
  return "FAIL";
}

bool isTerminal(RunState s) {
  return s == RunState::Pass || s == RunState::Fail || s == RunState::Timeout;
}

static bool suspends(RunState s) {
  return s == RunState::Validate1 || s == RunState::GenerativeFix || s == RunState::Validate2;
}

static RunState afterValidation(const DecisionInput& in, const RepairOptions& opts) {
  if (in.lastScore && *in.lastScore >= opts.thresholds.passScore) return RunState::Pass;
  if (in.state == RunState::Validate2 && in.lastScore && in.bestScore &&
      *in.bestScore - *in.lastScore > opts.catastrophicDrop)
    return RunState::Fail;
  if (in.generativeEligible && in.attemptsRemaining > 0) return RunState::GenerativeFix;
  return RunState::Fail;
}

RunState nextState(const DecisionInput& in, const RepairOptions& opts) {
  RunState next = RunState::Fail;
  switch (in.state) {
  case RunState::Classify:
    next = in.defectsFound == 0 ? RunState::Pass : RunState::DeterministicFix;
    break;
  case RunState::DeterministicFix:
    next = RunState::Validate1;
    break;
  case RunState::Validate1:
  case RunState::Validate2:
    next = afterValidation(in, opts);
    break;
  case RunState::GenerativeFix:
    next = RunState::Validate2;
    break;
  case RunState::Pass:
  case RunState::Fail:
  case RunState::Timeout:
    return in.state;
  }
  if (suspends(next) && in.deadlineExpired) return RunState::Timeout;
  return next;
}

} // namespace lfx

#include "orchestrator/Orchestrator.hpp"
#include "orchestrator/CallWithDeadline.hpp"
#include "patch/PatchApplier.hpp"
#include "patch/ProposalValidator.hpp"
#include "support/Log.hpp"
#include "llvm/Support/Format.h"
#include <algorithm>
#include <map>

namespace lfx {

Orchestrator::Orchestrator(std::shared_ptr<const Classifier> classifier,
                           RuleEngine rules,
                           std::shared_ptr<Validator> validator,
                           std::shared_ptr<GenerativeFixer> fixer,
                           std::shared_ptr<MetricsSink> metrics)
  : classifier_(std::move(classifier)), rules_(std::move(rules)),
    validator_(std::move(validator)), fixer_(std::move(fixer)), metrics_(std::move(metrics)) {}

std::vector<ClassifiedError> selectForGenerative(const std::vector<ClassifiedError>& errors,
                                                 const RepairOptions& opts) {
  std::vector<ClassifiedError> candidates;
  for (const auto& e : errors)
    if (e.requiresGenerative) candidates.push_back(e);

  std::vector<ClassifiedError> picked;
  for (const auto& e : candidates)
    if (e.confidence >= opts.generativeConfidenceFloor) picked.push_back(e);
  if (picked.empty()) picked = candidates;

  std::stable_sort(picked.begin(), picked.end(),
                   [](const ClassifiedError& a, const ClassifiedError& b) {
                     return a.confidence > b.confidence;
                   });
  if (picked.size() > (size_t)opts.maxDefectsPerGenerativeCall)
    picked.resize(opts.maxDefectsPerGenerativeCall);
  return picked;
}

namespace {

bool anyGenerative(const std::vector<ClassifiedError>& errors) {
  return std::any_of(errors.begin(), errors.end(),
                     [](const ClassifiedError& e) { return e.requiresGenerative; });
}

std::string scoreText(double s) {
  std::string out;
  llvm::raw_string_ostream os(out);
  os << llvm::format("%.3f", s);
  return os.str();
}

std::string failReason(const DecisionInput& in, const RepairOptions& opts) {
  if (!in.lastScore) {
    if (in.attemptsRemaining <= 0) return "validation failed and the generative budget is spent";
    return "validation failed and no generative-eligible defects remain";
  }
  if (in.state == RunState::Validate2 && in.bestScore &&
      *in.bestScore - *in.lastScore > opts.catastrophicDrop)
    return "score fell from " + scoreText(*in.bestScore) + " to " + scoreText(*in.lastScore);
  if (in.attemptsRemaining <= 0)
    return "score " + scoreText(*in.lastScore) + " below pass bar, generative budget exhausted";
  return "score " + scoreText(*in.lastScore) + " below pass bar, no generative-eligible defects";
}

// Mutable state of one run
struct RunContext {
  const RepairOptions& opts;
  Clock::time_point start;
  Clock::time_point deadline;
  OrchestratorResult& res;
  Document working;
  std::optional<double> lastScore;
  std::map<size_t, ValidationReport> reports;   // by history seq
  std::vector<ClassifiedError> pending;         // defects of the working document
  int attemptsRemaining = 0;

  bool expired() const { return Clock::now() >= deadline; }

  Clock::time_point callDeadline() const {
    return std::min(deadline, Clock::now() + opts.callTimeout);
  }

  const ValidationReport* reportFor(const HistoryEntry* e) const {
    if (!e) return nullptr;
    auto it = reports.find(e->seq);
    return it == reports.end() ? nullptr : &it->second;
  }
};

} // namespace

OrchestratorResult Orchestrator::run(const Document& doc, const RepairOptions& opts,
                                     const std::string& runId) const {
  OrchestratorResult res;
  res.original = doc;
  res.document = doc;
  RunContext ctx{opts, Clock::now(), {}, res, doc, std::nullopt, {}, {}, opts.maxGenerativeAttempts};
  ctx.deadline = ctx.start + opts.globalTimeout;
  History& hist = res.history;

  // `out` is only replaced on success
  auto classify = [&](const Document& d, const ValidationReport* report,
                      std::vector<ClassifiedError>& out, std::string* error) {
    std::vector<ClassifiedError> found;
    std::string err;
    bool ok = false;
    try {
      ok = classifier_->classify(d, report, opts.thresholds, found, &err);
    } catch (const std::exception& e) {
      err = std::string("classifier threw: ") + e.what();
    }
    if (!ok) {
      if (error) *error = err;
      return false;
    }
    prioritize(found);
    out = std::move(found);
    return true;
  };

  // CLASSIFY
  RunState state = RunState::Classify;
  hist.record(stateName(state), doc, std::nullopt);
  std::vector<ClassifiedError> errors;
  std::string classifyError;
  if (!classify(doc, nullptr, errors, &classifyError)) {
    state = RunState::Fail;
    res.reason = "initial classification failed: " + classifyError;
    log::error() << "[" << runId << "] " << res.reason << "\n";
  } else {
    res.phasesCompleted = 1;
    res.defectsFound = errors.size();
    log::info() << "[" << runId << "] " << errors.size() << " defect(s) found\n";

    DecisionInput in;
    in.state = state;
    in.defectsFound = errors.size();
    state = nextState(in, opts);
    if (state == RunState::Pass) {
      res.reason = "no defects found";
      res.score = 1.0;
    }
  }

  if (state == RunState::DeterministicFix) {
    res.deterministicPatches = rules_.applyRules(errors);
    InjectResult inj = PatchApplier::inject(ctx.working, res.deterministicPatches);
    if (inj.ok) {
      ctx.working = inj.document;
      for (const auto& s : inj.skipped)
        log::debug() << "[" << runId << "] skipped " << s.selector << ": " << s.reason << "\n";
    } else {
      log::warn() << "[" << runId << "] deterministic patches not applied: " << inj.error << "\n";
    }
    log::info() << "[" << runId << "] rules applied " << inj.appliedCount << " of "
                << res.deterministicPatches.size() << " patch(es)\n";
    hist.record(stateName(state), ctx.working, std::nullopt);
    res.phasesCompleted++;
    ctx.pending = errors;

    DecisionInput in;
    in.state = state;
    in.defectsFound = errors.size();
    in.deadlineExpired = ctx.expired();
    state = nextState(in, opts);
    if (state == RunState::Timeout) res.reason = "deadline expired before validation";
  }

  while (!isTerminal(state)) {
    if (state == RunState::Validate1 || state == RunState::Validate2) {
      auto validator = validator_;
      Document snapshot = ctx.working;
      CallOutcome<ValidationReport> outcome = callWithDeadline<ValidationReport>(
          [validator, snapshot](ValidationReport& out, std::string* error) {
            return validator->validate(snapshot, out, error);
          },
          ctx.callDeadline());
      res.validatorCalls++;

      if (outcome.status == CallStatus::TimedOut && ctx.expired()) {
        res.reason = "deadline expired while awaiting the validator";
        state = RunState::Timeout;
        break;
      }

      if (outcome.status == CallStatus::Ok) {
        double score = scoreReport(outcome.value, opts.thresholds).global;
        ctx.lastScore = score;
        hist.record(stateName(state), ctx.working, score);
        ctx.reports[hist.entries().back().seq] = std::move(outcome.value);
        log::info() << "[" << runId << "] " << stateName(state) << " score " << scoreText(score)
                    << "\n";
        if (!hist.bestIsMaximal())
          log::error() << "[" << runId << "] best snapshot is not the highest score\n";
      } else {
        // Zero-improvement attempt. After VALIDATE_2 the generative call
        // already spent the attempt.
        log::warn() << "[" << runId << "] validator failed: " << outcome.error << "\n";
        ctx.lastScore = std::nullopt;
        hist.record(stateName(state), ctx.working, std::nullopt);
        if (state == RunState::Validate1 && ctx.attemptsRemaining > 0) ctx.attemptsRemaining--;
      }
      res.phasesCompleted++;

      const HistoryEntry* last = &hist.entries().back();
      std::string reclassifyError;
      if (!classify(ctx.working, ctx.reportFor(last), ctx.pending, &reclassifyError))
        log::warn() << "[" << runId << "] re-classification failed, keeping "
                    << ctx.pending.size() << " known defect(s): " << reclassifyError << "\n";

      // Rollback: continue from the best snapshot
      bool rolledBack = false;
      if (opts.rollback && ctx.lastScore && hist.bestScore() &&
          *ctx.lastScore < *hist.bestScore()) {
        const HistoryEntry* best = hist.best();
        log::info() << "[" << runId << "] rolling back to " << best->phase << " (score "
                    << scoreText(*best->score) << ")\n";
        res.rollbackOccurred = true;
        rolledBack = true;
        ctx.working = best->document;
        if (!classify(ctx.working, ctx.reportFor(best), ctx.pending, &reclassifyError))
          log::warn() << "[" << runId << "] re-classification of the best snapshot failed: "
                      << reclassifyError << "\n";
      }

      DecisionInput in;
      in.state = state;
      in.lastScore = ctx.lastScore;
      in.bestScore = hist.bestScore();
      in.attemptsRemaining = ctx.attemptsRemaining;
      in.generativeEligible = anyGenerative(ctx.pending);
      in.defectsFound = res.defectsFound;
      in.deadlineExpired = ctx.expired();
      RunState next = nextState(in, opts);
      if (next == RunState::Pass)
        res.reason = "score " + scoreText(*ctx.lastScore) + " meets pass bar";
      else if (next == RunState::Fail)
        res.reason = failReason(in, opts);
      else if (next == RunState::Timeout)
        res.reason = "deadline expired before the generative fixer";
      if (rolledBack) ctx.lastScore = in.bestScore;
      state = next;
      continue;
    }

    // GENERATIVE_FIX
    std::vector<ClassifiedError> selected = selectForGenerative(ctx.pending, opts);
    int budget = ctx.attemptsRemaining;
    ctx.attemptsRemaining--;
    auto fixer = fixer_;
    Document snapshot = ctx.working;
    CallOutcome<FixProposal> outcome = callWithDeadline<FixProposal>(
        [fixer, snapshot, selected, budget](FixProposal& out, std::string* error) {
          return fixer->proposeFix(snapshot, selected, budget, out, error);
        },
        ctx.callDeadline());
    res.fixerCalls++;

    if (outcome.status == CallStatus::TimedOut && ctx.expired()) {
      res.reason = "deadline expired while awaiting the generative fixer";
      state = RunState::Timeout;
      break;
    }

    bool applied = false;
    if (outcome.status == CallStatus::Ok) {
      const FixProposal& proposal = outcome.value;
      res.fixerUsage.calls += proposal.usage.calls;
      res.fixerUsage.latencyMs += proposal.usage.latencyMs;
      res.fixerUsage.costUnits += proposal.usage.costUnits;
      if (proposal.patches.empty()) {
        log::info() << "[" << runId << "] fixer proposed nothing\n";
      } else {
        std::vector<SkippedPatch> rejected;
        PatchSet checked = validateProposal(ctx.working, proposal.patches, &rejected);
        for (const auto& r : rejected)
          log::warn() << "[" << runId << "] rejected generative patch for '" << r.selector
                      << "': " << r.reason << "\n";
        InjectResult inj = PatchApplier::inject(ctx.working, checked);
        if (inj.ok && inj.appliedCount > 0) {
          ctx.working = inj.document;
          applied = true;
        } else if (!inj.ok) {
          log::warn() << "[" << runId << "] generative patches not applied: " << inj.error << "\n";
        }
      }
    } else {
      log::warn() << "[" << runId << "] generative fixer failed: " << outcome.error << "\n";
    }
    hist.record(stateName(state), ctx.working, std::nullopt);
    res.phasesCompleted++;

    DecisionInput in;
    in.defectsFound = res.defectsFound;
    in.deadlineExpired = ctx.expired();
    if (applied) {
      in.state = state;
      state = nextState(in, opts);
      if (state == RunState::Timeout) res.reason = "deadline expired before validation";
      continue;
    }
    // Nothing changed: decide as if validation repeated the last score
    in.state = RunState::Validate2;
    in.lastScore = ctx.lastScore;
    in.bestScore = hist.bestScore();
    in.attemptsRemaining = ctx.attemptsRemaining;
    in.generativeEligible = anyGenerative(ctx.pending);
    state = nextState(in, opts);
    if (state == RunState::Fail) res.reason = failReason(in, opts);
    else if (state == RunState::Pass) res.reason = "score " + scoreText(*ctx.lastScore) + " meets pass bar";
    else if (state == RunState::Timeout) res.reason = "deadline expired before the generative fixer";
  }
  res.state = state;

  // Final snapshot
  if (res.phasesCompleted > 0 && !(state == RunState::Pass && res.defectsFound == 0)) {
    const HistoryEntry* chosen = (opts.rollback || state == RunState::Timeout)
                                     ? hist.best()
                                     : hist.lastScored();
    if (chosen) {
      res.document = chosen->document;
      res.score = *chosen->score;
      std::string finalError;
      if (!classify(chosen->document, ctx.reportFor(chosen), res.remaining, &finalError)) {
        log::warn() << "[" << runId << "] final classification failed: " << finalError << "\n";
        res.remaining = ctx.pending;
      }
    } else {
      res.document = doc;
      res.score = 0.0;
      res.remaining = errors;
    }
    res.defectsFixed = res.defectsFound > res.remaining.size()
                           ? res.defectsFound - res.remaining.size()
                           : 0;
  }

  res.durationMs =
      std::chrono::duration<double, std::milli>(Clock::now() - ctx.start).count();
  log::info() << "[" << runId << "] " << stateName(res.state) << ": " << res.reason << "\n";

  if (metrics_) {
    MetricsRecord rec;
    rec.runId = runId;
    rec.success = res.passed();
    rec.terminalState = stateName(res.state);
    rec.reason = res.reason;
    rec.finalScore = res.score;
    rec.phasesCompleted = res.phasesCompleted;
    rec.defectsFixed = (unsigned)res.defectsFixed;
    rec.defectsRemaining = (unsigned)res.remaining.size();
    rec.collaboratorCalls = res.collaboratorCalls();
    rec.durationMs = res.durationMs;
    rec.rollbackOccurred = res.rollbackOccurred;
    std::string err;
    if (!metrics_->append(rec, &err))
      log::warn() << "[" << runId << "] metrics not recorded: " << err << "\n";
  }
  return res;
}

} // namespace lfx

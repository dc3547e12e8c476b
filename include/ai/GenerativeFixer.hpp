#pragma once
#include "classify/Defect.hpp"
#include "document/Document.hpp"
#include "rules/Patch.hpp"
#include <string>
#include <vector>

namespace lfx {

struct FixerUsage {
  unsigned calls = 0;
  double   latencyMs = 0.0;
  double   costUnits = 0.0;
};

struct FixProposal {
  PatchSet   patches;
  FixerUsage usage;
};

// Proposes class edits for defects no deterministic rule covers.
// Fails closed: when nothing confident comes out the proposal is an empty
// PatchSet and the call still succeeds. Returning false means the backend
// itself failed.
class GenerativeFixer {
public:
  virtual ~GenerativeFixer() = default;

  virtual bool proposeFix(const Document& doc,
                          const std::vector<ClassifiedError>& unresolved,
                          int attemptsRemaining,
                          FixProposal& out,
                          std::string* error) = 0;
};

// Factory for a rule-of-thumb fixer, no model needed, always available
GenerativeFixer* makeHeuristicFixer();

// Factory for an ONNX backed fixer only if compiled in
GenerativeFixer* makeOnnxFixer(const std::string& modelPath);

} // namespace lfx

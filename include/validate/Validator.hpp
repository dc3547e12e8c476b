#pragma once
#include "classify/Defect.hpp"
#include "document/Document.hpp"
#include "llvm/Support/JSON.h"
#include <optional>
#include <string>
#include <vector>

namespace lfx {

// An element passes when its interaction changed at least `globalDelta`
// of the viewport or `localDelta` of its own box. The document passes at
// a global score of `passScore`.
struct Thresholds {
  double globalDelta = 0.02;
  double localDelta = 0.30;
  double passScore = 0.90;
};

// One interactive element's before/after capture
struct ElementCapture {
  std::string selector;
  double      globalDelta = 0.0;
  double      localDelta = 0.0;
  bool        intercepted = false;   // the click landed on another element
  std::string blocker;               // selector of that element, when known
  std::string error;                 // the capture itself failed
  std::optional<BoundingBox> box;
};

struct ValidationReport {
  std::vector<ElementCapture> elements;
  std::vector<std::string> scriptErrors;
};

struct ScoredElement {
  std::string selector;
  bool        pass = false;
};

struct ValidationScore {
  std::vector<ScoredElement> elements;
  double global = 1.0;

  bool passes(const Thresholds& t) const { return global >= t.passScore; }
  size_t passed() const;
};

bool elementPasses(const ElementCapture& c, const Thresholds& t);
// Empty reports score 1.0: nothing interactive, nothing broken.
ValidationScore scoreReport(const ValidationReport& report, const Thresholds& t);

bool fromJSON(const llvm::json::Value& v, ElementCapture& out, llvm::json::Path p);
bool fromJSON(const llvm::json::Value& v, ValidationReport& out, llvm::json::Path p);
llvm::json::Value toJSON(const ElementCapture& c);
llvm::json::Value toJSON(const ValidationReport& r);

// Rendering/interaction collaborator. Implementations must tolerate
// concurrent calls from independent runs; no state may leak from one
// call into the next.
class Validator {
public:
  virtual ~Validator() = default;
  virtual bool validate(const Document& doc, ValidationReport& out, std::string* error) = 0;
};

// Static estimate from the markup alone, no rendering
Validator* makeHeuristicValidator();

} // namespace lfx

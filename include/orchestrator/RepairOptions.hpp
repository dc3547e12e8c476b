#pragma once
#include "validate/Validator.hpp"
#include "llvm/Support/JSON.h"
#include <chrono>
#include <string>

namespace lfx {

// Immutable run configuration, passed by const reference into every call
// of one run.
struct RepairOptions {
  Thresholds thresholds;
  int    maxGenerativeAttempts = 3;
  std::chrono::milliseconds globalTimeout{120000};
  std::chrono::milliseconds callTimeout{60000};     // per collaborator call
  bool   rollback = true;
  double catastrophicDrop = 0.5;            // best - current above this ends the run
  double generativeConfidenceFloor = 0.7;
  int    maxDefectsPerGenerativeCall = 5;
};

bool validateOptions(const RepairOptions& o, std::string* error);

bool fromJSON(const llvm::json::Value& v, RepairOptions& out, llvm::json::Path p);
llvm::json::Value toJSON(const RepairOptions& o);

// Reads a JSON file; keys it leaves out keep the values already in `out`.
bool loadRepairOptions(const std::string& path, RepairOptions& out, std::string* error);

} // namespace lfx

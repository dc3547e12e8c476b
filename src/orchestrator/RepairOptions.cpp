#include "orchestrator/RepairOptions.hpp"
#include "llvm/Support/Error.h"
#include "llvm/Support/MemoryBuffer.h"

namespace lfx {

static bool thresholdsFromJSON(const llvm::json::Value& v, Thresholds& out, llvm::json::Path p) {
  llvm::json::ObjectMapper o(v, p);
  return o && o.mapOptional("globalDelta", out.globalDelta) &&
         o.mapOptional("localDelta", out.localDelta) && o.mapOptional("passScore", out.passScore);
}

bool fromJSON(const llvm::json::Value& v, RepairOptions& out, llvm::json::Path p) {
  llvm::json::ObjectMapper o(v, p);
  if (!o) return false;
  RepairOptions r = out;
  int64_t globalMs = r.globalTimeout.count();
  int64_t callMs = r.callTimeout.count();
  if (!o.mapOptional("maxGenerativeAttempts", r.maxGenerativeAttempts) ||
      !o.mapOptional("globalTimeoutMs", globalMs) || !o.mapOptional("callTimeoutMs", callMs) ||
      !o.mapOptional("rollback", r.rollback) ||
      !o.mapOptional("catastrophicDrop", r.catastrophicDrop) ||
      !o.mapOptional("generativeConfidenceFloor", r.generativeConfidenceFloor) ||
      !o.mapOptional("maxDefectsPerGenerativeCall", r.maxDefectsPerGenerativeCall))
    return false;
  if (const llvm::json::Value* t = v.getAsObject()->get("thresholds"))
    if (!thresholdsFromJSON(*t, r.thresholds, p.field("thresholds"))) return false;
  r.globalTimeout = std::chrono::milliseconds(globalMs);
  r.callTimeout = std::chrono::milliseconds(callMs);
  out = r;
  return true;
}

llvm::json::Value toJSON(const RepairOptions& o) {
  return llvm::json::Object{
    {"thresholds", llvm::json::Object{{"globalDelta", o.thresholds.globalDelta},
                                      {"localDelta", o.thresholds.localDelta},
                                      {"passScore", o.thresholds.passScore}}},
    {"maxGenerativeAttempts", o.maxGenerativeAttempts},
    {"globalTimeoutMs", (int64_t)o.globalTimeout.count()},
    {"callTimeoutMs", (int64_t)o.callTimeout.count()},
    {"rollback", o.rollback},
    {"catastrophicDrop", o.catastrophicDrop},
    {"generativeConfidenceFloor", o.generativeConfidenceFloor},
    {"maxDefectsPerGenerativeCall", o.maxDefectsPerGenerativeCall}};
}

static bool inUnit(double v) { return v >= 0.0 && v <= 1.0; }

bool validateOptions(const RepairOptions& o, std::string* error) {
  auto fail = [&](const std::string& msg) {
    if (error) *error = msg;
    return false;
  };
  if (!inUnit(o.thresholds.globalDelta) || !inUnit(o.thresholds.localDelta) ||
      !inUnit(o.thresholds.passScore))
    return fail("thresholds must be within [0,1]");
  if (o.maxGenerativeAttempts < 0) return fail("maxGenerativeAttempts must not be negative");
  if (o.globalTimeout.count() <= 0 || o.callTimeout.count() <= 0)
    return fail("timeouts must be positive");
  if (!inUnit(o.catastrophicDrop)) return fail("catastrophicDrop must be within [0,1]");
  if (!inUnit(o.generativeConfidenceFloor))
    return fail("generativeConfidenceFloor must be within [0,1]");
  if (o.maxDefectsPerGenerativeCall < 1) return fail("maxDefectsPerGenerativeCall must be >= 1");
  return true;
}

bool loadRepairOptions(const std::string& path, RepairOptions& out, std::string* error) {
  auto buf = llvm::MemoryBuffer::getFile(path);
  if (!buf) {
    if (error) *error = "cannot read " + path + ": " + buf.getError().message();
    return false;
  }
  llvm::Expected<llvm::json::Value> value = llvm::json::parse((*buf)->getBuffer());
  if (!value) {
    if (error) *error = path + ": " + llvm::toString(value.takeError());
    return false;
  }
  llvm::json::Path::Root root("options");
  RepairOptions parsed = out;
  if (!fromJSON(*value, parsed, root)) {
    if (error) *error = path + ": " + llvm::toString(root.getError());
    return false;
  }
  std::string why;
  if (!validateOptions(parsed, &why)) {
    if (error) *error = path + ": " + why;
    return false;
  }
  out = parsed;
  return true;
}

} // namespace lfx

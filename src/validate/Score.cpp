#include "validate/Validator.hpp"
#include <algorithm>

namespace lfx {

size_t ValidationScore::passed() const {
  return (size_t)std::count_if(elements.begin(), elements.end(),
                               [](const ScoredElement& e) { return e.pass; });
}

bool elementPasses(const ElementCapture& c, const Thresholds& t) {
  if (c.intercepted || !c.error.empty()) return false;
  return c.globalDelta >= t.globalDelta || c.localDelta >= t.localDelta;
}

ValidationScore scoreReport(const ValidationReport& report, const Thresholds& t) {
  ValidationScore s;
  for (const auto& c : report.elements) s.elements.push_back({c.selector, elementPasses(c, t)});
  if (!s.elements.empty()) s.global = (double)s.passed() / (double)s.elements.size();
  return s;
}

static bool boxFromJSON(const llvm::json::Value& v, BoundingBox& out, llvm::json::Path p) {
  llvm::json::ObjectMapper o(v, p);
  return o && o.map("x", out.x) && o.map("y", out.y) && o.map("width", out.width) &&
         o.map("height", out.height);
}

bool fromJSON(const llvm::json::Value& v, ElementCapture& out, llvm::json::Path p) {
  llvm::json::ObjectMapper o(v, p);
  if (!o || !o.map("selector", out.selector) || !o.mapOptional("globalDelta", out.globalDelta) ||
      !o.mapOptional("localDelta", out.localDelta) ||
      !o.mapOptional("intercepted", out.intercepted) || !o.mapOptional("blocker", out.blocker) ||
      !o.mapOptional("error", out.error))
    return false;
  if (const llvm::json::Value* box = v.getAsObject()->get("box")) {
    BoundingBox b;
    if (!boxFromJSON(*box, b, p.field("box"))) return false;
    out.box = b;
  }
  return true;
}

bool fromJSON(const llvm::json::Value& v, ValidationReport& out, llvm::json::Path p) {
  llvm::json::ObjectMapper o(v, p);
  return o && o.map("elements", out.elements) && o.mapOptional("scriptErrors", out.scriptErrors);
}

llvm::json::Value toJSON(const ElementCapture& c) {
  llvm::json::Object o{{"selector", c.selector},
                       {"globalDelta", c.globalDelta},
                       {"localDelta", c.localDelta},
                       {"intercepted", c.intercepted}};
  if (!c.blocker.empty()) o["blocker"] = c.blocker;
  if (!c.error.empty()) o["error"] = c.error;
  if (c.box)
    o["box"] = llvm::json::Object{
      {"x", c.box->x}, {"y", c.box->y}, {"width", c.box->width}, {"height", c.box->height}};
  return std::move(o);
}

llvm::json::Value toJSON(const ValidationReport& r) {
  llvm::json::Array elements;
  for (const auto& c : r.elements) elements.push_back(toJSON(c));
  llvm::json::Array errors;
  for (const auto& e : r.scriptErrors) errors.push_back(e);
  return llvm::json::Object{{"elements", std::move(elements)}, {"scriptErrors", std::move(errors)}};
}

} // namespace lfx

#include "rules/Patch.hpp"
#include <algorithm>

namespace lfx {

static bool contains(const std::vector<std::string>& v, std::string_view s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

bool isClassToken(std::string_view cls) {
  if (cls.empty()) return false;
  for (char c : cls) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u <= 0x20 || u == 0x7f) return false;
    if (c == '"' || c == '\'' || c == '<' || c == '>' || c == '=' || c == '`') return false;
  }
  return true;
}

std::string firstInvalidClass(const Patch& p) {
  for (const auto& c : p.add)
    if (!isClassToken(c)) return c;
  for (const auto& c : p.remove)
    if (!isClassToken(c)) return c;
  return "";
}

void Patch::addClass(std::string_view cls) {
  if (!cls.empty() && !contains(add, cls)) add.emplace_back(cls);
}

void Patch::removeClass(std::string_view cls) {
  if (!cls.empty() && !contains(remove, cls)) remove.emplace_back(cls);
}

void Patch::mergeFrom(const Patch& later) {
  for (const auto& c : later.add) addClass(c);
  for (const auto& c : later.remove) removeClass(c);
  if (!later.rationale.empty() && rationale.find(later.rationale) == std::string::npos)
    rationale = rationale.empty() ? later.rationale : rationale + "; " + later.rationale;
}

std::vector<std::string> Patch::applyTo(const std::vector<std::string>& classes) const {
  std::vector<std::string> out;
  auto keep = [&](const std::string& c) {
    if (!contains(remove, c) && !contains(out, c)) out.push_back(c);
  };
  for (const auto& c : classes) keep(c);
  for (const auto& a : add) keep(a);
  return out;
}

void PatchSet::add(Patch p, int priority) {
  for (auto& e : entries_) {
    if (e.patch.selector == p.selector) {
      e.patch.mergeFrom(p);
      if (priority < e.priority) {
        e.priority = priority;
        std::stable_sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) {
          return a.priority != b.priority ? a.priority < b.priority : a.seq < b.seq;
        });
      }
      return;
    }
  }
  Entry e;
  e.patch = std::move(p);
  e.priority = priority;
  e.seq = nextSeq_++;
  // after every entry of equal or lower priority
  auto at = std::upper_bound(entries_.begin(), entries_.end(), priority,
                             [](int prio, const Entry& x) { return prio < x.priority; });
  entries_.insert(at, std::move(e));
}

void PatchSet::append(const PatchSet& other) {
  for (const auto& e : other.entries_) add(e.patch, e.priority);
}

std::vector<Patch> PatchSet::patches() const {
  std::vector<Patch> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) out.push_back(e.patch);
  return out;
}

const Patch* PatchSet::find(std::string_view selector) const {
  for (const auto& e : entries_)
    if (e.patch.selector == selector) return &e.patch;
  return nullptr;
}

std::string PatchSet::describe() const {
  if (entries_.empty()) return "(no patches)\n";
  std::string out;
  for (const auto& e : entries_) {
    out += e.patch.selector + ":";
    for (const auto& a : e.patch.add) out += " +" + a;
    for (const auto& r : e.patch.remove) out += " -" + r;
    if (!e.patch.rationale.empty()) out += "  (" + e.patch.rationale + ")";
    out += "\n";
  }
  return out;
}

bool fromJSON(const llvm::json::Value& v, Patch& out, llvm::json::Path p) {
  llvm::json::ObjectMapper o(v, p);
  Patch raw;
  if (!o || !o.map("selector", raw.selector) || !o.mapOptional("add", raw.add) ||
      !o.mapOptional("remove", raw.remove) || !o.mapOptional("reason", raw.rationale))
    return false;
  if (raw.selector.empty()) {
    p.field("selector").report("empty selector");
    return false;
  }
  for (const auto& c : raw.add)
    if (!isClassToken(c)) {
      p.field("add").report("invalid class token");
      return false;
    }
  for (const auto& c : raw.remove)
    if (!isClassToken(c)) {
      p.field("remove").report("invalid class token");
      return false;
    }
  out = Patch();
  out.selector = std::move(raw.selector);
  out.rationale = std::move(raw.rationale);
  for (const auto& c : raw.add) out.addClass(c);
  for (const auto& c : raw.remove) out.removeClass(c);
  return true;
}

bool fromJSON(const llvm::json::Value& v, PatchSet& out, llvm::json::Path p) {
  llvm::json::ObjectMapper o(v, p);
  std::vector<Patch> patches;
  std::string source;
  if (!o || !o.mapOptional("source", source) || !o.map("patches", patches)) return false;
  out = PatchSet();
  out.source = std::move(source);
  for (auto& patch : patches) out.add(std::move(patch));
  return true;
}

llvm::json::Value toJSON(const Patch& p) {
  return llvm::json::Object{{"selector", p.selector},
                            {"add", p.add},
                            {"remove", p.remove},
                            {"reason", p.rationale}};
}

llvm::json::Value toJSON(const PatchSet& s) {
  llvm::json::Array patches;
  for (const auto& p : s.patches()) patches.push_back(toJSON(p));
  return llvm::json::Object{{"source", s.source}, {"patches", std::move(patches)}};
}

} // namespace lfx

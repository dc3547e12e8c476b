#pragma once
#include "llvm/Support/JSON.h"
#include <string>
#include <string_view>
#include <vector>

namespace lfx {

// Class-level edit of every element one selector matches. The only way a
// document is ever changed.
struct Patch {
  std::string selector;
  std::vector<std::string> add;      // insertion ordered, no duplicates
  std::vector<std::string> remove;
  std::string rationale;

  void addClass(std::string_view cls);
  void removeClass(std::string_view cls);
  bool empty() const { return add.empty() && remove.empty(); }

  // Union of both add sets and of both remove sets
  void mergeFrom(const Patch& later);

  // (classes + add) - remove. Existing classes keep their order, new ones
  // are appended. Replacing a class takes an explicit remove.
  std::vector<std::string> applyTo(const std::vector<std::string>& classes) const;
};

// A single class attribute token: non-empty, no whitespace, quotes or
// markup characters
bool isClassToken(std::string_view cls);

// Empty when every class of `p` is a valid token, otherwise the offender
std::string firstInvalidClass(const Patch& p);

// Patches ordered by originating priority, ties by insertion order. A
// second patch for a selector already present merges into the first entry
// and takes the lower of the two priorities.
class PatchSet {
public:
  std::string source;      // producer, eg. "rules" or "heuristic-fixer"

  void add(Patch p, int priority = 0);
  void append(const PatchSet& other);

  std::vector<Patch> patches() const;
  const Patch* find(std::string_view selector) const;
  bool empty() const { return entries_.empty(); }
  size_t size() const { return entries_.size(); }

  std::string describe() const;

private:
  struct Entry {
    Patch  patch;
    int    priority = 0;
    size_t seq = 0;
  };
  std::vector<Entry> entries_;
  size_t nextSeq_ = 0;
};

bool fromJSON(const llvm::json::Value& v, Patch& out, llvm::json::Path p);
bool fromJSON(const llvm::json::Value& v, PatchSet& out, llvm::json::Path p);
llvm::json::Value toJSON(const Patch& p);
llvm::json::Value toJSON(const PatchSet& s);

} // namespace lfx

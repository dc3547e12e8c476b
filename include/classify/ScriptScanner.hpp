#pragma once
#include "classify/Defect.hpp"
#include "document/HtmlParser.hpp"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSet.h"
#include <string>
#include <vector>

namespace lfx {

struct ScriptFault {
  ScriptDefect::Cause cause = ScriptDefect::Cause::UndefinedHandler;
  std::string symbol;
  const Node* where = nullptr;   // handler element, or the script that holds the reference
};

// Pattern-level view of the inline behavior: which functions exist,
// which ids the scripts look up, and which elements get listeners
// attached from script.
class ScriptScanner {
public:
  explicit ScriptScanner(const Dom& dom);

  std::vector<ScriptFault> faults() const;
  bool isBound(const Node& el) const;
  bool defines(llvm::StringRef name) const { return defined_.count(name) > 0; }
  const Node* firstScript() const { return scripts_.empty() ? nullptr : scripts_.front(); }

private:
  const Dom& dom_;
  std::vector<const Node*> scripts_;
  llvm::StringSet<> defined_;
  llvm::StringSet<> boundIds_;
  llvm::StringSet<> createdIds_;
  // id -> first script that looks it up
  llvm::StringMap<const Node*> lookups_;
};

} // namespace lfx

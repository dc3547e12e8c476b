#pragma once
#include "document/Document.hpp"
#include "rules/Patch.hpp"
#include <string>
#include <vector>

namespace lfx {

// Byte-range replacement over the original text
struct TextEdit {
  size_t      offset = 0;
  size_t      length = 0;
  std::string replacement;
};

struct SkippedPatch {
  std::string selector;
  std::string reason;
};

struct InjectResult {
  bool        ok = false;
  Document    document;               // input document when !ok
  size_t      appliedCount = 0;       // patches that changed at least one element
  std::vector<std::string> applied;
  std::vector<SkippedPatch> skipped;  // matched nothing, bad selector, or already in effect
  std::string error;
};

struct ClassChange {
  std::string selector;
  std::string element;                // generated selector of the matched element
  std::vector<std::string> before;
  std::vector<std::string> after;
};

class PatchApplier {
public:
  // All or nothing: the merged set either yields a document that parses,
  // or the input comes back unchanged with `error` set. Bytes outside the
  // rewritten class attributes are never touched.
  static InjectResult inject(const Document& doc, const PatchSet& patches);

  // Class lists before and after each patch, without editing anything
  static bool preview(const Document& doc, const PatchSet& patches,
                      std::vector<ClassChange>& out, std::string* error);

  // Applies from the highest offset down so earlier offsets stay valid
  static bool applyEdits(std::string& text, std::vector<TextEdit> edits, std::string* error);
};

} // namespace lfx

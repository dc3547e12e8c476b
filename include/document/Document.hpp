#pragma once
#include <string>

namespace lfx {

// One version of a generated interactive document. Markup and inline
// behavior (script elements, handler attributes) share the same text.
struct Document {
  std::string html;
  unsigned    version = 0;   // bumped by every successful patch application

  bool sameContent(const Document& other) const { return html == other.html; }
};

} // namespace lfx

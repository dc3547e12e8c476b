#pragma once
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"
#include <string>

namespace lfx {
namespace log {

enum class Level { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Process-wide threshold; messages above it are dropped
void setLevel(Level lvl);
Level level();
bool parseLevel(llvm::StringRef text, Level& out);

// One message. The body is buffered and written to llvm::errs() with its
// header in a single locked write when the line goes out of scope, so
// concurrent runs never interleave inside a message.
class Line {
public:
  explicit Line(Level lvl);
  ~Line();
  Line(const Line&) = delete;
  Line& operator=(const Line&) = delete;

  template <typename T> Line& operator<<(const T& value) {
    if (enabled_) os_ << value;
    return *this;
  }

private:
  Level lvl_;
  bool enabled_;
  std::string buf_;
  llvm::raw_string_ostream os_;
};

// Callers terminate lines themselves
Line error();
Line warn();
Line info();
Line debug();

} // namespace log
} // namespace lfx

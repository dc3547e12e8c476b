#include "support/Log.hpp"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/WithColor.h"
#include <atomic>
#include <mutex>

namespace lfx {
namespace log {

static std::atomic<int> gLevel{static_cast<int>(Level::Warn)};

// Serializes every write to llvm::errs() made through this logger
static std::mutex& sinkMutex() {
  static std::mutex mu;
  return mu;
}

static bool enabled(Level lvl) {
  return static_cast<int>(lvl) <= gLevel.load(std::memory_order_relaxed);
}

void setLevel(Level lvl) { gLevel.store(static_cast<int>(lvl), std::memory_order_relaxed); }

Level level() { return static_cast<Level>(gLevel.load(std::memory_order_relaxed)); }

bool parseLevel(llvm::StringRef text, Level& out) {
  int v = llvm::StringSwitch<int>(text.lower())
            .Case("error", 0)
            .Case("warn", 1)
            .Case("warning", 1)
            .Case("info", 2)
            .Case("debug", 3)
            .Default(-1);
  if (v < 0) return false;
  out = static_cast<Level>(v);
  return true;
}

Line::Line(Level lvl) : lvl_(lvl), enabled_(enabled(lvl)), os_(buf_) {}

Line::~Line() {
  if (!enabled_) return;
  os_.flush();
  std::lock_guard<std::mutex> lock(sinkMutex());
  llvm::raw_ostream& err = llvm::errs();
  switch (lvl_) {
  case Level::Error:
    llvm::WithColor::error(err, "layoutfix") << buf_;
    break;
  case Level::Warn:
    llvm::WithColor::warning(err, "layoutfix") << buf_;
    break;
  case Level::Info:
    llvm::WithColor::remark(err, "layoutfix") << buf_;
    break;
  case Level::Debug:
    err << "layoutfix: debug: " << buf_;
    break;
  }
  err.flush();
}

Line error() { return Line(Level::Error); }
Line warn() { return Line(Level::Warn); }
Line info() { return Line(Level::Info); }
Line debug() { return Line(Level::Debug); }

} // namespace log
} // namespace lfx

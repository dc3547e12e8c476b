#include "ai/GenerativeFixer.hpp"
#include "classify/Classifier.hpp"
#include "metrics/Metrics.hpp"
#include "orchestrator/Orchestrator.hpp"
#include "support/Log.hpp"
#include "validate/Validator.hpp"

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"
#include <memory>

using namespace lfx;

static llvm::cl::OptionCategory ToolCat("layoutfix options");

static llvm::cl::opt<std::string> Input(
  "input", llvm::cl::desc("Document to repair (HTML)"), llvm::cl::Required,
  llvm::cl::value_desc("file"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> Output(
  "output", llvm::cl::desc("Where to write the repaired document ('-' for stdout)"),
  llvm::cl::init("-"), llvm::cl::value_desc("file"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> Config(
  "config", llvm::cl::desc("JSON file with repair options"),
  llvm::cl::init(""), llvm::cl::value_desc("file"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> MetricsPath(
  "metrics", llvm::cl::desc("Append a JSON metrics line per run to this file"),
  llvm::cl::init(""), llvm::cl::value_desc("file"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<int> MaxAttempts(
  "max-attempts", llvm::cl::desc("Maximum generative attempts (overrides config)"),
  llvm::cl::init(-1), llvm::cl::cat(ToolCat));

static llvm::cl::opt<int> TimeoutMs(
  "timeout", llvm::cl::desc("Global deadline in milliseconds (overrides config)"),
  llvm::cl::init(0), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> NoRollback(
  "no-rollback", llvm::cl::desc("Keep the last validated version instead of the best one"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> DumpPatches(
  "dump-patches", llvm::cl::desc("Print the deterministic patch set as JSON"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> OnnxModel(
  "onnx-model", llvm::cl::desc("Path to ONNX model (enables ONNX fixer)"),
  llvm::cl::init(""), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> LogLevel(
  "log-level", llvm::cl::desc("error, warn, info or debug"),
  llvm::cl::init("warn"), llvm::cl::cat(ToolCat));

static bool writeOutput(const std::string& path, const std::string& text, std::string* error) {
  std::error_code ec;
  llvm::raw_fd_ostream os(path, ec, llvm::sys::fs::OF_None);
  if (ec) {
    if (error) *error = "cannot write " + path + ": " + ec.message();
    return false;
  }
  os << text;
  os.flush();
  if (os.has_error()) {
    if (error) *error = "write failed for " + path + ": " + os.error().message();
    os.clear_error();
    return false;
  }
  return true;
}

int main(int argc, const char** argv) {
  llvm::cl::HideUnrelatedOptions(ToolCat);
  llvm::cl::ParseCommandLineOptions(argc, argv, "Repairs non-interactive elements in generated UI documents\n");

  log::Level level;
  if (!log::parseLevel(LogLevel, level)) {
    llvm::errs() << "unknown log level '" << LogLevel << "'\n";
    return 2;
  }
  log::setLevel(level);

  RepairOptions opts;
  std::string error;
  if (!Config.empty() && !loadRepairOptions(Config, opts, &error)) {
    log::error() << error << "\n";
    return 2;
  }
  if (MaxAttempts >= 0) opts.maxGenerativeAttempts = MaxAttempts;
  if (TimeoutMs > 0) opts.globalTimeout = std::chrono::milliseconds(TimeoutMs);
  if (NoRollback) opts.rollback = false;
  if (!validateOptions(opts, &error)) {
    log::error() << error << "\n";
    return 2;
  }

  auto buf = llvm::MemoryBuffer::getFileOrSTDIN(Input);
  if (!buf) {
    log::error() << "cannot read " << Input << ": " << buf.getError().message() << "\n";
    return 2;
  }
  Document doc;
  doc.html = (*buf)->getBuffer().str();

  std::shared_ptr<GenerativeFixer> fixer;
  if (!OnnxModel.empty()) {
    try {
      fixer.reset(makeOnnxFixer(OnnxModel));
    } catch (const std::exception& e) {
      log::warn() << "ONNX fixer unavailable (" << e.what() << "), using heuristic fixer\n";
    }
  }
  if (!fixer) fixer.reset(makeHeuristicFixer());

  std::shared_ptr<MetricsSink> sink;
  if (!MetricsPath.empty()) {
    std::unique_ptr<JsonlMetricsSink> jsonl = JsonlMetricsSink::open(MetricsPath, &error);
    if (!jsonl) {
      log::error() << error << "\n";
      return 2;
    }
    sink = std::move(jsonl);
  }

  std::shared_ptr<Validator> validator(makeHeuristicValidator());
  Orchestrator orchestrator(makeLayoutClassifier(), makeDefaultRuleEngine(), validator, fixer,
                            sink);

  std::string runId = llvm::sys::path::filename(Input).str();
  OrchestratorResult result = orchestrator.run(doc, opts, runId);

  if (DumpPatches) llvm::outs() << toJSON(result.deterministicPatches) << "\n";

  if (!writeOutput(Output, result.document.html, &error)) {
    log::error() << error << "\n";
    return 2;
  }

  llvm::raw_ostream& summary = Output == "-" ? llvm::errs() : llvm::outs();
  summary << stateName(result.state) << ": " << result.reason << "\n"
          << "  score " << llvm::format("%.3f", result.score) << ", defects "
          << result.defectsFound << " found, " << result.defectsFixed << " fixed, "
          << result.remaining.size() << " remaining\n"
          << "  collaborator calls " << result.collaboratorCalls()
          << (result.rollbackOccurred ? ", rolled back" : "") << "\n";
  for (const auto& e : result.remaining) summary << "  - " << describe(e) << "\n";

  return result.passed() ? 0 : 1;
}

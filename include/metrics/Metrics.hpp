#pragma once
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lfx {

// One record per finished run
struct MetricsRecord {
  std::string runId;
  bool        success = false;
  std::string terminalState;
  std::string reason;
  double      finalScore = 0.0;
  unsigned    phasesCompleted = 0;
  unsigned    defectsFixed = 0;
  unsigned    defectsRemaining = 0;
  unsigned    collaboratorCalls = 0;
  double      durationMs = 0.0;
  bool        rollbackOccurred = false;
};

llvm::json::Value toJSON(const MetricsRecord& r);

// Append-only consumer of run records. Must accept appends from
// concurrent runs.
class MetricsSink {
public:
  virtual ~MetricsSink() = default;
  virtual bool append(const MetricsRecord& record, std::string* error) = 0;
};

// One JSON object per line
class JsonlMetricsSink : public MetricsSink {
public:
  static std::unique_ptr<JsonlMetricsSink> open(const std::string& path, std::string* error);

  bool append(const MetricsRecord& record, std::string* error) override;

private:
  explicit JsonlMetricsSink(std::unique_ptr<llvm::raw_fd_ostream> out) : out_(std::move(out)) {}

  std::mutex mu_;
  std::unique_ptr<llvm::raw_fd_ostream> out_;
};

class MemoryMetricsSink : public MetricsSink {
public:
  bool append(const MetricsRecord& record, std::string* error) override;
  std::vector<MetricsRecord> records() const;

private:
  mutable std::mutex mu_;
  std::vector<MetricsRecord> records_;
};

} // namespace lfx

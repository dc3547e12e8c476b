#include "metrics/Metrics.hpp"
#include "llvm/Support/FileSystem.h"

namespace lfx {

llvm::json::Value toJSON(const MetricsRecord& r) {
  return llvm::json::Object{{"id", r.runId},
                            {"success", r.success},
                            {"state", r.terminalState},
                            {"reason", r.reason},
                            {"finalScore", r.finalScore},
                            {"phasesCompleted", (int64_t)r.phasesCompleted},
                            {"defectsFixed", (int64_t)r.defectsFixed},
                            {"defectsRemaining", (int64_t)r.defectsRemaining},
                            {"collaboratorCalls", (int64_t)r.collaboratorCalls},
                            {"durationMs", r.durationMs},
                            {"rollbackOccurred", r.rollbackOccurred}};
}

std::unique_ptr<JsonlMetricsSink> JsonlMetricsSink::open(const std::string& path,
                                                         std::string* error) {
  std::error_code ec;
  auto out = std::make_unique<llvm::raw_fd_ostream>(path, ec, llvm::sys::fs::OF_Append);
  if (ec) {
    if (error) *error = "cannot open " + path + ": " + ec.message();
    return nullptr;
  }
  return std::unique_ptr<JsonlMetricsSink>(new JsonlMetricsSink(std::move(out)));
}

bool JsonlMetricsSink::append(const MetricsRecord& record, std::string* error) {
  std::lock_guard<std::mutex> lock(mu_);
  *out_ << toJSON(record) << "\n";
  out_->flush();
  if (out_->has_error()) {
    if (error) *error = "metrics write failed: " + out_->error().message();
    out_->clear_error();
    return false;
  }
  return true;
}

bool MemoryMetricsSink::append(const MetricsRecord& record, std::string*) {
  std::lock_guard<std::mutex> lock(mu_);
  records_.push_back(record);
  return true;
}

std::vector<MetricsRecord> MemoryMetricsSink::records() const {
  std::lock_guard<std::mutex> lock(mu_);
  return records_;
}

} // namespace lfx

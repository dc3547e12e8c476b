#pragma once
#include "document/Document.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lfx {

struct HistoryEntry {
  std::string           phase;
  Document              document;
  std::optional<double> score;    // only VALIDATE entries carry one
  size_t                seq = 0;
};

// Append-only log of one run plus the index of its best-scoring entry.
// The best entry only moves on a strictly higher score.
class History {
public:
  // Returns true when the new entry became the best one
  bool record(std::string phase, const Document& doc, std::optional<double> score);

  const std::vector<HistoryEntry>& entries() const { return entries_; }
  const HistoryEntry* best() const { return best_ ? &entries_[*best_] : nullptr; }
  std::optional<size_t> bestIndex() const { return best_; }
  std::optional<double> bestScore() const;
  const HistoryEntry* lastScored() const;

  // No scored entry beats the best one
  bool bestIsMaximal() const;

private:
  std::vector<HistoryEntry> entries_;
  std::optional<size_t> best_;
};

} // namespace lfx

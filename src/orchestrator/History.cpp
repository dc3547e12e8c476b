#include "orchestrator/History.hpp"

namespace lfx {

bool History::record(std::string phase, const Document& doc, std::optional<double> score) {
  HistoryEntry e;
  e.phase = std::move(phase);
  e.document = doc;
  e.score = score;
  e.seq = entries_.size();
  entries_.push_back(std::move(e));
  if (score && (!best_ || *score > *entries_[*best_].score)) {
    best_ = entries_.size() - 1;
    return true;
  }
  return false;
}

std::optional<double> History::bestScore() const {
  if (!best_) return std::nullopt;
  return entries_[*best_].score;
}

const HistoryEntry* History::lastScored() const {
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
    if (it->score) return &*it;
  return nullptr;
}

bool History::bestIsMaximal() const {
  for (const auto& e : entries_) {
    if (!e.score) continue;
    if (!best_ || *e.score > *entries_[*best_].score) return false;
  }
  return true;
}

} // namespace lfx

#include "order_key_sequencer.hpp"

#include <algorithm>
#include <cmath>

namespace voicecode::queue {

bool EntryLess(const QueueEntry& a, const QueueEntry& b) {
  if (a.priority != b.priority) return a.priority < b.priority;

  // NaN sorts after every number within its bucket
  const bool a_nan = std::isnan(a.order_key);
  const bool b_nan = std::isnan(b.order_key);
  if (a_nan != b_nan) return b_nan;
  if (!a_nan && a.order_key != b.order_key) return a.order_key < b.order_key;
  return a.session_id < b.session_id;
}

void SortEntries(std::vector<QueueEntry>& entries) {
  std::sort(entries.begin(), entries.end(), EntryLess);
}

double ComputeInsertionKey(std::optional<double> above, std::optional<double> below, const OrderKeyPolicy& policy) {
  if (above && below) {
    return *above + (*below - *above) / 2.0;
  }
  if (below) {
    return *below - policy.unit_step;
  }
  if (above) {
    return *above + policy.unit_step;
  }
  return policy.origin;
}

bool NeedsRenormalization(const std::vector<QueueEntry>& entries, const OrderKeyPolicy& policy) {
  for (const auto& entry : entries) {
    if (!std::isfinite(entry.order_key)) return true;
  }

  auto sorted = entries;
  SortEntries(sorted);

  for (size_t i = 1; i < sorted.size(); ++i) {
    const auto& prev = sorted[i - 1];
    const auto& cur  = sorted[i];
    if (prev.priority != cur.priority) continue;

    if (cur.order_key - prev.order_key < policy.min_gap) return true;

    const double mid = ComputeInsertionKey(prev.order_key, cur.order_key, policy);
    if (!(prev.order_key < mid && mid < cur.order_key)) return true;
  }

  return false;
}

std::vector<QueueEntry> Renormalize(std::vector<QueueEntry> entries, const OrderKeyPolicy& policy) {
  SortEntries(entries);

  size_t position = 0;
  for (size_t i = 0; i < entries.size(); ++i) {
    if (i > 0 && entries[i].priority != entries[i - 1].priority) position = 0;
    entries[i].order_key = policy.origin + static_cast<double>(position) * policy.renormalize_step;
    ++position;
  }

  return entries;
}

} // namespace voicecode::queue

#pragma once

#include <optional>
#include <vector>

#include "queue_entry.hpp"

namespace voicecode::queue {

/*
  Fractional order keys.

  A move writes exactly one new key, computed from its two neighbours.
  Repeated midpoint insertions eventually exhaust double precision, so
  callers check NeedsRenormalization after every write and rewrite the whole
  list with Renormalize when it reports true. All functions are pure.
*/

struct OrderKeyPolicy {
  // Key of the first entry in an empty list.
  double origin = 1.0;

  // Distance from the neighbour when inserting at the head or tail.
  double unit_step = 1.0;

  // Adjacent keys closer than this are considered collided.
  double min_gap = 1e-9;

  // Spacing used by Renormalize.
  double renormalize_step = 1.0;
};

// Strict total order: priority, then order_key, then session_id.
bool EntryLess(const QueueEntry& a, const QueueEntry& b);

void SortEntries(std::vector<QueueEntry>& entries);

// above/below are the keys of the entries that will sit directly before and
// after the new position, if any.
double ComputeInsertionKey(std::optional<double> above, std::optional<double> below, const OrderKeyPolicy& policy = {});

// True when two adjacent keys in the same priority bucket are closer than
// min_gap, or their midpoint no longer lands strictly between them.
bool NeedsRenormalization(const std::vector<QueueEntry>& entries, const OrderKeyPolicy& policy = {});

// Returns the entries sorted, with each bucket's keys reassigned to
// origin, origin + step, origin + 2*step, ...
std::vector<QueueEntry> Renormalize(std::vector<QueueEntry> entries, const OrderKeyPolicy& policy = {});

} // namespace voicecode::queue

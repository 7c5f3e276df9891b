#pragma once

#include <cstdint>
#include <string>

#include "voicecode/session/v1.hpp"

namespace voicecode::queue {

/*
  A session participating in the priority queue.

  Sorted by (priority, order_key, session_id). session_id is the stable
  tie-break that keeps the order total when two order keys collide.
*/
struct QueueEntry {
  std::string session_id;

  voicecode::session::v1::Priority priority = voicecode::session::v1::PRIORITY_LOW;

  double order_key = 0.0;

  uint64_t queued_at_ms = 0;
};

} // namespace voicecode::queue

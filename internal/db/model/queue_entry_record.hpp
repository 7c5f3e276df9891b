#pragma once

#include <cstdint>
#include <string>

#include "voicecode/session/v1.hpp"

namespace voicecode::db::model {

/*
  Persistent priority queue row. One row per queued session.
*/

struct QueueEntryRecord {
  std::string session_id;

  voicecode::session::v1::Priority priority = voicecode::session::v1::PRIORITY_LOW;

  double order_key = 0.0;

  uint64_t queued_at_ms = 0;
};

}

#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace voicecode::util {

/*
  Time utilities. Wall clock for persisted timestamps, steady clock for
  deadlines.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock = std::chrono::steady_clock;

TimePoint Now();

uint64_t NowUnixMillis();
uint64_t ToUnixMillis(TimePoint tp);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& duration);
google::protobuf::Duration ToProto(std::chrono::milliseconds duration);

} // namespace voicecode::util

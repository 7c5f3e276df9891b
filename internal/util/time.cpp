#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace voicecode::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t NowUnixMillis() {
  return ToUnixMillis(Now());
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& duration) {
  return std::chrono::milliseconds(google::protobuf::util::TimeUtil::DurationToMilliseconds(duration));
}

google::protobuf::Duration ToProto(std::chrono::milliseconds duration) {
  return google::protobuf::util::TimeUtil::MillisecondsToDuration(duration.count());
}

} // namespace voicecode::util

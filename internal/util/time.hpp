#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace courier::util {

/*
  Time utilities: single place to control clock source later.

  Bundle timestamps travel as unix milliseconds; everything below the
  node API takes an explicit now_ms so tests can drive time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();
uint64_t  NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t unix_ms);

// Zero durations map to the fallback.
std::chrono::milliseconds DurationOr(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);
google::protobuf::Duration ToProto(std::chrono::milliseconds d);

} // namespace courier::util

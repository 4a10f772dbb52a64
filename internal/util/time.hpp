#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/timestamp.pb.h"

namespace datahub::util {

/*
  Time utilities. Every clock read goes through ClockFn.

  Components that reason about windows (quota, session TTL) take a
  ClockFn so tests can move time forward.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t unix_ms);

// Start of the UTC calendar day containing tp.
TimePoint StartOfUtcDay(TimePoint tp);

} // namespace datahub::util

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace glucolumin::util {

/*
  Time utilities. All clock reads go through here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// UTC, millisecond precision: 2026-10-19T08:15:02.123Z
std::string ToIso8601(TimePoint tp);

// YYYYMMDD in UTC
std::string ToDateStamp(TimePoint tp);

} // namespace glucolumin::util

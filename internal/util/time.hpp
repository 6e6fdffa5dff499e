#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace bazaar::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Zero or negative durations yield `fallback`.
std::chrono::milliseconds FromProto(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

std::int64_t ToUnixMillis(TimePoint tp);

} // namespace bazaar::util

#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace circulation::util {

/*
  Time utilities. Single place to control the clock source.

  Ledgers persist wall-clock milliseconds. Deadlines use the steady clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Deadline  = std::chrono::steady_clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);
uint64_t  NowMs();

google::protobuf::Timestamp MillisToProto(uint64_t ms);

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d);

Deadline DeadlineAfter(std::chrono::milliseconds timeout);
bool     Expired(Deadline deadline);

} // namespace circulation::util

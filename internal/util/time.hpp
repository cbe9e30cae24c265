#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace swarm::util {

/*
  Time utilities. All clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration);

// RFC3339 ("2026-01-02T03:04:05Z", offsets allowed). Throws std::invalid_argument.
TimePoint ParseRfc3339(const std::string& text);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace swarm::util

#pragma once

#include <chrono>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace timekeeper::util {

/*
  Time utilities. All wall-clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// RFC 3339 / ISO-8601 in UTC, e.g. "2024-05-01T18:30:00.250Z".
std::string ToIso8601(TimePoint tp);

// Throws std::invalid_argument on malformed input.
TimePoint FromIso8601(const std::string& text);

} // namespace timekeeper::util

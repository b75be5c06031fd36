#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/duration.pb.h"

namespace purchase::util {

/*
  Time utilities. Timestamps persisted in SQLite are ISO-8601 UTC text
  ("2024-03-01T10:15:30.250Z").
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::string              FormatIso8601(TimePoint tp);
// accepts 'T' or ' ' between date and time; no zone means UTC
std::optional<TimePoint> ParseIso8601(const std::string& text);

// "2024-03-01 10:15:30", the form the remote validator expects
std::string FormatWireDateTime(TimePoint tp);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace purchase::util

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace aegis::util {

// Wall clock for ledger records, reports and backup buckets.
using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// Local-time bucket used to namespace backup and quarantine runs: YYYYMMDDHHMM.
std::string MinuteBucket(TimePoint tp);

// ISO-8601 UTC with milliseconds, e.g. 2026-10-17T09:30:00.125Z
std::string ToIso8601(TimePoint tp);

} // namespace aegis::util

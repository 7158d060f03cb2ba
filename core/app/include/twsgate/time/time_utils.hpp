#pragma once

#include "twsgate/domain/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace twsgate {

// -----------------------------------------------------------------------------
// Time conversion and wire-format utilities
// -----------------------------------------------------------------------------
//
// The gateway is inconsistent about time formats: historical bars arrive
// as epoch seconds (formatDate=2, intraday) or as bare dates (daily bars),
// executions as "YYYYMMDD  HH:MM:SS zone", and older servers echo
// "YYYYMMDD HH:MM:SS". Outbound filters expect "YYYYMMDD-HH:MM:SS" in UTC.
//
// Thread-safety: Stateless. Uses gmtime_r / timegm style arithmetic only.
// -----------------------------------------------------------------------------

inline domain::Timestamp ms_to_timestamp(std::int64_t ms) {
  return domain::Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(domain::Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// parseWireTimestamp(text)
// -------------------------------------------------------------------------
// @brief  Parses a gateway time string.
//
// @param  text  One of:
//                 "1700000000"                       epoch seconds
//                 "20240105"                         date, UTC midnight
//                 "20240105 09:30:00"                wall clock, UTC
//                 "20240105  09:30:00"               (double space)
//                 "20240105-09:30:00"                UTC
//                 "20240105 09:30:00 US/Eastern"     zone suffix
//
// @return std::nullopt when the string matches none of the above.
//
// @details
// Zone suffixes UTC, GMT, Etc/UTC and Z are honoured exactly. Fixed
// offsets ("+0100", "-05:00") are applied. A small table covers the named
// zones the gateway reports (US/Eastern, America/Chicago, Europe/London,
// Asia/Hong_Kong, EST, ...), with US and EU daylight saving rules. Any
// other name is read as UTC; callers still have the raw string
// (Bar::wire_time, Execution::wire_time) if they need the original.
//
// Epoch strings longer than ten digits are rejected.
// -------------------------------------------------------------------------
std::optional<domain::Timestamp> parseWireTimestamp(const std::string& text);

// "YYYYMMDD-HH:MM:SS" in UTC, the form accepted by historical end times and
// execution filters.
std::string formatWireDateTime(domain::Timestamp tp);

// ISO-8601 "YYYY-MM-DDTHH:MM:SSZ" for JSON telemetry.
std::string formatIso8601(domain::Timestamp tp);

}  // namespace twsgate

#pragma once

#include <string>
#include "types.hpp"

// Format the duration between two ISO timestamps (YYYY-MM-DDTHH:MM:SS).
// If end_time is empty, uses current time (for "still connected" durations).
// Returns human-readable string like "2h35m", "14m22s", "8s", or "-" if start is empty.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// Same formatting for a span of seconds.
std::string format_seconds(long seconds);

// Format an ISO timestamp (YYYY-MM-DDTHH:MM:SS) to "8:13pm" display.
// Returns "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);

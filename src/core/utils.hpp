#pragma once

#include <string>
#include <optional>
#include <ctime>
#include "types.hpp"

// Format a time point as local ISO 8601 (YYYY-MM-DDTHH:MM:SS).
std::string to_iso(TimePoint tp);

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Parse an ISO 8601 timestamp to a time point. nullopt on empty or bad input.
std::optional<TimePoint> parse_iso_time_point(const std::string& iso);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// True if `s` is a dotted IPv4 or an IPv6 literal.
bool is_ip_literal(const std::string& s);

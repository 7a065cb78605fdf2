#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <stdexcept>
#include <arpa/inet.h>

std::string to_iso(TimePoint tp) {
    auto t = Clock::to_time_t(tp);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::time_t parse_iso_time(const std::string& iso) {
    struct tm tm_buf = {};
    if (sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) == 6) {
        tm_buf.tm_year -= 1900;
        tm_buf.tm_mon -= 1;
        tm_buf.tm_isdst = -1;
        return mktime(&tm_buf);
    }
    return 0;
}

std::optional<TimePoint> parse_iso_time_point(const std::string& iso) {
    if (iso.empty()) return std::nullopt;
    std::time_t t = parse_iso_time(iso);
    if (t == 0) return std::nullopt;
    return Clock::from_time_t(t);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

bool is_ip_literal(const std::string& s) {
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, s.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, s.c_str(), buf) == 1;
}

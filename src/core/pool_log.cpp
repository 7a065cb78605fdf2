#include "pool_log.hpp"
#include <platform/platform.hpp>
#include <atomic>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>

static std::mutex g_log_mutex;
static std::atomic<bool> g_log_echo{false};

std::string pool_log_path() {
    static std::string path = (platform::temp_dir() / "sockspool_debug.log").string();
    return path;
}

void set_pool_log_echo(bool enabled) {
    g_log_echo.store(enabled);
}

void pool_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ofstream out(pool_log_path(), std::ios::app);
    if (out) {
        out << "[" << ts << "] " << msg << "\n";
    }
    if (g_log_echo.load()) {
        std::cerr << "[" << ts << "] " << msg << "\n";
    }
}

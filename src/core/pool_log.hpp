#pragma once

#include <string>

// Path of the append-only debug log (<tmp>/sockspool_debug.log).
std::string pool_log_path();

// Also echo every log line to stderr (`sockspool run -v`).
void set_pool_log_echo(bool enabled);

// Append a timestamped line to the debug log. Safe to call from any thread.
void pool_log(const std::string& msg);

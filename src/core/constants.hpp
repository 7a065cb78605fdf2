#pragma once

// ── Defaults ────────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT              = 22;
constexpr const char* DEFAULT_PORT_NUMBERS  = "10000-10009";
constexpr const char* DEFAULT_SSH_PORTS     = "22";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_POLL_INTERVAL_MS          = 20;    // Sleep between EAGAIN retries
constexpr int CHANNEL_OPEN_TIMEOUT_SECS     = 15;    // direct-tcpip open budget
constexpr int SSH_DISCONNECT_TIMEOUT_MS     = 1000;  // Flush of the disconnect message
constexpr int SOCKS_HANDSHAKE_TIMEOUT_MS    = 10000; // Client greeting + request
constexpr int SHUTDOWN_POLL_MS              = 100;   // Stop-flag granularity in sleeps

// ── Retry counts ────────────────────────────────────────────
constexpr int STORE_TX_MAX_ATTEMPTS         = 3;     // Optimistic transaction attempts

// ── Buffer sizes ────────────────────────────────────────────
constexpr int RELAY_BUF_SIZE                = 16384;
constexpr int IP_CHECK_MAX_RESPONSE         = 4096;
constexpr int LISTEN_BACKLOG                = 64;

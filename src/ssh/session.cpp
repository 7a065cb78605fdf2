#include "session.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <cstring>

// ── Algorithm preferences ────────────────────────────────────
// Old dropbear/OpenSSH servers in the pool only speak ssh-rsa host keys,
// CBC ciphers or SHA1 MACs. ecdh-sha2-nistp521 is left out for OpenSSH 7.2.
static const char* PREF_KEX =
    "curve25519-sha256,curve25519-sha256@libssh.org,"
    "ecdh-sha2-nistp256,ecdh-sha2-nistp384,"
    "diffie-hellman-group-exchange-sha256,diffie-hellman-group16-sha512,"
    "diffie-hellman-group18-sha512,diffie-hellman-group14-sha256,"
    "diffie-hellman-group14-sha1,diffie-hellman-group-exchange-sha1,"
    "diffie-hellman-group1-sha1";
static const char* PREF_HOSTKEY =
    "ssh-rsa,rsa-sha2-512,rsa-sha2-256,ecdsa-sha2-nistp256,"
    "ecdsa-sha2-nistp384,ecdsa-sha2-nistp521,ssh-ed25519,ssh-dss";
static const char* PREF_CRYPT =
    "aes128-ctr,aes192-ctr,aes256-ctr,aes256-gcm@openssh.com,aes128-gcm@openssh.com,"
    "chacha20-poly1305@openssh.com,aes256-cbc,aes192-cbc,aes128-cbc,"
    "rijndael-cbc@lysator.liu.se,blowfish-cbc,cast128-cbc,3des-cbc,arcfour128,arcfour";
static const char* PREF_MAC =
    "hmac-sha2-256,hmac-sha2-512,hmac-sha2-256-etm@openssh.com,"
    "hmac-sha2-512-etm@openssh.com,hmac-sha1,hmac-sha1-96,hmac-md5,hmac-md5-96,"
    "hmac-ripemd160,hmac-ripemd160@openssh.com";
static const char* PREF_COMP = "none,zlib@openssh.com,zlib";

static std::once_flag g_libssh2_once;
static int g_libssh2_rc = 0;

// libssh2_init is not thread-safe; run it once per process.
static void ensure_libssh2() {
    std::call_once(g_libssh2_once, [] { g_libssh2_rc = libssh2_init(0); });
    if (g_libssh2_rc != 0) {
        throw TunnelError("InitError", "Failed to initialize libssh2");
    }
}

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    const auto* password = static_cast<const std::string*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(password->c_str());
        responses[i].length = static_cast<unsigned int>(password->length());
    }
}

static std::string last_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : "unknown error";
}

SshSession::SshSession(const SshTarget& target)
    : target_(target), session_(nullptr), sock_(SOCKSPOOL_INVALID_SOCKET), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SshSession::~SshSession() {
    close();
}

void SshSession::connect(const std::atomic<bool>& cancel) {
    ensure_libssh2();

    const std::string where = fmt::format("{}:{}", target_.host, target_.port);
    auto connect_deadline = std::chrono::steady_clock::now() +
                            std::chrono::seconds(target_.connect_timeout);

    auto check_progress = [&](const char* stage, std::chrono::steady_clock::time_point deadline) {
        if (cancel.load()) {
            close();
            throw TunnelError("Cancelled", fmt::format("{} to {} cancelled", stage, where));
        }
        if (std::chrono::steady_clock::now() > deadline) {
            close();
            throw TunnelError("TimeoutError", fmt::format("{} to {} timed out", stage, where));
        }
    };

    // Resolve and connect
    std::string error;
    sock_ = platform::connect_tcp(target_.host, target_.port,
                                  target_.connect_timeout * 1000, error, &cancel);
    if (sock_ == SOCKSPOOL_INVALID_SOCKET) {
        if (cancel.load()) throw TunnelError("Cancelled", "Connect to " + where + " cancelled");
        if (error.find("timed out") != std::string::npos) throw TunnelError("TimeoutError", error);
        throw TunnelError("OSError", error);
    }

    // Enable TCP keepalive on the socket
    int tcp_keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif

    // Create SSH session
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        throw TunnelError("InitError", "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);
    apply_method_prefs();

    // SSH handshake (key exchange)
    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        check_progress("Handshake", connect_deadline);
        wait_socket(SSH_POLL_INTERVAL_MS);
    }
    if (rc != 0) {
        std::string why = last_error(session_);
        close();
        throw TunnelError("HandshakeError", fmt::format("SSH handshake with {} failed: {}", where, why));
    }

    // SSH keepalive every 30s
    libssh2_keepalive_config(session_, 1, 30);

    auto login_deadline = std::chrono::steady_clock::now() +
                          std::chrono::seconds(target_.login_timeout);
    try {
        userauth(login_deadline, cancel);
    } catch (const TunnelError&) {
        close();
        throw;
    }

    active_ = true;
}

void SshSession::apply_method_prefs() {
    struct Pref { int method; const char* list; };
    const Pref prefs[] = {
        {LIBSSH2_METHOD_KEX, PREF_KEX},
        {LIBSSH2_METHOD_HOSTKEY, PREF_HOSTKEY},
        {LIBSSH2_METHOD_CRYPT_CS, PREF_CRYPT},
        {LIBSSH2_METHOD_CRYPT_SC, PREF_CRYPT},
        {LIBSSH2_METHOD_MAC_CS, PREF_MAC},
        {LIBSSH2_METHOD_MAC_SC, PREF_MAC},
        {LIBSSH2_METHOD_COMP_CS, PREF_COMP},
        {LIBSSH2_METHOD_COMP_SC, PREF_COMP},
    };
    // Unsupported names are skipped by libssh2; a list with no supported
    // name fails and leaves the library default in place.
    for (const auto& p : prefs) {
        libssh2_session_method_pref(session_, p.method, p.list);
    }
    libssh2_session_flag(session_, LIBSSH2_FLAG_COMPRESS, 1);
}

void SshSession::userauth(std::chrono::steady_clock::time_point deadline,
                          const std::atomic<bool>& cancel) {
    const std::string who = fmt::format("{}@{}:{}", target_.username, target_.host, target_.port);

    auto check_progress = [&]() {
        if (cancel.load()) {
            throw TunnelError("Cancelled", "Login as " + who + " cancelled");
        }
        if (std::chrono::steady_clock::now() > deadline) {
            throw TunnelError("TimeoutError", "Login as " + who + " timed out");
        }
    };

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.username.c_str(),
                                              static_cast<unsigned int>(target_.username.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) return;  // "none" auth accepted
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        check_progress();
        wait_socket(SSH_POLL_INTERVAL_MS);
    }
    std::string methods = auth_list ? auth_list : "";

    int rc = -1;
    if (methods.empty() || methods.find("password") != std::string::npos) {
        while ((rc = libssh2_userauth_password(session_, target_.username.c_str(),
                                               target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            check_progress();
            wait_socket(SSH_POLL_INTERVAL_MS);
        }
        if (rc == 0) return;
    }

    // Some servers only take the password through keyboard-interactive
    if (methods.find("keyboard-interactive") != std::string::npos) {
        *libssh2_session_abstract(session_) = &target_.password;
        while ((rc = libssh2_userauth_keyboard_interactive(session_, target_.username.c_str(),
                                                           kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            check_progress();
            wait_socket(SSH_POLL_INTERVAL_MS);
        }
        *libssh2_session_abstract(session_) = nullptr;
        if (rc == 0) return;
    }

    throw TunnelError("AuthError", fmt::format("Authentication failed for {} (methods: {})",
                                               who, methods.empty() ? "?" : methods));
}

void SshSession::wait_socket(int timeout_ms) {
    if (!session_ || sock_ == SOCKSPOOL_INVALID_SOCKET) {
        platform::sleep_ms(timeout_ms);
        return;
    }
    int dir = libssh2_session_block_directions(session_);
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) {
        platform::sleep_ms(timeout_ms);
        return;
    }
    platform::poll_socket(sock_, events, timeout_ms);
}

LIBSSH2_CHANNEL* SshSession::open_direct_tcpip(const std::string& host, int port,
                                               const std::atomic<bool>& stop) {
    if (!session_ || !active_) return nullptr;

    LIBSSH2_CHANNEL* ch = nullptr;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while (std::chrono::steady_clock::now() < deadline && !stop.load()) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_direct_tcpip(session_, host.c_str(), port);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN)
                return nullptr;
        }
        if (ch) break;
        platform::sleep_ms(10);
    }
    return ch;
}

void SshSession::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    if (session_) {
        // Non-blocking: the disconnect message may need several calls to go out
        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(SSH_DISCONNECT_TIMEOUT_MS);
        while (true) {
            int rc;
            {
                std::lock_guard<std::mutex> lock(*io_mutex_);
                rc = libssh2_session_disconnect(session_, "Normal disconnection");
            }
            if (rc != LIBSSH2_ERROR_EAGAIN || sock_ == SOCKSPOOL_INVALID_SOCKET) break;
            if (std::chrono::steady_clock::now() >= deadline) break;
            wait_socket(SSH_POLL_INTERVAL_MS);
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ != SOCKSPOOL_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SOCKSPOOL_INVALID_SOCKET;
    }
}

bool SshSession::is_active() const {
    return active_;
}

bool SshSession::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ == SOCKSPOOL_INVALID_SOCKET) return false;

    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }
    return true;
}

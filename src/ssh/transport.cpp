#include "transport.hpp"
#include "auth.hpp"
#include "ssh_channel.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>

SshTransport::SshTransport(const HostConfig& host)
    : host_(host), session_(nullptr), sock_(MCSH_INVALID_SOCKET), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SshTransport::~SshTransport() {
    close();
}

SSHResult SshTransport::connect_socket(StatusCallback callback) {
    if (callback) {
        callback(fmt::format("Connecting to {}:{}...", host_.host, host_.port));
    }

    auto connected = platform::connect_tcp(host_.host, host_.port, host_.timeout * 1000);
    if (connected.is_err()) {
        return SSHResult{-1, "", connected.error};
    }
    sock_ = connected.value;
    return SSHResult{0, "", ""};
}

SSHResult SshTransport::establish(StatusCallback callback) {
    int rc = libssh2_init(0);
    if (rc != 0) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    auto connected = connect_socket(callback);
    if (connected.failed()) return connected;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        platform::close_socket(sock_);
        sock_ = MCSH_INVALID_SOCKET;
        return SSHResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(100);
    }
    if (ret != 0) {
        free_session("Handshake failed");
        return SSHResult{-1, "", "SSH handshake failed"};
    }

    // Enable SSH keepalive (send every 30s)
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = authenticate(session_, host_, callback);
    if (auth_result.failed()) {
        free_session("Authentication failed");
        return auth_result;
    }

    active_ = true;
    target_str_ = host_.user + "@" + host_.host;
    mcsh_log("[transport] connected to " + target_str_);

    if (callback) {
        callback("Connected to " + host_.host);
    }

    return SSHResult{0, "", ""};
}

Result<std::unique_ptr<RemoteChannel>> SshTransport::open_channel() {
    using ChannelResult = Result<std::unique_ptr<RemoteChannel>>;

    if (!active_ || !session_) {
        return ChannelResult::Err("Transport not connected");
    }

    LIBSSH2_CHANNEL* ch = nullptr;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(host_.timeout);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_open_session(session_);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                return ChannelResult::Err("Failed to open SSH channel");
            }
        }
        if (ch) break;
        platform::sleep_ms(10);
    }
    if (!ch) {
        return ChannelResult::Err("Timed out opening SSH channel");
    }

    return ChannelResult::Ok(std::make_unique<SshChannel>(ch, session_, io_mutex_, sock_));
}

void SshTransport::free_session(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != MCSH_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = MCSH_INVALID_SOCKET;
    }
}

void SshTransport::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    if (session_) {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != MCSH_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = MCSH_INVALID_SOCKET;
    }
}

bool SshTransport::is_active() const {
    return active_;
}

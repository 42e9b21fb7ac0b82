#include "ssh_channel.hpp"
#include "terminal_modes.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>

SshChannel::SshChannel(LIBSSH2_CHANNEL* ch, LIBSSH2_SESSION* session,
                       std::shared_ptr<std::mutex> io_mutex, socket_t sock)
    : ch_(ch), session_(session), io_mutex_(std::move(io_mutex)), sock_(sock) {}

SshChannel::~SshChannel() {
    close();
}

// Caller must hold io_mutex_.
std::string SshChannel::last_error() {
    char* msg = nullptr;
    int len = 0;
    int code = libssh2_session_last_error(session_, &msg, &len, 0);
    if (!msg || len == 0) return fmt::format("libssh2 error {}", code);
    return fmt::format("{} ({})", std::string(msg, len), code);
}

Result<void> SshChannel::setenv(const std::string& name, const std::string& value) {
    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return Result<void>::Err("Channel closed");
            rc = libssh2_channel_setenv_ex(ch_, name.c_str(),
                                           static_cast<unsigned int>(name.size()),
                                           value.c_str(),
                                           static_cast<unsigned int>(value.size()));
            if (rc != LIBSSH2_ERROR_EAGAIN) {
                if (rc != 0) return Result<void>::Err(last_error());
                return Result<void>::Ok();
            }
        }
        platform::sleep_ms(10);
    }
}

Result<void> SshChannel::request_pty(const PtyRequest& pty) {
    std::string modes = encode_terminal_modes(pty.modes);
    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return Result<void>::Err("Channel closed");
            rc = libssh2_channel_request_pty_ex(
                ch_, pty.term.c_str(), static_cast<unsigned int>(pty.term.size()),
                modes.data(), static_cast<unsigned int>(modes.size()),
                pty.columns, pty.rows, 0, 0);
            if (rc != LIBSSH2_ERROR_EAGAIN) {
                if (rc != 0) return Result<void>::Err(last_error());
                return Result<void>::Ok();
            }
        }
        platform::sleep_ms(10);
    }
}

Result<void> SshChannel::start(const std::string& program) {
    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return Result<void>::Err("Channel closed");
            rc = libssh2_channel_exec(ch_, program.c_str());
            if (rc != LIBSSH2_ERROR_EAGAIN) {
                if (rc != 0) return Result<void>::Err(last_error());
                return Result<void>::Ok();
            }
        }
        platform::sleep_ms(10);
    }
}

ssize_t SshChannel::read(StreamKind stream, char* buf, size_t len) {
    int stream_id = (stream == StreamKind::STDERR) ? SSH_EXTENDED_DATA_STDERR : 0;

    while (true) {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (closed_ || !ch_) return LIBSSH2_ERROR_CHANNEL_CLOSED;
            n = libssh2_channel_read_ex(ch_, stream_id, buf, len);
            if ((n == 0 || n == LIBSSH2_ERROR_EAGAIN) && libssh2_channel_eof(ch_)) {
                return 0;
            }
        }
        if (n > 0) return n;
        if (n != 0 && n != LIBSSH2_ERROR_EAGAIN) return n;

        // Poll socket without holding io_mutex_
        platform::poll_socket(sock_, POLLIN, SSH_POLL_INTERVAL_MS);
    }
}

Result<void> SshChannel::write(const std::string& data) {
    size_t sent = 0;
    int write_retries = 0;
    while (sent < data.size()) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (closed_ || !ch_) return Result<void>::Err("Channel closed");
            w = libssh2_channel_write(ch_, data.data() + sent, data.size() - sent);
            if (w < 0 && w != LIBSSH2_ERROR_EAGAIN) {
                return Result<void>::Err(last_error());
            }
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > SSH_WRITE_MAX_RETRIES) {
                return Result<void>::Err("Write stalled (EAGAIN for too long)");
            }
            platform::sleep_ms(10);
            continue;
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

void SshChannel::close_input() {
    int rc;
    int retries = 0;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return;
            rc = libssh2_channel_send_eof(ch_);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) platform::sleep_ms(10);
    } while (rc == LIBSSH2_ERROR_EAGAIN && ++retries < SSH_WRITE_MAX_RETRIES);

    if (rc != 0) {
        mcsh_log(fmt::format("[channel] send_eof failed ({})", rc));
    }
}

void SshChannel::close() {
    closed_ = true;
    if (!io_mutex_) return;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!ch_) return;
    libssh2_channel_close(ch_);
    libssh2_channel_free(ch_);
    ch_ = nullptr;
}

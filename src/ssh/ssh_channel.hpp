#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <shell/remote_channel.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// RAII handle for a session channel on a non-blocking libssh2 session.
// Owns the channel and closes+frees it on destruction.
// All libssh2 calls are protected by brief io_mutex_ holds, so the two
// drainer threads and the writer never hold the session for long.
// read() polls the socket between attempts and returns an error as soon as
// close() has run.
class SshChannel : public RemoteChannel {
public:
    SshChannel(LIBSSH2_CHANNEL* ch, LIBSSH2_SESSION* session,
               std::shared_ptr<std::mutex> io_mutex, socket_t sock);
    ~SshChannel() override;

    SshChannel(const SshChannel&) = delete;
    SshChannel& operator=(const SshChannel&) = delete;

    Result<void> setenv(const std::string& name, const std::string& value) override;
    Result<void> request_pty(const PtyRequest& pty) override;
    Result<void> start(const std::string& program) override;
    ssize_t read(StreamKind stream, char* buf, size_t len) override;
    Result<void> write(const std::string& data) override;
    void close_input() override;
    void close() override;

private:
    LIBSSH2_CHANNEL* ch_;
    LIBSSH2_SESSION* session_;
    std::shared_ptr<std::mutex> io_mutex_;
    socket_t sock_;
    std::atomic<bool> closed_{false};

    std::string last_error();
};

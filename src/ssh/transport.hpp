#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <shell/remote_channel.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// SshTransport: one authenticated, non-blocking libssh2 session.
//
// establish() connects, handshakes and authenticates. open_channel() then
// hands out SshChannels that share the session's io mutex. Channels must be
// destroyed before the transport is closed.
class SshTransport : public ChannelFactory {
public:
    explicit SshTransport(const HostConfig& host);
    ~SshTransport() override;

    SshTransport(const SshTransport&) = delete;
    SshTransport& operator=(const SshTransport&) = delete;

    SSHResult establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;

    Result<std::unique_ptr<RemoteChannel>> open_channel() override;

    const std::string& get_target() const { return target_str_; }

private:
    HostConfig host_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    SSHResult connect_socket(StatusCallback callback);
    void free_session(const char* reason);
};

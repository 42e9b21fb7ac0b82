#pragma once

#include <string>
#include <core/types.hpp>

// libssh2 forward declaration
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// User authentication on a handshaken, non-blocking session.
//
// Tries, in order and only when the server offers the method:
//   publickey             (host.ssh_key_path, public key at <path>.pub)
//   keyboard-interactive  (answers every prompt with host.password)
//   password
SSHResult authenticate(LIBSSH2_SESSION* session, const HostConfig& host,
                       StatusCallback callback = nullptr);

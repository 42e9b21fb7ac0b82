#include "socket_util.hpp"
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

static void enable_keepalive(socket_t sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, reinterpret_cast<const char*>(&on), sizeof(on));
#ifdef TCP_KEEPIDLE
    int idle = 60;
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, reinterpret_cast<const char*>(&idle), sizeof(idle));
#endif
}

// Non-blocking connect to one resolved address
static Result<socket_t> connect_addr(const struct addrinfo* ai, int timeout_ms) {
    socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock == MCSH_INVALID_SOCKET) {
        return Result<socket_t>::Err("Failed to create socket");
    }
    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
    if (ret < 0 && errno != EINPROGRESS) {
        std::string err = strerror(errno);
        close_socket(sock);
        return Result<socket_t>::Err("Failed to connect: " + err);
    }

    if (ret < 0) {
        if (poll_socket(sock, POLLOUT, timeout_ms) == 0) {
            close_socket(sock);
            return Result<socket_t>::Err("Connection timed out");
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            return Result<socket_t>::Err("Connection failed: " + std::string(strerror(sock_err)));
        }
    }

    enable_keepalive(sock);
    return Result<socket_t>::Ok(sock);
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* found = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &found);
    if (rc != 0 || !found) {
        return Result<socket_t>::Err(fmt::format("Failed to resolve host: {} ({})",
                                                 host, gai_strerror(rc)));
    }

    // First address that connects wins; report the last failure otherwise
    auto result = Result<socket_t>::Err("No usable address for " + host);
    for (auto* ai = found; ai; ai = ai->ai_next) {
        result = connect_addr(ai, timeout_ms);
        if (result.is_ok()) break;
    }
    freeaddrinfo(found);

    if (result.is_err()) {
        result.error = fmt::format("{}:{}: {}", host, port, result.error);
    }
    return result;
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

} // namespace platform

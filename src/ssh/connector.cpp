#include "connector.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netdb.h>
#endif
#include <cerrno>
#include <cstring>
#include <string>

// Try one resolved address. Returns the connected socket or SSHKIT_INVALID_SOCKET.
static socket_t try_candidate(const struct addrinfo* ai, int timeout_secs) {
    socket_t sock;
    do {
        sock = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    } while (sock == SSHKIT_INVALID_SOCKET && errno == EINTR);
    if (sock == SSHKIT_INVALID_SOCKET) {
        sshkit_log(fmt::format("socket() failed: {}", std::strerror(errno)));
        return SSHKIT_INVALID_SOCKET;
    }

    if (!platform::set_nonblocking(sock)) {
        platform::close_socket(sock);
        return SSHKIT_INVALID_SOCKET;
    }

    int ret = ::connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
        sshkit_log(fmt::format("connect() failed: {}", std::strerror(errno)));
        platform::close_socket(sock);
        return SSHKIT_INVALID_SOCKET;
    }

    // The server speaks first, so a readable socket means connected.
    int revents = platform::poll_socket(sock, POLLIN | POLLPRI, timeout_secs * 1000);
    if (revents <= 0) {
        sshkit_log(revents == 0 ? fmt::format("Connection timed out after {}s", timeout_secs)
                                : fmt::format("poll() failed: {}", std::strerror(errno)));
        platform::close_socket(sock);
        return SSHKIT_INVALID_SOCKET;
    }

    int sock_err = platform::socket_error(sock);
    if (sock_err != 0 || !(revents & (POLLIN | POLLPRI))) {
        sshkit_log(fmt::format("Connection failed: {}",
                               sock_err != 0 ? std::strerror(sock_err) : "socket hung up"));
        platform::close_socket(sock);
        return SSHKIT_INVALID_SOCKET;
    }

    if (!platform::set_blocking(sock)) {
        platform::close_socket(sock);
        return SSHKIT_INVALID_SOCKET;
    }
    return sock;
}

Outcome<socket_t> connect_socket(const std::string& host, int port, int timeout_secs) {
    if (timeout_secs <= 0 || timeout_secs > SSH_MAX_TIMEOUT_SECS) {
        sshkit_log(SSHError::CONNECT, fmt::format("Invalid connect timeout {}s for {}:{}",
                                                  timeout_secs, host, port));
        return Outcome<socket_t>::Err(SSHError::CONNECT);
    }

    platform::init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;
    hints.ai_protocol = 0;

    std::string service = std::to_string(port);
    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        sshkit_log(SSHError::CONNECT, fmt::format("Failed to resolve {}: {}", host, gai_strerror(gai)));
        return Outcome<socket_t>::Err(SSHError::CONNECT);
    }

    int attempt = 0;
    for (struct addrinfo* current = res; current != nullptr; current = current->ai_next) {
        ++attempt;
        sshkit_log(fmt::format("Connecting to {}:{} (candidate {})", host, port, attempt));
        socket_t sock = try_candidate(current, timeout_secs);
        if (sock != SSHKIT_INVALID_SOCKET) {
            freeaddrinfo(res);
            sshkit_log(fmt::format("TCP connected to {}:{}", host, port));
            return Outcome<socket_t>::Ok(sock);
        }
    }

    freeaddrinfo(res);
    sshkit_log(SSHError::CONNECT, fmt::format("No address of {}:{} accepted a connection", host, port));
    return Outcome<socket_t>::Err(SSHError::CONNECT);
}

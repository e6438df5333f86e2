#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// One SSH connection: a connected socket plus the transport that speaks the
// protocol over it. A Session handed out by open() has completed the
// handshake. It does not track authentication; exec() and send_file() expect a
// prior authenticate_*() call to have succeeded.
//
// The socket and transport are released exactly once, by close() or the
// destructor, whichever comes first.
class Session {
public:
    // Connect, initialize libssh2 and run the handshake.
    // Errors: CONNECT, INIT, HANDSHAKE.
    static Outcome<std::unique_ptr<Session>> open(const std::string& host, int port,
                                                  int timeout_secs = SSH_CONNECT_TIMEOUT_SECS);

    // Run the handshake with an already created transport over an already
    // connected socket. Takes ownership of both, also on failure.
    // Errors: HANDSHAKE.
    static Outcome<std::unique_ptr<Session>> open(std::unique_ptr<Transport> transport,
                                                  socket_t sock, int timeout_secs,
                                                  const std::string& target = "");

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // ── Authentication ─────────────────────────────────────────
    // Every failure is AUTHENTICATION and leaves the session open for
    // another attempt.

    Outcome<void> authenticate_password(const std::string& user, const std::string& password);

    // An empty public_key_path lets the transport derive the public key.
    Outcome<void> authenticate_key(const std::string& user,
                                   const std::string& public_key_path,
                                   const std::string& private_key_path,
                                   const std::string& passphrase = "");

    Outcome<void> authenticate_key_memory(const std::string& user,
                                          const char* public_key, std::size_t public_key_len,
                                          const char* private_key, std::size_t private_key_len,
                                          const std::string& passphrase = "");

    Outcome<void> authenticate_key_memory(const std::string& user,
                                          const std::string& public_key,
                                          const std::string& private_key,
                                          const std::string& passphrase = "");

    // ── Channels ───────────────────────────────────────────────

    Outcome<SSHResult> exec(const std::string& command);

    Outcome<std::size_t> send_file(int mode, const char* data, std::size_t len,
                                   const std::string& destination);
    Outcome<std::size_t> send_file(int mode, const std::string& data,
                                   const std::string& destination);
    Outcome<std::size_t> send_local_file(int mode, const std::filesystem::path& source,
                                         const std::string& destination);

    // ── Lifecycle ──────────────────────────────────────────────

    // Disconnect, free the transport and close the socket. Safe to call again.
    void close();
    bool is_open() const { return transport_ != nullptr; }

    // Wait for the socket in the direction the transport needs.
    int wait();

    // Call op until it stops reporting would-block, waiting in between.
    template <typename Op>
    auto retry(Op&& op) -> decltype(op()) {
        auto rc = op();
        while (rc == TRANSPORT_EAGAIN) {
            wait();
            rc = op();
        }
        return rc;
    }

    void set_wait_timeout(int timeout_ms) { wait_timeout_ms_ = timeout_ms; }
    int wait_timeout() const { return wait_timeout_ms_; }

    Transport& transport() { return *transport_; }
    socket_t socket() const { return sock_; }
    const std::string& target() const { return target_; }

private:
    Session(std::unique_ptr<Transport> transport, socket_t sock, std::string target);

    void close(const char* reason);

    std::unique_ptr<Transport> transport_;
    socket_t sock_;
    std::string target_;
    int wait_timeout_ms_ = SSH_WAIT_TIMEOUT_MS;

    Outcome<void> finish_auth(int rc, const std::string& method, const std::string& user);
};

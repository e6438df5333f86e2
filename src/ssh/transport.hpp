#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <sys/types.h>
#include <platform/socket_util.hpp>

// Return code for "no progress without more socket I/O, retry later".
// Same value as LIBSSH2_ERROR_EAGAIN.
constexpr int TRANSPORT_EAGAIN = -37;

// block_directions() bits
constexpr int BLOCK_INBOUND  = 0x0001;
constexpr int BLOCK_OUTBOUND = 0x0002;

// One channel multiplexed over a transport's socket.
//
// All calls are non-blocking: they return TRANSPORT_EAGAIN when the transport
// needs socket readiness first, another negative code on hard failure, and 0
// (or a byte count for read/write) on success.
class TransportChannel {
public:
    virtual ~TransportChannel() = default;

    virtual int exec(const std::string& command) = 0;

    // 0 means end of data on that stream.
    virtual ssize_t read(char* buf, std::size_t len) = 0;
    virtual ssize_t read_stderr(char* buf, std::size_t len) = 0;
    virtual ssize_t write(const char* buf, std::size_t len) = 0;

    virtual int send_eof() = 0;
    virtual int close() = 0;

    // Only meaningful after close() returned 0.
    virtual int exit_status() = 0;
    virtual std::string exit_signal() = 0;

    // Release the protocol-layer channel. Destroying an unfreed channel frees it.
    virtual int free() = 0;
};

// Protocol layer driven by Session: handshake, auth, channel creation.
// Methods returning a channel return nullptr on failure; last_errno() then
// tells would-block (TRANSPORT_EAGAIN) apart from a hard error.
class Transport {
public:
    virtual ~Transport() = default;

    // Overall protocol timeout, set once before the handshake.
    virtual void set_timeout(long timeout_ms) = 0;
    virtual int handshake(socket_t sock) = 0;

    // Directions the last would-block was waiting for (BLOCK_* bits).
    virtual int block_directions() const = 0;
    virtual int last_errno() const = 0;
    virtual std::string last_error_message() const = 0;

    virtual int userauth_password(const std::string& user, const std::string& password) = 0;
    virtual int userauth_publickey_fromfile(const std::string& user,
                                            const std::string& public_key_path,
                                            const std::string& private_key_path,
                                            const std::string& passphrase) = 0;
    virtual int userauth_publickey_frommemory(const std::string& user,
                                              const char* public_key, std::size_t public_key_len,
                                              const char* private_key, std::size_t private_key_len,
                                              const std::string& passphrase) = 0;

    virtual std::unique_ptr<TransportChannel> open_session() = 0;
    virtual std::unique_ptr<TransportChannel> scp_send(const std::string& path, int mode,
                                                       std::size_t size) = 0;

    // Best effort; the result is not reported.
    virtual void disconnect(const std::string& reason) = 0;
};

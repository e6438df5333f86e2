#include "session.hpp"
#include "command_executor.hpp"
#include "connector.hpp"
#include "file_sender.hpp"
#include "libssh2_transport.hpp"
#include "waiter.hpp"
#include <core/log.hpp>

Session::Session(std::unique_ptr<Transport> transport, socket_t sock, std::string target)
    : transport_(std::move(transport)), sock_(sock), target_(std::move(target)) {}

Session::~Session() {
    close();
}

Outcome<std::unique_ptr<Session>> Session::open(const std::string& host, int port,
                                                int timeout_secs) {
    auto sock = connect_socket(host, port, timeout_secs);
    if (sock.is_err()) {
        return Outcome<std::unique_ptr<Session>>::Err(sock.error());
    }

    auto transport = Libssh2Transport::create();
    if (!transport) {
        platform::close_socket(sock.value());
        sshkit_log(SSHError::INIT, "Failed to create SSH session");
        return Outcome<std::unique_ptr<Session>>::Err(SSHError::INIT);
    }

    return open(std::move(transport), sock.value(), timeout_secs,
                host + ":" + std::to_string(port));
}

Outcome<std::unique_ptr<Session>> Session::open(std::unique_ptr<Transport> transport,
                                                socket_t sock, int timeout_secs,
                                                const std::string& target) {
    std::unique_ptr<Session> session(new Session(std::move(transport), sock, target));

    session->transport_->set_timeout(static_cast<long>(timeout_secs) * 1000);

    // SSH handshake (key exchange)
    int rc;
    while ((rc = session->transport_->handshake(sock)) == TRANSPORT_EAGAIN) {}

    if (rc != 0) {
        sshkit_log(SSHError::HANDSHAKE, fmt::format("SSH handshake with {} failed ({}): {}",
                                                    target, rc,
                                                    session->transport_->last_error_message()));
        session->close(DISCONNECT_REASON_HANDSHAKE);
        return Outcome<std::unique_ptr<Session>>::Err(SSHError::HANDSHAKE);
    }

    sshkit_log(fmt::format("SSH handshake with {} complete", target));
    return Outcome<std::unique_ptr<Session>>::Ok(std::move(session));
}

void Session::close() {
    close(DISCONNECT_REASON_CLOSE);
}

void Session::close(const char* reason) {
    if (transport_) {
        transport_->disconnect(reason);
        transport_.reset();
    }
    if (sock_ != SSHKIT_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SSHKIT_INVALID_SOCKET;
    }
}

int Session::wait() {
    return wait_socket(sock_, *transport_, wait_timeout_ms_);
}

Outcome<void> Session::finish_auth(int rc, const std::string& method, const std::string& user) {
    if (rc != 0) {
        sshkit_log(SSHError::AUTHENTICATION, fmt::format("{} auth for {} on {} failed ({}): {}",
                                                         method, user, target_, rc,
                                                         transport_->last_error_message()));
        return Outcome<void>::Err(SSHError::AUTHENTICATION);
    }
    sshkit_log(fmt::format("{} auth for {} on {} succeeded", method, user, target_));
    return Outcome<void>::Ok();
}

Outcome<void> Session::authenticate_password(const std::string& user, const std::string& password) {
    if (!is_open()) return Outcome<void>::Err(SSHError::AUTHENTICATION);
    int rc = retry([&] { return transport_->userauth_password(user, password); });
    return finish_auth(rc, "Password", user);
}

Outcome<void> Session::authenticate_key(const std::string& user,
                                        const std::string& public_key_path,
                                        const std::string& private_key_path,
                                        const std::string& passphrase) {
    if (!is_open()) return Outcome<void>::Err(SSHError::AUTHENTICATION);
    int rc = retry([&] {
        return transport_->userauth_publickey_fromfile(user, public_key_path,
                                                       private_key_path, passphrase);
    });
    return finish_auth(rc, "Public key", user);
}

Outcome<void> Session::authenticate_key_memory(const std::string& user,
                                               const char* public_key, std::size_t public_key_len,
                                               const char* private_key, std::size_t private_key_len,
                                               const std::string& passphrase) {
    if (!is_open()) return Outcome<void>::Err(SSHError::AUTHENTICATION);
    int rc = retry([&] {
        return transport_->userauth_publickey_frommemory(user, public_key, public_key_len,
                                                         private_key, private_key_len, passphrase);
    });
    return finish_auth(rc, "In-memory key", user);
}

Outcome<void> Session::authenticate_key_memory(const std::string& user,
                                               const std::string& public_key,
                                               const std::string& private_key,
                                               const std::string& passphrase) {
    return authenticate_key_memory(user, public_key.data(), public_key.size(),
                                   private_key.data(), private_key.size(), passphrase);
}

Outcome<SSHResult> Session::exec(const std::string& command) {
    return exec_command(*this, command);
}

Outcome<std::size_t> Session::send_file(int mode, const char* data, std::size_t len,
                                        const std::string& destination) {
    return ::send_file(*this, mode, data, len, destination);
}

Outcome<std::size_t> Session::send_file(int mode, const std::string& data,
                                        const std::string& destination) {
    return ::send_file(*this, mode, data.data(), data.size(), destination);
}

Outcome<std::size_t> Session::send_local_file(int mode, const std::filesystem::path& source,
                                              const std::string& destination) {
    return ::send_local_file(*this, mode, source, destination);
}

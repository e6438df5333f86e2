#pragma once

#include <memory>
#include <mutex>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Keeps libssh2 initialized while at least one holder exists.
// libssh2_init() runs when the first holder is acquired and libssh2_exit()
// when the last one is released.
class Libssh2Library {
public:
    // nullptr if libssh2_init() failed.
    static std::shared_ptr<Libssh2Library> acquire();

    ~Libssh2Library();

    Libssh2Library(const Libssh2Library&) = delete;
    Libssh2Library& operator=(const Libssh2Library&) = delete;

private:
    Libssh2Library() = default;

    static std::mutex& registry_mutex();
    static std::weak_ptr<Libssh2Library>& registry();
};

class Libssh2Channel : public TransportChannel {
public:
    Libssh2Channel(LIBSSH2_CHANNEL* channel, LIBSSH2_SESSION* session);
    ~Libssh2Channel() override;

    Libssh2Channel(const Libssh2Channel&) = delete;
    Libssh2Channel& operator=(const Libssh2Channel&) = delete;

    int exec(const std::string& command) override;
    ssize_t read(char* buf, std::size_t len) override;
    ssize_t read_stderr(char* buf, std::size_t len) override;
    ssize_t write(const char* buf, std::size_t len) override;
    int send_eof() override;
    int close() override;
    int exit_status() override;
    std::string exit_signal() override;
    int free() override;

private:
    LIBSSH2_CHANNEL* channel_;
    LIBSSH2_SESSION* session_;
};

class Libssh2Transport : public Transport {
public:
    // nullptr if the library or the session could not be initialized.
    static std::unique_ptr<Libssh2Transport> create();

    ~Libssh2Transport() override;

    Libssh2Transport(const Libssh2Transport&) = delete;
    Libssh2Transport& operator=(const Libssh2Transport&) = delete;

    void set_timeout(long timeout_ms) override;
    int handshake(socket_t sock) override;
    int block_directions() const override;
    int last_errno() const override;
    std::string last_error_message() const override;

    int userauth_password(const std::string& user, const std::string& password) override;
    int userauth_publickey_fromfile(const std::string& user,
                                    const std::string& public_key_path,
                                    const std::string& private_key_path,
                                    const std::string& passphrase) override;
    int userauth_publickey_frommemory(const std::string& user,
                                      const char* public_key, std::size_t public_key_len,
                                      const char* private_key, std::size_t private_key_len,
                                      const std::string& passphrase) override;

    std::unique_ptr<TransportChannel> open_session() override;
    std::unique_ptr<TransportChannel> scp_send(const std::string& path, int mode,
                                               std::size_t size) override;

    void disconnect(const std::string& reason) override;

private:
    Libssh2Transport(std::shared_ptr<Libssh2Library> library, LIBSSH2_SESSION* session);

    std::shared_ptr<Libssh2Library> library_;
    LIBSSH2_SESSION* session_;
};

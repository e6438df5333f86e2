#include "libssh2_transport.hpp"
#include <core/log.hpp>
#include <libssh2.h>

static_assert(TRANSPORT_EAGAIN == LIBSSH2_ERROR_EAGAIN,
              "TRANSPORT_EAGAIN must match libssh2's would-block code");
static_assert(BLOCK_INBOUND == LIBSSH2_SESSION_BLOCK_INBOUND &&
              BLOCK_OUTBOUND == LIBSSH2_SESSION_BLOCK_OUTBOUND,
              "block direction bits must match libssh2");

// ── Libssh2Library ───────────────────────────────────────────────────

std::mutex& Libssh2Library::registry_mutex() {
    static std::mutex m;
    return m;
}

std::weak_ptr<Libssh2Library>& Libssh2Library::registry() {
    static std::weak_ptr<Libssh2Library> current;
    return current;
}

std::shared_ptr<Libssh2Library> Libssh2Library::acquire() {
    std::lock_guard<std::mutex> lock(registry_mutex());
    if (auto existing = registry().lock()) {
        return existing;
    }

    int rc = libssh2_init(0);
    if (rc != 0) {
        sshkit_log(fmt::format("libssh2_init failed ({})", rc));
        return nullptr;
    }

    std::shared_ptr<Libssh2Library> library(new Libssh2Library());
    registry() = library;
    return library;
}

Libssh2Library::~Libssh2Library() {
    libssh2_exit();
}

// ── Libssh2Channel ───────────────────────────────────────────────────

Libssh2Channel::Libssh2Channel(LIBSSH2_CHANNEL* channel, LIBSSH2_SESSION* session)
    : channel_(channel), session_(session) {}

Libssh2Channel::~Libssh2Channel() {
    if (!channel_) return;
    while (libssh2_channel_free(channel_) == LIBSSH2_ERROR_EAGAIN) {}
    channel_ = nullptr;
}

int Libssh2Channel::exec(const std::string& command) {
    return libssh2_channel_exec(channel_, command.c_str());
}

ssize_t Libssh2Channel::read(char* buf, std::size_t len) {
    return libssh2_channel_read(channel_, buf, len);
}

ssize_t Libssh2Channel::read_stderr(char* buf, std::size_t len) {
    return libssh2_channel_read_stderr(channel_, buf, len);
}

ssize_t Libssh2Channel::write(const char* buf, std::size_t len) {
    return libssh2_channel_write(channel_, buf, len);
}

int Libssh2Channel::send_eof() {
    return libssh2_channel_send_eof(channel_);
}

int Libssh2Channel::close() {
    return libssh2_channel_close(channel_);
}

int Libssh2Channel::exit_status() {
    return libssh2_channel_get_exit_status(channel_);
}

std::string Libssh2Channel::exit_signal() {
    char* signal = nullptr;
    size_t signal_len = 0;
    libssh2_channel_get_exit_signal(channel_, &signal, &signal_len,
                                    nullptr, nullptr, nullptr, nullptr);
    if (!signal) return "";

    std::string out(signal, signal_len);
    libssh2_free(session_, signal);
    return out;
}

int Libssh2Channel::free() {
    if (!channel_) return 0;
    int rc = libssh2_channel_free(channel_);
    if (rc == 0) channel_ = nullptr;
    return rc;
}

// ── Libssh2Transport ─────────────────────────────────────────────────

std::unique_ptr<Libssh2Transport> Libssh2Transport::create() {
    auto library = Libssh2Library::acquire();
    if (!library) return nullptr;

    LIBSSH2_SESSION* session = libssh2_session_init();
    if (!session) {
        sshkit_log("libssh2_session_init failed");
        return nullptr;
    }

    libssh2_session_set_blocking(session, 0);
    return std::unique_ptr<Libssh2Transport>(new Libssh2Transport(std::move(library), session));
}

Libssh2Transport::Libssh2Transport(std::shared_ptr<Libssh2Library> library, LIBSSH2_SESSION* session)
    : library_(std::move(library)), session_(session) {}

Libssh2Transport::~Libssh2Transport() {
    if (session_) {
        libssh2_session_free(session_);
        session_ = nullptr;
    }
}

void Libssh2Transport::set_timeout(long timeout_ms) {
    libssh2_session_set_timeout(session_, timeout_ms);
}

int Libssh2Transport::handshake(socket_t sock) {
    return libssh2_session_handshake(session_, sock);
}

int Libssh2Transport::block_directions() const {
    return libssh2_session_block_directions(session_);
}

int Libssh2Transport::last_errno() const {
    return libssh2_session_last_errno(session_);
}

std::string Libssh2Transport::last_error_message() const {
    char* msg = nullptr;
    int msg_len = 0;
    libssh2_session_last_error(session_, &msg, &msg_len, 0);
    if (!msg || msg_len <= 0) return "";
    return std::string(msg, static_cast<std::size_t>(msg_len));
}

int Libssh2Transport::userauth_password(const std::string& user, const std::string& password) {
    return libssh2_userauth_password_ex(session_,
                                        user.c_str(), static_cast<unsigned int>(user.size()),
                                        password.c_str(), static_cast<unsigned int>(password.size()),
                                        nullptr);
}

int Libssh2Transport::userauth_publickey_fromfile(const std::string& user,
                                                  const std::string& public_key_path,
                                                  const std::string& private_key_path,
                                                  const std::string& passphrase) {
    // An empty public key path lets libssh2 derive it from the private key.
    return libssh2_userauth_publickey_fromfile_ex(
        session_, user.c_str(), static_cast<unsigned int>(user.size()),
        public_key_path.empty() ? nullptr : public_key_path.c_str(),
        private_key_path.c_str(),
        passphrase.c_str());
}

int Libssh2Transport::userauth_publickey_frommemory(const std::string& user,
                                                    const char* public_key, std::size_t public_key_len,
                                                    const char* private_key, std::size_t private_key_len,
                                                    const std::string& passphrase) {
    return libssh2_userauth_publickey_frommemory(
        session_, user.c_str(), user.size(),
        public_key_len > 0 ? public_key : nullptr, public_key_len,
        private_key, private_key_len,
        passphrase.c_str());
}

std::unique_ptr<TransportChannel> Libssh2Transport::open_session() {
    LIBSSH2_CHANNEL* channel = libssh2_channel_open_session(session_);
    if (!channel) return nullptr;
    return std::make_unique<Libssh2Channel>(channel, session_);
}

std::unique_ptr<TransportChannel> Libssh2Transport::scp_send(const std::string& path, int mode,
                                                             std::size_t size) {
    LIBSSH2_CHANNEL* channel = libssh2_scp_send64(session_, path.c_str(), mode,
                                                  static_cast<libssh2_int64_t>(size), 0, 0);
    if (!channel) return nullptr;
    return std::make_unique<Libssh2Channel>(channel, session_);
}

void Libssh2Transport::disconnect(const std::string& reason) {
    libssh2_session_disconnect(session_, reason.c_str());
}

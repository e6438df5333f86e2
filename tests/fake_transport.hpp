#pragma once

// Scripted in-process Transport for engine tests. Every call consumes the
// next scripted answer; the shared FakeState records what the engine did so
// tests can inspect it after the Session is gone.

#include <ssh/session.hpp>
#include <ssh/transport.hpp>
#include <algorithm>
#include <cstring>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include <sys/socket.h>
#include <fcntl.h>
#include <unistd.h>

constexpr int FAKE_ERROR = -7;          // generic hard error
constexpr int FAKE_AUTH_FAILED = -18;   // LIBSSH2_ERROR_AUTHENTICATION_FAILED

struct ReadStep {
    enum Kind { DATA, WOULD_BLOCK, FAILURE } kind;
    std::string data;

    static ReadStep bytes(std::string d) { return {DATA, std::move(d)}; }
    static ReadStep again() { return {WOULD_BLOCK, ""}; }
    static ReadStep fail() { return {FAILURE, ""}; }
};

struct ChannelScript {
    int exec_eagain = 0;
    int exec_rc = 0;

    // Consumed front to back; an empty queue reads as end of data.
    std::deque<ReadStep> stdout_steps;
    std::deque<ReadStep> stderr_steps;

    // Per-call write answers: TRANSPORT_EAGAIN, a negative error, or the
    // maximum number of bytes to accept. Empty means accept everything.
    std::deque<long> write_steps;

    int eof_eagain = 0;
    int close_eagain = 0;
    int close_rc = 0;
    int free_eagain = 0;

    int exit_status = 0;
    std::string exit_signal;
};

struct FakeState {
    // transport behaviour
    int handshake_eagain = 0;
    int handshake_rc = 0;
    int auth_eagain = 0;
    std::string user = "alice";
    std::string password = "secret";
    std::string private_key = "PRIVATE";
    int open_eagain = 0;
    bool open_fails = false;
    int directions = BLOCK_OUTBOUND;
    std::deque<ChannelScript> channels;

    // what the engine did
    long timeout_ms = -1;
    int handshake_calls = 0;
    int auth_calls = 0;
    int direction_queries = 0;
    std::vector<std::string> disconnect_reasons;
    bool transport_destroyed = false;
    int channels_opened = 0;
    int channels_alive = 0;
    int channels_freed = 0;
    int channels_freed_by_destructor = 0;
    std::vector<std::string> executed;
    std::vector<std::string> events;          // send_eof / close / free order
    std::string scp_path;
    int scp_mode = -1;
    std::size_t scp_size = 0;
    std::string written;
    std::vector<std::size_t> write_sizes;     // bytes accepted per successful write
    std::vector<std::size_t> write_requests;  // bytes offered per write call
    std::string last_pubkey_path;
    std::string last_privkey_path;
    std::string last_passphrase;
};

class FakeChannel : public TransportChannel {
public:
    FakeChannel(std::shared_ptr<FakeState> state, ChannelScript script)
        : state_(std::move(state)), script_(std::move(script)) {
        ++state_->channels_opened;
        ++state_->channels_alive;
    }

    ~FakeChannel() override {
        if (!freed_) {
            ++state_->channels_freed_by_destructor;
            --state_->channels_alive;
        }
    }

    int exec(const std::string& command) override {
        if (script_.exec_eagain > 0) { --script_.exec_eagain; return TRANSPORT_EAGAIN; }
        state_->executed.push_back(command);
        return script_.exec_rc;
    }

    ssize_t read(char* buf, std::size_t len) override {
        return consume(script_.stdout_steps, buf, len);
    }

    ssize_t read_stderr(char* buf, std::size_t len) override {
        return consume(script_.stderr_steps, buf, len);
    }

    ssize_t write(const char* buf, std::size_t len) override {
        state_->write_requests.push_back(len);
        std::size_t accept = len;
        if (!script_.write_steps.empty()) {
            long step = script_.write_steps.front();
            script_.write_steps.pop_front();
            if (step < 0) return step;
            accept = std::min(len, static_cast<std::size_t>(step));
        }
        state_->written.append(buf, accept);
        state_->write_sizes.push_back(accept);
        return static_cast<ssize_t>(accept);
    }

    int send_eof() override {
        if (script_.eof_eagain > 0) { --script_.eof_eagain; return TRANSPORT_EAGAIN; }
        state_->events.push_back("eof");
        return 0;
    }

    int close() override {
        if (script_.close_eagain > 0) { --script_.close_eagain; return TRANSPORT_EAGAIN; }
        state_->events.push_back("close");
        return script_.close_rc;
    }

    int exit_status() override { return script_.exit_status; }
    std::string exit_signal() override { return script_.exit_signal; }

    int free() override {
        if (freed_) return 0;
        if (script_.free_eagain > 0) { --script_.free_eagain; return TRANSPORT_EAGAIN; }
        freed_ = true;
        state_->events.push_back("free");
        ++state_->channels_freed;
        --state_->channels_alive;
        return 0;
    }

private:
    std::shared_ptr<FakeState> state_;
    ChannelScript script_;
    bool freed_ = false;

    static ssize_t consume(std::deque<ReadStep>& steps, char* buf, std::size_t len) {
        if (steps.empty()) return 0;
        ReadStep& step = steps.front();
        if (step.kind == ReadStep::WOULD_BLOCK) { steps.pop_front(); return TRANSPORT_EAGAIN; }
        if (step.kind == ReadStep::FAILURE) { steps.pop_front(); return FAKE_ERROR; }

        std::size_t n = std::min(len, step.data.size());
        std::memcpy(buf, step.data.data(), n);
        step.data.erase(0, n);
        if (step.data.empty()) steps.pop_front();
        return static_cast<ssize_t>(n);
    }
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeState> state) : state_(std::move(state)) {}

    ~FakeTransport() override { state_->transport_destroyed = true; }

    void set_timeout(long timeout_ms) override { state_->timeout_ms = timeout_ms; }

    int handshake(socket_t) override {
        ++state_->handshake_calls;
        if (state_->handshake_eagain > 0) { --state_->handshake_eagain; return TRANSPORT_EAGAIN; }
        return state_->handshake_rc;
    }

    int block_directions() const override {
        ++state_->direction_queries;
        return state_->directions;
    }

    int last_errno() const override { return last_errno_; }
    std::string last_error_message() const override { return "fake transport error"; }

    int userauth_password(const std::string& user, const std::string& password) override {
        if (auth_pending()) return TRANSPORT_EAGAIN;
        return (user == state_->user && password == state_->password) ? 0 : FAKE_AUTH_FAILED;
    }

    int userauth_publickey_fromfile(const std::string& user,
                                    const std::string& public_key_path,
                                    const std::string& private_key_path,
                                    const std::string& passphrase) override {
        if (auth_pending()) return TRANSPORT_EAGAIN;
        state_->last_pubkey_path = public_key_path;
        state_->last_privkey_path = private_key_path;
        state_->last_passphrase = passphrase;
        return (user == state_->user && private_key_path == state_->private_key) ? 0 : FAKE_AUTH_FAILED;
    }

    int userauth_publickey_frommemory(const std::string& user,
                                      const char*, std::size_t,
                                      const char* private_key, std::size_t private_key_len,
                                      const std::string& passphrase) override {
        if (auth_pending()) return TRANSPORT_EAGAIN;
        state_->last_passphrase = passphrase;
        std::string key(private_key, private_key_len);
        return (user == state_->user && key == state_->private_key) ? 0 : FAKE_AUTH_FAILED;
    }

    std::unique_ptr<TransportChannel> open_session() override {
        return open_channel();
    }

    std::unique_ptr<TransportChannel> scp_send(const std::string& path, int mode,
                                               std::size_t size) override {
        auto channel = open_channel();
        if (channel) {
            state_->scp_path = path;
            state_->scp_mode = mode;
            state_->scp_size = size;
        }
        return channel;
    }

    void disconnect(const std::string& reason) override {
        state_->disconnect_reasons.push_back(reason);
    }

private:
    std::shared_ptr<FakeState> state_;
    int last_errno_ = 0;

    bool auth_pending() {
        ++state_->auth_calls;
        if (state_->auth_eagain > 0) { --state_->auth_eagain; return true; }
        return false;
    }

    std::unique_ptr<TransportChannel> open_channel() {
        if (state_->open_eagain > 0) {
            --state_->open_eagain;
            last_errno_ = TRANSPORT_EAGAIN;
            return nullptr;
        }
        if (state_->open_fails) {
            last_errno_ = FAKE_ERROR;
            return nullptr;
        }
        last_errno_ = 0;
        ChannelScript script;
        if (!state_->channels.empty()) {
            script = std::move(state_->channels.front());
            state_->channels.pop_front();
        }
        return std::make_unique<FakeChannel>(state_, std::move(script));
    }
};

// A connected local socket pair: the session gets one end, the test keeps
// the other so poll() on the session end behaves like a real socket.
struct SocketPair {
    int session_end = -1;
    int peer_end = -1;

    SocketPair() {
        int fds[2];
        if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0) {
            session_end = fds[0];
            peer_end = fds[1];
        }
    }

    ~SocketPair() {
        if (peer_end >= 0) ::close(peer_end);
    }
};

inline bool fd_is_open(int fd) {
    return fcntl(fd, F_GETFD) != -1;
}

inline Outcome<std::unique_ptr<Session>> open_fake_session(const std::shared_ptr<FakeState>& state,
                                                           SocketPair& sockets,
                                                           int timeout_secs = 5) {
    return Session::open(std::make_unique<FakeTransport>(state), sockets.session_end,
                         timeout_secs, "fake:22");
}

#pragma once

#include <string>
#include <optional>
#include <variant>
#include <utility>
#include <fmt/format.h>

// Result type for operations that can fail. Holds either a value or an error,
// never both.
template <typename T, typename E = std::string>
class Result {
public:
    static Result<T, E> Ok(T val) {
        return Result(std::in_place_index<1>, std::move(val));
    }

    static Result<T, E> Err(E err) {
        return Result(std::in_place_index<0>, std::move(err));
    }

    bool is_ok() const { return data_.index() == 1; }
    bool is_err() const { return data_.index() == 0; }

    // Throws std::bad_variant_access when called on the wrong side.
    T& value() & { return std::get<1>(data_); }
    const T& value() const& { return std::get<1>(data_); }
    T&& value() && { return std::get<1>(std::move(data_)); }
    const E& error() const { return std::get<0>(data_); }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& v) : data_(tag, std::forward<U>(v)) {}

    std::variant<E, T> data_;
};

// Specialization for void
template <typename E>
class Result<void, E> {
public:
    static Result<void, E> Ok() {
        return Result(std::nullopt);
    }

    static Result<void, E> Err(E err) {
        return Result(std::optional<E>(std::move(err)));
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    // Throws std::bad_optional_access when the result is Ok.
    const E& error() const { return error_.value(); }

private:
    explicit Result(std::optional<E> err) : error_(std::move(err)) {}

    std::optional<E> error_;
};

// Failure kinds of the SSH engine. Each fallible step reports exactly one.
enum class SSHError {
    CONNECT,
    INIT,
    HANDSHAKE,
    AUTHENTICATION,
    CHANNEL_OPEN,
    CHANNEL_EXEC,
    READ,
    WRITE,
};

const char* to_string(SSHError err);

template <typename T>
using Outcome = Result<T, SSHError>;

// Exit code reported when the command's real status could not be obtained.
constexpr int EXIT_CODE_UNKNOWN = 127;

// SSH command execution result
struct SSHResult {
    int exit_code = EXIT_CODE_UNKNOWN;
    std::string stdout_data;
    std::string stderr_data;
    std::string exit_signal;   // empty unless the command was killed by a signal

    bool success() const { return exit_code == 0 && exit_signal.empty(); }
    bool failed() const { return !success(); }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Connection settings for one remote host
struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> public_key_path;
    std::optional<std::string> private_key_path;
    std::optional<std::string> public_key_data;    // in-memory key material
    std::optional<std::string> private_key_data;
    std::string passphrase;
    int connect_timeout = 30;        // seconds
    int wait_timeout_ms = 10000;     // readiness wait
};

template <>
struct fmt::formatter<SSHError> : fmt::formatter<fmt::string_view> {
    template <typename FormatContext>
    auto format(SSHError err, FormatContext& ctx) const {
        return fmt::formatter<fmt::string_view>::format(to_string(err), ctx);
    }
};

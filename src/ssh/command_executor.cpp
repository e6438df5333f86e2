#include "command_executor.hpp"
#include "session.hpp"
#include <core/growable_buffer.hpp>
#include <core/log.hpp>

static bool is_hard_error(ssize_t rc) {
    return rc < 0 && rc != TRANSPORT_EAGAIN;
}

Outcome<SSHResult> exec_command(Session& session, const std::string& command) {
    if (!session.is_open()) {
        return Outcome<SSHResult>::Err(SSHError::CHANNEL_OPEN);
    }
    Transport& transport = session.transport();

    // Open an exec channel
    std::unique_ptr<TransportChannel> channel;
    while (!(channel = transport.open_session())) {
        if (transport.last_errno() != TRANSPORT_EAGAIN) {
            sshkit_log(SSHError::CHANNEL_OPEN, fmt::format("Failed to open channel on {}: {}",
                                                           session.target(),
                                                           transport.last_error_message()));
            return Outcome<SSHResult>::Err(SSHError::CHANNEL_OPEN);
        }
        session.wait();
    }

    // Send the command
    int rc = session.retry([&] { return channel->exec(command); });
    if (rc != 0) {
        sshkit_log(SSHError::CHANNEL_EXEC, fmt::format("Failed to exec '{}' on {}: {}",
                                                       command, session.target(),
                                                       transport.last_error_message()));
        return Outcome<SSHResult>::Err(SSHError::CHANNEL_EXEC);
    }

    // Drain stdout and stderr together; a full stderr window can stall stdout.
    GrowableBuffer out;
    GrowableBuffer err;
    for (;;) {
        ssize_t n_out = channel->read(out.write_ptr(), out.writable());
        ssize_t n_err = channel->read_stderr(err.write_ptr(), err.writable());

        if (n_out == 0 && n_err == 0) break;

        if (is_hard_error(n_out) || is_hard_error(n_err)) {
            sshkit_log(SSHError::READ, fmt::format("Read failed for '{}' on {} (stdout={}, stderr={}): {}",
                                                   command, session.target(), n_out, n_err,
                                                   transport.last_error_message()));
            return Outcome<SSHResult>::Err(SSHError::READ);
        }

        if (n_out > 0) out.advance(static_cast<std::size_t>(n_out));
        if (n_err > 0) err.advance(static_cast<std::size_t>(n_err));

        if (n_out <= 0 && n_err <= 0) {
            session.wait();
        }
    }

    SSHResult result;
    result.stdout_data = out.finish();
    result.stderr_data = err.finish();

    rc = session.retry([&] { return channel->close(); });
    if (rc == 0) {
        result.exit_code = channel->exit_status();
        result.exit_signal = channel->exit_signal();
    } else {
        sshkit_log(fmt::format("Channel close for '{}' on {} failed ({}), exit status unknown",
                               command, session.target(), rc));
    }

    if (session.retry([&] { return channel->free(); }) != 0) {
        sshkit_log(fmt::format("Channel free for '{}' on {} failed", command, session.target()));
    }
    sshkit_log_ssh(session.target(), command, result);
    return Outcome<SSHResult>::Ok(std::move(result));
}

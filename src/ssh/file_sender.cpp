#include "file_sender.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>

Outcome<std::size_t> send_file(Session& session, int mode,
                               const char* data, std::size_t len,
                               const std::string& destination) {
    if (!session.is_open()) {
        return Outcome<std::size_t>::Err(SSHError::CHANNEL_OPEN);
    }
    Transport& transport = session.transport();

    std::unique_ptr<TransportChannel> channel;
    while (!(channel = transport.scp_send(destination, mode & SCP_MODE_MASK, len))) {
        if (transport.last_errno() != TRANSPORT_EAGAIN) {
            sshkit_log(SSHError::CHANNEL_OPEN, fmt::format("Failed to open scp channel for {} on {}: {}",
                                                           destination, session.target(),
                                                           transport.last_error_message()));
            return Outcome<std::size_t>::Err(SSHError::CHANNEL_OPEN);
        }
        session.wait();
    }

    std::size_t transferred = 0;
    while (transferred < len) {
        std::size_t n = std::min(len - transferred, SCP_CHUNK_SIZE);
        const char* current = data + transferred;

        // The channel may accept less than the whole chunk.
        while (n > 0) {
            ssize_t rc = session.retry([&] { return channel->write(current, n); });
            if (rc < 0) {
                sshkit_log(SSHError::WRITE, fmt::format("Write to {} on {} failed after {} of {} bytes: {}",
                                                        destination, session.target(), transferred, len,
                                                        transport.last_error_message()));
                return Outcome<std::size_t>::Err(SSHError::WRITE);
            }
            std::size_t accepted = static_cast<std::size_t>(rc);
            if (accepted == 0) {
                session.wait();
                continue;
            }
            n -= accepted;
            current += accepted;
            transferred += accepted;
        }
    }

    // Finalize: the remote scp only creates the file once it sees EOF.
    int rc = session.retry([&] { return channel->send_eof(); });
    if (rc != 0) {
        sshkit_log(fmt::format("send_eof for {} on {} returned {}", destination, session.target(), rc));
    }
    rc = session.retry([&] { return channel->close(); });
    if (rc != 0) {
        sshkit_log(fmt::format("Channel close for {} on {} returned {}", destination, session.target(), rc));
    }
    rc = session.retry([&] { return channel->free(); });
    if (rc != 0) {
        sshkit_log(fmt::format("Channel free for {} on {} returned {}", destination, session.target(), rc));
    }

    sshkit_log(fmt::format("Sent {} bytes to {}:{} (mode {:o})", transferred, session.target(),
                           destination, mode & SCP_MODE_MASK));
    return Outcome<std::size_t>::Ok(transferred);
}

Outcome<std::size_t> send_local_file(Session& session, int mode,
                                     const std::filesystem::path& source,
                                     const std::string& destination) {
    std::ifstream file(source, std::ios::binary);
    if (!file) {
        sshkit_log(SSHError::WRITE, "Cannot read file: " + source.string());
        return Outcome<std::size_t>::Err(SSHError::WRITE);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        sshkit_log(SSHError::WRITE, "Failed reading file: " + source.string());
        return Outcome<std::size_t>::Err(SSHError::WRITE);
    }

    return send_file(session, mode, content.data(), content.size(), destination);
}

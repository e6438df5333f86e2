#pragma once

#include <string>
#include <core/types.hpp>

// Debug log file. Defaults to <temp dir>/sshkit_debug.log.
std::string sshkit_log_path();
void set_log_path(const std::string& path);

// Append a timestamped line to the debug log. Never throws.
void sshkit_log(const std::string& msg);

inline void sshkit_log(SSHError err, const std::string& msg) {
    sshkit_log(fmt::format("[{}] {}", err, msg));
}

void sshkit_log_ssh(const std::string& label, const std::string& cmd,
                    const SSHResult& r);

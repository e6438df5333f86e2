#pragma once

#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// Resolve host:port and connect to the first candidate address that becomes
// readable within timeout_secs. The returned socket is in blocking mode.
// Fails with SSHError::CONNECT when resolution fails or no candidate connects,
// and when timeout_secs is not in 1..SSH_MAX_TIMEOUT_SECS.
Outcome<socket_t> connect_socket(const std::string& host, int port, int timeout_secs);

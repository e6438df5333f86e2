#pragma once

#include <core/constants.hpp>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// Block until sock is ready in the direction(s) the transport is waiting for,
// or timeout_ms elapses. Without a direction hint it waits for input. Returns poll's revents (0 on timeout, -1 on error);
// callers just retry the operation that would have blocked.
int wait_socket(socket_t sock, const Transport& transport,
                int timeout_ms = SSH_WAIT_TIMEOUT_MS);

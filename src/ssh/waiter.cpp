#include "waiter.hpp"

int wait_socket(socket_t sock, const Transport& transport, int timeout_ms) {
    int dir = transport.block_directions();

    short events = 0;
    if (dir & BLOCK_INBOUND) events |= POLLIN;
    if (dir & BLOCK_OUTBOUND) events |= POLLOUT;
    // No hint: wait for input only.
    if (events == 0) events = POLLIN;

    return platform::poll_socket(sock, events, timeout_ms);
}

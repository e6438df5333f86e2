#pragma once

#include <cstddef>

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;      // Per-candidate connect bound
constexpr int SSH_WAIT_TIMEOUT_MS        = 10000;   // Single readiness wait on the socket
constexpr int SSH_MAX_TIMEOUT_SECS       = 86400;   // Upper bound accepted for a connect timeout

// ── Transfer ────────────────────────────────────────────────
constexpr std::size_t SCP_CHUNK_SIZE     = 16 * 1024;   // Bytes handed to one channel write
constexpr int SCP_MODE_MASK              = 0777;        // Permission bits passed to scp

// ── Disconnect reasons ──────────────────────────────────────
constexpr const char* DISCONNECT_REASON_CLOSE     = "sshkit: session closed";
constexpr const char* DISCONNECT_REASON_HANDSHAKE = "sshkit: handshake failed";

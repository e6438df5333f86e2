#pragma once

#include <string>
#include <core/types.hpp>

class Session;

// Run command on a fresh exec channel of an authenticated session and collect
// stdout, stderr, exit status and exit signal. The channel is closed and freed
// before returning, on success and on every error.
//
// Errors: CHANNEL_OPEN, CHANNEL_EXEC, READ.
// exit_code stays EXIT_CODE_UNKNOWN when the channel did not close cleanly.
Outcome<SSHResult> exec_command(Session& session, const std::string& command);

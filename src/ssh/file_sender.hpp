#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <core/types.hpp>

class Session;

// Copy len bytes to destination over an SCP channel, creating the remote file
// with the permission bits of mode (mode & 0777). Returns the number of bytes
// written, which equals len on success.
//
// Errors: CHANNEL_OPEN, WRITE.
Outcome<std::size_t> send_file(Session& session, int mode,
                               const char* data, std::size_t len,
                               const std::string& destination);

// Same, reading the payload from a local file. An unreadable source is WRITE.
Outcome<std::size_t> send_local_file(Session& session, int mode,
                                     const std::filesystem::path& source,
                                     const std::string& destination);

#include "types.hpp"

const char* to_string(SSHError err) {
    switch (err) {
        case SSHError::CONNECT:        return "connect";
        case SSHError::INIT:           return "init";
        case SSHError::HANDSHAKE:      return "handshake";
        case SSHError::AUTHENTICATION: return "authentication";
        case SSHError::CHANNEL_OPEN:   return "channel open";
        case SSHError::CHANNEL_EXEC:   return "channel exec";
        case SSHError::READ:           return "read";
        case SSHError::WRITE:          return "write";
    }
    return "unknown";
}

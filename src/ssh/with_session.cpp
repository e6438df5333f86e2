#include "with_session.hpp"
#include <core/log.hpp>

Outcome<void> authenticate_target(Session& session, const SessionTarget& target) {
    if (target.private_key_path) {
        return session.authenticate_key(target.user, target.public_key_path.value_or(""),
                                        *target.private_key_path, target.passphrase);
    }
    if (target.private_key_data) {
        return session.authenticate_key_memory(target.user, target.public_key_data.value_or(""),
                                               *target.private_key_data, target.passphrase);
    }
    if (target.password) {
        return session.authenticate_password(target.user, *target.password);
    }
    sshkit_log(SSHError::AUTHENTICATION,
               fmt::format("No credentials configured for {}@{}", target.user, target.host));
    return Outcome<void>::Err(SSHError::AUTHENTICATION);
}

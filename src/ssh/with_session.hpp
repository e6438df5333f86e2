#pragma once

#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <core/types.hpp>
#include "session.hpp"

// Open a session, authenticate, run action(Session&) and close the session
// on every path. action must return an Outcome<T>; the bracket returns the
// first error (open, authenticate or the action's own) or the action's value.
//
//   auto r = with_session_password("host", 22, 30, "user", "pw",
//       [](Session& s) { return s.exec("uname -a"); });

namespace detail {

template <typename Action>
using ActionOutcome = std::invoke_result_t<Action, Session&>;

template <typename Action, typename Authenticate>
ActionOutcome<Action> run_bracket(const std::string& host, int port, int timeout_secs,
                                  int wait_timeout_ms, Authenticate&& authenticate,
                                  Action&& action) {
    using Out = ActionOutcome<Action>;

    auto opened = Session::open(host, port, timeout_secs);
    if (opened.is_err()) return Out::Err(opened.error());
    std::unique_ptr<Session> session = std::move(opened).value();
    session->set_wait_timeout(wait_timeout_ms);

    Outcome<void> auth = authenticate(*session);
    if (auth.is_err()) return Out::Err(auth.error());

    Out result = std::forward<Action>(action)(*session);
    session->close();
    return result;
}

} // namespace detail

template <typename Action>
detail::ActionOutcome<Action> with_session_password(const std::string& host, int port,
                                                    int timeout_secs,
                                                    const std::string& user,
                                                    const std::string& password,
                                                    Action&& action) {
    return detail::run_bracket(host, port, timeout_secs, SSH_WAIT_TIMEOUT_MS,
        [&](Session& s) { return s.authenticate_password(user, password); },
        std::forward<Action>(action));
}

template <typename Action>
detail::ActionOutcome<Action> with_session_key(const std::string& host, int port,
                                               int timeout_secs,
                                               const std::string& user,
                                               const std::string& public_key_path,
                                               const std::string& private_key_path,
                                               const std::string& passphrase,
                                               Action&& action) {
    return detail::run_bracket(host, port, timeout_secs, SSH_WAIT_TIMEOUT_MS,
        [&](Session& s) {
            return s.authenticate_key(user, public_key_path, private_key_path, passphrase);
        },
        std::forward<Action>(action));
}

// Pick the authentication method from the target: private key file, then
// in-memory key material, then password.
Outcome<void> authenticate_target(Session& session, const SessionTarget& target);

template <typename Action>
detail::ActionOutcome<Action> with_session(const SessionTarget& target, Action&& action) {
    return detail::run_bracket(target.host, target.port, target.connect_timeout,
                               target.wait_timeout_ms,
        [&](Session& s) { return authenticate_target(s, target); },
        std::forward<Action>(action));
}

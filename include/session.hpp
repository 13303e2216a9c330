#pragma once
#include <optional>
#include <string>
#include "protocol.hpp"

namespace hk
{
    enum class AuthState
    {
        Unauthenticated,
        Authenticated,
        Locked
    };

    // Per-connection authentication gate. The password is handed in by whoever
    // accepts the connection; sessions never share state.
    class Session
    {
    public:
        static constexpr int max_auth_attempts = 3;

        // No password means the session starts authenticated.
        explicit Session(std::optional<std::string> password = std::nullopt);

        // Handles AUTH <password>. Three wrong attempts lock the session.
        Reply authenticate(const std::string &password);

        AuthState state() const { return auth_state; }

        bool authenticated() const { return auth_state == AuthState::Authenticated; }

        // The connection must be closed without further replies.
        bool locked() const { return auth_state == AuthState::Locked; }

        bool requires_auth() const { return secret.has_value(); }

        int failed_attempts() const { return failures; }

    private:
        std::optional<std::string> secret;
        AuthState auth_state;
        int failures = 0;
    };
}

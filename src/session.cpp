#include "session.hpp"
#include "errors.hpp"

namespace hk
{
    namespace
    {
        // Compares every byte so timing does not reveal the matching prefix.
        bool same_secret(const std::string &a, const std::string &b)
        {
            if (a.size() != b.size())
            {
                return false;
            }
            unsigned char diff = 0;
            for (std::size_t i = 0; i < a.size(); ++i)
            {
                diff |= static_cast<unsigned char>(a[i] ^ b[i]);
            }
            return diff == 0;
        }
    }

    Session::Session(std::optional<std::string> password)
        : secret(std::move(password)),
          auth_state(secret.has_value() ? AuthState::Unauthenticated : AuthState::Authenticated)
    {
    }

    Reply Session::authenticate(const std::string &password)
    {
        if (!secret.has_value())
        {
            return Reply::error(CommandError::auth_not_configured().what());
        }
        if (auth_state == AuthState::Locked)
        {
            return Reply::error(CommandError::too_many_attempts(failures, max_auth_attempts).what());
        }
        if (same_secret(password, *secret))
        {
            auth_state = AuthState::Authenticated;
            failures = 0;
            return Reply::ok();
        }

        ++failures;
        if (failures >= max_auth_attempts)
        {
            auth_state = AuthState::Locked;
            return Reply::error(CommandError::too_many_attempts(failures, max_auth_attempts).what());
        }
        return Reply::error(CommandError::invalid_password(failures, max_auth_attempts).what());
    }
}

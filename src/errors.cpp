#include "errors.hpp"

namespace hk
{
    CommandError::CommandError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), error_kind(kind)
    {
    }

    CommandError CommandError::unknown_command(const std::string &name)
    {
        return CommandError(ErrorKind::UnknownCommand, "unknown command '" + name + "'");
    }

    CommandError CommandError::wrong_arity(const std::string &name)
    {
        return CommandError(ErrorKind::WrongArgumentCount, "wrong number of arguments for '" + name + "'");
    }

    CommandError CommandError::type_mismatch()
    {
        return CommandError(ErrorKind::TypeMismatch, "WRONGTYPE Operation against a key holding the wrong kind of value");
    }

    CommandError CommandError::not_an_integer()
    {
        return CommandError(ErrorKind::NotAnInteger, "value is not an integer or out of range");
    }

    CommandError CommandError::not_a_float()
    {
        return CommandError(ErrorKind::NotAFloat, "value is not a valid float");
    }

    CommandError CommandError::syntax()
    {
        return CommandError(ErrorKind::SyntaxError, "syntax error");
    }

    CommandError CommandError::auth_required()
    {
        return CommandError(ErrorKind::AuthRequired, "NOAUTH Authentication required");
    }

    CommandError CommandError::auth_not_configured()
    {
        return CommandError(ErrorKind::InvalidPassword, "AUTH called without any password configured");
    }

    CommandError CommandError::invalid_password(int failures, int limit)
    {
        return CommandError(ErrorKind::InvalidPassword,
                            "invalid password (" + std::to_string(failures) + "/" + std::to_string(limit) + ")");
    }

    CommandError CommandError::too_many_attempts(int failures, int limit)
    {
        return CommandError(ErrorKind::TooManyAttempts, "invalid password (" + std::to_string(failures) + "/" +
                                                            std::to_string(limit) +
                                                            "), too many failed attempts, closing connection");
    }

    CorruptLogError::CorruptLogError(const std::string &path, std::size_t offset)
        : std::runtime_error("corrupt record in durability log '" + path + "' at offset " + std::to_string(offset)),
          bad_offset(offset)
    {
    }
}

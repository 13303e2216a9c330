#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace hk
{
    enum class ErrorKind
    {
        UnknownCommand,
        WrongArgumentCount,
        TypeMismatch,
        NotAnInteger,
        NotAFloat,
        SyntaxError,
        AuthRequired,
        InvalidPassword,
        TooManyAttempts,
        PersistenceFailure
    };

    // Raised by the engine for a single failed command; the dispatcher turns it
    // into an error reply and the connection stays open.
    class CommandError : public std::runtime_error
    {
    public:
        CommandError(ErrorKind kind, const std::string &message);

        ErrorKind kind() const noexcept { return error_kind; }

        static CommandError unknown_command(const std::string &name);
        static CommandError wrong_arity(const std::string &name);
        static CommandError type_mismatch();
        static CommandError not_an_integer();
        static CommandError not_a_float();
        static CommandError syntax();
        static CommandError auth_required();
        static CommandError auth_not_configured();
        static CommandError invalid_password(int failures, int limit);
        static CommandError too_many_attempts(int failures, int limit);

    private:
        ErrorKind error_kind;
    };

    // The durability log cannot be replayed: a record in the middle of the
    // file is malformed. Fatal at startup.
    class CorruptLogError : public std::runtime_error
    {
    public:
        CorruptLogError(const std::string &path, std::size_t offset);

        std::size_t offset() const noexcept { return bad_offset; }

    private:
        std::size_t bad_offset;
    };
}

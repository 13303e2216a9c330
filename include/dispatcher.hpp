#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>
#include "aof.hpp"
#include "keyspace.hpp"
#include "protocol.hpp"
#include "server_info.hpp"
#include "session.hpp"

namespace hk
{
    struct ReplayStats
    {
        std::size_t applied = 0;
        std::size_t skipped = 0;
        std::size_t discarded_bytes = 0;
        std::size_t expired = 0;
    };

    // Turns requests into keyspace operations. Every command runs under one
    // lock, and a mutating command's log records are appended inside that same
    // critical section, after the mutation.
    class Dispatcher
    {
    public:
        explicit Dispatcher(Keyspace &keyspace, ServerInfo &info, AofWriter *aof = nullptr);

        Reply dispatch(Session &session, const std::vector<std::string> &args);

        // Inline form: splits on whitespace first.
        Reply dispatch(Session &session, const std::string &line);

        // Rebuilds the keyspace from the log. Must run before any client is served
        // and before a writer is attached, so nothing is logged twice.
        ReplayStats replay(AofReader &reader);

        // One locked batch of the active sweep. Returns the number of keys removed.
        std::size_t sweep_expired(std::size_t batch);

        void attach_log(AofWriter *writer);

    private:
        Reply execute(const std::vector<std::string> &args, bool replaying);

        // Caller holds the lock. False after the first record that could not be written.
        bool append_records(const std::vector<std::vector<std::string>> &records);

        std::mutex mutex;
        Keyspace &keyspace;
        ServerInfo &info;
        AofWriter *aof;
    };

    // Lower-cased command name as used in the command table and in error replies.
    std::string command_name(const std::string &raw);
}

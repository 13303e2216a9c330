#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include "config.hpp"
#include "dispatcher.hpp"
#include "server_info.hpp"

namespace hk
{
    // Client sockets owned by connection threads, so shutdown can wake every
    // thread and wait for it. A thread calls close() on its socket, then finish()
    // as the very last thing it does.
    class Connections
    {
    public:
        void add(int fd);

        // Closes fd under the lock so shutdown_all never sees a reused descriptor.
        void close(int fd);

        void finish();

        void shutdown_all();

        // Blocks until every added connection has called finish().
        void wait_drained();

    private:
        std::mutex mutex;
        std::condition_variable drained;
        std::unordered_set<int> fds;
        std::size_t active = 0;
    };

    // Serves one connection until EOF, I/O error, QUIT or an auth lockout, then
    // closes client_fd. Requests may be inline lines or RESP arrays.
    void handle_client(int client_fd, Dispatcher &dispatcher, const std::optional<std::string> &password);

    // Accept loop. One thread per connection, refusing connections past
    // maxclients. Returns when `running` goes false or the listener fails.
    int run_server(const ServerConfig &config, Dispatcher &dispatcher, ServerInfo &info,
                   const std::atomic<bool> &running);
}

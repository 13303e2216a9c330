#include "server.hpp"
#include "io.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>

namespace hk
{
    static constexpr std::size_t MAX_LINE = 1024 * 1024;

    void Connections::add(int fd)
    {
        std::lock_guard<std::mutex> lock(mutex);
        fds.insert(fd);
        ++active;
    }

    void Connections::close(int fd)
    {
        std::lock_guard<std::mutex> lock(mutex);
        fds.erase(fd);
        ::close(fd);
    }

    void Connections::finish()
    {
        // notify under the lock: once it is released the waiter may destroy *this
        std::lock_guard<std::mutex> lock(mutex);
        if (--active == 0)
            drained.notify_all();
    }

    void Connections::shutdown_all()
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (int fd : fds)
            ::shutdown(fd, SHUT_RDWR);
    }

    void Connections::wait_drained()
    {
        std::unique_lock<std::mutex> lock(mutex);
        drained.wait(lock, [this] { return active == 0; });
    }

    static void say_goodbye(int fd, std::string_view message)
    {
        if (!write_all(fd, message))
        {
            log(LogLevel::Debug, "peer went away before the final reply");
        }
    }

    static bool is_quit(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
            return false;
        std::string cmd = command_name(args[0]);
        return cmd == "quit" || cmd == "exit";
    }

    enum class FrameResult
    {
        NeedMore,
        Handled,
        Close
    };

    // Handles at most one request from the front of inbuf.
    static FrameResult serve_one(int client_fd, std::string &inbuf, Dispatcher &dispatcher, Session &session)
    {
        std::vector<std::string> args;
        std::string out;

        if (inbuf[0] == '*')
        {
            std::size_t consumed = 0;
            auto st = parse_resp_array(inbuf, consumed, args);
            if (st == RespParseStatus::NeedMore)
                return FrameResult::NeedMore;
            if (st == RespParseStatus::Error)
            {
                say_goodbye(client_fd, "-ERR Protocol error\r\n");
                return FrameResult::Close;
            }
            inbuf.erase(0, consumed);
            if (args.empty())
                return FrameResult::Handled;
            if (is_quit(args))
            {
                say_goodbye(client_fd, "+OK\r\n");
                return FrameResult::Close;
            }
            out = render_resp(dispatcher.dispatch(session, args));
        }
        else
        {
            std::size_t lf = inbuf.find('\n');
            if (lf == std::string::npos)
                return FrameResult::NeedMore;

            std::string line = inbuf.substr(0, lf);
            inbuf.erase(0, lf + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();

            args = parse_line(line);
            if (args.empty())
                return FrameResult::Handled;
            if (is_quit(args))
            {
                say_goodbye(client_fd, "+OK\n");
                return FrameResult::Close;
            }
            out = render_text(dispatcher.dispatch(session, args)) + "\n";
        }

        if (!write_all(client_fd, out))
            return FrameResult::Close;
        // A locked session gets its last error and nothing more.
        if (session.locked())
        {
            log(LogLevel::Warn, "closing connection after too many failed AUTH attempts");
            return FrameResult::Close;
        }
        return FrameResult::Handled;
    }

    // Runs the request loop; the caller owns and closes client_fd.
    static void serve_connection(int client_fd, Dispatcher &dispatcher, const std::optional<std::string> &password)
    {
        Session session(password);
        std::string inbuf;
        char buf[4096];

        for (;;)
        {
            ssize_t n = ::read(client_fd, buf, sizeof(buf));
            if (n > 0)
            {
                inbuf.append(buf, static_cast<std::size_t>(n));
                while (!inbuf.empty())
                {
                    FrameResult res = serve_one(client_fd, inbuf, dispatcher, session);
                    if (res == FrameResult::Close)
                        return;
                    if (res == FrameResult::NeedMore)
                        break;
                }
                if (inbuf.size() > MAX_LINE)
                {
                    say_goodbye(client_fd, "-ERR request too large\r\n");
                    return;
                }
            }
            else if (n == 0)
            {
                return;
            }
            else if (errno == EINTR)
            {
                continue;
            }
            else
            {
                // EAGAIN here is the read timeout expiring
                log(LogLevel::Debug, std::string("closing connection: ") + std::strerror(errno));
                return;
            }
        }
    }

    void handle_client(int client_fd, Dispatcher &dispatcher, const std::optional<std::string> &password)
    {
        serve_connection(client_fd, dispatcher, password);
        ::close(client_fd);
    }

    int run_server(const ServerConfig &config, Dispatcher &dispatcher, ServerInfo &info,
                   const std::atomic<bool> &running)
    {
        int listen_fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (listen_fd < 0)
        {
            log(LogLevel::Error, std::string("socket() failed: ") + std::strerror(errno));
            return 1;
        }
        int yes = 1;
        if (::setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0)
        {
            log(LogLevel::Error, std::string("setsockopt() failed: ") + std::strerror(errno));
            ::close(listen_fd);
            return 1;
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(config.port);
        if (::inet_pton(AF_INET, config.bind.c_str(), &addr.sin_addr) != 1)
        {
            log(LogLevel::Error, "invalid bind address '" + config.bind + "'");
            ::close(listen_fd);
            return 1;
        }
        if (::bind(listen_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
        {
            log(LogLevel::Error, std::string("bind() failed: ") + std::strerror(errno));
            ::close(listen_fd);
            return 1;
        }
        if (::listen(listen_fd, 128) < 0)
        {
            log(LogLevel::Error, std::string("listen() failed: ") + std::strerror(errno));
            ::close(listen_fd);
            return 1;
        }
        log(LogLevel::Info, "listening on " + config.bind + ":" + std::to_string(config.port));

        const std::optional<std::string> password = config.password();
        Connections connections;
        while (running.load())
        {
            pollfd pfd{listen_fd, POLLIN, 0};
            int ready = ::poll(&pfd, 1, 200);
            if (ready <= 0)
            {
                if (ready < 0 && errno != EINTR)
                {
                    log(LogLevel::Error, std::string("poll() failed: ") + std::strerror(errno));
                    break;
                }
                continue;
            }

            sockaddr_in peer{};
            socklen_t peer_len = sizeof(peer);
            int client_fd = ::accept4(listen_fd, reinterpret_cast<sockaddr *>(&peer), &peer_len, SOCK_CLOEXEC);
            if (client_fd < 0)
            {
                if (errno != EINTR && errno != EAGAIN)
                {
                    log(LogLevel::Warn, std::string("accept() failed: ") + std::strerror(errno));
                }
                continue;
            }
            info.total_connections.fetch_add(1);

            char ip[INET_ADDRSTRLEN] = {0};
            ::inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));
            const std::string peer_name = std::string(ip) + ":" + std::to_string(ntohs(peer.sin_port));

            if (info.connected_clients.fetch_add(1) >= config.maxclients)
            {
                info.connected_clients.fetch_sub(1);
                info.rejected_connections.fetch_add(1);
                log(LogLevel::Warn, "max number of clients reached, rejecting " + peer_name);
                say_goodbye(client_fd, "-ERR max number of clients reached\r\n");
                ::close(client_fd);
                continue;
            }

            if (config.timeout > 0)
            {
                timeval tv{};
                tv.tv_sec = config.timeout;
                if (::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0)
                {
                    log(LogLevel::Warn, std::string("cannot set client timeout: ") + std::strerror(errno));
                }
            }

            log(LogLevel::Debug, "client connected: " + peer_name);
            connections.add(client_fd);
            std::thread([client_fd, &dispatcher, &info, &connections, password, peer_name] {
                serve_connection(client_fd, dispatcher, password);
                connections.close(client_fd);
                info.connected_clients.fetch_sub(1);
                log(LogLevel::Debug, "client disconnected: " + peer_name);
                connections.finish();
            }).detach();
        }

        ::close(listen_fd);
        connections.shutdown_all();
        connections.wait_drained();
        return 0;
    }
}

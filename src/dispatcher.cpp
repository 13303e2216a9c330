#include "dispatcher.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <sstream>
#include <unordered_map>

namespace hk
{
    namespace
    {
        using Args = std::vector<std::string>;
        using Records = std::vector<Args>;

        struct ExecContext
        {
            Keyspace &ks;
            ServerInfo &info;
            const AofWriter *aof;
            Records records; // what goes to the durability log if the command commits

            void propagate(Args args) { records.push_back(std::move(args)); }
        };

        using Handler = Reply (*)(ExecContext &ctx, const Args &args);

        struct CommandDef
        {
            int min_args; // not counting the command name
            int max_args; // -1 = unbounded
            bool mutating;
            Handler handler;
        };

        long long parse_int(const std::string &s)
        {
            long long n = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
            if (s.empty() || ec != std::errc() || ptr != s.data() + s.size())
            {
                throw CommandError::not_an_integer();
            }
            return n;
        }

        double parse_score(const std::string &s)
        {
            std::string v = s;
            std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (v == "inf" || v == "+inf")
                return std::numeric_limits<double>::infinity();
            if (v == "-inf")
                return -std::numeric_limits<double>::infinity();

            char *end = nullptr;
            errno = 0;
            double d = std::strtod(s.c_str(), &end);
            if (s.empty() || end != s.c_str() + s.size() || errno == ERANGE || std::isnan(d) || std::isspace(static_cast<unsigned char>(s[0])))
            {
                throw CommandError::not_a_float();
            }
            return d;
        }

        // seconds/milliseconds -> absolute unix ms, rejecting overflow.
        std::int64_t deadline_after(std::int64_t now, long long amount, long long unit_ms, const char *cmd)
        {
            const long long limit = std::numeric_limits<std::int64_t>::max() / 2;
            if (amount > limit / unit_ms || amount < -limit / unit_ms)
            {
                throw CommandError(ErrorKind::SyntaxError, std::string("invalid expire time in '") + cmd + "'");
            }
            return now + amount * unit_ms;
        }

        Reply apply_deadline(ExecContext &ctx, const std::string &key, std::int64_t deadline)
        {
            if (!ctx.ks.expire_at(key, deadline))
            {
                return Reply::from_integer(0);
            }
            if (ctx.ks.exists(key))
            {
                ctx.propagate({"PEXPIREAT", key, std::to_string(deadline)});
            }
            else
            {
                ctx.propagate({"DEL", key});
            }
            return Reply::from_integer(1);
        }

        // --- connection / server ---

        Reply cmd_ping(ExecContext &, const Args &args)
        {
            if (args.size() == 2)
                return Reply::bulk(args[1]);
            return Reply::status("PONG");
        }

        Reply cmd_echo(ExecContext &, const Args &args)
        {
            return Reply::bulk(args[1]);
        }

        Reply cmd_info(ExecContext &ctx, const Args &)
        {
            std::ostringstream out;
            out << "# Server\r\n"
                << "hexkv_version:1.0.0\r\n"
                << "uptime_in_seconds:" << ctx.info.uptime_seconds() << "\r\n"
                << "\r\n# Clients\r\n"
                << "connected_clients:" << ctx.info.connected_clients.load() << "\r\n"
                << "total_connections_received:" << ctx.info.total_connections.load() << "\r\n"
                << "rejected_connections:" << ctx.info.rejected_connections.load() << "\r\n"
                << "auth_lockouts:" << ctx.info.auth_lockouts.load() << "\r\n"
                << "\r\n# Stats\r\n"
                << "total_commands_processed:" << ctx.info.total_commands.load() << "\r\n"
                << "expired_keys:" << ctx.ks.expired_total() << "\r\n"
                << "\r\n# Persistence\r\n"
                << "aof_enabled:" << (ctx.aof != nullptr ? 1 : 0) << "\r\n"
                << "aof_records_appended:" << (ctx.aof != nullptr ? ctx.aof->records() : 0) << "\r\n"
                << "\r\n# Keyspace\r\n"
                << "keys:" << ctx.ks.size() << "\r\n"
                << "expires:" << ctx.ks.volatile_size() << "\r\n";
            return Reply::bulk(out.str());
        }

        Reply cmd_dbsize(ExecContext &ctx, const Args &)
        {
            return Reply::from_integer(static_cast<long long>(ctx.ks.size()));
        }

        Reply cmd_flushdb(ExecContext &ctx, const Args &args)
        {
            if (ctx.ks.size() > 0)
            {
                ctx.ks.clear();
                ctx.propagate({args[0]});
            }
            return Reply::ok();
        }

        // --- keys / strings ---

        Reply cmd_get(ExecContext &ctx, const Args &args)
        {
            auto value = ctx.ks.get_string(args[1]);
            if (!value.has_value())
                return Reply::nil();
            return Reply::bulk(std::move(*value));
        }

        Reply cmd_set(ExecContext &ctx, const Args &args)
        {
            std::optional<std::int64_t> ttl_ms;
            if (args.size() == 4)
            {
                throw CommandError::syntax();
            }
            if (args.size() == 5)
            {
                std::string opt = args[3];
                std::transform(opt.begin(), opt.end(), opt.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
                long long amount = parse_int(args[4]);
                if (amount <= 0)
                {
                    throw CommandError(ErrorKind::SyntaxError, "invalid expire time in 'set'");
                }
                if (opt == "EX")
                    ttl_ms = deadline_after(0, amount, 1000, "set");
                else if (opt == "PX")
                    ttl_ms = deadline_after(0, amount, 1, "set");
                else
                    throw CommandError::syntax();
            }

            auto deadline = ctx.ks.set(args[1], Value(args[2]), ttl_ms);
            ctx.propagate({"SET", args[1], args[2]});
            if (deadline.has_value())
            {
                ctx.propagate({"PEXPIREAT", args[1], std::to_string(*deadline)});
            }
            return Reply::ok();
        }

        Reply cmd_del(ExecContext &ctx, const Args &args)
        {
            Args removed{"DEL"};
            for (std::size_t i = 1; i < args.size(); ++i)
            {
                if (ctx.ks.del(args[i]))
                    removed.push_back(args[i]);
            }
            long long count = static_cast<long long>(removed.size() - 1);
            if (count > 0)
                ctx.propagate(std::move(removed));
            return Reply::from_integer(count);
        }

        Reply cmd_exists(ExecContext &ctx, const Args &args)
        {
            long long count = 0;
            for (std::size_t i = 1; i < args.size(); ++i)
            {
                if (ctx.ks.exists(args[i]))
                    ++count;
            }
            return Reply::from_integer(count);
        }

        Reply cmd_keys(ExecContext &ctx, const Args &args)
        {
            return Reply::array(ctx.ks.keys_matching(args[1]));
        }

        Reply cmd_type(ExecContext &ctx, const Args &args)
        {
            const Value *value = ctx.ks.get(args[1]);
            if (value == nullptr)
                return Reply::status("none");
            return Reply::status(type_name(type_of(*value)));
        }

        Reply incr_reply(ExecContext &ctx, const Args &args, long long delta)
        {
            std::int64_t result = ctx.ks.incr_by(args[1], delta);
            ctx.propagate(args);
            return Reply::from_integer(result);
        }

        Reply cmd_incr(ExecContext &ctx, const Args &args)
        {
            return incr_reply(ctx, args, 1);
        }

        Reply cmd_decr(ExecContext &ctx, const Args &args)
        {
            return incr_reply(ctx, args, -1);
        }

        Reply cmd_incrby(ExecContext &ctx, const Args &args)
        {
            return incr_reply(ctx, args, parse_int(args[2]));
        }

        Reply cmd_decrby(ExecContext &ctx, const Args &args)
        {
            long long delta = parse_int(args[2]);
            if (delta == std::numeric_limits<long long>::min())
                throw CommandError::not_an_integer();
            return incr_reply(ctx, args, -delta);
        }

        // --- expiration ---

        Reply cmd_expire(ExecContext &ctx, const Args &args)
        {
            long long seconds = parse_int(args[2]);
            return apply_deadline(ctx, args[1], deadline_after(ctx.ks.now(), seconds, 1000, "expire"));
        }

        Reply cmd_expireat(ExecContext &ctx, const Args &args)
        {
            long long when = parse_int(args[2]);
            return apply_deadline(ctx, args[1], deadline_after(0, when, 1000, "expireat"));
        }

        Reply cmd_pexpireat(ExecContext &ctx, const Args &args)
        {
            long long when = parse_int(args[2]);
            return apply_deadline(ctx, args[1], deadline_after(0, when, 1, "pexpireat"));
        }

        Reply cmd_ttl(ExecContext &ctx, const Args &args)
        {
            return Reply::from_integer(ctx.ks.ttl(args[1]));
        }

        Reply cmd_pttl(ExecContext &ctx, const Args &args)
        {
            return Reply::from_integer(ctx.ks.pttl(args[1]));
        }

        Reply cmd_persist(ExecContext &ctx, const Args &args)
        {
            bool removed = ctx.ks.persist(args[1]);
            if (removed)
                ctx.propagate(args);
            return Reply::from_integer(removed ? 1 : 0);
        }

        // --- lists ---

        Reply push_reply(ExecContext &ctx, const Args &args, bool left)
        {
            std::size_t len = ctx.ks.mutate_typed<List>(args[1], [&](List &list) {
                for (std::size_t i = 2; i < args.size(); ++i)
                {
                    if (left)
                        list.push_front(args[i]);
                    else
                        list.push_back(args[i]);
                }
                return list.size();
            });
            ctx.propagate(args);
            return Reply::from_integer(static_cast<long long>(len));
        }

        Reply cmd_lpush(ExecContext &ctx, const Args &args)
        {
            return push_reply(ctx, args, true);
        }

        Reply cmd_rpush(ExecContext &ctx, const Args &args)
        {
            return push_reply(ctx, args, false);
        }

        Reply pop_reply(ExecContext &ctx, const Args &args, bool left)
        {
            if (ctx.ks.find_typed<List>(args[1]) == nullptr)
                return Reply::nil();
            std::string value = ctx.ks.mutate_typed<List>(args[1], [&](List &list) {
                std::string out;
                if (left)
                {
                    out = std::move(list.front());
                    list.pop_front();
                }
                else
                {
                    out = std::move(list.back());
                    list.pop_back();
                }
                return out;
            });
            ctx.propagate(args);
            return Reply::bulk(std::move(value));
        }

        Reply cmd_lpop(ExecContext &ctx, const Args &args)
        {
            return pop_reply(ctx, args, true);
        }

        Reply cmd_rpop(ExecContext &ctx, const Args &args)
        {
            return pop_reply(ctx, args, false);
        }

        Reply cmd_llen(ExecContext &ctx, const Args &args)
        {
            const List *list = ctx.ks.find_typed<List>(args[1]);
            return Reply::from_integer(list == nullptr ? 0 : static_cast<long long>(list->size()));
        }

        Reply cmd_lrange(ExecContext &ctx, const Args &args)
        {
            long long start = parse_int(args[2]);
            long long stop = parse_int(args[3]);
            const List *list = ctx.ks.find_typed<List>(args[1]);
            std::vector<std::string> out;
            std::size_t first = 0;
            std::size_t last = 0;
            if (list != nullptr && normalize_range(start, stop, list->size(), first, last))
            {
                out.assign(list->begin() + static_cast<std::ptrdiff_t>(first),
                           list->begin() + static_cast<std::ptrdiff_t>(last) + 1);
            }
            return Reply::array(std::move(out));
        }

        // --- hashes ---

        Reply cmd_hset(ExecContext &ctx, const Args &args)
        {
            if (args.size() % 2 != 0)
                throw CommandError::wrong_arity("hset");
            bool changed = false;
            long long added = ctx.ks.mutate_typed<Hash>(args[1], [&](Hash &hash) {
                long long fresh = 0;
                for (std::size_t i = 2; i + 1 < args.size(); i += 2)
                {
                    auto [it, inserted] = hash.try_emplace(args[i], args[i + 1]);
                    if (inserted)
                    {
                        ++fresh;
                        changed = true;
                    }
                    else if (it->second != args[i + 1])
                    {
                        it->second = args[i + 1];
                        changed = true;
                    }
                }
                return fresh;
            });
            if (changed)
                ctx.propagate(args);
            return Reply::from_integer(added);
        }

        Reply cmd_hget(ExecContext &ctx, const Args &args)
        {
            const Hash *hash = ctx.ks.find_typed<Hash>(args[1]);
            if (hash == nullptr)
                return Reply::nil();
            auto it = hash->find(args[2]);
            if (it == hash->end())
                return Reply::nil();
            return Reply::bulk(it->second);
        }

        // Fields sorted so listings are stable across calls.
        std::vector<std::pair<std::string, std::string>> sorted_fields(const Hash *hash)
        {
            std::vector<std::pair<std::string, std::string>> fields;
            if (hash != nullptr)
            {
                fields.assign(hash->begin(), hash->end());
                std::sort(fields.begin(), fields.end());
            }
            return fields;
        }

        Reply cmd_hgetall(ExecContext &ctx, const Args &args)
        {
            std::vector<std::string> out;
            for (auto &[field, value] : sorted_fields(ctx.ks.find_typed<Hash>(args[1])))
            {
                out.push_back(field);
                out.push_back(value);
            }
            return Reply::array(std::move(out));
        }

        Reply cmd_hkeys(ExecContext &ctx, const Args &args)
        {
            std::vector<std::string> out;
            for (auto &field : sorted_fields(ctx.ks.find_typed<Hash>(args[1])))
                out.push_back(field.first);
            return Reply::array(std::move(out));
        }

        Reply cmd_hvals(ExecContext &ctx, const Args &args)
        {
            std::vector<std::string> out;
            for (auto &field : sorted_fields(ctx.ks.find_typed<Hash>(args[1])))
                out.push_back(field.second);
            return Reply::array(std::move(out));
        }

        Reply cmd_hdel(ExecContext &ctx, const Args &args)
        {
            if (ctx.ks.find_typed<Hash>(args[1]) == nullptr)
                return Reply::from_integer(0);
            long long removed = ctx.ks.mutate_typed<Hash>(args[1], [&](Hash &hash) {
                long long n = 0;
                for (std::size_t i = 2; i < args.size(); ++i)
                    n += static_cast<long long>(hash.erase(args[i]));
                return n;
            });
            if (removed > 0)
                ctx.propagate(args);
            return Reply::from_integer(removed);
        }

        Reply cmd_hlen(ExecContext &ctx, const Args &args)
        {
            const Hash *hash = ctx.ks.find_typed<Hash>(args[1]);
            return Reply::from_integer(hash == nullptr ? 0 : static_cast<long long>(hash->size()));
        }

        Reply cmd_hexists(ExecContext &ctx, const Args &args)
        {
            const Hash *hash = ctx.ks.find_typed<Hash>(args[1]);
            return Reply::from_integer(hash != nullptr && hash->count(args[2]) > 0 ? 1 : 0);
        }

        // --- sets ---

        Reply cmd_sadd(ExecContext &ctx, const Args &args)
        {
            long long added = ctx.ks.mutate_typed<Set>(args[1], [&](Set &set) {
                long long n = 0;
                for (std::size_t i = 2; i < args.size(); ++i)
                    n += set.insert(args[i]).second ? 1 : 0;
                return n;
            });
            if (added > 0)
                ctx.propagate(args);
            return Reply::from_integer(added);
        }

        Reply cmd_srem(ExecContext &ctx, const Args &args)
        {
            if (ctx.ks.find_typed<Set>(args[1]) == nullptr)
                return Reply::from_integer(0);
            long long removed = ctx.ks.mutate_typed<Set>(args[1], [&](Set &set) {
                long long n = 0;
                for (std::size_t i = 2; i < args.size(); ++i)
                    n += static_cast<long long>(set.erase(args[i]));
                return n;
            });
            if (removed > 0)
                ctx.propagate(args);
            return Reply::from_integer(removed);
        }

        Reply cmd_smembers(ExecContext &ctx, const Args &args)
        {
            const Set *set = ctx.ks.find_typed<Set>(args[1]);
            std::vector<std::string> out;
            if (set != nullptr)
            {
                out.assign(set->begin(), set->end());
                std::sort(out.begin(), out.end());
            }
            return Reply::array(std::move(out));
        }

        Reply cmd_sismember(ExecContext &ctx, const Args &args)
        {
            const Set *set = ctx.ks.find_typed<Set>(args[1]);
            return Reply::from_integer(set != nullptr && set->count(args[2]) > 0 ? 1 : 0);
        }

        Reply cmd_scard(ExecContext &ctx, const Args &args)
        {
            const Set *set = ctx.ks.find_typed<Set>(args[1]);
            return Reply::from_integer(set == nullptr ? 0 : static_cast<long long>(set->size()));
        }

        // --- sorted sets ---

        Reply cmd_zadd(ExecContext &ctx, const Args &args)
        {
            if (args.size() % 2 != 0)
                throw CommandError::wrong_arity("zadd");
            std::vector<std::pair<double, std::string>> pairs;
            for (std::size_t i = 2; i + 1 < args.size(); i += 2)
                pairs.emplace_back(parse_score(args[i]), args[i + 1]);

            bool changed = false;
            long long added = ctx.ks.mutate_typed<SortedSet>(args[1], [&](SortedSet &zset) {
                long long n = 0;
                for (const auto &[score, member] : pairs)
                {
                    auto before = zset.score(member);
                    if (zset.add(member, score))
                        ++n;
                    if (!before.has_value() || *before != score)
                        changed = true;
                }
                return n;
            });
            if (changed)
                ctx.propagate(args);
            return Reply::from_integer(added);
        }

        Reply cmd_zrem(ExecContext &ctx, const Args &args)
        {
            if (ctx.ks.find_typed<SortedSet>(args[1]) == nullptr)
                return Reply::from_integer(0);
            long long removed = ctx.ks.mutate_typed<SortedSet>(args[1], [&](SortedSet &zset) {
                long long n = 0;
                for (std::size_t i = 2; i < args.size(); ++i)
                    n += zset.remove(args[i]) ? 1 : 0;
                return n;
            });
            if (removed > 0)
                ctx.propagate(args);
            return Reply::from_integer(removed);
        }

        Reply cmd_zscore(ExecContext &ctx, const Args &args)
        {
            const SortedSet *zset = ctx.ks.find_typed<SortedSet>(args[1]);
            if (zset == nullptr)
                return Reply::nil();
            auto score = zset->score(args[2]);
            if (!score.has_value())
                return Reply::nil();
            return Reply::bulk(format_score(*score));
        }

        Reply cmd_zrange(ExecContext &ctx, const Args &args)
        {
            bool withscores = false;
            if (args.size() == 5)
            {
                std::string opt = args[4];
                std::transform(opt.begin(), opt.end(), opt.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
                if (opt != "WITHSCORES")
                    throw CommandError::syntax();
                withscores = true;
            }
            long long start = parse_int(args[2]);
            long long stop = parse_int(args[3]);
            const SortedSet *zset = ctx.ks.find_typed<SortedSet>(args[1]);
            std::vector<std::string> out;
            if (zset != nullptr)
            {
                for (auto &[member, score] : zset->range(start, stop))
                {
                    out.push_back(member);
                    if (withscores)
                        out.push_back(format_score(score));
                }
            }
            return Reply::array(std::move(out));
        }

        Reply cmd_zcard(ExecContext &ctx, const Args &args)
        {
            const SortedSet *zset = ctx.ks.find_typed<SortedSet>(args[1]);
            return Reply::from_integer(zset == nullptr ? 0 : static_cast<long long>(zset->size()));
        }

        Reply cmd_zrank(ExecContext &ctx, const Args &args)
        {
            const SortedSet *zset = ctx.ks.find_typed<SortedSet>(args[1]);
            if (zset == nullptr)
                return Reply::nil();
            auto rank = zset->rank(args[2]);
            if (!rank.has_value())
                return Reply::nil();
            return Reply::from_integer(static_cast<long long>(*rank));
        }

        const std::unordered_map<std::string, CommandDef> &command_table()
        {
            static const std::unordered_map<std::string, CommandDef> table = {
                {"ping", {0, 1, false, cmd_ping}},
                {"echo", {1, 1, false, cmd_echo}},
                {"info", {0, 1, false, cmd_info}},
                {"dbsize", {0, 0, false, cmd_dbsize}},
                {"flushdb", {0, 0, true, cmd_flushdb}},

                {"get", {1, 1, false, cmd_get}},
                {"set", {2, 4, true, cmd_set}},
                {"del", {1, -1, true, cmd_del}},
                {"exists", {1, -1, false, cmd_exists}},
                {"keys", {1, 1, false, cmd_keys}},
                {"type", {1, 1, false, cmd_type}},
                {"incr", {1, 1, true, cmd_incr}},
                {"decr", {1, 1, true, cmd_decr}},
                {"incrby", {2, 2, true, cmd_incrby}},
                {"decrby", {2, 2, true, cmd_decrby}},

                {"expire", {2, 2, true, cmd_expire}},
                {"expireat", {2, 2, true, cmd_expireat}},
                {"pexpireat", {2, 2, true, cmd_pexpireat}},
                {"ttl", {1, 1, false, cmd_ttl}},
                {"pttl", {1, 1, false, cmd_pttl}},
                {"persist", {1, 1, true, cmd_persist}},

                {"lpush", {2, -1, true, cmd_lpush}},
                {"rpush", {2, -1, true, cmd_rpush}},
                {"lpop", {1, 1, true, cmd_lpop}},
                {"rpop", {1, 1, true, cmd_rpop}},
                {"llen", {1, 1, false, cmd_llen}},
                {"lrange", {3, 3, false, cmd_lrange}},

                {"hset", {3, -1, true, cmd_hset}},
                {"hget", {2, 2, false, cmd_hget}},
                {"hgetall", {1, 1, false, cmd_hgetall}},
                {"hkeys", {1, 1, false, cmd_hkeys}},
                {"hvals", {1, 1, false, cmd_hvals}},
                {"hdel", {2, -1, true, cmd_hdel}},
                {"hlen", {1, 1, false, cmd_hlen}},
                {"hexists", {2, 2, false, cmd_hexists}},

                {"sadd", {2, -1, true, cmd_sadd}},
                {"srem", {2, -1, true, cmd_srem}},
                {"smembers", {1, 1, false, cmd_smembers}},
                {"sismember", {2, 2, false, cmd_sismember}},
                {"scard", {1, 1, false, cmd_scard}},

                {"zadd", {3, -1, true, cmd_zadd}},
                {"zrem", {2, -1, true, cmd_zrem}},
                {"zscore", {2, 2, false, cmd_zscore}},
                {"zrange", {3, 4, false, cmd_zrange}},
                {"zcard", {1, 1, false, cmd_zcard}},
                {"zrank", {2, 2, false, cmd_zrank}},
            };
            return table;
        }

        const CommandDef &lookup(const std::string &name, std::size_t argc)
        {
            const auto &table = command_table();
            auto it = table.find(name);
            if (it == table.end())
            {
                throw CommandError::unknown_command(name);
            }
            const CommandDef &def = it->second;
            const long long given = static_cast<long long>(argc) - 1;
            if (given < def.min_args || (def.max_args >= 0 && given > def.max_args))
            {
                throw CommandError::wrong_arity(name);
            }
            return def;
        }
    }

    std::string command_name(const std::string &raw)
    {
        std::string cmd = raw;
        std::transform(cmd.begin(), cmd.end(), cmd.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return cmd;
    }

    Dispatcher::Dispatcher(Keyspace &keyspace, ServerInfo &info, AofWriter *aof)
        : keyspace(keyspace), info(info), aof(aof)
    {
    }

    void Dispatcher::attach_log(AofWriter *writer)
    {
        std::lock_guard<std::mutex> lock(mutex);
        aof = writer;
    }

    Reply Dispatcher::dispatch(Session &session, const std::string &line)
    {
        return dispatch(session, parse_line(line));
    }

    Reply Dispatcher::dispatch(Session &session, const std::vector<std::string> &args)
    {
        if (args.empty())
        {
            return Reply::error("empty command");
        }
        info.total_commands.fetch_add(1);
        const std::string name = command_name(args[0]);

        if (name == "auth")
        {
            if (args.size() != 2)
            {
                return Reply::error(CommandError::wrong_arity(name).what());
            }
            Reply reply = session.authenticate(args[1]);
            if (session.locked())
            {
                info.auth_lockouts.fetch_add(1);
            }
            return reply;
        }
        if (!session.authenticated())
        {
            return Reply::error(CommandError::auth_required().what());
        }

        try
        {
            return execute(args, false);
        }
        catch (const CommandError &e)
        {
            return Reply::error(e.what());
        }
    }

    Reply Dispatcher::execute(const std::vector<std::string> &args, bool replaying)
    {
        const std::string name = command_name(args[0]);
        const CommandDef &def = lookup(name, args.size());

        std::lock_guard<std::mutex> lock(mutex);
        ExecContext ctx{keyspace, info, aof, {}};

        Reply reply;
        std::optional<CommandError> failure;
        try
        {
            reply = def.handler(ctx, args);
        }
        catch (const CommandError &e)
        {
            failure = e;
            ctx.records.clear();
        }

        // Keys that lazily expired while the command ran are logged as deletions
        // ahead of the command itself, in the order they happened. This holds for
        // read-only commands too: replay runs with expiry suspended, so a later
        // write to the same key would otherwise land on the stale entry.
        Records records;
        for (auto &key : keyspace.take_expired())
        {
            records.push_back({"DEL", std::move(key)});
        }
        if (def.mutating)
        {
            for (auto &record : ctx.records)
            {
                records.push_back(std::move(record));
            }
        }

        if (!replaying && !append_records(records))
        {
            throw CommandError(ErrorKind::PersistenceFailure, "failed to append to the durability log");
        }

        if (failure.has_value())
        {
            throw *failure;
        }
        return reply;
    }

    bool Dispatcher::append_records(const std::vector<std::vector<std::string>> &records)
    {
        if (aof == nullptr)
        {
            return true;
        }
        for (const auto &record : records)
        {
            if (!aof->append(record))
            {
                log(LogLevel::Error, "failed to append '" + record[0] + "' to " + aof->path());
                return false;
            }
        }
        return true;
    }

    ReplayStats Dispatcher::replay(AofReader &reader)
    {
        ReplayStats stats;
        {
            std::lock_guard<std::mutex> lock(mutex);
            keyspace.set_loading(true);
        }

        std::vector<std::string> record;
        try
        {
            while (reader.next(record))
            {
                try
                {
                    execute(record, true);
                    ++stats.applied;
                }
                catch (const CommandError &e)
                {
                    ++stats.skipped;
                    log(LogLevel::Warn, "skipping log record '" + command_name(record[0]) + "': " + e.what());
                }
            }
        }
        catch (const CorruptLogError &)
        {
            std::lock_guard<std::mutex> lock(mutex);
            keyspace.set_loading(false);
            throw;
        }
        stats.discarded_bytes = reader.discarded_bytes();

        std::lock_guard<std::mutex> lock(mutex);
        keyspace.set_loading(false);
        while (std::size_t removed = keyspace.remove_expired(1024))
        {
            stats.expired += removed;
        }
        // elapsed TTLs are already in the log; nothing to re-log
        keyspace.take_expired();
        return stats;
    }

    std::size_t Dispatcher::sweep_expired(std::size_t batch)
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t removed = keyspace.remove_expired(batch);
        Records records;
        for (auto &key : keyspace.take_expired())
        {
            records.push_back({"DEL", std::move(key)});
        }
        if (!append_records(records))
        {
            log(LogLevel::Warn, "expired keys were removed but their deletions are missing from the log");
        }
        return removed;
    }
}

#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <type_traits>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "errors.hpp"
#include "value.hpp"

namespace hk
{
    using Clock = std::function<std::int64_t()>;

    // Wall-clock unix time in milliseconds.
    std::int64_t unix_time_ms();

    // Key -> Entry map with per-key expiration. Not synchronized: every call
    // must be made while holding the database lock (see Dispatcher).
    class Keyspace
    {
    public:
        explicit Keyspace(Clock clock = unix_time_ms);

        std::int64_t now() const { return clock(); }

        // nullptr when the key is absent or has expired.
        const Value *get(const std::string &key);

        // String view of a key; throws TypeMismatch when the key holds a container.
        std::optional<std::string> get_string(const std::string &key);

        // Inserts or replaces the entry. Any previous TTL is dropped unless a new one is given.
        // Returns the absolute deadline stored for the key, if any.
        std::optional<std::int64_t> set(const std::string &key, Value value, std::optional<std::int64_t> ttl_ms = std::nullopt);

        bool del(const std::string &key);

        bool exists(const std::string &key);

        // Read access to a container. nullptr when absent, TypeMismatch on another variant.
        template <typename T>
        const T *find_typed(const std::string &key)
        {
            auto it = live(key);
            if (it == memory.end())
            {
                return nullptr;
            }
            const T *typed = std::get_if<T>(&it->second.value);
            if (typed == nullptr)
            {
                throw CommandError::type_mismatch();
            }
            return typed;
        }

        // Applies f to the container stored at key, creating an empty one first when
        // the key is absent. A container left empty by f is removed.
        template <typename T, typename F>
        auto mutate_typed(const std::string &key, F &&f) -> decltype(f(std::declval<T &>()))
        {
            auto it = live(key);
            if (it == memory.end())
            {
                it = memory.emplace(key, Entry{Value(std::in_place_type<T>), std::nullopt}).first;
            }
            T *typed = std::get_if<T>(&it->second.value);
            if (typed == nullptr)
            {
                throw CommandError::type_mismatch();
            }
            if constexpr (std::is_void_v<decltype(f(*typed))>)
            {
                f(*typed);
                drop_if_empty(it, *typed);
            }
            else
            {
                auto result = f(*typed);
                drop_if_empty(it, *typed);
                return result;
            }
        }

        // Keys matching a glob pattern ("*", "prefix*", ...), sorted.
        std::vector<std::string> keys_matching(const std::string &pattern);

        // Parses the string value as base-10, adds delta and stores it back.
        // A missing key counts as "0".
        std::int64_t incr_by(const std::string &key, std::int64_t delta);

        // Sets an absolute deadline. A deadline at or before now deletes the key
        // (outside loading). Returns false when the key is absent.
        bool expire_at(const std::string &key, std::int64_t deadline_ms);

        bool persist(const std::string &key);

        // Remaining milliseconds, -1 without TTL, -2 when absent.
        std::int64_t pttl(const std::string &key);

        // Remaining whole seconds (rounded to nearest), -1 without TTL, -2 when absent.
        std::int64_t ttl(const std::string &key);

        std::optional<std::int64_t> expires_at(const std::string &key);

        // Removes up to `limit` entries whose deadline has passed. Returns how many went.
        std::size_t remove_expired(std::size_t limit);

        void clear();

        std::size_t size() const { return memory.size(); }

        std::size_t volatile_size() const { return deadlines.size(); }

        std::uint64_t expired_total() const { return expired; }

        // Keys removed by expiration since the last call, oldest first.
        std::vector<std::string> take_expired();

        // While loading, deadlines are stored but never enforced, so a replayed
        // log rebuilds the state clients saw when each record was written.
        void set_loading(bool on) { loading = on; }

        bool is_loading() const { return loading; }

    private:
        using Map = std::unordered_map<std::string, Entry>;

        // Lazily expires key; returns end() when absent.
        Map::iterator live(const std::string &key);

        void erase(Map::iterator it);

        void clear_deadline(const std::string &key, Entry &entry);

        template <typename T>
        void drop_if_empty(Map::iterator it, const T &container)
        {
            if (container.empty())
            {
                erase(it);
            }
        }

        Map memory;

        std::set<std::pair<std::int64_t, std::string>> deadlines;

        Clock clock;

        std::uint64_t expired = 0;

        std::vector<std::string> expired_keys;

        bool loading = false;
    };
}

#include "keyspace.hpp"
#include <algorithm>
#include <charconv>
#include <chrono>
#include <fnmatch.h>
#include <limits>

namespace hk
{
    std::int64_t unix_time_ms()
    {
        auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
    }

    Keyspace::Keyspace(Clock clock) : clock(std::move(clock))
    {
        memory.reserve(1024);
    }

    Keyspace::Map::iterator Keyspace::live(const std::string &key)
    {
        auto it = memory.find(key);
        if (it == memory.end())
        {
            return it;
        }
        const auto &deadline = it->second.expires_at;
        if (!loading && deadline.has_value() && *deadline <= clock())
        {
            expired_keys.push_back(key);
            erase(it);
            ++expired;
            return memory.end();
        }
        return it;
    }

    void Keyspace::erase(Map::iterator it)
    {
        if (it->second.expires_at.has_value())
        {
            deadlines.erase({*it->second.expires_at, it->first});
        }
        memory.erase(it);
    }

    void Keyspace::clear_deadline(const std::string &key, Entry &entry)
    {
        if (entry.expires_at.has_value())
        {
            deadlines.erase({*entry.expires_at, key});
            entry.expires_at.reset();
        }
    }

    const Value *Keyspace::get(const std::string &key)
    {
        auto it = live(key);
        if (it == memory.end())
        {
            return nullptr;
        }
        return &it->second.value;
    }

    std::optional<std::string> Keyspace::get_string(const std::string &key)
    {
        const std::string *value = find_typed<std::string>(key);
        if (value == nullptr)
        {
            return std::nullopt;
        }
        return *value;
    }

    std::optional<std::int64_t> Keyspace::set(const std::string &key, Value value, std::optional<std::int64_t> ttl_ms)
    {
        auto it = live(key);
        if (it == memory.end())
        {
            it = memory.emplace(key, Entry{std::move(value), std::nullopt}).first;
        }
        else
        {
            clear_deadline(key, it->second);
            it->second.value = std::move(value);
        }
        if (ttl_ms.has_value())
        {
            std::int64_t deadline = clock() + *ttl_ms;
            it->second.expires_at = deadline;
            deadlines.emplace(deadline, key);
        }
        return it->second.expires_at;
    }

    bool Keyspace::del(const std::string &key)
    {
        auto it = live(key);
        if (it == memory.end())
        {
            return false;
        }
        erase(it);
        return true;
    }

    bool Keyspace::exists(const std::string &key)
    {
        return live(key) != memory.end();
    }

    std::vector<std::string> Keyspace::keys_matching(const std::string &pattern)
    {
        std::vector<std::string> out;
        const std::int64_t now = clock();
        const bool match_all = pattern == "*";
        for (const auto &[key, entry] : memory)
        {
            if (entry.expires_at.has_value() && *entry.expires_at <= now)
            {
                continue;
            }
            if (match_all || ::fnmatch(pattern.c_str(), key.c_str(), 0) == 0)
            {
                out.push_back(key);
            }
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    std::int64_t Keyspace::incr_by(const std::string &key, std::int64_t delta)
    {
        auto it = live(key);
        std::int64_t current = 0;
        if (it != memory.end())
        {
            const std::string *text = std::get_if<std::string>(&it->second.value);
            if (text == nullptr)
            {
                throw CommandError::type_mismatch();
            }
            const char *first = text->data();
            const char *last = text->data() + text->size();
            auto [ptr, ec] = std::from_chars(first, last, current);
            if (text->empty() || ec != std::errc() || ptr != last)
            {
                throw CommandError::not_an_integer();
            }
        }

        if ((delta > 0 && current > std::numeric_limits<std::int64_t>::max() - delta) ||
            (delta < 0 && current < std::numeric_limits<std::int64_t>::min() - delta))
        {
            throw CommandError::not_an_integer();
        }
        std::int64_t result = current + delta;

        if (it == memory.end())
        {
            memory.emplace(key, Entry{Value(std::to_string(result)), std::nullopt});
        }
        else
        {
            // keeps the TTL, like an in-place edit
            it->second.value = std::to_string(result);
        }
        return result;
    }

    bool Keyspace::expire_at(const std::string &key, std::int64_t deadline_ms)
    {
        auto it = live(key);
        if (it == memory.end())
        {
            return false;
        }
        if (!loading && deadline_ms <= clock())
        {
            erase(it);
            return true;
        }
        clear_deadline(key, it->second);
        it->second.expires_at = deadline_ms;
        deadlines.emplace(deadline_ms, key);
        return true;
    }

    bool Keyspace::persist(const std::string &key)
    {
        auto it = live(key);
        if (it == memory.end() || !it->second.expires_at.has_value())
        {
            return false;
        }
        clear_deadline(key, it->second);
        return true;
    }

    std::int64_t Keyspace::pttl(const std::string &key)
    {
        auto it = live(key);
        if (it == memory.end())
        {
            return -2;
        }
        if (!it->second.expires_at.has_value())
        {
            return -1;
        }
        return *it->second.expires_at - clock();
    }

    std::int64_t Keyspace::ttl(const std::string &key)
    {
        std::int64_t ms = pttl(key);
        if (ms < 0)
        {
            return ms;
        }
        return (ms + 500) / 1000;
    }

    std::optional<std::int64_t> Keyspace::expires_at(const std::string &key)
    {
        auto it = live(key);
        if (it == memory.end())
        {
            return std::nullopt;
        }
        return it->second.expires_at;
    }

    std::size_t Keyspace::remove_expired(std::size_t limit)
    {
        const std::int64_t now = clock();
        std::size_t removed = 0;
        while (removed < limit && !deadlines.empty())
        {
            auto first = deadlines.begin();
            if (first->first > now)
            {
                break;
            }
            // erase() drops the deadline too; copy the key before it goes
            std::string key = first->second;
            auto it = memory.find(key);
            if (it == memory.end())
            {
                deadlines.erase(first);
                continue;
            }
            expired_keys.push_back(std::move(key));
            erase(it);
            ++removed;
        }
        expired += removed;
        return removed;
    }

    std::vector<std::string> Keyspace::take_expired()
    {
        std::vector<std::string> out;
        out.swap(expired_keys);
        return out;
    }

    void Keyspace::clear()
    {
        memory.clear();
        deadlines.clear();
    }
}

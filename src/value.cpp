#include "value.hpp"
#include <charconv>
#include <cmath>
#include <iterator>
#include <type_traits>
#include <variant>

namespace hk
{
    bool SortedSet::add(const std::string &member, double score)
    {
        auto it = scores.find(member);
        if (it == scores.end())
        {
            scores.emplace(member, score);
            order.emplace(score, member);
            return true;
        }
        if (it->second != score)
        {
            order.erase({it->second, member});
            it->second = score;
            order.emplace(score, member);
        }
        return false;
    }

    bool SortedSet::remove(const std::string &member)
    {
        auto it = scores.find(member);
        if (it == scores.end())
        {
            return false;
        }
        order.erase({it->second, member});
        scores.erase(it);
        return true;
    }

    std::optional<double> SortedSet::score(const std::string &member) const
    {
        auto it = scores.find(member);
        if (it == scores.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::size_t> SortedSet::rank(const std::string &member) const
    {
        auto it = scores.find(member);
        if (it == scores.end())
        {
            return std::nullopt;
        }
        auto pos = order.find({it->second, member});
        return static_cast<std::size_t>(std::distance(order.begin(), pos));
    }

    std::vector<std::pair<std::string, double>> SortedSet::range(long long start, long long stop) const
    {
        std::vector<std::pair<std::string, double>> out;
        std::size_t first = 0;
        std::size_t last = 0;
        if (!normalize_range(start, stop, order.size(), first, last))
        {
            return out;
        }
        out.reserve(last - first + 1);
        auto it = std::next(order.begin(), static_cast<std::ptrdiff_t>(first));
        for (std::size_t i = first; i <= last; ++i, ++it)
        {
            out.emplace_back(it->second, it->first);
        }
        return out;
    }

    ValueType type_of(const Value &value)
    {
        return std::visit(
            [](const auto &held) -> ValueType {
                using T = std::decay_t<decltype(held)>;
                if constexpr (std::is_same_v<T, std::string>)
                    return ValueType::String;
                else if constexpr (std::is_same_v<T, List>)
                    return ValueType::List;
                else if constexpr (std::is_same_v<T, Hash>)
                    return ValueType::Hash;
                else if constexpr (std::is_same_v<T, Set>)
                    return ValueType::Set;
                else
                {
                    static_assert(std::is_same_v<T, SortedSet>, "type_of must cover every Value alternative");
                    return ValueType::SortedSet;
                }
            },
            value);
    }

    const char *type_name(ValueType type)
    {
        switch (type)
        {
        case ValueType::String:
            return "string";
        case ValueType::List:
            return "list";
        case ValueType::Hash:
            return "hash";
        case ValueType::Set:
            return "set";
        case ValueType::SortedSet:
            return "zset";
        }
        return "none";
    }

    bool normalize_range(long long start, long long stop, std::size_t size, std::size_t &first, std::size_t &last)
    {
        const long long n = static_cast<long long>(size);
        if (start < 0)
        {
            start += n;
        }
        if (stop < 0)
        {
            stop += n;
        }
        if (start < 0)
        {
            start = 0;
        }
        if (stop >= n)
        {
            stop = n - 1;
        }
        if (n == 0 || start > stop || start >= n)
        {
            return false;
        }
        first = static_cast<std::size_t>(start);
        last = static_cast<std::size_t>(stop);
        return true;
    }

    std::string format_score(double score)
    {
        if (std::isinf(score))
        {
            return score > 0 ? "inf" : "-inf";
        }
        char buf[64];
        auto res = std::to_chars(buf, buf + sizeof(buf), score);
        return std::string(buf, res.ptr);
    }
}

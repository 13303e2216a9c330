#pragma once
#include <cstdint>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace hk
{
    using List = std::deque<std::string>;
    using Hash = std::unordered_map<std::string, std::string>;
    using Set = std::unordered_set<std::string>;

    // Members ordered by (score, member); ties fall back to byte order of the member.
    class SortedSet
    {
    public:
        // Returns true when the member was not present before.
        bool add(const std::string &member, double score);

        bool remove(const std::string &member);

        std::optional<double> score(const std::string &member) const;

        std::optional<std::size_t> rank(const std::string &member) const;

        std::vector<std::pair<std::string, double>> range(long long start, long long stop) const;

        std::size_t size() const { return scores.size(); }

        bool empty() const { return scores.empty(); }

    private:
        std::unordered_map<std::string, double> scores;

        std::set<std::pair<double, std::string>> order;
    };

    using Value = std::variant<std::string, List, Hash, Set, SortedSet>;

    enum class ValueType
    {
        String,
        List,
        Hash,
        Set,
        SortedSet
    };

    ValueType type_of(const Value &value);

    const char *type_name(ValueType type);

    struct Entry
    {
        Value value;
        std::optional<std::int64_t> expires_at; // unix time in milliseconds
    };

    // Resolves redis-style start/stop (negative counts from the end) against a
    // container of `size` elements. Returns false when the range is empty.
    bool normalize_range(long long start, long long stop, std::size_t size, std::size_t &first, std::size_t &last);

    std::string format_score(double score);
}

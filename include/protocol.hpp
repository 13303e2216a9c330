#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace hk
{
    struct Reply
    {
        enum class Kind
        {
            Status,
            Integer,
            Bulk,
            Nil,
            Array,
            Error
        };

        Kind kind = Kind::Nil;
        std::string text;
        long long integer = 0;
        std::vector<std::string> items;

        static Reply status(std::string text);
        static Reply from_integer(long long n);
        static Reply bulk(std::string value);
        static Reply nil();
        static Reply array(std::vector<std::string> items);
        static Reply error(std::string message);

        static Reply ok() { return status("OK"); }

        bool is_error() const { return kind == Kind::Error; }
    };

    // Splits an inline request on whitespace.
    std::vector<std::string> parse_line(const std::string &line);

    enum class RespParseStatus
    {
        NeedMore,
        Ok,
        Error
    };

    // Parses one RESP array of bulk strings from the front of `in`.
    RespParseStatus parse_resp_array(std::string_view in, std::size_t &consumed, std::vector<std::string> &out);

    // Serializes arguments as a RESP array of bulk strings.
    std::string encode_resp_array(const std::vector<std::string> &args);

    // Text form used for inline requests; no trailing newline.
    std::string render_text(const Reply &reply);

    // Wire form used for RESP requests.
    std::string render_resp(const Reply &reply);
}

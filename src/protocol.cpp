#include "protocol.hpp"
#include <charconv>
#include <sstream>

namespace hk
{
    Reply Reply::status(std::string text)
    {
        Reply r;
        r.kind = Kind::Status;
        r.text = std::move(text);
        return r;
    }

    Reply Reply::from_integer(long long n)
    {
        Reply r;
        r.kind = Kind::Integer;
        r.integer = n;
        return r;
    }

    Reply Reply::bulk(std::string value)
    {
        Reply r;
        r.kind = Kind::Bulk;
        r.text = std::move(value);
        return r;
    }

    Reply Reply::nil()
    {
        return Reply{};
    }

    Reply Reply::array(std::vector<std::string> items)
    {
        Reply r;
        r.kind = Kind::Array;
        r.items = std::move(items);
        return r;
    }

    Reply Reply::error(std::string message)
    {
        Reply r;
        r.kind = Kind::Error;
        r.text = std::move(message);
        return r;
    }

    std::vector<std::string> parse_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::istringstream ss(line);
        std::string token;

        while (ss >> token)
        {
            tokens.push_back(token);
        }

        return tokens;
    }

    static bool parse_length(std::string_view digits, long long &n)
    {
        if (digits.empty())
            return false;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), n);
        return ec == std::errc() && ptr == digits.data() + digits.size() && n >= 0;
    }

    RespParseStatus parse_resp_array(std::string_view in, std::size_t &consumed, std::vector<std::string> &out)
    {
        consumed = 0;
        out.clear();

        if (in.empty())
            return RespParseStatus::NeedMore;

        if (in[0] != '*')
            return RespParseStatus::Error;

        std::size_t crlf = in.find("\r\n");
        if (crlf == std::string_view::npos)
            return RespParseStatus::NeedMore;

        long long n = 0;
        if (!parse_length(in.substr(1, crlf - 1), n))
            return RespParseStatus::Error;

        std::size_t cursor = crlf + 2;
        std::vector<std::string> args;
        args.reserve(static_cast<std::size_t>(n < 64 ? n : 64));

        for (long long i = 0; i < n; ++i)
        {
            if (cursor >= in.size())
                return RespParseStatus::NeedMore;

            if (in[cursor] != '$')
                return RespParseStatus::Error;

            std::size_t crlf2 = in.find("\r\n", cursor + 1);
            if (crlf2 == std::string_view::npos)
                return RespParseStatus::NeedMore;

            long long len = 0;
            if (!parse_length(in.substr(cursor + 1, crlf2 - (cursor + 1)), len))
                return RespParseStatus::Error;

            std::size_t data_start = crlf2 + 2;
            std::size_t need = data_start + static_cast<std::size_t>(len) + 2;
            if (in.size() < need)
                return RespParseStatus::NeedMore;

            std::size_t data_end = data_start + static_cast<std::size_t>(len);
            if (in[data_end] != '\r' || in[data_end + 1] != '\n')
                return RespParseStatus::Error;

            args.emplace_back(in.substr(data_start, static_cast<std::size_t>(len)));
            cursor = data_end + 2;
        }
        out = std::move(args);
        consumed = cursor;
        return RespParseStatus::Ok;
    }

    static void append_bulk(std::string &out, std::string_view s)
    {
        out.push_back('$');
        out.append(std::to_string(s.size()));
        out.append("\r\n");
        out.append(s);
        out.append("\r\n");
    }

    std::string encode_resp_array(const std::vector<std::string> &args)
    {
        std::string out;
        out.push_back('*');
        out.append(std::to_string(args.size()));
        out.append("\r\n");
        for (const auto &arg : args)
        {
            append_bulk(out, arg);
        }
        return out;
    }

    std::string render_text(const Reply &reply)
    {
        switch (reply.kind)
        {
        case Reply::Kind::Status:
            return "+" + reply.text;
        case Reply::Kind::Integer:
            return ":" + std::to_string(reply.integer);
        case Reply::Kind::Bulk:
            return reply.text;
        case Reply::Kind::Nil:
            return "(nil)";
        case Reply::Kind::Error:
            return "ERR " + reply.text;
        case Reply::Kind::Array:
        {
            if (reply.items.empty())
            {
                return "(empty)";
            }
            std::string out;
            for (std::size_t i = 0; i < reply.items.size(); ++i)
            {
                if (i > 0)
                    out.push_back('\n');
                out.append(reply.items[i]);
            }
            return out;
        }
        }
        return {};
    }

    std::string render_resp(const Reply &reply)
    {
        std::string out;
        switch (reply.kind)
        {
        case Reply::Kind::Status:
            out = "+" + reply.text + "\r\n";
            break;
        case Reply::Kind::Integer:
            out = ":" + std::to_string(reply.integer) + "\r\n";
            break;
        case Reply::Kind::Bulk:
            append_bulk(out, reply.text);
            break;
        case Reply::Kind::Nil:
            out = "$-1\r\n";
            break;
        case Reply::Kind::Error:
            out = "-ERR " + reply.text + "\r\n";
            break;
        case Reply::Kind::Array:
            out = encode_resp_array(reply.items);
            break;
        }
        return out;
    }
}

#include "request_target.hpp"
#include "../errors/errors.hpp"

namespace chunkstream
{

    namespace
    {
        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }
    } // namespace

    std::optional<std::string> RequestTarget::param(const std::string &name) const
    {
        auto it = query.find(name);
        if (it == query.end())
            return std::nullopt;
        return it->second;
    }

    std::string url_decode(const std::string &text)
    {
        std::string decoded;
        decoded.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] != '%')
            {
                decoded += text[i];
                continue;
            }
            if (i + 2 >= text.size())
            {
                throw ValidationError("Truncated percent escape in '" + text + "'");
            }
            int high = hex_value(text[i + 1]);
            int low = hex_value(text[i + 2]);
            if (high < 0 || low < 0)
            {
                throw ValidationError("Invalid percent escape in '" + text + "'");
            }
            decoded += static_cast<char>(high * 16 + low);
            i += 2;
        }
        return decoded;
    }

    RequestTarget parse_target(const std::string &target)
    {
        RequestTarget result;

        std::string path = target;
        std::string query;
        auto question = target.find('?');
        if (question != std::string::npos)
        {
            path = target.substr(0, question);
            query = target.substr(question + 1);
        }

        std::size_t pos = 0;
        while (pos <= path.size())
        {
            auto slash = path.find('/', pos);
            if (slash == std::string::npos)
                slash = path.size();
            if (slash > pos)
            {
                result.segments.push_back(url_decode(path.substr(pos, slash - pos)));
            }
            pos = slash + 1;
        }

        pos = 0;
        while (pos < query.size())
        {
            auto amp = query.find('&', pos);
            if (amp == std::string::npos)
                amp = query.size();
            std::string pair = query.substr(pos, amp - pos);
            if (!pair.empty())
            {
                auto eq = pair.find('=');
                std::string key = url_decode(pair.substr(0, eq));
                std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
                result.query[key] = value;
            }
            pos = amp + 1;
        }
        return result;
    }

} // namespace chunkstream

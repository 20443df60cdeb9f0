#ifndef CHUNKSTREAM_REQUEST_TARGET_HPP
#define CHUNKSTREAM_REQUEST_TARGET_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chunkstream
{

    // A request target split into decoded path segments and query parameters.
    struct RequestTarget
    {
        std::vector<std::string> segments; // "/items/a%20b/chunks" -> {"items", "a b", "chunks"}
        std::map<std::string, std::string> query;

        std::optional<std::string> param(const std::string &name) const;
    };

    // Percent-decoding; '+' is kept literally. Throws ValidationError on a bad escape.
    std::string url_decode(const std::string &text);

    RequestTarget parse_target(const std::string &target);

} // namespace chunkstream

#endif // CHUNKSTREAM_REQUEST_TARGET_HPP

#ifndef CHUNKSTREAM_CHUNK_CODEC_HPP
#define CHUNKSTREAM_CHUNK_CODEC_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "../metadata/chunk_record.hpp"

namespace chunkstream
{
    namespace codec
    {

        enum class Mode
        {
            plain,      // id1:size1,id2:size2,...
            compressed  // raw deflate of the plain form, base64url without padding
        };

        // Automatic mode selection switches to compressed above either limit.
        constexpr std::size_t COMPRESS_ABOVE_CHUNKS = 5;
        constexpr std::size_t COMPRESS_ABOVE_PLAIN_LENGTH = 200;

        // Upper bound on an inflated token, guards against deflate bombs.
        constexpr std::size_t MAX_INFLATED_SIZE = 16 * 1024 * 1024;

        /**
         * Render an ordered chunk list as a URL-safe token.
         * Opaque ids must not contain ':' or ','; this is not checked.
         * @param force_mode Mode to use; when empty the mode is picked from the
         *                   chunk count and the plain length.
         */
        std::string encode(const std::vector<ChunkRef> &chunks,
                           std::optional<Mode> force_mode = std::nullopt);

        /**
         * Parse a token produced by encode(). A token containing ':' is plain,
         * anything else is treated as compressed.
         * @throws DecodeError naming the offending segment.
         */
        std::vector<ChunkRef> decode(const std::string &token);

        Mode select_mode(const std::vector<ChunkRef> &chunks, const std::string &plain);
        std::string to_plain(const std::vector<ChunkRef> &chunks);
        std::vector<ChunkRef> parse_plain(const std::string &plain);

        std::string deflate_raw(const std::string &data);
        std::string inflate_raw(const std::string &data);
        std::string base64url_encode(const std::string &data);
        std::string base64url_decode(const std::string &text);

    } // namespace codec
} // namespace chunkstream

#endif // CHUNKSTREAM_CHUNK_CODEC_HPP

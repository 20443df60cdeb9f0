#include "chunk_codec.hpp"
#include "../errors/errors.hpp"

#include <zlib.h>
#include <openssl/evp.h>
#include <charconv>
#include <limits>

namespace chunkstream
{
    namespace codec
    {

        std::string to_plain(const std::vector<ChunkRef> &chunks)
        {
            std::string plain;
            for (std::size_t i = 0; i < chunks.size(); ++i)
            {
                if (i > 0)
                    plain += ',';
                plain += chunks[i].opaque_id;
                plain += ':';
                plain += std::to_string(chunks[i].byte_size);
            }
            return plain;
        }

        Mode select_mode(const std::vector<ChunkRef> &chunks, const std::string &plain)
        {
            if (chunks.size() > COMPRESS_ABOVE_CHUNKS || plain.size() > COMPRESS_ABOVE_PLAIN_LENGTH)
                return Mode::compressed;
            return Mode::plain;
        }

        std::string encode(const std::vector<ChunkRef> &chunks, std::optional<Mode> force_mode)
        {
            std::string plain = to_plain(chunks);
            Mode mode = force_mode ? *force_mode : select_mode(chunks, plain);
            if (mode == Mode::plain || chunks.empty())
                return plain;
            return base64url_encode(deflate_raw(plain));
        }

        std::vector<ChunkRef> parse_plain(const std::string &plain)
        {
            std::vector<ChunkRef> result;
            std::uint64_t total = 0;
            std::size_t begin = 0;
            while (begin <= plain.size())
            {
                std::size_t end = plain.find(',', begin);
                if (end == std::string::npos)
                    end = plain.size();
                std::string segment = plain.substr(begin, end - begin);
                begin = end + 1;

                // Empty segments (e.g. a trailing comma) carry no entry.
                if (segment.empty())
                    continue;

                std::size_t colon = segment.find(':');
                if (colon == std::string::npos || segment.find(':', colon + 1) != std::string::npos)
                    throw DecodeError("Invalid chunk format", segment);

                std::string id = segment.substr(0, colon);
                std::string size_str = segment.substr(colon + 1);
                if (id.empty())
                    throw DecodeError("Empty chunk id", segment);

                std::uint64_t size = 0;
                const char *first = size_str.data();
                const char *last = first + size_str.size();
                auto parsed = std::from_chars(first, last, size);
                if (size_str.empty() || parsed.ec != std::errc() || parsed.ptr != last)
                    throw DecodeError("Invalid chunk size", size_str);
                if (size == 0)
                    throw DecodeError("Chunk size must be positive", segment);
                if (size > std::numeric_limits<std::uint64_t>::max() - total)
                    throw DecodeError("Chunk sizes overflow", segment);
                total += size;

                result.push_back({id, size});
            }
            return result;
        }

        std::vector<ChunkRef> decode(const std::string &token)
        {
            if (token.empty())
                return {};
            if (token.find(':') != std::string::npos)
                return parse_plain(token);

            std::string plain = inflate_raw(base64url_decode(token));
            if (plain.empty())
                throw DecodeError("Compressed token holds no chunks", token);
            return parse_plain(plain);
        }

        std::string deflate_raw(const std::string &data)
        {
            z_stream strm{};
            if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK)
                throw std::runtime_error("Failed to initialize deflate stream");

            std::string out(deflateBound(&strm, static_cast<uLong>(data.size())), '\0');
            strm.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
            strm.avail_in = static_cast<uInt>(data.size());
            strm.next_out = reinterpret_cast<Bytef *>(&out[0]);
            strm.avail_out = static_cast<uInt>(out.size());

            int ret = deflate(&strm, Z_FINISH);
            if (ret != Z_STREAM_END)
            {
                deflateEnd(&strm);
                throw std::runtime_error("Failed to deflate chunk list");
            }
            out.resize(strm.total_out);
            deflateEnd(&strm);
            return out;
        }

        std::string inflate_raw(const std::string &data)
        {
            z_stream strm{};
            if (inflateInit2(&strm, -MAX_WBITS) != Z_OK)
                throw std::runtime_error("Failed to initialize inflate stream");

            strm.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
            strm.avail_in = static_cast<uInt>(data.size());

            std::string out;
            char buffer[16384];
            int ret = Z_OK;
            do
            {
                strm.next_out = reinterpret_cast<Bytef *>(buffer);
                strm.avail_out = sizeof(buffer);
                ret = inflate(&strm, Z_NO_FLUSH);
                if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR)
                {
                    std::string reason = strm.msg ? strm.msg : "corrupt stream";
                    inflateEnd(&strm);
                    throw DecodeError("Failed to decompress chunks data (" + reason + ")", "<compressed token>");
                }
                if (ret == Z_BUF_ERROR)
                {
                    inflateEnd(&strm);
                    throw DecodeError("Failed to decompress chunks data (truncated stream)", "<compressed token>");
                }
                out.append(buffer, sizeof(buffer) - strm.avail_out);
                if (out.size() > MAX_INFLATED_SIZE)
                {
                    inflateEnd(&strm);
                    throw DecodeError("Decompressed chunks data too large", "<compressed token>");
                }
            } while (ret != Z_STREAM_END);

            bool trailing = strm.avail_in != 0;
            inflateEnd(&strm);
            if (trailing)
                throw DecodeError("Unexpected data after compressed stream", "<compressed token>");
            return out;
        }

        std::string base64url_encode(const std::string &data)
        {
            std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
            int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                          reinterpret_cast<const unsigned char *>(data.data()),
                                          static_cast<int>(data.size()));
            out.resize(static_cast<std::size_t>(written));

            while (!out.empty() && out.back() == '=')
                out.pop_back();
            for (char &c : out)
            {
                if (c == '+')
                    c = '-';
                else if (c == '/')
                    c = '_';
            }
            return out;
        }

        std::string base64url_decode(const std::string &text)
        {
            std::string b64;
            b64.reserve(text.size() + 3);
            for (std::size_t i = 0; i < text.size(); ++i)
            {
                char c = text[i];
                if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'))
                    b64 += c;
                else if (c == '-')
                    b64 += '+';
                else if (c == '_')
                    b64 += '/';
                else
                    throw DecodeError("Invalid base64url character at offset " + std::to_string(i), text);
            }
            if (b64.size() % 4 == 1)
                throw DecodeError("Invalid base64url length", text);

            std::size_t padding = (4 - b64.size() % 4) % 4;
            b64.append(padding, '=');

            std::string out(3 * (b64.size() / 4), '\0');
            int decoded = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                          reinterpret_cast<const unsigned char *>(b64.data()),
                                          static_cast<int>(b64.size()));
            if (decoded < 0 || static_cast<std::size_t>(decoded) < padding)
                throw DecodeError("Invalid base64url data", text);

            // EVP_DecodeBlock counts the zero bytes produced by padding.
            out.resize(static_cast<std::size_t>(decoded) - padding);
            return out;
        }

    } // namespace codec
} // namespace chunkstream

#ifndef CHUNKSTREAM_STREAM_HANDLER_HPP
#define CHUNKSTREAM_STREAM_HANDLER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../blob_client/blob_client.hpp"
#include "../metadata/chunk_record.hpp"
#include "../range_stream/range_stream.hpp"

namespace chunkstream
{

    // Inclusive byte bounds resolved against a known total size.
    struct ByteRange
    {
        std::uint64_t start = 0;
        std::uint64_t end = 0;
    };

    /**
     * Resolve a Range header value against total_size.
     * Accepts "bytes=a-b", "bytes=a-" and the suffix form "bytes=-n".
     * @return the clamped range, or nullopt for anything malformed or
     *         unsatisfiable (callers answer with the full body).
     */
    std::optional<ByteRange> parse_range_header(const std::string &value, std::uint64_t total_size);

    // Everything needed to write the response head for a stream request.
    struct StreamResponsePlan
    {
        unsigned status = 200;
        std::uint64_t start = 0;
        std::uint64_t end = 0;
        std::uint64_t total_size = 0;
        std::vector<std::pair<std::string, std::string>> headers;

        std::uint64_t content_length() const { return end - start + 1; }
        bool partial() const { return status == 206; }
    };

    class StreamRequestHandler
    {
    public:
        explicit StreamRequestHandler(std::shared_ptr<BlobBackendClient> blobs,
                                      std::string content_type = "video/mp4");

        // Throws NotFoundError when total_size is 0.
        StreamResponsePlan plan(std::uint64_t total_size, const std::optional<std::string> &range_header) const;

        // Byte producer for a planned response.
        std::unique_ptr<RangeStream> open(std::vector<ChunkRecord> chunks, const StreamResponsePlan &plan) const;

        const std::string &content_type() const { return content_type_; }

    private:
        std::shared_ptr<BlobBackendClient> blobs_;
        std::string content_type_;
    };

} // namespace chunkstream

#endif // CHUNKSTREAM_STREAM_HANDLER_HPP

#ifndef CHUNKSTREAM_RANGE_STREAM_HPP
#define CHUNKSTREAM_RANGE_STREAM_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "../blob_client/blob_client.hpp"
#include "../metadata/chunk_record.hpp"

namespace chunkstream
{

    // Lazily produces the bytes [start, end] (inclusive) of the concatenation of
    // an ordered chunk list; an empty list produces nothing. Each chunk
    // overlapping the range is fetched only when the consumer asks for the next
    // piece, so at most one chunk is held in memory and chunks past a
    // cancellation point are never fetched.
    class RangeStream
    {
    public:
        RangeStream(std::shared_ptr<BlobBackendClient> blobs,
                    std::vector<ChunkRecord> chunks,
                    std::uint64_t start,
                    std::uint64_t end);

        /**
         * Fetch the next overlapping chunk and hand out its slice.
         * @param out receives the slice; cleared when the stream is exhausted
         * @return false once every byte of the range has been produced or the
         *         stream was cancelled
         * @throws RetrievalFailure, NotFoundError
         */
        bool next(std::string &out);

        // Safe to call from another thread; takes effect before the next fetch.
        void cancel() { cancelled_.store(true); }
        bool cancelled() const { return cancelled_.load(); }

        std::uint64_t start() const { return start_; }
        std::uint64_t end() const { return end_; }
        std::uint64_t length() const { return end_ - start_ + 1; }
        std::size_t chunks_fetched() const { return chunks_fetched_; }
        std::uint64_t bytes_emitted() const { return bytes_emitted_; }

    private:
        std::shared_ptr<BlobBackendClient> blobs_;
        std::vector<ChunkRecord> chunks_;
        std::uint64_t start_;
        std::uint64_t end_;

        std::size_t position_ = 0;      // next chunk to consider
        std::uint64_t chunk_offset_ = 0; // absolute offset of chunks_[position_]
        std::size_t chunks_fetched_ = 0;
        std::uint64_t bytes_emitted_ = 0;
        std::atomic<bool> cancelled_{false};
    };

} // namespace chunkstream

#endif // CHUNKSTREAM_RANGE_STREAM_HPP

#include "range_stream.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include <algorithm>
#include <stdexcept>

namespace chunkstream
{

    RangeStream::RangeStream(std::shared_ptr<BlobBackendClient> blobs,
                             std::vector<ChunkRecord> chunks,
                             std::uint64_t start,
                             std::uint64_t end)
        : blobs_(std::move(blobs)), chunks_(std::move(chunks)), start_(start), end_(end)
    {
        if (start_ > end_)
        {
            throw std::invalid_argument("Range start " + std::to_string(start_) +
                                        " is past end " + std::to_string(end_));
        }
        if (!chunks_.empty() && end_ >= total_size(chunks_))
        {
            throw std::invalid_argument("Range end " + std::to_string(end_) + " is past the last byte");
        }
    }

    bool RangeStream::next(std::string &out)
    {
        out.clear();

        while (position_ < chunks_.size())
        {
            if (cancelled_.load())
            {
                MyLogger::debug("Range stream cancelled after " + std::to_string(chunks_fetched_) + " chunks");
                return false;
            }

            const ChunkRecord &chunk = chunks_[position_];
            std::uint64_t chunk_start = chunk_offset_;
            std::uint64_t chunk_end = chunk_offset_ + chunk.byte_size; // exclusive
            ++position_;
            chunk_offset_ = chunk_end;

            if (chunk.byte_size == 0 || chunk_end <= start_)
                continue;
            if (chunk_start > end_)
            {
                position_ = chunks_.size();
                return false;
            }

            std::string data = blobs_->get(chunk.opaque_id);
            ++chunks_fetched_;

            std::uint64_t slice_from = std::max(start_, chunk_start) - chunk_start;
            std::uint64_t slice_to = std::min(end_ + 1, chunk_end) - chunk_start;
            if (data.size() < slice_to)
            {
                throw RetrievalFailure("Chunk " + chunk.opaque_id + " returned " + std::to_string(data.size()) +
                                       " bytes, expected " + std::to_string(chunk.byte_size));
            }
            out.assign(data, static_cast<std::size_t>(slice_from), static_cast<std::size_t>(slice_to - slice_from));
            bytes_emitted_ += out.size();

            if (chunk_end > end_)
            {
                position_ = chunks_.size();
            }
            return true;
        }
        return false;
    }

} // namespace chunkstream

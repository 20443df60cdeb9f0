#include "Chunker.hpp"
#include <algorithm>
#include <stdexcept>

namespace chunkstream
{

    std::size_t IStreamSource::read(char *buffer, std::size_t max_bytes)
    {
        input_.read(buffer, static_cast<std::streamsize>(max_bytes));
        std::streamsize got = input_.gcount();
        if (input_.bad())
        {
            throw std::runtime_error("Failed to read from input stream");
        }
        return static_cast<std::size_t>(got);
    }

    ChunkSplitter::ChunkSplitter(std::size_t chunk_size, std::size_t read_size)
        : target_size_(chunk_size), read_size_(read_size)
    {
        if (chunk_size == 0 || read_size == 0)
        {
            throw std::invalid_argument("chunk_size and read_size must be positive");
        }
    }

    std::size_t ChunkSplitter::feed(const char *data, std::size_t size)
    {
        if (finished_)
        {
            throw std::logic_error("feed() after finish()");
        }
        std::size_t room = target_size_ - accumulated_.size();
        std::size_t taken = std::min(room, size);
        if (accumulated_.empty() && taken > 0)
        {
            accumulated_.reserve(target_size_);
        }
        accumulated_.append(data, taken);
        return taken;
    }

    bool ChunkSplitter::finish()
    {
        finished_ = true;
        return !accumulated_.empty();
    }

    Chunk ChunkSplitter::take()
    {
        if (accumulated_.empty() || (!ready() && !finished_))
        {
            throw std::logic_error("take() called with no complete chunk");
        }
        Chunk chunk{next_index_++, std::move(accumulated_)};
        accumulated_.clear();
        return chunk;
    }

    std::optional<Chunk> ChunkSplitter::next(ByteSource &source)
    {
        if (read_buffer_.empty())
        {
            read_buffer_.resize(std::min(read_size_, target_size_));
        }

        while (!finished_ && !ready())
        {
            // Never ask for more than fits in the current chunk.
            std::size_t want = std::min(read_buffer_.size(), target_size_ - accumulated_.size());
            std::size_t got = source.read(read_buffer_.data(), want);
            if (got == 0)
            {
                finish();
                break;
            }
            feed(read_buffer_.data(), got);
        }

        if (accumulated_.empty())
        {
            return std::nullopt;
        }
        return take();
    }

} // namespace chunkstream

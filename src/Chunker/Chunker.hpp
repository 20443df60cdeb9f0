// File: Chunker.hpp
#ifndef CHUNKSTREAM_CHUNKER_HPP
#define CHUNKSTREAM_CHUNKER_HPP

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace chunkstream
{

    // Pull-style byte producer. read() returns 0 only at end of input.
    class ByteSource
    {
    public:
        virtual ~ByteSource() = default;
        virtual std::size_t read(char *buffer, std::size_t max_bytes) = 0;
    };

    // Adapts any std::istream (file, string stream) to a ByteSource.
    class IStreamSource : public ByteSource
    {
    public:
        explicit IStreamSource(std::istream &input) : input_(input) {}
        std::size_t read(char *buffer, std::size_t max_bytes) override;

    private:
        std::istream &input_;
    };

    struct Chunk
    {
        std::size_t index; // sequence_index within the upload
        std::string data;
    };

    // Splits a byte stream into fixed-size chunks; the last one may be shorter.
    //
    // State machine over (accumulated bytes, target size). Push side: feed()
    // pieces until ready(), take() the full chunk, call finish() at end of input
    // and take() the remainder if it returned true. Pull side: next() drives the
    // same machine from a ByteSource. Never holds more than chunk_size bytes.
    class ChunkSplitter
    {
    public:
        static constexpr std::size_t DEFAULT_CHUNK_SIZE = 10 * 1024 * 1024;
        static constexpr std::size_t DEFAULT_READ_SIZE = 1024 * 1024;

        explicit ChunkSplitter(std::size_t chunk_size = DEFAULT_CHUNK_SIZE,
                               std::size_t read_size = DEFAULT_READ_SIZE);

        // Consumes bytes until the current chunk is full; returns how many were taken.
        std::size_t feed(const char *data, std::size_t size);
        bool ready() const { return accumulated_.size() == target_size_; }
        // Marks end of input. Returns true when a final partial chunk is pending.
        bool finish();
        Chunk take();

        std::optional<Chunk> next(ByteSource &source);

        std::size_t chunk_size() const { return target_size_; }
        std::size_t read_size() const { return read_size_; }
        std::size_t pending() const { return accumulated_.size(); }
        std::size_t chunks_emitted() const { return next_index_; }
        bool finished() const { return finished_; }

    private:
        std::size_t target_size_;
        std::size_t read_size_;
        std::string accumulated_;
        std::vector<char> read_buffer_;
        std::size_t next_index_ = 0;
        bool finished_ = false;
    };

} // namespace chunkstream

#endif // CHUNKSTREAM_CHUNKER_HPP

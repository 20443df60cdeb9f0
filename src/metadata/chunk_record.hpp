#ifndef CHUNKSTREAM_CHUNK_RECORD_HPP
#define CHUNKSTREAM_CHUNK_RECORD_HPP

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace chunkstream
{

    // One stored segment of a media item.
    struct ChunkRecord
    {
        std::uint64_t sequence_index = 0; // Zero-based position in the item
        std::string opaque_id;            // Backend-assigned handle
        std::uint64_t byte_size = 0;      // Exact payload length

        bool operator==(const ChunkRecord &other) const
        {
            return sequence_index == other.sequence_index &&
                   opaque_id == other.opaque_id &&
                   byte_size == other.byte_size;
        }
        bool operator!=(const ChunkRecord &other) const { return !(*this == other); }
    };

    // An (opaque_id, byte_size) pair as carried by a chunk-list token.
    struct ChunkRef
    {
        std::string opaque_id;
        std::uint64_t byte_size = 0;

        bool operator==(const ChunkRef &other) const
        {
            return opaque_id == other.opaque_id && byte_size == other.byte_size;
        }
        bool operator!=(const ChunkRef &other) const { return !(*this == other); }
    };

    // Committed state of an item.
    struct ItemState
    {
        std::uint64_t generation = 0; // 0 = no chunk set committed yet
        std::uint64_t chunk_count = 0;
        std::uint64_t total_size = 0;
    };

    inline void to_json(nlohmann::json &j, const ChunkRecord &chunk)
    {
        j = nlohmann::json{
            {"sequence_index", chunk.sequence_index},
            {"opaque_id", chunk.opaque_id},
            {"byte_size", chunk.byte_size}};
    }

    inline void from_json(const nlohmann::json &j, ChunkRecord &chunk)
    {
        j.at("sequence_index").get_to(chunk.sequence_index);
        j.at("opaque_id").get_to(chunk.opaque_id);
        j.at("byte_size").get_to(chunk.byte_size);
    }

    inline void to_json(nlohmann::json &j, const ItemState &state)
    {
        j = nlohmann::json{
            {"generation", state.generation},
            {"chunk_count", state.chunk_count},
            {"total_size", state.total_size}};
    }

    inline void from_json(const nlohmann::json &j, ItemState &state)
    {
        j.at("generation").get_to(state.generation);
        j.at("chunk_count").get_to(state.chunk_count);
        j.at("total_size").get_to(state.total_size);
    }

    inline std::uint64_t total_size(const std::vector<ChunkRecord> &chunks)
    {
        std::uint64_t total = 0;
        for (const auto &chunk : chunks)
        {
            if (chunk.byte_size > std::numeric_limits<std::uint64_t>::max() - total)
            {
                throw std::overflow_error("Total size of chunk list overflows");
            }
            total += chunk.byte_size;
        }
        return total;
    }

    inline std::vector<ChunkRef> to_refs(const std::vector<ChunkRecord> &chunks)
    {
        std::vector<ChunkRef> refs;
        refs.reserve(chunks.size());
        for (const auto &chunk : chunks)
        {
            refs.push_back({chunk.opaque_id, chunk.byte_size});
        }
        return refs;
    }

    // Assigns sequence indices by position.
    inline std::vector<ChunkRecord> to_records(const std::vector<ChunkRef> &refs)
    {
        std::vector<ChunkRecord> chunks;
        chunks.reserve(refs.size());
        for (std::size_t i = 0; i < refs.size(); ++i)
        {
            chunks.push_back({i, refs[i].opaque_id, refs[i].byte_size});
        }
        return chunks;
    }

} // namespace chunkstream

#endif // CHUNKSTREAM_CHUNK_RECORD_HPP

#ifndef CHUNKSTREAM_CHUNK_STORE_HPP
#define CHUNKSTREAM_CHUNK_STORE_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "rocksdb/db.h"
#include "rocksdb/write_batch.h"
#include "chunk_record.hpp"

namespace chunkstream
{

    // Persists ChunkRecords per item in RocksDB.
    //
    // Key layout:
    //   item/{item_id}                                   -> ItemState JSON
    //   chunk/{item_id}/{generation:016x}/{index:010d}   -> {"opaque_id","byte_size"}
    //   meta/next_generation                             -> decimal counter
    //
    // A replace stages records under a fresh generation, then commit_generation()
    // repoints the item header and drops the old generation in one WriteBatch.
    // Readers take a snapshot, so they see either the old or the new set.
    class ChunkStore
    {
    public:
        explicit ChunkStore(const std::string &db_path);
        ~ChunkStore();

        ChunkStore(const ChunkStore &) = delete;
        ChunkStore &operator=(const ChunkStore &) = delete;

        // Returns false when the item already exists.
        bool register_item(const std::string &item_id);
        // Deletes the header and every record of every generation. Returns false if absent.
        bool remove_item(const std::string &item_id);
        bool item_exists(const std::string &item_id) const;
        std::optional<ItemState> get_item(const std::string &item_id) const;

        // Committed records in sequence order. Throws NotFoundError for unknown items.
        std::vector<ChunkRecord> list_chunks(const std::string &item_id) const;

        // Staged replace. begin_generation throws NotFoundError for unknown items.
        std::uint64_t begin_generation(const std::string &item_id);
        void stage_chunk(const std::string &item_id, std::uint64_t generation, const ChunkRecord &record);
        void commit_generation(const std::string &item_id, std::uint64_t generation,
                               std::uint64_t chunk_count, std::uint64_t total_size);
        void discard_generation(const std::string &item_id, std::uint64_t generation);

        // Drops records of generations no item points to (crashed uploads).
        // Runs at open; calling it while an upload is in flight discards that upload.
        std::size_t purge_stale_generations();

        static void validate_item_id(const std::string &item_id);

    private:
        std::unique_ptr<rocksdb::DB> db_;
        std::mutex generation_mutex_;
        std::uint64_t next_generation_ = 1;

        std::mutex locks_mutex_;
        std::unordered_map<std::string, std::shared_ptr<std::mutex>> item_locks_;

        std::shared_ptr<std::mutex> lock_for(const std::string &item_id);
        std::optional<ItemState> read_item(const rocksdb::ReadOptions &options, const std::string &item_id) const;
        void delete_prefix(rocksdb::WriteBatch &batch, const std::string &prefix) const;
        void write(rocksdb::WriteBatch &batch, const std::string &what);
    };

} // namespace chunkstream

#endif // CHUNKSTREAM_CHUNK_STORE_HPP

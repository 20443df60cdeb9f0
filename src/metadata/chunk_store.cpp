#include "chunk_store.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"

#include <cstdio>
#include <map>

using json = nlohmann::json;

namespace chunkstream
{

    namespace
    {
        const std::string ITEM_PREFIX = "item/";
        const std::string CHUNK_PREFIX = "chunk/";
        const std::string NEXT_GENERATION_KEY = "meta/next_generation";

        std::string item_key(const std::string &item_id)
        {
            return ITEM_PREFIX + item_id;
        }

        std::string item_chunks_prefix(const std::string &item_id)
        {
            return CHUNK_PREFIX + item_id + "/";
        }

        std::string generation_prefix(const std::string &item_id, std::uint64_t generation)
        {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%016llx/", static_cast<unsigned long long>(generation));
            return item_chunks_prefix(item_id) + buf;
        }

        // Zero padding keeps lexicographic key order equal to sequence order.
        std::string chunk_key(const std::string &item_id, std::uint64_t generation, std::uint64_t index)
        {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%010llu", static_cast<unsigned long long>(index));
            return generation_prefix(item_id, generation) + buf;
        }

        bool starts_with(const rocksdb::Slice &key, const std::string &prefix)
        {
            return key.starts_with(rocksdb::Slice(prefix));
        }

        class SnapshotGuard
        {
        public:
            explicit SnapshotGuard(rocksdb::DB *db) : db_(db), snapshot_(db->GetSnapshot()) {}
            ~SnapshotGuard() { db_->ReleaseSnapshot(snapshot_); }
            const rocksdb::Snapshot *get() const { return snapshot_; }

        private:
            rocksdb::DB *db_;
            const rocksdb::Snapshot *snapshot_;
        };
    } // namespace

    ChunkStore::ChunkStore(const std::string &db_path)
    {
        rocksdb::Options options;
        options.create_if_missing = true;

        rocksdb::DB *raw = nullptr;
        rocksdb::Status status = rocksdb::DB::Open(options, db_path, &raw);
        if (!status.ok())
        {
            MyLogger::error("Failed to open chunk database at " + db_path + ": " + status.ToString());
            throw StorageError("Failed to open chunk database: " + status.ToString());
        }
        db_.reset(raw);

        std::string value;
        status = db_->Get(rocksdb::ReadOptions(), NEXT_GENERATION_KEY, &value);
        if (status.ok())
        {
            next_generation_ = std::stoull(value);
        }
        else if (!status.IsNotFound())
        {
            throw StorageError("Failed to read generation counter: " + status.ToString());
        }

        MyLogger::info("Chunk database opened at " + db_path);
        std::size_t purged = purge_stale_generations();
        if (purged > 0)
        {
            MyLogger::warning("Purged " + std::to_string(purged) + " staged chunk records left by interrupted uploads");
        }
    }

    ChunkStore::~ChunkStore() = default;

    void ChunkStore::validate_item_id(const std::string &item_id)
    {
        if (item_id.empty() || item_id.size() > 256)
        {
            throw ValidationError("Item id must be 1 to 256 characters");
        }
        for (char c : item_id)
        {
            if (c == '/' || static_cast<unsigned char>(c) < 0x20)
            {
                throw ValidationError("Item id contains an invalid character");
            }
        }
    }

    std::shared_ptr<std::mutex> ChunkStore::lock_for(const std::string &item_id)
    {
        std::lock_guard<std::mutex> lock(locks_mutex_);
        auto &entry = item_locks_[item_id];
        if (!entry)
        {
            entry = std::make_shared<std::mutex>();
        }
        return entry;
    }

    std::optional<ItemState> ChunkStore::read_item(const rocksdb::ReadOptions &options, const std::string &item_id) const
    {
        std::string value;
        rocksdb::Status status = db_->Get(options, item_key(item_id), &value);
        if (status.IsNotFound())
        {
            return std::nullopt;
        }
        if (!status.ok())
        {
            throw StorageError("Failed to read item " + item_id + ": " + status.ToString());
        }
        try
        {
            return json::parse(value).get<ItemState>();
        }
        catch (const json::exception &e)
        {
            MyLogger::error("Corrupt item header for " + item_id + ": " + e.what());
            throw StorageError("Corrupt item header for " + item_id);
        }
    }

    void ChunkStore::delete_prefix(rocksdb::WriteBatch &batch, const std::string &prefix) const
    {
        std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));
        for (it->Seek(prefix); it->Valid() && starts_with(it->key(), prefix); it->Next())
        {
            batch.Delete(it->key());
        }
        if (!it->status().ok())
        {
            throw StorageError("Failed to scan " + prefix + ": " + it->status().ToString());
        }
    }

    void ChunkStore::write(rocksdb::WriteBatch &batch, const std::string &what)
    {
        rocksdb::WriteOptions options;
        options.sync = true;
        rocksdb::Status status = db_->Write(options, &batch);
        if (!status.ok())
        {
            MyLogger::error("Failed to " + what + ": " + status.ToString());
            throw StorageError("Failed to " + what + ": " + status.ToString());
        }
    }

    bool ChunkStore::register_item(const std::string &item_id)
    {
        validate_item_id(item_id);
        auto item_lock = lock_for(item_id);
        std::lock_guard<std::mutex> guard(*item_lock);

        if (read_item(rocksdb::ReadOptions(), item_id))
        {
            return false;
        }
        rocksdb::WriteBatch batch;
        batch.Put(item_key(item_id), json(ItemState{}).dump());
        write(batch, "register item " + item_id);
        MyLogger::info("Registered item " + item_id);
        return true;
    }

    bool ChunkStore::remove_item(const std::string &item_id)
    {
        validate_item_id(item_id);
        auto item_lock = lock_for(item_id);
        std::lock_guard<std::mutex> guard(*item_lock);

        if (!read_item(rocksdb::ReadOptions(), item_id))
        {
            return false;
        }
        rocksdb::WriteBatch batch;
        batch.Delete(item_key(item_id));
        delete_prefix(batch, item_chunks_prefix(item_id));
        write(batch, "remove item " + item_id);
        MyLogger::warning("Removed item and its chunk records: " + item_id);
        return true;
    }

    bool ChunkStore::item_exists(const std::string &item_id) const
    {
        return get_item(item_id).has_value();
    }

    std::optional<ItemState> ChunkStore::get_item(const std::string &item_id) const
    {
        validate_item_id(item_id);
        return read_item(rocksdb::ReadOptions(), item_id);
    }

    std::vector<ChunkRecord> ChunkStore::list_chunks(const std::string &item_id) const
    {
        validate_item_id(item_id);
        SnapshotGuard snapshot(db_.get());
        rocksdb::ReadOptions options;
        options.snapshot = snapshot.get();

        auto state = read_item(options, item_id);
        if (!state)
        {
            throw NotFoundError("Item not found: " + item_id);
        }

        std::vector<ChunkRecord> chunks;
        if (state->generation == 0)
        {
            return chunks;
        }
        chunks.reserve(state->chunk_count);

        const std::string prefix = generation_prefix(item_id, state->generation);
        std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(options));
        for (it->Seek(prefix); it->Valid() && starts_with(it->key(), prefix); it->Next())
        {
            ChunkRecord record;
            try
            {
                record = json::parse(it->value().ToString()).get<ChunkRecord>();
            }
            catch (const json::exception &e)
            {
                MyLogger::error("Corrupt chunk record " + it->key().ToString() + ": " + e.what());
                throw StorageError("Corrupt chunk record for item " + item_id);
            }
            if (record.sequence_index != chunks.size())
            {
                throw StorageError("Chunk records for item " + item_id + " are not contiguous");
            }
            chunks.push_back(std::move(record));
        }
        if (!it->status().ok())
        {
            throw StorageError("Failed to scan chunks of " + item_id + ": " + it->status().ToString());
        }
        if (chunks.size() != state->chunk_count)
        {
            throw StorageError("Item " + item_id + " expects " + std::to_string(state->chunk_count) +
                               " chunks, found " + std::to_string(chunks.size()));
        }
        return chunks;
    }

    std::uint64_t ChunkStore::begin_generation(const std::string &item_id)
    {
        if (!item_exists(item_id))
        {
            throw NotFoundError("Item not found: " + item_id);
        }

        std::lock_guard<std::mutex> lock(generation_mutex_);
        std::uint64_t generation = next_generation_;
        rocksdb::WriteOptions options;
        options.sync = true;
        rocksdb::Status status = db_->Put(options, NEXT_GENERATION_KEY, std::to_string(generation + 1));
        if (!status.ok())
        {
            throw StorageError("Failed to advance generation counter: " + status.ToString());
        }
        next_generation_ = generation + 1;
        MyLogger::debug("Item " + item_id + " staging generation " + std::to_string(generation));
        return generation;
    }

    void ChunkStore::stage_chunk(const std::string &item_id, std::uint64_t generation, const ChunkRecord &record)
    {
        rocksdb::Status status = db_->Put(rocksdb::WriteOptions(),
                                          chunk_key(item_id, generation, record.sequence_index),
                                          json(record).dump());
        if (!status.ok())
        {
            MyLogger::error("Failed to stage chunk " + std::to_string(record.sequence_index) +
                            " of item " + item_id + ": " + status.ToString());
            throw StorageError("Failed to persist chunk record: " + status.ToString());
        }
    }

    void ChunkStore::commit_generation(const std::string &item_id, std::uint64_t generation,
                                       std::uint64_t chunk_count, std::uint64_t total_size)
    {
        auto item_lock = lock_for(item_id);
        std::lock_guard<std::mutex> guard(*item_lock);

        auto current = read_item(rocksdb::ReadOptions(), item_id);
        if (!current)
        {
            rocksdb::WriteBatch cleanup;
            delete_prefix(cleanup, generation_prefix(item_id, generation));
            write(cleanup, "discard staged chunks of removed item " + item_id);
            throw NotFoundError("Item removed during upload: " + item_id);
        }

        std::uint64_t staged = 0;
        const std::string prefix = generation_prefix(item_id, generation);
        std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));
        for (it->Seek(prefix); it->Valid() && starts_with(it->key(), prefix); it->Next())
        {
            ++staged;
        }
        if (staged != chunk_count)
        {
            throw StorageError("Generation " + std::to_string(generation) + " of item " + item_id + " has " +
                               std::to_string(staged) + " staged chunks, expected " + std::to_string(chunk_count));
        }

        ItemState next{generation, chunk_count, total_size};
        rocksdb::WriteBatch batch;
        batch.Put(item_key(item_id), json(next).dump());
        if (current->generation != 0 && current->generation != generation)
        {
            delete_prefix(batch, generation_prefix(item_id, current->generation));
        }
        write(batch, "commit chunks of item " + item_id);
        MyLogger::info("Committed " + std::to_string(chunk_count) + " chunks (" + std::to_string(total_size) +
                       " bytes) for item " + item_id + ", replacing generation " +
                       std::to_string(current->generation));
    }

    void ChunkStore::discard_generation(const std::string &item_id, std::uint64_t generation)
    {
        auto item_lock = lock_for(item_id);
        std::lock_guard<std::mutex> guard(*item_lock);

        auto current = read_item(rocksdb::ReadOptions(), item_id);
        if (current && current->generation == generation)
        {
            return;
        }
        rocksdb::WriteBatch batch;
        delete_prefix(batch, generation_prefix(item_id, generation));
        write(batch, "discard staged chunks of item " + item_id);
        MyLogger::warning("Discarded staged generation " + std::to_string(generation) + " of item " + item_id);
    }

    std::size_t ChunkStore::purge_stale_generations()
    {
        std::map<std::string, std::optional<ItemState>> headers;
        rocksdb::WriteBatch batch;
        std::size_t purged = 0;

        std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));
        for (it->Seek(CHUNK_PREFIX); it->Valid() && starts_with(it->key(), CHUNK_PREFIX); it->Next())
        {
            std::string key = it->key().ToString();
            std::string remainder = key.substr(CHUNK_PREFIX.size());
            std::size_t slash = remainder.find('/');
            if (slash == std::string::npos || remainder.size() < slash + 17)
            {
                batch.Delete(it->key());
                ++purged;
                continue;
            }
            std::string item_id = remainder.substr(0, slash);
            std::uint64_t generation = std::stoull(remainder.substr(slash + 1, 16), nullptr, 16);

            auto found = headers.find(item_id);
            if (found == headers.end())
            {
                found = headers.emplace(item_id, read_item(rocksdb::ReadOptions(), item_id)).first;
            }
            if (!found->second || found->second->generation != generation)
            {
                batch.Delete(it->key());
                ++purged;
            }
        }
        if (!it->status().ok())
        {
            throw StorageError("Failed to scan chunk records: " + it->status().ToString());
        }
        if (purged > 0)
        {
            write(batch, "purge stale chunk records");
        }
        return purged;
    }

} // namespace chunkstream

#ifndef CHUNKSTREAM_UPLOAD_PIPELINE_HPP
#define CHUNKSTREAM_UPLOAD_PIPELINE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "../Chunker/Chunker.hpp"
#include "../blob_client/blob_client.hpp"
#include "../metadata/chunk_store.hpp"

namespace chunkstream
{

    // Called after every persisted chunk with (sequence_index, bytes uploaded so far).
    using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

    // One all-or-nothing replace of an item's chunk set. Records are staged as
    // soon as their upload succeeds; nothing is visible to readers until
    // commit(). Destroying an uncommitted transaction discards the staged set.
    class UploadTransaction
    {
    public:
        UploadTransaction(std::shared_ptr<ChunkStore> store,
                          std::shared_ptr<BlobBackendClient> blobs,
                          const std::string &item_id,
                          const std::string &name_prefix);
        ~UploadTransaction();

        UploadTransaction(const UploadTransaction &) = delete;
        UploadTransaction &operator=(const UploadTransaction &) = delete;

        // Uploads the chunk as "{name_prefix}.part{index}" and stages its record.
        // Chunks must arrive in sequence order. Throws UploadFailure.
        ChunkRecord upload_chunk(const Chunk &chunk);

        // Stages a record whose bytes are already in the backend.
        void stage_record(const ChunkRecord &record);

        // Publishes the staged set; returns the chunk count.
        std::size_t commit();
        void abort();

        void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

        const std::string &item_id() const { return item_id_; }
        std::uint64_t generation() const { return generation_; }
        std::size_t chunk_count() const { return chunk_count_; }
        std::uint64_t bytes_staged() const { return bytes_staged_; }

    private:
        std::shared_ptr<ChunkStore> store_;
        std::shared_ptr<BlobBackendClient> blobs_;
        std::string item_id_;
        std::string name_prefix_;
        std::uint64_t generation_;
        std::size_t chunk_count_ = 0;
        std::uint64_t bytes_staged_ = 0;
        bool done_ = false;
        ProgressCallback progress_;
    };

    class ChunkUploadPipeline
    {
    public:
        ChunkUploadPipeline(std::shared_ptr<ChunkStore> store,
                            std::shared_ptr<BlobBackendClient> blobs,
                            std::size_t chunk_size = ChunkSplitter::DEFAULT_CHUNK_SIZE,
                            std::size_t read_size = ChunkSplitter::DEFAULT_READ_SIZE);

        /**
         * Split the source into chunks, upload each one and replace the item's
         * chunk set with the result. Empty input commits an empty set.
         * @return number of chunks committed
         * @throws NotFoundError unknown item; UploadFailure backend failure.
         */
        std::size_t replace_chunks(const std::string &item_id,
                                   ByteSource &source,
                                   const std::string &name_prefix,
                                   ProgressCallback progress = {});

        /**
         * Replace the item's chunk set with a list uploaded directly by the
         * client. Indices must be exactly 0..N-1 in order.
         * @throws ValidationError, NotFoundError
         */
        std::size_t finalize_chunks(const std::string &item_id, const std::vector<ChunkRecord> &chunks);

        // Starts a push-driven replace (used by the HTTP upload path).
        std::unique_ptr<UploadTransaction> begin(const std::string &item_id, const std::string &name_prefix);

        std::vector<ChunkRecord> list_chunks(const std::string &item_id) const;
        // Returns false when the item already exists.
        bool register_item(const std::string &item_id);
        // Returns false when the item does not exist.
        bool remove_item(const std::string &item_id);

        static void validate_chunk_list(const std::vector<ChunkRecord> &chunks);

        std::size_t chunk_size() const { return chunk_size_; }
        std::size_t read_size() const { return read_size_; }

    private:
        std::shared_ptr<ChunkStore> store_;
        std::shared_ptr<BlobBackendClient> blobs_;
        std::size_t chunk_size_;
        std::size_t read_size_;
    };

} // namespace chunkstream

#endif // CHUNKSTREAM_UPLOAD_PIPELINE_HPP

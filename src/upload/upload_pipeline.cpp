#include "upload_pipeline.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include <limits>

namespace chunkstream
{

    UploadTransaction::UploadTransaction(std::shared_ptr<ChunkStore> store,
                                         std::shared_ptr<BlobBackendClient> blobs,
                                         const std::string &item_id,
                                         const std::string &name_prefix)
        : store_(std::move(store)),
          blobs_(std::move(blobs)),
          item_id_(item_id),
          name_prefix_(name_prefix),
          generation_(store_->begin_generation(item_id))
    {
        MyLogger::info("Starting chunk upload for item " + item_id_ + " (generation " +
                       std::to_string(generation_) + ")");
    }

    UploadTransaction::~UploadTransaction()
    {
        if (done_)
            return;
        try
        {
            abort();
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Failed to discard staged chunks of item " + item_id_ + ": " + e.what());
        }
    }

    ChunkRecord UploadTransaction::upload_chunk(const Chunk &chunk)
    {
        if (chunk.index != chunk_count_)
        {
            throw std::logic_error("Chunk " + std::to_string(chunk.index) + " out of order, expected " +
                                   std::to_string(chunk_count_));
        }
        std::string chunk_name = name_prefix_ + ".part" + std::to_string(chunk.index);
        std::string opaque_id = blobs_->put(chunk.data, chunk_name);

        ChunkRecord record{chunk.index, opaque_id, chunk.data.size()};
        stage_record(record);
        return record;
    }

    void UploadTransaction::stage_record(const ChunkRecord &record)
    {
        if (done_)
        {
            throw std::logic_error("Transaction for item " + item_id_ + " already finished");
        }
        store_->stage_chunk(item_id_, generation_, record);
        ++chunk_count_;
        bytes_staged_ += record.byte_size;
        MyLogger::debug("Staged chunk " + std::to_string(record.sequence_index) + " of item " + item_id_);
        if (progress_)
        {
            progress_(record.sequence_index, bytes_staged_);
        }
    }

    std::size_t UploadTransaction::commit()
    {
        if (done_)
        {
            throw std::logic_error("Transaction for item " + item_id_ + " already finished");
        }
        store_->commit_generation(item_id_, generation_, chunk_count_, bytes_staged_);
        done_ = true;
        return chunk_count_;
    }

    void UploadTransaction::abort()
    {
        if (done_)
            return;
        done_ = true;
        MyLogger::warning("Aborting chunk upload for item " + item_id_ + " after " +
                          std::to_string(chunk_count_) + " chunks");
        store_->discard_generation(item_id_, generation_);
    }

    ChunkUploadPipeline::ChunkUploadPipeline(std::shared_ptr<ChunkStore> store,
                                             std::shared_ptr<BlobBackendClient> blobs,
                                             std::size_t chunk_size,
                                             std::size_t read_size)
        : store_(std::move(store)), blobs_(std::move(blobs)), chunk_size_(chunk_size), read_size_(read_size)
    {
        if (chunk_size_ == 0 || read_size_ == 0)
        {
            throw std::invalid_argument("chunk_size and read_size must be positive");
        }
    }

    std::unique_ptr<UploadTransaction> ChunkUploadPipeline::begin(const std::string &item_id,
                                                                  const std::string &name_prefix)
    {
        return std::make_unique<UploadTransaction>(store_, blobs_, item_id, name_prefix);
    }

    std::size_t ChunkUploadPipeline::replace_chunks(const std::string &item_id,
                                                    ByteSource &source,
                                                    const std::string &name_prefix,
                                                    ProgressCallback progress)
    {
        auto transaction = begin(item_id, name_prefix);
        transaction->set_progress_callback(std::move(progress));

        ChunkSplitter splitter(chunk_size_, read_size_);
        while (auto chunk = splitter.next(source))
        {
            transaction->upload_chunk(*chunk);
        }

        std::size_t count = transaction->commit();
        MyLogger::info("Successfully uploaded " + std::to_string(count) + " chunks for item " + item_id);
        return count;
    }

    void ChunkUploadPipeline::validate_chunk_list(const std::vector<ChunkRecord> &chunks)
    {
        if (chunks.empty())
        {
            throw ValidationError("Chunk list is empty");
        }
        std::uint64_t total = 0;
        for (std::size_t i = 0; i < chunks.size(); ++i)
        {
            const ChunkRecord &chunk = chunks[i];
            if (chunk.sequence_index != i)
            {
                throw ValidationError("Chunk sequence_index values must be contiguous from 0; position " +
                                      std::to_string(i) + " has " + std::to_string(chunk.sequence_index));
            }
            if (chunk.opaque_id.empty())
            {
                throw ValidationError("Chunk " + std::to_string(i) + " has an empty opaque_id");
            }
            if (chunk.byte_size == 0)
            {
                throw ValidationError("Chunk " + std::to_string(i) + " has zero byte_size");
            }
            if (chunk.byte_size > std::numeric_limits<std::uint64_t>::max() - total)
            {
                throw ValidationError("Chunk sizes overflow at chunk " + std::to_string(i));
            }
            total += chunk.byte_size;
        }
    }

    std::size_t ChunkUploadPipeline::finalize_chunks(const std::string &item_id,
                                                     const std::vector<ChunkRecord> &chunks)
    {
        validate_chunk_list(chunks);

        auto transaction = begin(item_id, "finalize");
        for (const auto &chunk : chunks)
        {
            transaction->stage_record(chunk);
        }
        std::size_t count = transaction->commit();
        MyLogger::info("Finalized " + std::to_string(count) + " client-uploaded chunks for item " + item_id);
        return count;
    }

    std::vector<ChunkRecord> ChunkUploadPipeline::list_chunks(const std::string &item_id) const
    {
        return store_->list_chunks(item_id);
    }

    bool ChunkUploadPipeline::register_item(const std::string &item_id)
    {
        return store_->register_item(item_id);
    }

    bool ChunkUploadPipeline::remove_item(const std::string &item_id)
    {
        // Blobs stay in the backend; only the records go.
        return store_->remove_item(item_id);
    }

} // namespace chunkstream

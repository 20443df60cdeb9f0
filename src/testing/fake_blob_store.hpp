#ifndef CHUNKSTREAM_FAKE_BLOB_STORE_HPP
#define CHUNKSTREAM_FAKE_BLOB_STORE_HPP

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "blob_client/blob_client.hpp"
#include "errors/errors.hpp"

namespace chunkstream
{
    namespace test_support
    {

        // In-memory BlobBackendClient with fetch counting and failure injection.
        class FakeBlobStore : public BlobBackendClient
        {
        public:
            std::string put(const std::string &bytes, const std::string &name) override
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (fail_put_after_ >= 0 && puts_ >= fail_put_after_)
                {
                    throw UploadFailure("injected put failure for " + name);
                }
                ++puts_;
                std::string id = "blob" + std::to_string(blobs_.size());
                blobs_[id] = bytes;
                names_.push_back(name);
                return id;
            }

            std::string get(const std::string &opaque_id) override
            {
                std::lock_guard<std::mutex> lock(mutex_);
                fetched_.push_back(opaque_id);
                auto it = blobs_.find(opaque_id);
                if (it == blobs_.end())
                {
                    throw NotFoundError("no blob " + opaque_id);
                }
                if (truncate_on_get_)
                {
                    return it->second.substr(0, it->second.size() / 2);
                }
                return it->second;
            }

            // Stores bytes under a chosen id, bypassing put().
            void add(const std::string &id, const std::string &bytes)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                blobs_[id] = bytes;
            }

            // Puts beyond the first n throw UploadFailure; -1 disables.
            void fail_put_after(int n)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                fail_put_after_ = n;
                puts_ = 0;
            }

            void truncate_on_get(bool enabled) { truncate_on_get_ = enabled; }

            std::vector<std::string> fetched() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return fetched_;
            }

            std::vector<std::string> names() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return names_;
            }

            std::size_t size() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return blobs_.size();
            }

        private:
            mutable std::mutex mutex_;
            std::map<std::string, std::string> blobs_;
            std::vector<std::string> fetched_;
            std::vector<std::string> names_;
            int fail_put_after_ = -1;
            int puts_ = 0;
            std::atomic<bool> truncate_on_get_{false};
        };

        // Deterministic payload of the given size; byte i is (i * 31 + seed) mod 251.
        inline std::string make_payload(std::size_t size, unsigned seed = 7)
        {
            std::string data(size, '\0');
            for (std::size_t i = 0; i < size; ++i)
            {
                data[i] = static_cast<char>((i * 31 + seed) % 251);
            }
            return data;
        }

    } // namespace test_support
} // namespace chunkstream

#endif // CHUNKSTREAM_FAKE_BLOB_STORE_HPP

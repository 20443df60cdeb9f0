#ifndef CHUNKSTREAM_LOCAL_BLOB_STORE_HPP
#define CHUNKSTREAM_LOCAL_BLOB_STORE_HPP

#include "blob_client.hpp"
#include <string>

namespace chunkstream
{

    // Blob store on a local directory. Each blob is a file named by the
    // SHA-256 of its content, which doubles as the opaque id.
    class LocalBlobStore : public BlobBackendClient
    {
    public:
        explicit LocalBlobStore(const std::string &root_dir);

        std::string put(const std::string &bytes, const std::string &name) override;
        std::string get(const std::string &opaque_id) override;

        static std::string calculateChunkHash(const char *data, size_t size);

    private:
        std::string root_dir_;

        bool is_valid_id(const std::string &opaque_id) const;
    };

} // namespace chunkstream

#endif // CHUNKSTREAM_LOCAL_BLOB_STORE_HPP

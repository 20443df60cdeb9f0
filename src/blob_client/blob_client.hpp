#ifndef CHUNKSTREAM_BLOB_CLIENT_HPP
#define CHUNKSTREAM_BLOB_CLIENT_HPP

#include <memory>
#include <string>

namespace chunkstream
{

    struct BlobBackendConfig;

    // Capability interface over the external blob store.
    // Implementations must be safe to call from several threads at once.
    class BlobBackendClient
    {
    public:
        virtual ~BlobBackendClient() = default;

        // Stores bytes under a display name and returns the backend's opaque id.
        // Throws UploadFailure.
        virtual std::string put(const std::string &bytes, const std::string &name) = 0;

        // Returns exactly the bytes stored under opaque_id.
        // Throws NotFoundError or RetrievalFailure.
        virtual std::string get(const std::string &opaque_id) = 0;
    };

    std::shared_ptr<BlobBackendClient> make_blob_client(const BlobBackendConfig &config);

} // namespace chunkstream

#endif // CHUNKSTREAM_BLOB_CLIENT_HPP

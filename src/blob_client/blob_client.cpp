#include "blob_client.hpp"
#include "http_blob_client.hpp"
#include "local_blob_store.hpp"
#include "../load_config/load_config.hpp"
#include <stdexcept>

namespace chunkstream
{

    std::shared_ptr<BlobBackendClient> make_blob_client(const BlobBackendConfig &config)
    {
        if (config.type == "http")
        {
            return std::make_shared<HttpBlobClient>(config);
        }
        if (config.type == "local")
        {
            return std::make_shared<LocalBlobStore>(config.root_dir);
        }
        throw std::runtime_error("Unknown blob backend type: " + config.type);
    }

} // namespace chunkstream

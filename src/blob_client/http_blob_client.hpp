#ifndef CHUNKSTREAM_HTTP_BLOB_CLIENT_HPP
#define CHUNKSTREAM_HTTP_BLOB_CLIENT_HPP

#include "blob_client.hpp"
#include "../load_config/load_config.hpp"
#include <curl/curl.h>
#include <string>

namespace chunkstream
{

    // Struct to hold a raw backend response.
    struct BlobResponse
    {
        long responseCode = 0;    // HTTP status, 0 when the transfer itself failed
        std::string errorMessage; // curl error text, if any
        std::string content;      // Response body
    };

    // Talks to the storage service over HTTP:
    //   POST {base_url}/api/upload  multipart file + media_type + chat_id
    //   GET  {base_url}/file/{id}
    // Each call uses its own easy handle so the client can be shared across threads.
    class HttpBlobClient : public BlobBackendClient
    {
    public:
        explicit HttpBlobClient(const BlobBackendConfig &config);
        ~HttpBlobClient() override;

        HttpBlobClient(const HttpBlobClient &) = delete;
        HttpBlobClient &operator=(const HttpBlobClient &) = delete;

        std::string put(const std::string &bytes, const std::string &name) override;
        std::string get(const std::string &opaque_id) override;

    private:
        std::string baseUrl;
        std::string apiToken;
        std::string chatId;
        long timeoutSeconds;

        // Sets common options, performs the request and fills a BlobResponse.
        BlobResponse performRequest(CURL *curl, const std::string &url, struct curl_slist *headers);
    };

} // namespace chunkstream

#endif // CHUNKSTREAM_HTTP_BLOB_CLIENT_HPP

#include "http_blob_client.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>

namespace chunkstream
{

    namespace
    {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

        CurlHandle make_handle()
        {
            CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
            if (!curl)
            {
                throw std::runtime_error("Failed to initialize CURL");
            }
            return curl;
        }
    } // namespace

    HttpBlobClient::HttpBlobClient(const BlobBackendConfig &config)
        : baseUrl(config.base_url),
          apiToken(config.api_token),
          chatId(config.chat_id),
          timeoutSeconds(config.timeout_seconds)
    {
        MyLogger::info("Initializing HttpBlobClient.");
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
        {
            MyLogger::error("Failed to initialize CURL globally in HttpBlobClient.");
            throw std::runtime_error("Failed to initialize CURL");
        }
        MyLogger::debug("Blob backend base URL: " + baseUrl);
    }

    HttpBlobClient::~HttpBlobClient()
    {
        curl_global_cleanup();
        MyLogger::debug("Cleaned up CURL global resources.");
    }

    BlobResponse HttpBlobClient::performRequest(CURL *curl, const std::string &url, struct curl_slist *headers)
    {
        MyLogger::debug("Performing request to URL: " + url);
        BlobResponse response;
        std::string readBuffer;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        if (headers)
        {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        }
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(
            curl, CURLOPT_WRITEFUNCTION,
            +[](char *ptr, size_t size, size_t nmemb, void *userdata) -> size_t
            {
                std::string *str = static_cast<std::string *>(userdata);
                size_t totalSize = size * nmemb;
                str->append(ptr, totalSize);
                return totalSize;
            });
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK)
        {
            response.errorMessage = curl_easy_strerror(res);
            return response;
        }

        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.responseCode);
        response.content = std::move(readBuffer);
        MyLogger::debug("Received response with HTTP code: " + std::to_string(response.responseCode));
        return response;
    }

    std::string HttpBlobClient::put(const std::string &bytes, const std::string &name)
    {
        MyLogger::info("Uploading chunk '" + name + "' (" + std::to_string(bytes.size()) + " bytes)");
        CurlHandle curl = make_handle();

        std::unique_ptr<curl_mime, decltype(&curl_mime_free)> form(curl_mime_init(curl.get()), &curl_mime_free);
        curl_mimepart *field = curl_mime_addpart(form.get());
        curl_mime_name(field, "file");
        curl_mime_data(field, bytes.data(), bytes.size());
        curl_mime_filename(field, name.c_str());
        curl_mime_type(field, "application/octet-stream");

        field = curl_mime_addpart(form.get());
        curl_mime_name(field, "media_type");
        curl_mime_data(field, "document", CURL_ZERO_TERMINATED);

        field = curl_mime_addpart(form.get());
        curl_mime_name(field, "chat_id");
        curl_mime_data(field, chatId.c_str(), CURL_ZERO_TERMINATED);

        curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, form.get());

        std::string tokenHeader = "X-Api-Token: " + apiToken;
        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
            curl_slist_append(nullptr, tokenHeader.c_str()), &curl_slist_free_all);

        BlobResponse response = performRequest(curl.get(), baseUrl + "/api/upload", headers.get());
        if (response.responseCode == 0)
        {
            MyLogger::error("Upload of chunk '" + name + "' failed: " + response.errorMessage);
            throw UploadFailure("Blob backend unreachable while uploading " + name + ": " + response.errorMessage);
        }
        if (response.responseCode < 200 || response.responseCode >= 300)
        {
            MyLogger::error("Upload of chunk '" + name + "' rejected with HTTP " + std::to_string(response.responseCode));
            throw UploadFailure("Blob backend rejected " + name + " with HTTP " + std::to_string(response.responseCode));
        }

        std::string fileId;
        try
        {
            nlohmann::json result = nlohmann::json::parse(response.content);
            if (result.value("success", false) && result.contains("files") &&
                result["files"].is_array() && !result["files"].empty())
            {
                fileId = result["files"][0].at("file_id").get<std::string>();
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            MyLogger::error("Unparseable upload response for chunk '" + name + "': " + e.what());
            throw UploadFailure("Blob backend returned an invalid response for " + name);
        }

        if (fileId.empty())
        {
            MyLogger::error("Upload response for chunk '" + name + "' carries no file id");
            throw UploadFailure("Failed to upload chunk " + name + " to blob backend");
        }
        if (fileId.find_first_of(":,") != std::string::npos)
        {
            MyLogger::warning("Backend id for '" + name + "' contains ':' or ','; chunk-list tokens will not round-trip");
        }
        MyLogger::info("Uploaded chunk '" + name + "' as " + fileId);
        return fileId;
    }

    std::string HttpBlobClient::get(const std::string &opaque_id)
    {
        MyLogger::debug("Downloading chunk " + opaque_id);
        CurlHandle curl = make_handle();

        std::unique_ptr<char, decltype(&curl_free)> escaped(
            curl_easy_escape(curl.get(), opaque_id.c_str(), static_cast<int>(opaque_id.size())), &curl_free);
        if (!escaped)
        {
            throw RetrievalFailure("Failed to escape chunk id " + opaque_id);
        }

        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        BlobResponse response = performRequest(curl.get(), baseUrl + "/file/" + escaped.get(), nullptr);
        if (response.responseCode == 0)
        {
            MyLogger::error("Download of chunk " + opaque_id + " failed: " + response.errorMessage);
            throw RetrievalFailure("Blob backend unreachable while fetching " + opaque_id + ": " + response.errorMessage);
        }
        if (response.responseCode == 404)
        {
            MyLogger::warning("Chunk not found in blob backend: " + opaque_id);
            throw NotFoundError("Chunk not found: " + opaque_id);
        }
        if (response.responseCode < 200 || response.responseCode >= 300)
        {
            MyLogger::error("Download of chunk " + opaque_id + " failed with HTTP " + std::to_string(response.responseCode));
            throw RetrievalFailure("Blob backend returned HTTP " + std::to_string(response.responseCode) +
                                   " for " + opaque_id);
        }
        return std::move(response.content);
    }

} // namespace chunkstream

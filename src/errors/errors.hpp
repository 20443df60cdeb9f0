#ifndef CHUNKSTREAM_ERRORS_HPP
#define CHUNKSTREAM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace chunkstream
{

    // Base of every failure the service reports to callers. The category is a
    // stable machine-readable string; http_status is the status a front end
    // should answer with.
    class Error : public std::runtime_error
    {
    public:
        Error(const std::string &category, const std::string &message, unsigned http_status)
            : std::runtime_error(message), category_(category), http_status_(http_status)
        {
        }

        const std::string &category() const noexcept { return category_; }
        unsigned http_status() const noexcept { return http_status_; }

    private:
        std::string category_;
        unsigned http_status_;
    };

    // Item, chunk set or backend object missing.
    class NotFoundError : public Error
    {
    public:
        explicit NotFoundError(const std::string &message)
            : Error("not_found", message, 404) {}
    };

    // Backend rejected or was unreachable during a put.
    class UploadFailure : public Error
    {
    public:
        explicit UploadFailure(const std::string &message)
            : Error("upload_failed", message, 502) {}
    };

    // Backend rejected or was unreachable during a get.
    class RetrievalFailure : public Error
    {
    public:
        explicit RetrievalFailure(const std::string &message)
            : Error("retrieval_failed", message, 502) {}
    };

    // Malformed chunk-list token. segment() holds the part that failed to parse.
    class DecodeError : public Error
    {
    public:
        DecodeError(const std::string &message, const std::string &segment)
            : Error("decode_error", message + ": '" + segment + "'", 400), segment_(segment)
        {
        }

        const std::string &segment() const noexcept { return segment_; }

    private:
        std::string segment_;
    };

    // Caller-supplied input rejected before anything was persisted.
    class ValidationError : public Error
    {
    public:
        explicit ValidationError(const std::string &message)
            : Error("invalid_request", message, 400) {}
    };

    // Metadata database failure.
    class StorageError : public Error
    {
    public:
        explicit StorageError(const std::string &message)
            : Error("storage_error", message, 500) {}
    };

} // namespace chunkstream

#endif // CHUNKSTREAM_ERRORS_HPP

#include "local_blob_store.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"

#include <openssl/evp.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace chunkstream
{

    LocalBlobStore::LocalBlobStore(const std::string &root_dir) : root_dir_(root_dir)
    {
        std::error_code ec;
        fs::create_directories(root_dir_, ec);
        if (ec)
        {
            MyLogger::error("Failed to create blob directory " + root_dir_ + ": " + ec.message());
            throw std::runtime_error("Failed to create blob directory: " + root_dir_);
        }
        MyLogger::info("Local blob store rooted at " + root_dir_);
    }

    std::string LocalBlobStore::calculateChunkHash(const char *data, size_t size)
    {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        EVP_MD_CTX *ctx = EVP_MD_CTX_new();
        if (!ctx)
        {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }

        if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
            EVP_DigestUpdate(ctx, data, size) != 1 ||
            EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1)
        {
            EVP_MD_CTX_free(ctx);
            throw std::runtime_error("Failed to compute SHA-256 hash");
        }

        EVP_MD_CTX_free(ctx);

        std::stringstream ss;
        for (unsigned int i = 0; i < hash_len; i++)
        {
            ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        }
        return ss.str();
    }

    bool LocalBlobStore::is_valid_id(const std::string &opaque_id) const
    {
        if (opaque_id.size() != 64)
            return false;
        for (char c : opaque_id)
        {
            if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
                return false;
        }
        return true;
    }

    std::string LocalBlobStore::put(const std::string &bytes, const std::string &name)
    {
        std::string chunk_hash = calculateChunkHash(bytes.data(), bytes.size());
        fs::path chunk_path = fs::path(root_dir_) / chunk_hash;

        if (fs::exists(chunk_path))
        {
            MyLogger::debug("Chunk '" + name + "' already stored as " + chunk_hash);
            return chunk_hash;
        }

        // Write under a unique temporary name, then rename into place.
        std::ostringstream tmp_name;
        tmp_name << chunk_hash << ".tmp." << std::this_thread::get_id();
        fs::path tmp_path = fs::path(root_dir_) / tmp_name.str();
        {
            std::ofstream chunk_file(tmp_path, std::ios::binary | std::ios::trunc);
            if (!chunk_file)
            {
                MyLogger::error("Failed to create chunk file: " + tmp_path.string());
                throw UploadFailure("Failed to store chunk " + name);
            }
            chunk_file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            if (!chunk_file)
            {
                MyLogger::error("Failed to write chunk file: " + tmp_path.string());
                throw UploadFailure("Failed to store chunk " + name);
            }
        }

        std::error_code ec;
        fs::rename(tmp_path, chunk_path, ec);
        if (ec)
        {
            fs::remove(tmp_path, ec);
            MyLogger::error("Failed to move chunk into place: " + chunk_path.string());
            throw UploadFailure("Failed to store chunk " + name);
        }

        MyLogger::info("Stored chunk '" + name + "' as " + chunk_hash);
        return chunk_hash;
    }

    std::string LocalBlobStore::get(const std::string &opaque_id)
    {
        if (!is_valid_id(opaque_id))
        {
            throw NotFoundError("Chunk not found: " + opaque_id);
        }

        fs::path chunk_path = fs::path(root_dir_) / opaque_id;
        std::ifstream chunk_file(chunk_path, std::ios::binary);
        if (!chunk_file)
        {
            MyLogger::warning("Chunk file missing: " + chunk_path.string());
            throw NotFoundError("Chunk not found: " + opaque_id);
        }

        std::string content((std::istreambuf_iterator<char>(chunk_file)),
                            std::istreambuf_iterator<char>());
        if (chunk_file.bad())
        {
            MyLogger::error("Failed to read chunk file: " + chunk_path.string());
            throw RetrievalFailure("Failed to read chunk " + opaque_id);
        }
        return content;
    }

} // namespace chunkstream

#ifndef CHUNKSTREAM_LOAD_CONFIG_HPP
#define CHUNKSTREAM_LOAD_CONFIG_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "../logger/Mylogger.hpp"

namespace chunkstream
{

    using json = nlohmann::json;

    struct BlobBackendConfig
    {
        std::string type;         // "http" or "local"
        std::string base_url;     // http: storage service root, e.g. http://127.0.0.1:8080
        std::string api_token;    // http: sent as X-Api-Token, never logged
        std::string chat_id;      // http: destination identifier
        std::string root_dir;     // local: directory holding chunk files
        long timeout_seconds = 300;
    };

    struct ServerConfig
    {
        std::string server_ip;
        unsigned short server_port = 0;
        std::string db_path;
        std::size_t chunk_size = 10 * 1024 * 1024;
        std::size_t read_size = 1024 * 1024;
        std::size_t worker_threads = 4;
        std::string content_type = "video/mp4";
        std::string log_level = "info";
        std::string log_file;
        BlobBackendConfig blob_backend;
    };

    namespace ConfigReader
    {
        json load(const std::string &filepath);

        // Lenient getters: log and return a zero value when the key is absent
        // or has the wrong type.
        std::string get_config_string(const std::string &key, const json &j);
        unsigned short get_config_short(const std::string &key, const json &j);

        // Strict getters: throw std::runtime_error when the key is absent or invalid.
        std::string require_string(const std::string &key, const json &j);
        unsigned short require_short(const std::string &key, const json &j);
        std::uint64_t get_config_size(const std::string &key, const json &j, std::uint64_t fallback);

        ServerConfig parse_server_config(const json &j);
        ServerConfig load_server_config(const std::string &filepath);
    }

} // namespace chunkstream

#endif // CHUNKSTREAM_LOAD_CONFIG_HPP

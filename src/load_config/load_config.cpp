#include "load_config.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>

namespace chunkstream
{
    namespace ConfigReader
    {
        json load(const std::string &filepath)
        {
            std::ifstream config_file(filepath);
            if (!config_file.is_open())
            {
                MyLogger::error("Unable to open configuration file: " + filepath);
                throw std::runtime_error("Could not open config file: " + filepath);
            }

            try
            {
                json j;
                config_file >> j;
                MyLogger::info("Configuration file loaded successfully: " + filepath);
                return j;
            }
            catch (const json::parse_error &e)
            {
                MyLogger::error("JSON parse error in file " + filepath + ": " + e.what());
                throw std::runtime_error("Invalid JSON in config file: " + filepath);
            }
        }

        std::string get_config_string(const std::string &key, const json &j)
        {
            if (!j.contains(key))
            {
                MyLogger::error("Key not found in JSON: " + key);
                return "";
            }
            if (!j[key].is_string())
            {
                MyLogger::error("Key is not a string: " + key);
                return "";
            }
            return j[key].get<std::string>();
        }

        unsigned short get_config_short(const std::string &key, const json &j)
        {
            if (!j.contains(key))
            {
                MyLogger::error("Key not found in JSON: " + key);
                return 0;
            }
            if (!j[key].is_number_unsigned())
            {
                MyLogger::error("Key is not an unsigned integer: " + key);
                return 0;
            }
            auto val = j[key].get<unsigned int>();
            if (val > std::numeric_limits<unsigned short>::max())
            {
                MyLogger::error("Value for key '" + key + "' exceeds unsigned short limit");
                return 0;
            }
            return static_cast<unsigned short>(val);
        }

        std::string require_string(const std::string &key, const json &j)
        {
            std::string value = get_config_string(key, j);
            if (value.empty())
            {
                throw std::runtime_error("Missing or empty config key: " + key);
            }
            return value;
        }

        unsigned short require_short(const std::string &key, const json &j)
        {
            unsigned short value = get_config_short(key, j);
            if (value == 0)
            {
                throw std::runtime_error("Missing or invalid config key: " + key);
            }
            return value;
        }

        std::uint64_t get_config_size(const std::string &key, const json &j, std::uint64_t fallback)
        {
            if (!j.contains(key))
            {
                return fallback;
            }
            if (!j[key].is_number_unsigned() || j[key].get<std::uint64_t>() == 0)
            {
                throw std::runtime_error("Config key must be a positive integer: " + key);
            }
            return j[key].get<std::uint64_t>();
        }

        ServerConfig parse_server_config(const json &j)
        {
            ServerConfig config;
            config.server_ip = require_string("server_ip", j);
            config.server_port = require_short("server_port", j);
            config.db_path = require_string("db_path", j);

            config.chunk_size = get_config_size("chunk_size", j, config.chunk_size);
            config.read_size = get_config_size("read_size", j, config.read_size);
            config.worker_threads = get_config_size("worker_threads", j, config.worker_threads);
            if (j.contains("content_type"))
                config.content_type = require_string("content_type", j);
            if (j.contains("log_level"))
                config.log_level = require_string("log_level", j);
            if (j.contains("log_file"))
                config.log_file = get_config_string("log_file", j);

            if (!j.contains("blob_backend") || !j["blob_backend"].is_object())
            {
                throw std::runtime_error("Missing config section: blob_backend");
            }
            const json &backend = j["blob_backend"];
            BlobBackendConfig &blob = config.blob_backend;
            blob.type = require_string("type", backend);
            if (blob.type == "http")
            {
                blob.base_url = require_string("base_url", backend);
                blob.api_token = require_string("api_token", backend);
                blob.chat_id = require_string("chat_id", backend);
                blob.timeout_seconds = static_cast<long>(
                    get_config_size("timeout_seconds", backend, static_cast<std::uint64_t>(blob.timeout_seconds)));
                while (!blob.base_url.empty() && blob.base_url.back() == '/')
                {
                    blob.base_url.pop_back();
                }
            }
            else if (blob.type == "local")
            {
                blob.root_dir = require_string("root_dir", backend);
            }
            else
            {
                throw std::runtime_error("Unknown blob_backend.type: " + blob.type);
            }
            return config;
        }

        ServerConfig load_server_config(const std::string &filepath)
        {
            return parse_server_config(load(filepath));
        }
    }

} // namespace chunkstream

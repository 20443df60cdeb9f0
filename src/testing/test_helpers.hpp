#ifndef CHUNKSTREAM_TEST_HELPERS_HPP
#define CHUNKSTREAM_TEST_HELPERS_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>

namespace chunkstream
{
    namespace test_support
    {

        // Unique scratch directory, removed on destruction.
        class TempDir
        {
        public:
            explicit TempDir(const std::string &tag)
            {
                static std::atomic<unsigned> counter{0};
                auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
                path_ = std::filesystem::temp_directory_path() /
                        ("chunkstream_" + tag + "_" + std::to_string(::getpid()) + "_" +
                         std::to_string(stamp) + "_" + std::to_string(counter++));
                std::filesystem::create_directories(path_);
            }

            ~TempDir()
            {
                std::error_code ec;
                std::filesystem::remove_all(path_, ec);
                if (ec)
                {
                    std::cerr << "Warning: could not clean up " << path_ << ": " << ec.message() << std::endl;
                }
            }

            TempDir(const TempDir &) = delete;
            TempDir &operator=(const TempDir &) = delete;

            const std::filesystem::path &path() const { return path_; }
            std::string str(const std::string &child = "") const
            {
                return child.empty() ? path_.string() : (path_ / child).string();
            }

        private:
            std::filesystem::path path_;
        };

    } // namespace test_support
} // namespace chunkstream

#endif // CHUNKSTREAM_TEST_HELPERS_HPP

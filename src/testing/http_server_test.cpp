#include <gtest/gtest.h>
#include "http_server/http_server.hpp"
#include "chunk_codec/chunk_codec.hpp"
#include "fake_blob_store.hpp"
#include "test_helpers.hpp"
#include <boost/beast.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <limits>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

using namespace chunkstream;
using test_support::FakeBlobStore;
using test_support::make_payload;
using test_support::TempDir;

class HttpServerTest : public ::testing::Test
{
protected:
    TempDir dir_{"http"};
    std::shared_ptr<ChunkStore> store_ = std::make_shared<ChunkStore>(dir_.str("db"));
    std::shared_ptr<FakeBlobStore> blobs_ = std::make_shared<FakeBlobStore>();
    std::shared_ptr<ChunkUploadPipeline> pipeline_ = std::make_shared<ChunkUploadPipeline>(store_, blobs_, 1000, 256);
    std::shared_ptr<StreamRequestHandler> streams_ = std::make_shared<StreamRequestHandler>(blobs_);

    asio::io_context ioc_;
    asio::thread_pool workers_{2};
    std::unique_ptr<HttpServer> server_;
    std::thread io_thread_;

    void SetUp() override
    {
        server_ = std::make_unique<HttpServer>(ioc_, "127.0.0.1", 0,
                                               ServiceContext{store_, pipeline_, streams_, &workers_});
        server_->run();
        io_thread_ = std::thread([this]() { ioc_.run(); });
    }

    void TearDown() override
    {
        server_->stop();
        ioc_.stop();
        io_thread_.join();
        workers_.join();
    }

    http::response<http::string_body> request(http::verb verb,
                                              const std::string &target,
                                              const std::string &body = "",
                                              const std::string &range = "")
    {
        asio::io_context ioc;
        tcp::socket socket(ioc);
        socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_->port()));

        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, "localhost");
        if (!range.empty())
            req.set(http::field::range, range);
        req.body() = body;
        req.prepare_payload();
        http::write(socket, req);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        http::read(socket, buffer, parser);

        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return parser.release();
    }

    static json body_json(const http::response<http::string_body> &res)
    {
        return json::parse(res.body());
    }

    static std::string field(const http::response<http::string_body> &res, http::field name)
    {
        auto value = res[name];
        return std::string(value.data(), value.size());
    }
};

TEST_F(HttpServerTest, RegisterCreatesOnce)
{
    auto first = request(http::verb::post, "/items/ep1");
    EXPECT_EQ(first.result(), http::status::created);
    EXPECT_TRUE(body_json(first)["created"].get<bool>());

    auto second = request(http::verb::post, "/items/ep1");
    EXPECT_EQ(second.result(), http::status::ok);
    EXPECT_FALSE(body_json(second)["created"].get<bool>());
}

TEST_F(HttpServerTest, UploadThenStreamARange)
{
    request(http::verb::post, "/items/ep1");
    std::string data = make_payload(2500);

    auto uploaded = request(http::verb::post, "/items/ep1/upload?name=show", data);
    ASSERT_EQ(uploaded.result(), http::status::ok) << uploaded.body();
    EXPECT_EQ(body_json(uploaded)["chunks"].get<int>(), 3);
    EXPECT_EQ(blobs_->names(), (std::vector<std::string>{"show.part0", "show.part1", "show.part2"}));

    auto listed = request(http::verb::get, "/items/ep1/chunks");
    ASSERT_EQ(listed.result(), http::status::ok);
    json listing = body_json(listed);
    EXPECT_EQ(listing["total_size"].get<std::uint64_t>(), 2500u);
    ASSERT_EQ(listing["chunks"].size(), 3u);
    EXPECT_EQ(listing["chunks"][2]["byte_size"].get<std::uint64_t>(), 500u);

    auto partial = request(http::verb::get, "/stream/ep1", "", "bytes=900-2100");
    EXPECT_EQ(partial.result(), http::status::partial_content);
    EXPECT_EQ(field(partial, http::field::content_range), "bytes 900-2100/2500");
    EXPECT_EQ(field(partial, http::field::accept_ranges), "bytes");
    EXPECT_EQ(field(partial, http::field::content_type), "video/mp4");
    EXPECT_EQ(partial.body(), data.substr(900, 1201));

    auto full = request(http::verb::get, "/stream/ep1");
    EXPECT_EQ(full.result(), http::status::ok);
    EXPECT_EQ(full.body(), data);
}

TEST_F(HttpServerTest, StreamsStraightFromAToken)
{
    std::string data = make_payload(3000);
    std::vector<ChunkRef> refs;
    for (int i = 0; i < 6; ++i)
    {
        std::string id = "t" + std::to_string(i);
        blobs_->add(id, data.substr(i * 500, 500));
        refs.push_back({id, 500});
    }
    std::string token = codec::encode(refs);

    auto res = request(http::verb::get, "/stream?chunks=" + token, "", "bytes=-700");
    EXPECT_EQ(res.result(), http::status::partial_content);
    EXPECT_EQ(field(res, http::field::content_range), "bytes 2300-2999/3000");
    EXPECT_EQ(res.body(), data.substr(2300));
}

TEST_F(HttpServerTest, GarbageRangeGivesFullBody)
{
    std::vector<ChunkRef> refs{{"only", 5}};
    blobs_->add("only", "hello");
    auto res = request(http::verb::get, "/stream?chunks=" + codec::encode(refs), "", "bytes=garbage");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "hello");
}

TEST_F(HttpServerTest, ErrorsAreJson)
{
    auto missing = request(http::verb::get, "/stream/nope");
    EXPECT_EQ(missing.result(), http::status::not_found);
    EXPECT_EQ(body_json(missing)["error"], "not_found");

    auto bad_token = request(http::verb::get, "/stream?chunks=a:zz");
    EXPECT_EQ(bad_token.result(), http::status::bad_request);
    EXPECT_EQ(body_json(bad_token)["error"], "decode_error");

    request(http::verb::post, "/items/ep1");
    auto empty = request(http::verb::get, "/stream/ep1");
    EXPECT_EQ(empty.result(), http::status::not_found);

    auto bad_finalize = request(http::verb::post, "/items/ep1/finalize",
                                R"({"chunks":[{"sequence_index":1,"opaque_id":"a","byte_size":3}]})");
    EXPECT_EQ(bad_finalize.result(), http::status::bad_request);
    EXPECT_EQ(body_json(bad_finalize)["error"], "invalid_request");

    auto upload_unknown = request(http::verb::post, "/items/ghost/upload", "abc");
    EXPECT_EQ(upload_unknown.result(), http::status::not_found);
}

TEST_F(HttpServerTest, TokenWhoseSizesOverflowIsADecodeError)
{
    std::string max = std::to_string(std::numeric_limits<std::uint64_t>::max());
    blobs_->add("a", "x");
    blobs_->add("b", "yz");

    auto wrapped = request(http::verb::get, "/stream?chunks=a:" + max + ",b:2");
    EXPECT_EQ(wrapped.result(), http::status::bad_request);
    EXPECT_EQ(body_json(wrapped)["error"], "decode_error");

    auto to_zero = request(http::verb::get, "/stream?chunks=a:" + max + ",b:1");
    EXPECT_EQ(to_zero.result(), http::status::bad_request);
    EXPECT_TRUE(blobs_->fetched().empty());
}

TEST_F(HttpServerTest, ClientDisconnectStopsChunkFetches)
{
    constexpr std::size_t chunk_count = 400;
    constexpr std::size_t chunk_bytes = 64 * 1024;
    std::string block = make_payload(chunk_bytes);
    std::vector<ChunkRecord> chunks;
    for (std::size_t i = 0; i < chunk_count; ++i)
    {
        std::string id = "s" + std::to_string(i);
        blobs_->add(id, block);
        chunks.push_back({i, id, chunk_bytes});
    }
    pipeline_->register_item("ep1");
    pipeline_->finalize_chunks("ep1", chunks);

    {
        asio::io_context ioc;
        tcp::socket socket(ioc);
        socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_->port()));

        http::request<http::empty_body> req{http::verb::get, "/stream/ep1", 11};
        req.set(http::field::host, "localhost");
        http::write(socket, req);

        beast::flat_buffer buffer;
        http::response_parser<http::empty_body> parser;
        http::read_header(socket, buffer, parser);
        ASSERT_EQ(parser.get().result(), http::status::ok);

        // Dropping unread data makes the kernel reset the connection.
        socket.close();
    }

    // Wait for the session to notice and settle.
    std::size_t fetched = blobs_->fetched().size();
    for (int i = 0; i < 50; ++i)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        std::size_t now = blobs_->fetched().size();
        if (now == fetched && i >= 2)
            break;
        fetched = now;
    }

    EXPECT_LT(fetched, chunk_count);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(blobs_->fetched().size(), fetched);
}

TEST_F(HttpServerTest, FinalizeAndRemove)
{
    request(http::verb::post, "/items/ep1");
    blobs_->add("x0", "abc");
    blobs_->add("x1", "de");

    auto finalized = request(http::verb::post, "/items/ep1/finalize",
                             R"({"chunks":[{"sequence_index":0,"opaque_id":"x0","byte_size":3},)"
                             R"({"sequence_index":1,"opaque_id":"x1","byte_size":2}]})");
    ASSERT_EQ(finalized.result(), http::status::ok) << finalized.body();

    auto streamed = request(http::verb::get, "/stream/ep1");
    EXPECT_EQ(streamed.body(), "abcde");

    auto compressed = request(http::verb::get, "/items/ep1/chunks?compress=true");
    std::string token = body_json(compressed)["token"].get<std::string>();
    EXPECT_EQ(token.find(':'), std::string::npos);
    EXPECT_EQ(codec::decode(token).size(), 2u);

    auto removed = request(http::verb::delete_, "/items/ep1");
    EXPECT_EQ(removed.result(), http::status::ok);
    EXPECT_EQ(request(http::verb::get, "/stream/ep1").result(), http::status::not_found);
    EXPECT_EQ(request(http::verb::delete_, "/items/ep1").result(), http::status::not_found);
}

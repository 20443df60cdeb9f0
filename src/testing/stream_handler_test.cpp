#include <gtest/gtest.h>
#include "stream_handler/stream_handler.hpp"
#include "errors/errors.hpp"
#include "fake_blob_store.hpp"

using namespace chunkstream;
using test_support::FakeBlobStore;
using test_support::make_payload;

namespace
{
    constexpr std::uint64_t MiB = 1024 * 1024;

    std::string header(const StreamResponsePlan &plan, const std::string &name)
    {
        for (const auto &[key, value] : plan.headers)
        {
            if (key == name)
                return value;
        }
        return "";
    }

    bool has_header(const StreamResponsePlan &plan, const std::string &name)
    {
        for (const auto &entry : plan.headers)
        {
            if (entry.first == name)
                return true;
        }
        return false;
    }
} // namespace

TEST(ParseRangeHeaderTest, ExplicitBounds)
{
    auto range = parse_range_header("bytes=10-19", 100);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->start, 10u);
    EXPECT_EQ(range->end, 19u);
}

TEST(ParseRangeHeaderTest, OpenEndRunsToLastByte)
{
    auto range = parse_range_header("bytes=40-", 100);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->start, 40u);
    EXPECT_EQ(range->end, 99u);
}

TEST(ParseRangeHeaderTest, EndPastTheFileIsClamped)
{
    auto range = parse_range_header("bytes=90-5000", 100);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->end, 99u);
}

TEST(ParseRangeHeaderTest, SuffixSelectsTheLastBytes)
{
    auto range = parse_range_header("bytes=-30", 100);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->start, 70u);
    EXPECT_EQ(range->end, 99u);

    auto whole = parse_range_header("bytes=-500", 100);
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(whole->start, 0u);
    EXPECT_EQ(whole->end, 99u);
}

TEST(ParseRangeHeaderTest, MalformedValuesAreIgnored)
{
    EXPECT_FALSE(parse_range_header("garbage", 100));
    EXPECT_FALSE(parse_range_header("bytes=garbage", 100));
    EXPECT_FALSE(parse_range_header("items=0-10", 100));
    EXPECT_FALSE(parse_range_header("bytes=20-10", 100));
    EXPECT_FALSE(parse_range_header("bytes=100-", 100));
    EXPECT_FALSE(parse_range_header("bytes=0-10,20-30", 100));
    EXPECT_FALSE(parse_range_header("bytes=-", 100));
    EXPECT_FALSE(parse_range_header("bytes=-0", 100));
    EXPECT_FALSE(parse_range_header("bytes=1x-5", 100));
}

class StreamRequestHandlerTest : public ::testing::Test
{
protected:
    std::shared_ptr<FakeBlobStore> blobs_ = std::make_shared<FakeBlobStore>();
    StreamRequestHandler handler_{blobs_};
};

TEST_F(StreamRequestHandlerTest, RangeInsideLastTwoChunksOf25MiB)
{
    std::string file = make_payload(25 * MiB);
    blobs_->add("c0", file.substr(0, 10 * MiB));
    blobs_->add("c1", file.substr(10 * MiB, 10 * MiB));
    blobs_->add("c2", file.substr(20 * MiB));
    std::vector<ChunkRecord> chunks{{0, "c0", 10 * MiB}, {1, "c1", 10 * MiB}, {2, "c2", 5 * MiB}};

    auto plan = handler_.plan(total_size(chunks), std::string("bytes=15728640-20971519"));
    EXPECT_EQ(plan.status, 206u);
    EXPECT_EQ(header(plan, "Content-Range"), "bytes 15728640-20971519/26214400");
    EXPECT_EQ(header(plan, "Content-Length"), "5242880");
    EXPECT_EQ(header(plan, "Accept-Ranges"), "bytes");
    EXPECT_EQ(header(plan, "Content-Type"), "video/mp4");

    auto stream = handler_.open(chunks, plan);
    std::string body;
    std::string slice;
    while (stream->next(slice))
        body += slice;

    EXPECT_EQ(body.size(), 5242880u);
    EXPECT_EQ(body, file.substr(15728640, 5242880));
    EXPECT_EQ(blobs_->fetched(), (std::vector<std::string>{"c1", "c2"}));
}

TEST_F(StreamRequestHandlerTest, NoHeaderGivesFullResponse)
{
    auto plan = handler_.plan(26214400, std::nullopt);
    EXPECT_EQ(plan.status, 200u);
    EXPECT_EQ(plan.start, 0u);
    EXPECT_EQ(plan.end, 26214399u);
    EXPECT_EQ(header(plan, "Content-Length"), "26214400");
    EXPECT_FALSE(has_header(plan, "Content-Range"));
}

TEST_F(StreamRequestHandlerTest, GarbageHeaderGivesFullResponse)
{
    auto plan = handler_.plan(26214400, std::string("bytes=garbage"));
    EXPECT_EQ(plan.status, 200u);
    EXPECT_EQ(plan.content_length(), 26214400u);
    EXPECT_FALSE(has_header(plan, "Content-Range"));
}

TEST_F(StreamRequestHandlerTest, SuffixRangeIsPartial)
{
    auto plan = handler_.plan(1000, std::string("bytes=-100"));
    EXPECT_EQ(plan.status, 206u);
    EXPECT_EQ(header(plan, "Content-Range"), "bytes 900-999/1000");
    EXPECT_EQ(plan.content_length(), 100u);
}

TEST_F(StreamRequestHandlerTest, EmptyItemIsNotFound)
{
    EXPECT_THROW(handler_.plan(0, std::nullopt), NotFoundError);
}

TEST_F(StreamRequestHandlerTest, ContentTypeIsConfigurable)
{
    StreamRequestHandler webm(blobs_, "video/webm");
    auto plan = webm.plan(10, std::nullopt);
    EXPECT_EQ(header(plan, "Content-Type"), "video/webm");
}

#include <gtest/gtest.h>
#include "chunk_codec/chunk_codec.hpp"
#include "errors/errors.hpp"
#include <limits>

using namespace chunkstream;

namespace
{
    std::vector<ChunkRef> make_refs(std::size_t count)
    {
        std::vector<ChunkRef> refs;
        for (std::size_t i = 0; i < count; ++i)
        {
            refs.push_back({"BQACAgUAAxkDAAI" + std::to_string(1000 + i) + "Zx9QhLm", 10485760 - i});
        }
        return refs;
    }
} // namespace

TEST(ChunkCodecTest, PlainFormatIsIdColonSizeCommaSeparated)
{
    std::vector<ChunkRef> refs{{"a", 10}, {"b", 20}};
    EXPECT_EQ(codec::encode(refs, codec::Mode::plain), "a:10,b:20");
}

TEST(ChunkCodecTest, ThreeShortIdsStayPlain)
{
    std::vector<ChunkRef> refs{{"id1", 100}, {"id2", 200}, {"id3", 300}};
    std::string token = codec::encode(refs);
    EXPECT_EQ(token, "id1:100,id2:200,id3:300");
    EXPECT_EQ(codec::decode(token), refs);
}

TEST(ChunkCodecTest, TenIdsAreCompressedAndDecodeBack)
{
    auto refs = make_refs(10);
    std::string token = codec::encode(refs);

    EXPECT_EQ(token.find(':'), std::string::npos);
    EXPECT_EQ(token.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_"),
              std::string::npos);
    EXPECT_EQ(codec::decode(token), refs);
}

TEST(ChunkCodecTest, LongPlainStringTriggersCompression)
{
    std::vector<ChunkRef> refs{{std::string(250, 'x'), 5}};
    EXPECT_EQ(codec::select_mode(refs, codec::to_plain(refs)), codec::Mode::compressed);
    EXPECT_EQ(codec::decode(codec::encode(refs)), refs);
}

TEST(ChunkCodecTest, ForcedModesRoundTrip)
{
    auto refs = make_refs(3);
    std::string compressed = codec::encode(refs, codec::Mode::compressed);
    EXPECT_EQ(compressed.find(':'), std::string::npos);
    EXPECT_EQ(codec::decode(compressed), refs);

    auto many = make_refs(12);
    std::string plain = codec::encode(many, codec::Mode::plain);
    EXPECT_NE(plain.find(':'), std::string::npos);
    EXPECT_EQ(codec::decode(plain), many);
}

TEST(ChunkCodecTest, EmptyListEncodesToEmptyToken)
{
    EXPECT_EQ(codec::encode({}), "");
    EXPECT_EQ(codec::encode({}, codec::Mode::compressed), "");
    EXPECT_TRUE(codec::decode("").empty());
}

TEST(ChunkCodecTest, TrailingCommaIsIgnored)
{
    std::vector<ChunkRef> expected{{"a", 1}, {"b", 2}};
    EXPECT_EQ(codec::decode("a:1,b:2,"), expected);
}

TEST(ChunkCodecTest, BadSizeNamesTheSegment)
{
    try
    {
        codec::decode("a:1,b:twelve");
        FAIL() << "expected DecodeError";
    }
    catch (const DecodeError &e)
    {
        EXPECT_EQ(e.segment(), "twelve");
        EXPECT_EQ(e.category(), "decode_error");
        EXPECT_EQ(e.http_status(), 400u);
    }
}

TEST(ChunkCodecTest, MalformedPlainSegmentsAreRejected)
{
    EXPECT_THROW(codec::decode("a:1,b"), DecodeError);   // no size, but token has a colon
    EXPECT_THROW(codec::decode("a:1:2"), DecodeError);   // two colons
    EXPECT_THROW(codec::decode(":5"), DecodeError);      // empty id
    EXPECT_THROW(codec::decode("a:-5"), DecodeError);    // negative
    EXPECT_THROW(codec::decode("a:0"), DecodeError);     // zero size
    EXPECT_THROW(codec::decode("a:99999999999999999999999"), DecodeError);
}

TEST(ChunkCodecTest, SizesWhoseSumOverflowsAreRejected)
{
    const std::string max = std::to_string(std::numeric_limits<std::uint64_t>::max());
    try
    {
        codec::decode("a:" + max + ",b:2");
        FAIL() << "expected DecodeError";
    }
    catch (const DecodeError &e)
    {
        EXPECT_EQ(e.segment(), "b:2");
    }
    EXPECT_THROW(codec::decode("a:" + max + ",b:1"), DecodeError);

    std::vector<ChunkRef> refs{{"a", std::numeric_limits<std::uint64_t>::max()}, {"b", 2}};
    EXPECT_THROW(codec::decode(codec::encode(refs, codec::Mode::compressed)), DecodeError);

    auto single = codec::decode("a:" + max);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0].byte_size, std::numeric_limits<std::uint64_t>::max());
}

TEST(ChunkCodecTest, CorruptCompressedTokensAreRejected)
{
    EXPECT_THROW(codec::decode("not*base64"), DecodeError);
    EXPECT_THROW(codec::decode("AAAAA"), DecodeError); // length % 4 == 1

    std::string token = codec::encode(make_refs(10));
    EXPECT_THROW(codec::decode(token.substr(0, token.size() / 2)), DecodeError);
}

TEST(ChunkCodecTest, Base64UrlHasNoPaddingOrUnsafeCharacters)
{
    std::string data("\xfb\xff\xfe", 3);
    std::string encoded = codec::base64url_encode(data);
    EXPECT_EQ(encoded, "-__-");
    EXPECT_EQ(codec::base64url_decode(encoded), data);

    EXPECT_EQ(codec::base64url_encode("a"), "YQ");
    EXPECT_EQ(codec::base64url_decode("YQ"), "a");
    EXPECT_EQ(codec::base64url_decode("YWI"), "ab");
}

TEST(ChunkCodecTest, RawDeflateHasNoZlibHeader)
{
    std::string plain = codec::to_plain(make_refs(8));
    std::string deflated = codec::deflate_raw(plain);
    ASSERT_FALSE(deflated.empty());
    // A zlib stream would start with 0x78.
    EXPECT_NE(static_cast<unsigned char>(deflated[0]), 0x78);
    EXPECT_EQ(codec::inflate_raw(deflated), plain);
}

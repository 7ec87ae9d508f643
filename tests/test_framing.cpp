#include <gtest/gtest.h>
#include "errors.hpp"
#include "framing.hpp"
#include "test_support.hpp"

using namespace chatrelay;
using chatrelay::testkit::MemoryStream;
using chatrelay::testkit::bytes;
using chatrelay::testkit::text;

TEST(Framing, BigEndianLength) {
    uint8_t b[4];
    put_be32(b, 0x01020304u);
    EXPECT_EQ(b[0], 1);
    EXPECT_EQ(b[3], 4);
    EXPECT_EQ(get_be32(b), 0x01020304u);
    put_be32(b, 0xFFFFFFFFu);
    EXPECT_EQ(get_be32(b), 0xFFFFFFFFu);
}

TEST(Framing, WriteFramePrefixesPayload) {
    MemoryStream s;
    std::error_code ec;
    write_frame(s, bytes("hello"), ec);
    ASSERT_FALSE(ec);
    std::vector<uint8_t> expect = {0, 0, 0, 5, 'h', 'e', 'l', 'l', 'o'};
    EXPECT_EQ(s.written(), expect);
    EXPECT_EQ(make_frame(bytes("hello")), expect);
}

TEST(Framing, WriteFailureIsReported) {
    MemoryStream s;
    s.fail_writes(asio::error::broken_pipe);
    std::error_code ec;
    write_frame(s, bytes("x"), ec);
    EXPECT_EQ(ec, asio::error::broken_pipe);
}

TEST(Framing, ReadsConsecutiveFramesAcrossShortReads) {
    auto in = make_frame(bytes("first"));
    auto second = make_frame(bytes("second frame"));
    in.insert(in.end(), second.begin(), second.end());
    MemoryStream s(in);
    s.set_chunk(3);

    std::vector<uint8_t> payload;
    std::error_code ec;
    ASSERT_TRUE(read_frame(s, payload, ec));
    EXPECT_EQ(text(payload), "first");
    ASSERT_TRUE(read_frame(s, payload, ec));
    EXPECT_EQ(text(payload), "second frame");

    EXPECT_FALSE(read_frame(s, payload, ec));
    EXPECT_FALSE(ec) << ec.message();
}

TEST(Framing, CleanEofBeforeFrameIsNotAnError) {
    MemoryStream s;
    std::vector<uint8_t> payload;
    std::error_code ec;
    EXPECT_FALSE(read_frame(s, payload, ec));
    EXPECT_FALSE(ec);
}

TEST(Framing, EofInsideLengthPrefixIsTruncation) {
    MemoryStream s({0, 0});
    std::vector<uint8_t> payload;
    std::error_code ec;
    EXPECT_FALSE(read_frame(s, payload, ec));
    EXPECT_EQ(ec, errc::truncated_frame);
}

TEST(Framing, EofInsidePayloadIsTruncation) {
    MemoryStream s({0, 0, 0, 10, 'a', 'b', 'c'});
    std::vector<uint8_t> payload;
    std::error_code ec;
    EXPECT_FALSE(read_frame(s, payload, ec));
    EXPECT_EQ(ec, errc::truncated_frame);
}

TEST(Framing, OversizeLengthRejectedBeforeReadingPayload) {
    MemoryStream s({0, 0, 1, 0, 'x', 'x'});
    std::vector<uint8_t> payload;
    std::error_code ec;
    EXPECT_FALSE(read_frame(s, payload, ec, 255));
    EXPECT_EQ(ec, errc::frame_too_large);
    EXPECT_EQ(s.consumed(), kFrameHeaderSize);
}

TEST(Framing, EmptyFrameReadsButDoesNotDecode) {
    MemoryStream s({0, 0, 0, 0});
    ClientMessage msg;
    std::error_code ec;
    EXPECT_FALSE(read_message(s, msg, ec));
    EXPECT_EQ(ec, errc::decode_failed);
}

TEST(Framing, TypedMessagesOverTheStream) {
    MemoryStream out;
    std::error_code ec;
    write_message(out, Register{"alice"}, ec);
    ASSERT_FALSE(ec);
    write_message(out, ListUsers{}, ec);
    ASSERT_FALSE(ec);

    MemoryStream in(out.written());
    ClientMessage msg;
    ASSERT_TRUE(read_message(in, msg, ec));
    EXPECT_EQ(std::get<Register>(msg).handle, "alice");
    ASSERT_TRUE(read_message(in, msg, ec));
    EXPECT_TRUE(std::holds_alternative<ListUsers>(msg));
    EXPECT_FALSE(read_message(in, msg, ec));
    EXPECT_FALSE(ec);
}

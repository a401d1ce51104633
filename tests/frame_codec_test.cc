/**
 * @file frame_codec_test.cc
 * @brief Unit tests for the length-prefixed JSON frame codec
 *
 * Covers the in-memory encoder/decoder and the coroutine ReadFrame over a
 * real stream, including frames that arrive one byte at a time.
 */

#include "test_util.h"
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <core/protocol/frame_codec.h>
#include <gtest/gtest.h>
#include <string>
#include <thread>

using namespace filerelay::core;
using filerelay::test::IoContextRunner;
using json = nlohmann::json;
namespace net = boost::asio;

namespace {

std::vector<std::uint8_t> Bytes(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::vector<std::uint8_t> RawFrame(const std::string& body) {
    auto prefix = EncodeLengthPrefix(body.size());
    std::vector<std::uint8_t> frame(prefix.begin(), prefix.end());
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

} // namespace

//=============================================================================
// Encoding
//=============================================================================

/**
 * @test Length prefix is eight bytes, big-endian
 */
TEST(FrameCodecTest, LengthPrefixIsBigEndian) {
    auto prefix = EncodeLengthPrefix(0x0102030405060708ULL);
    LengthPrefix expected{0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    EXPECT_EQ(prefix, expected);
    EXPECT_EQ(DecodeLengthPrefix(prefix), 0x0102030405060708ULL);
}

/**
 * @test Encoded frame is prefix plus compact UTF-8 JSON
 */
TEST(FrameCodecTest, EncodeFrameWritesPrefixAndBody) {
    Frame frame = EncodeFrame(json{{"filename", "report.txt"}, {"filesize", 10}});
    std::string body(frame.begin() + 8, frame.end());

    EXPECT_EQ(body, R"({"filename":"report.txt","filesize":10})");
    EXPECT_EQ(DecodeLengthPrefix(std::span<const std::uint8_t, 8>(frame.data(), 8)), body.size());
}

/**
 * @test Non-ASCII filenames survive encoding
 */
TEST(FrameCodecTest, EncodeDecodeKeepsUnicode) {
    json message{{"filename", "résumé 報告.pdf"}, {"filesize", 3}};
    auto decoded = DecodeFrame(EncodeFrame(message));

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ((*decoded)["filename"], "résumé 報告.pdf");
}

//=============================================================================
// In-memory decoding
//=============================================================================

TEST(FrameCodecTest, DecodeRejectsTruncatedPrefix) {
    std::vector<std::uint8_t> bytes{0x00, 0x00, 0x00};
    auto decoded = DecodeFrame(bytes);

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, ErrorKind::kFraming);
}

TEST(FrameCodecTest, DecodeRejectsTruncatedBody) {
    auto frame = RawFrame(R"({"status":"OK"})");
    frame.pop_back();
    auto decoded = DecodeFrame(frame);

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, ErrorKind::kFraming);
}

TEST(FrameCodecTest, DecodeRejectsTrailingBytes) {
    auto frame = RawFrame(R"({"status":"OK"})");
    frame.push_back('x');
    auto decoded = DecodeFrame(frame);

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, ErrorKind::kFraming);
}

TEST(FrameCodecTest, DecodeRejectsOversizedLength) {
    auto prefix = EncodeLengthPrefix(transfer::kMaxFrameBodySize + 1);
    std::vector<std::uint8_t> bytes(prefix.begin(), prefix.end());
    auto decoded = DecodeFrame(bytes);

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, ErrorKind::kFraming);
}

TEST(FrameCodecTest, DecodeRejectsInvalidJson) {
    auto decoded = DecodeFrameBody(Bytes("{not json"));

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, ErrorKind::kFraming);
}

/**
 * @test Valid JSON that is not an object is still a framing error
 */
TEST(FrameCodecTest, DecodeRejectsNonObjectJson) {
    for (const char* body : {"[1,2,3]", "\"text\"", "42", "null"}) {
        auto decoded = DecodeFrameBody(Bytes(body));
        ASSERT_FALSE(decoded.has_value()) << body;
        EXPECT_EQ(decoded.error().kind, ErrorKind::kFraming) << body;
    }
}

TEST(FrameCodecTest, DecodeRejectsEmptyBody) {
    auto decoded = DecodeFrame(RawFrame(""));

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, ErrorKind::kFraming);
}

//=============================================================================
// Stream decoding
//=============================================================================

/**
 * @test Fixture with a connected local socket pair
 */
class FrameStreamTest : public ::testing::Test {
protected:
    IoContextRunner runner_{1};
    net::local::stream_protocol::socket reader_{runner_.io_context()};
    net::local::stream_protocol::socket writer_{runner_.io_context()};

    void SetUp() override { net::local::connect_pair(reader_, writer_); }

    void TearDown() override {
        boost::system::error_code ec;
        reader_.close(ec);
        writer_.close(ec);
        runner_.Stop();
    }
};

/**
 * @test A frame delivered one byte per write decodes the same as a whole one
 */
TEST_F(FrameStreamTest, ReadFrameReassemblesSingleByteWrites) {
    Frame frame = EncodeFrame(json{{"status", "OK"}, {"save_as", "a.txt"}, {"message", "Ready"}});

    std::thread slow_writer([this, &frame]() {
        for (std::uint8_t byte : frame) {
            net::write(writer_, net::buffer(&byte, 1));
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    auto message = runner_.Run(ReadFrame(reader_));
    slow_writer.join();

    ASSERT_TRUE(message.has_value()) << message.error().message;
    EXPECT_EQ((*message)["save_as"], "a.txt");
}

TEST_F(FrameStreamTest, ReadFrameReadsBackToBackFrames) {
    Frame first = EncodeFrame(json{{"n", 1}});
    Frame second = EncodeFrame(json{{"n", 2}});
    first.insert(first.end(), second.begin(), second.end());
    net::write(writer_, net::buffer(first));

    auto one = runner_.Run(ReadFrame(reader_));
    auto two = runner_.Run(ReadFrame(reader_));

    ASSERT_TRUE(one.has_value());
    ASSERT_TRUE(two.has_value());
    EXPECT_EQ((*one)["n"], 1);
    EXPECT_EQ((*two)["n"], 2);
}

/**
 * @test Peer closing halfway through the body is a framing error
 */
TEST_F(FrameStreamTest, ReadFrameFailsOnEarlyClose) {
    Frame frame = EncodeFrame(json{{"filename", "a.txt"}, {"filesize", 1}});
    net::write(writer_, net::buffer(frame.data(), frame.size() / 2));
    writer_.close();

    auto message = runner_.Run(ReadFrame(reader_));

    ASSERT_FALSE(message.has_value());
    EXPECT_EQ(message.error().kind, ErrorKind::kFraming);
}

TEST_F(FrameStreamTest, ReadFrameRejectsOversizedPrefixWithoutReadingBody) {
    auto prefix = EncodeLengthPrefix(1024);
    net::write(writer_, net::buffer(prefix));

    auto message = runner_.Run(ReadFrame(reader_, 512));

    ASSERT_FALSE(message.has_value());
    EXPECT_EQ(message.error().kind, ErrorKind::kFraming);
}

TEST_F(FrameStreamTest, WriteFrameThenReadFrame) {
    auto written = runner_.Run(WriteFrame(writer_, json{{"status", "DONE"}}));
    ASSERT_TRUE(written.has_value());

    auto message = runner_.Run(ReadFrame(reader_));
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ((*message)["status"], "DONE");
}

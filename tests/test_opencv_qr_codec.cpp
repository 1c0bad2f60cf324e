#include <gtest/gtest.h>

#include <random>

#include "errors.hpp"
#include "frame_codec.hpp"
#include "opencv_qr_codec.hpp"

TEST(QrCapacity, MatchesTheStandardTable) {
    EXPECT_EQ(qr_byte_capacity(1, ErrorCorrection::L), 17);
    EXPECT_EQ(qr_byte_capacity(1, ErrorCorrection::H), 7);
    EXPECT_EQ(qr_byte_capacity(10, ErrorCorrection::L), 271);
    EXPECT_EQ(qr_byte_capacity(25, ErrorCorrection::L), 1273);
    EXPECT_EQ(qr_byte_capacity(40, ErrorCorrection::L), 2953);
    EXPECT_EQ(qr_byte_capacity(40, ErrorCorrection::H), 1273);
    EXPECT_THROW(qr_byte_capacity(0, ErrorCorrection::L), InvalidConfiguration);
    EXPECT_THROW(qr_byte_capacity(41, ErrorCorrection::L), InvalidConfiguration);
}

TEST(QrCapacity, MinimumImageIncludesQuietZone) {
    OpenCvQrCodec codec;
    EXPECT_EQ(codec.min_image_size(1), 29);
    EXPECT_EQ(codec.min_image_size(25), 125);
    EXPECT_EQ(codec.capacity(25, ErrorCorrection::L), 1273);
}

TEST(OpenCvQrCodec, SymbolHasVersionModulesAndQuietZone) {
    OpenCvQrCodec codec;
    std::string text = "hello";
    cv::Mat symbol = codec.encode(std::vector<uint8_t>(text.begin(), text.end()), 5, ErrorCorrection::M);
    EXPECT_EQ(symbol.cols, 37 + 2 * kQuietZoneModules);
    EXPECT_EQ(symbol.rows, 37 + 2 * kQuietZoneModules);
    EXPECT_EQ(symbol.type(), CV_8UC1);
    EXPECT_EQ(symbol.at<uint8_t>(0, 0), 255);
    // finder pattern corner
    EXPECT_EQ(symbol.at<uint8_t>(kQuietZoneModules, kQuietZoneModules), 0);
}

TEST(OpenCvQrCodec, OverfullSymbolOverflows) {
    OpenCvQrCodec codec;
    EXPECT_THROW(codec.encode(std::vector<uint8_t>(272, 'x'), 10, ErrorCorrection::L), EncodeOverflow);
}

TEST(OpenCvQrCodec, FrameRoundTripsThroughARealSymbol) {
    OpenCvQrCodec codec;
    FrameParams params;
    params.image_size = 400;
    params.qr_version = 10;
    params.level = ErrorCorrection::M;
    FrameEncoder encoder(codec, params);
    FrameDecoder decoder(codec);

    Segment seg;
    seg.index = 2;
    seg.count = 3;
    seg.stream_crc = 0x01020304;
    std::string text = "The quick brown fox jumps over the lazy dog. 0123456789";
    seg.data.assign(text.begin(), text.end());

    cv::Mat image = encoder.encode(seg);
    ASSERT_EQ(image.cols, 400);

    DecodeResult r = decoder.decode(image);
    ASSERT_TRUE(r.ok()) << to_string(r.error) << ": " << r.detail;
    EXPECT_EQ(r.segment.index, 2u);
    EXPECT_EQ(r.segment.count, 3u);
    EXPECT_EQ(r.segment.data, seg.data);
}

TEST(OpenCvQrCodec, FullSizeBinaryFrameRoundTripsAtDefaults) {
    OpenCvQrCodec codec;
    FrameParams params;
    FrameEncoder encoder(codec, params);
    FrameDecoder decoder(codec);
    ASSERT_EQ(encoder.max_segment_bytes(), 1273u - kFrameHeaderSize);

    std::mt19937 rng(61);
    std::uniform_int_distribution<int> dist(0, 255);
    Segment seg;
    seg.index = 7;
    seg.count = 9;
    seg.stream_crc = 0x9E3779B9;
    seg.data.resize(encoder.max_segment_bytes());
    for (auto& b : seg.data) b = static_cast<uint8_t>(dist(rng));

    cv::Mat image = encoder.encode(seg);
    ASSERT_EQ(image.cols, params.image_size);
    ASSERT_EQ(image.rows, params.image_size);

    DecodeResult r = decoder.decode(image);
    ASSERT_TRUE(r.ok()) << to_string(r.error) << ": " << r.detail;
    EXPECT_EQ(r.segment.index, 7u);
    EXPECT_EQ(r.segment.count, 9u);
    EXPECT_EQ(r.segment.stream_crc, 0x9E3779B9u);
    EXPECT_EQ(r.segment.data, seg.data);
}

TEST(OpenCvQrCodec, BlankImageIsUnreadable) {
    OpenCvQrCodec codec;
    cv::Mat blank(300, 300, CV_8UC3, cv::Scalar::all(255));
    EXPECT_EQ(codec.decode(blank).error, DecodeError::Unreadable);
    EXPECT_EQ(codec.decode(cv::Mat()).error, DecodeError::Unreadable);
}

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

#include "fakes.hpp"
#include "frame_codec.hpp"
#include "packet_parser.hpp"
#include "receiver.hpp"
#include "transmitter.hpp"

namespace fs = std::filesystem;

namespace {

std::vector<CapturedFrame> encode_all(QrCodec& codec, const std::vector<Segment>& segments) {
    FrameEncoder encoder(codec, FrameParams{});
    std::vector<CapturedFrame> frames;
    for (const auto& s : segments)
        frames.push_back({encoder.encode(s), "frame " + std::to_string(s.index)});
    return frames;
}

CapturedFrame garbage_frame() {
    return {cv::Mat(450, 450, CV_8UC3, cv::Scalar::all(128)), "garbage"};
}

ReceiveConfig quick_config() {
    ReceiveConfig config;
    config.source = "test";
    config.workers = 3;
    return config;
}

} // namespace

TEST(Receiver, ReassemblesShuffledFramesAmongGarbageAndRepeats) {
    FakeQrCodec codec;
    RecordingSink sink;
    std::atomic<bool> cancel{false};

    auto payload = random_bytes(5000, 51);
    auto frames = encode_all(codec, slice_payload(payload, 1000, false));
    frames.push_back(frames[2]);
    frames.push_back(frames[0]);
    frames.push_back(garbage_frame());
    std::shuffle(frames.begin(), frames.end(), std::mt19937(51));

    VectorFrameSource source(frames);
    Receiver rx(quick_config(), codec, sink);
    ReceiveSummary summary = rx.run(source, cancel);

    ASSERT_TRUE(summary.success) << summary.failure_kind << ": " << summary.failure_detail;
    EXPECT_EQ(summary.state, ReassemblyState::Complete);
    EXPECT_EQ(summary.payload, payload);
    EXPECT_EQ(summary.expected, 5u);
    EXPECT_EQ(summary.received, 5u);
    EXPECT_TRUE(summary.missing.empty());
}

TEST(Receiver, ReportsEachNewSegment) {
    FakeQrCodec codec;
    RecordingSink sink;
    std::atomic<bool> cancel{false};

    auto frames = encode_all(codec, slice_payload(random_bytes(300, 52), 100, false));
    VectorFrameSource source(frames);
    ReceiveConfig config = quick_config();
    config.workers = 1;
    Receiver rx(config, codec, sink);
    ReceiveSummary summary = rx.run(source, cancel);

    ASSERT_TRUE(summary.success);
    ASSERT_EQ(sink.events.size(), 3u);
    EXPECT_EQ(sink.verbs[0], "Received");
    EXPECT_EQ(sink.events[2].number, 3u);
    EXPECT_EQ(sink.events[2].count, 3u);
    EXPECT_EQ(sink.events[2].bytes_done, 300u);
}

TEST(Receiver, GarbageFramesAreCountedAndSkipped) {
    FakeQrCodec codec;
    RecordingSink sink;
    std::atomic<bool> cancel{false};

    std::string text = "https://example.com";
    cv::Mat foreign = fit_symbol(codec.encode(std::vector<uint8_t>(text.begin(), text.end()), 25,
                                              ErrorCorrection::L), 450);

    auto frames = encode_all(codec, slice_payload(random_bytes(200, 53), 100, false));
    frames.insert(frames.begin(), CapturedFrame{foreign, "foreign"});
    frames.insert(frames.begin(), garbage_frame());

    VectorFrameSource source(frames);
    ReceiveConfig config = quick_config();
    config.workers = 1;
    Receiver rx(config, codec, sink);
    ReceiveSummary summary = rx.run(source, cancel);

    ASSERT_TRUE(summary.success);
    EXPECT_EQ(summary.unreadable, 1u);
    EXPECT_EQ(summary.malformed, 1u);
    EXPECT_TRUE(sink.saw(sink.warnings, "Unreadable"));
    EXPECT_TRUE(sink.saw(sink.warnings, "Malformed"));
}

TEST(Receiver, MissingFrameLeavesTransferIncomplete) {
    FakeQrCodec codec;
    RecordingSink sink;
    std::atomic<bool> cancel{false};

    auto frames = encode_all(codec, slice_payload(random_bytes(500, 54), 100, false));
    frames.erase(frames.begin() + 1);

    VectorFrameSource source(frames);
    Receiver rx(quick_config(), codec, sink);
    ReceiveSummary summary = rx.run(source, cancel);

    EXPECT_FALSE(summary.success);
    EXPECT_EQ(summary.failure_kind, "Incomplete");
    EXPECT_EQ(summary.state, ReassemblyState::Abandoned);
    EXPECT_EQ(summary.expected, 5u);
    EXPECT_EQ(summary.received, 4u);
    EXPECT_EQ(summary.missing, std::vector<uint32_t>{2});
    EXPECT_TRUE(summary.payload.empty());

    report_summary(summary, sink);
    EXPECT_TRUE(sink.saw(sink.errors, "Recovered 4/5 segments"));
    EXPECT_TRUE(sink.saw(sink.errors, "missing 2"));
}

TEST(Receiver, MixedTransfersAreInconsistent) {
    FakeQrCodec codec;
    RecordingSink sink;
    std::atomic<bool> cancel{false};

    auto a = encode_all(codec, slice_payload(random_bytes(300, 55), 100, false));
    auto b = encode_all(codec, slice_payload(random_bytes(500, 56), 100, false));
    std::vector<CapturedFrame> frames = {a[0], b[1], a[1], a[2]};

    VectorFrameSource source(frames);
    ReceiveConfig config = quick_config();
    config.workers = 1;
    Receiver rx(config, codec, sink);
    ReceiveSummary summary = rx.run(source, cancel);

    EXPECT_FALSE(summary.success);
    EXPECT_EQ(summary.failure_kind, "InconsistentCount");
    EXPECT_EQ(summary.state, ReassemblyState::Abandoned);
}

TEST(Receiver, BrokenCompressedStreamIsCorruptPayload) {
    FakeQrCodec codec;
    RecordingSink sink;
    std::atomic<bool> cancel{false};

    auto frames = encode_all(codec, slice_payload(std::vector<uint8_t>(300, 0x07), 100, true));
    VectorFrameSource source(frames);
    Receiver rx(quick_config(), codec, sink);
    ReceiveSummary summary = rx.run(source, cancel);

    EXPECT_FALSE(summary.success);
    EXPECT_EQ(summary.failure_kind, "CorruptPayload");
    EXPECT_EQ(summary.state, ReassemblyState::Complete);
}

TEST(Receiver, StallTimeoutGivesUp) {
    FakeQrCodec codec;
    RecordingSink sink;
    std::atomic<bool> cancel{false};

    auto frames = encode_all(codec, slice_payload(random_bytes(300, 57), 100, false));
    frames.pop_back();

    VectorFrameSource source(frames, true);
    ReceiveConfig config = quick_config();
    config.timeout = 0.3;
    Receiver rx(config, codec, sink);
    ReceiveSummary summary = rx.run(source, cancel);

    EXPECT_FALSE(summary.success);
    EXPECT_EQ(summary.failure_kind, "Incomplete");
    EXPECT_NE(summary.failure_detail.find("no new segment"), std::string::npos);
    EXPECT_EQ(summary.received, 2u);
}

TEST(Receiver, CancelStopsALiveSource) {
    FakeQrCodec codec;
    RecordingSink sink;
    std::atomic<bool> cancel{true};

    VectorFrameSource source(std::vector<CapturedFrame>{}, true);
    Receiver rx(quick_config(), codec, sink);
    ReceiveSummary summary = rx.run(source, cancel);

    EXPECT_FALSE(summary.success);
    EXPECT_EQ(summary.failure_detail, "cancelled");
    EXPECT_EQ(summary.expected, 0u);
}

TEST(Receiver, FrameAnnouncingAHugeCountIsSkipped) {
    FakeQrCodec codec;
    RecordingSink sink;
    std::atomic<bool> cancel{false};

    Segment bogus;
    bogus.index = 1;
    bogus.count = 0xFFFFFFFF;
    bogus.data = {1, 2, 3};
    cv::Mat bogus_image = fit_symbol(codec.encode(serialize_packet(bogus), 25, ErrorCorrection::L), 450);

    auto payload = random_bytes(300, 58);
    auto frames = encode_all(codec, slice_payload(payload, 100, false));
    frames.insert(frames.begin(), CapturedFrame{bogus_image, "bogus"});

    VectorFrameSource source(frames);
    ReceiveConfig config = quick_config();
    config.workers = 1;
    Receiver rx(config, codec, sink);
    ReceiveSummary summary = rx.run(source, cancel);

    ASSERT_TRUE(summary.success) << summary.failure_kind << ": " << summary.failure_detail;
    EXPECT_EQ(summary.malformed, 1u);
    EXPECT_EQ(summary.payload, payload);
}

TEST(Receiver, Latin1TranscodingDecoderStillCompletes) {
    FakeQrCodec codec;
    codec.latin1_transcode = true;
    RecordingSink sink;
    std::atomic<bool> cancel{false};

    auto payload = random_bytes(4000, 59);
    auto frames = encode_all(codec, slice_payload(payload, 1000, false));
    VectorFrameSource source(frames);
    Receiver rx(quick_config(), codec, sink);
    ReceiveSummary summary = rx.run(source, cancel);

    ASSERT_TRUE(summary.success) << summary.failure_kind << ": " << summary.failure_detail;
    EXPECT_EQ(summary.malformed, 0u);
    EXPECT_EQ(summary.payload, payload);
}

TEST(Receiver, TransmitterOutputRoundTrips) {
    const size_t sizes[] = {0, 1, 1024, 2500, 7000};
    for (size_t n : sizes) {
        for (bool zlib : {false, true}) {
            FakeQrCodec codec;
            RecordingSink sink;
            FakeAssembler assembler;
            std::atomic<bool> cancel{false};

            TransmitConfig tx_config;
            tx_config.outfile = "out.gif";
            tx_config.segment_bytes = 700;
            tx_config.zlib = zlib;
            auto payload = random_bytes(n, static_cast<uint32_t>(n));
            Transmitter tx(tx_config, codec, sink, &assembler, nullptr);
            tx.run(payload, cancel);

            auto frames = assembler.images;
            std::reverse(frames.begin(), frames.end());
            VectorFrameSource source(frames);
            Receiver rx(quick_config(), codec, sink);
            ReceiveSummary summary = rx.run(source, cancel);

            ASSERT_TRUE(summary.success) << "size " << n << " zlib " << zlib << ": "
                                         << summary.failure_detail;
            EXPECT_EQ(summary.payload, payload);
        }
    }
}

TEST(Receiver, WritesPayloadToFile) {
    TempFrameDir dir;
    std::string path = (fs::path(dir.path()) / "received.bin").string();
    std::vector<uint8_t> payload = {0, 1, 2, 255};
    write_payload(path, payload);

    std::ifstream in(path, std::ios::binary);
    std::vector<uint8_t> back((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(back, payload);
}

#pragma once

#include <opencv2/core.hpp>

#include <cstddef>

#include "packet_parser.hpp"
#include "qr_codec.hpp"
#include "slicer.hpp"

struct FrameParams {
    int image_size = 450;  // pixels per side
    int qr_version = 25;
    ErrorCorrection level = ErrorCorrection::L;
};

// Segment -> framed bytes -> QR symbol -> square image of image_size pixels.
class FrameEncoder {
public:
    // Throws InvalidConfiguration if the image size is below the codec
    // minimum for the version, or the version itself is invalid.
    FrameEncoder(QrCodec& codec, const FrameParams& params);

    // Largest segment payload that still fits one frame.
    std::size_t max_segment_bytes() const;

    // Throws EncodeOverflow when the segment is larger than max_segment_bytes().
    cv::Mat encode(const Segment& segment);

    const FrameParams& params() const { return params_; }

private:
    QrCodec& codec_;
    FrameParams params_;
};

// Captured image -> Segment. Never throws for bad images. Accepts frames
// whose bytes came back Latin-1 transcoded, see undo_latin1_transcoding.
class FrameDecoder {
public:
    explicit FrameDecoder(QrCodec& codec) : codec_(codec) {}

    DecodeResult decode(const cv::Mat& image);

private:
    QrCodec& codec_;
};

// Scale a one-pixel-per-module symbol by the largest whole factor that fits
// image_size, then pad it with white to exactly image_size x image_size.
cv::Mat fit_symbol(const cv::Mat& symbol, int image_size);

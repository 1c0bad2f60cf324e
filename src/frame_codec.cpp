#include "frame_codec.hpp"
#include "errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <string>
#include <vector>

cv::Mat fit_symbol(const cv::Mat& symbol, int image_size) {
    if (symbol.cols > image_size || symbol.rows > image_size)
        throw InvalidConfiguration("image size " + std::to_string(image_size) +
                                   " px is smaller than the " + std::to_string(symbol.cols) +
                                   " module QR symbol");

    int scale = std::min(image_size / symbol.cols, image_size / symbol.rows);
    cv::Mat scaled;
    cv::resize(symbol, scaled, cv::Size(symbol.cols * scale, symbol.rows * scale), 0, 0,
               cv::INTER_NEAREST);

    int pad_x = image_size - scaled.cols;
    int pad_y = image_size - scaled.rows;
    cv::Mat fitted;
    cv::copyMakeBorder(scaled, fitted, pad_y / 2, pad_y - pad_y / 2, pad_x / 2, pad_x - pad_x / 2,
                       cv::BORDER_CONSTANT, cv::Scalar::all(255));
    return fitted;
}

FrameEncoder::FrameEncoder(QrCodec& codec, const FrameParams& params)
    : codec_(codec), params_(params) {
    int minimum = codec_.min_image_size(params_.qr_version);
    if (params_.image_size < minimum)
        throw InvalidConfiguration("image size " + std::to_string(params_.image_size) +
                                   " px is below the " + std::to_string(minimum) +
                                   " px minimum of a version " +
                                   std::to_string(params_.qr_version) + " QR code");
}

std::size_t FrameEncoder::max_segment_bytes() const {
    int capacity = codec_.capacity(params_.qr_version, params_.level);
    if (capacity <= static_cast<int>(kFrameHeaderSize)) return 0;
    return static_cast<std::size_t>(capacity) - kFrameHeaderSize;
}

cv::Mat FrameEncoder::encode(const Segment& segment) {
    std::size_t limit = max_segment_bytes();
    if (segment.data.size() > limit)
        throw EncodeOverflow("segment " + std::to_string(segment.index) + " holds " +
                             std::to_string(segment.data.size()) + " bytes, a version " +
                             std::to_string(params_.qr_version) + "-" + to_char(params_.level) +
                             " frame carries at most " + std::to_string(limit));

    cv::Mat symbol = codec_.encode(serialize_packet(segment), params_.qr_version, params_.level);
    return fit_symbol(symbol, params_.image_size);
}

DecodeResult FrameDecoder::decode(const cv::Mat& image) {
    QrDecodeResult qr = codec_.decode(image);
    if (qr.error != DecodeError::None) {
        DecodeResult result;
        result.error = qr.error;
        result.detail = qr.detail;
        return result;
    }
    DecodeResult result = parse_packet(qr.bytes.data(), qr.bytes.size());
    if (result.ok())
        return result;

    // The frame CRC tells which reading is the one that was sent.
    std::vector<uint8_t> raw;
    if (undo_latin1_transcoding(qr.bytes, raw)) {
        DecodeResult retry = parse_packet(raw.data(), raw.size());
        if (retry.ok())
            return retry;
    }
    return result;
}

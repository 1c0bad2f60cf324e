#include "opencv_qr_codec.hpp"
#include "errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace {

cv::QRCodeEncoder::CorrectionLevel to_opencv(ErrorCorrection level) {
    switch (level) {
        case ErrorCorrection::L: return cv::QRCodeEncoder::CORRECT_LEVEL_L;
        case ErrorCorrection::M: return cv::QRCodeEncoder::CORRECT_LEVEL_M;
        case ErrorCorrection::Q: return cv::QRCodeEncoder::CORRECT_LEVEL_Q;
        case ErrorCorrection::H: return cv::QRCodeEncoder::CORRECT_LEVEL_H;
    }
    return cv::QRCodeEncoder::CORRECT_LEVEL_L;
}

// Crop whatever margin the encoder drew, leaving the bare symbol.
cv::Mat strip_margin(const cv::Mat& symbol) {
    cv::Mat dark;
    cv::threshold(symbol, dark, 127, 255, cv::THRESH_BINARY_INV);
    std::vector<cv::Point> points;
    cv::findNonZero(dark, points);
    if (points.empty())
        throw std::runtime_error("QR encoder produced a blank image");
    return symbol(cv::boundingRect(points)).clone();
}

} // namespace

int OpenCvQrCodec::capacity(int version, ErrorCorrection level) const {
    return qr_byte_capacity(version, level);
}

int OpenCvQrCodec::min_image_size(int version) const {
    return qr_modules_with_quiet_zone(version);
}

cv::Mat OpenCvQrCodec::encode(const std::vector<uint8_t>& bytes, int version,
                              ErrorCorrection level) {
    int limit = capacity(version, level);
    if (bytes.size() > static_cast<size_t>(limit))
        throw EncodeOverflow(std::to_string(bytes.size()) + " bytes do not fit a version " +
                             std::to_string(version) + "-" + to_char(level) +
                             " QR code (max " + std::to_string(limit) + ")");

    cv::QRCodeEncoder::Params params;
    params.version = version;
    params.correction_level = to_opencv(level);
    params.mode = cv::QRCodeEncoder::MODE_BYTE;

    cv::Mat raw;
    try {
        cv::Ptr<cv::QRCodeEncoder> encoder = cv::QRCodeEncoder::create(params);
        encoder->encode(std::string(bytes.begin(), bytes.end()), raw);
    } catch (const cv::Exception& e) {
        throw std::runtime_error(std::string("OpenCV QR encoder failed: ") + e.what());
    }
    if (raw.empty())
        throw std::runtime_error("OpenCV QR encoder returned an empty image");

    if (raw.channels() != 1)
        cv::cvtColor(raw, raw, cv::COLOR_BGR2GRAY);

    cv::Mat symbol = strip_margin(raw);
    int expected = 17 + 4 * version;
    if (symbol.cols != expected || symbol.rows != expected)
        throw EncodeOverflow("QR encoder produced a " + std::to_string(symbol.cols) +
                             " module symbol, expected version " + std::to_string(version) +
                             " (" + std::to_string(expected) + " modules)");

    cv::Mat framed;
    cv::copyMakeBorder(symbol, framed, kQuietZoneModules, kQuietZoneModules,
                       kQuietZoneModules, kQuietZoneModules,
                       cv::BORDER_CONSTANT, cv::Scalar(255));
    return framed;
}

QrDecodeResult OpenCvQrCodec::decode(const cv::Mat& image) {
    QrDecodeResult result;
    if (image.empty()) {
        result.error = DecodeError::Unreadable;
        result.detail = "empty image";
        return result;
    }

    // QRCodeDetector keeps per-call state, one instance per call keeps this reentrant.
    cv::QRCodeDetector detector;
    std::string text;
    try {
        text = detector.detectAndDecode(image);
        if (text.empty()) {
            // Captures cropped tight to the symbol lose the quiet zone.
            cv::Mat padded;
            int pad = std::max(8, std::min(image.cols, image.rows) / 10);
            cv::copyMakeBorder(image, padded, pad, pad, pad, pad,
                               cv::BORDER_CONSTANT, cv::Scalar::all(255));
            text = detector.detectAndDecode(padded);
        }
    } catch (const cv::Exception& e) {
        result.error = DecodeError::Unreadable;
        result.detail = std::string("OpenCV QR detector failed: ") + e.what();
        return result;
    }

    if (text.empty()) {
        result.error = DecodeError::Unreadable;
        result.detail = "no QR code found";
        return result;
    }

    result.bytes.assign(text.begin(), text.end());
    return result;
}

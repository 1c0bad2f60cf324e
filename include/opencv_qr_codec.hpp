#pragma once

#include "qr_codec.hpp"

// QrCodec backed by OpenCV objdetect (QRCodeEncoder / QRCodeDetector).
class OpenCvQrCodec : public QrCodec {
public:
    int capacity(int version, ErrorCorrection level) const override;
    int min_image_size(int version) const override;

    cv::Mat encode(const std::vector<uint8_t>& bytes, int version,
                   ErrorCorrection level) override;
    QrDecodeResult decode(const cv::Mat& image) override;
};

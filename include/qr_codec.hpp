#ifndef QRCOMM_QR_CODEC_HPP
#define QRCOMM_QR_CODEC_HPP

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "packet_parser.hpp"

enum class ErrorCorrection { L, M, Q, H };

// 'L', 'm', ... -> level. Throws InvalidConfiguration on anything else.
ErrorCorrection parse_error_correction(const std::string& text);
char to_char(ErrorCorrection level);

constexpr int kMinQrVersion = 1;
constexpr int kMaxQrVersion = 40;
constexpr int kQuietZoneModules = 4;

// Byte-mode capacity of one symbol (ISO/IEC 18004 table).
int qr_byte_capacity(int version, ErrorCorrection level);

// Modules per side including the quiet zone on both sides.
int qr_modules_with_quiet_zone(int version);

// Some QR decoders return byte-mode data that is not valid UTF-8 as its
// Latin-1 reading re-encoded in UTF-8. Maps such text back to the original
// bytes. False when `text` holds no two-byte Latin-1 sequence or anything
// outside U+0000..U+00FF.
bool undo_latin1_transcoding(const std::vector<uint8_t>& text, std::vector<uint8_t>& out);

struct QrDecodeResult {
    DecodeError error = DecodeError::None;
    std::vector<uint8_t> bytes;
    std::string detail;
};

// Capability interface over the external QR library.
class QrCodec {
public:
    virtual ~QrCodec() = default;

    // Raw bytes one symbol can hold.
    virtual int capacity(int version, ErrorCorrection level) const = 0;

    // Smallest square image (pixels) a symbol of this version can be drawn at.
    virtual int min_image_size(int version) const = 0;

    // Single channel image, one pixel per module, quiet zone included.
    // Throws EncodeOverflow when the bytes do not fit.
    virtual cv::Mat encode(const std::vector<uint8_t>& bytes, int version,
                           ErrorCorrection level) = 0;

    // Error is Unreadable when no symbol can be read. Must be safe to call
    // from several threads at once.
    virtual QrDecodeResult decode(const cv::Mat& image) = 0;
};

#endif // QRCOMM_QR_CODEC_HPP

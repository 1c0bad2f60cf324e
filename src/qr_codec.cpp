#include "qr_codec.hpp"
#include "errors.hpp"
#include <cctype>
#include <cstddef>
#include <utility>

namespace {

// Byte-mode capacity per version (index 0 = version 1), columns L M Q H.
constexpr int kByteCapacity[kMaxQrVersion][4] = {
    {17, 14, 11, 7},         {32, 26, 20, 14},        {53, 42, 32, 24},
    {78, 62, 46, 34},        {106, 84, 60, 44},       {134, 106, 74, 58},
    {154, 122, 86, 64},      {192, 152, 108, 84},     {230, 180, 130, 98},
    {271, 213, 151, 119},    {321, 251, 177, 137},    {367, 287, 203, 155},
    {425, 331, 241, 177},    {458, 362, 258, 194},    {520, 412, 292, 220},
    {586, 450, 322, 250},    {644, 504, 364, 280},    {718, 560, 394, 310},
    {792, 624, 442, 338},    {858, 666, 482, 382},    {929, 711, 509, 403},
    {1003, 779, 565, 439},   {1091, 857, 611, 461},   {1171, 911, 661, 511},
    {1273, 997, 715, 535},   {1367, 1059, 751, 593},  {1465, 1125, 805, 625},
    {1528, 1190, 868, 658},  {1628, 1264, 908, 698},  {1732, 1370, 982, 742},
    {1840, 1452, 1030, 790}, {1952, 1538, 1112, 842}, {2068, 1628, 1168, 898},
    {2188, 1722, 1228, 958}, {2303, 1809, 1283, 983}, {2431, 1911, 1351, 1051},
    {2563, 1989, 1423, 1093},{2699, 2099, 1499, 1139},{2809, 2213, 1579, 1219},
    {2953, 2331, 1663, 1273},
};

void check_version(int version) {
    if (version < kMinQrVersion || version > kMaxQrVersion)
        throw InvalidConfiguration("QR version " + std::to_string(version) +
                                   " outside " + std::to_string(kMinQrVersion) +
                                   ".." + std::to_string(kMaxQrVersion));
}

} // namespace

ErrorCorrection parse_error_correction(const std::string& text) {
    if (text.size() == 1) {
        switch (std::toupper(static_cast<unsigned char>(text[0]))) {
            case 'L': return ErrorCorrection::L;
            case 'M': return ErrorCorrection::M;
            case 'Q': return ErrorCorrection::Q;
            case 'H': return ErrorCorrection::H;
        }
    }
    throw InvalidConfiguration("unknown error correction level '" + text + "' (expected L, M, Q or H)");
}

char to_char(ErrorCorrection level) {
    switch (level) {
        case ErrorCorrection::L: return 'L';
        case ErrorCorrection::M: return 'M';
        case ErrorCorrection::Q: return 'Q';
        case ErrorCorrection::H: return 'H';
    }
    return '?';
}

bool undo_latin1_transcoding(const std::vector<uint8_t>& text, std::vector<uint8_t>& out) {
    std::vector<uint8_t> bytes;
    bytes.reserve(text.size());
    bool widened = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        uint8_t lead = text[i];
        if (lead < 0x80) {
            bytes.push_back(lead);
            continue;
        }
        // U+0080..U+00FF is C2 xx or C3 xx
        if ((lead != 0xC2 && lead != 0xC3) || i + 1 >= text.size() || (text[i + 1] & 0xC0) != 0x80)
            return false;
        bytes.push_back(static_cast<uint8_t>(((lead & 0x03) << 6) | (text[i + 1] & 0x3F)));
        widened = true;
        ++i;
    }

    if (!widened)
        return false;
    out = std::move(bytes);
    return true;
}

int qr_byte_capacity(int version, ErrorCorrection level) {
    check_version(version);
    return kByteCapacity[version - 1][static_cast<int>(level)];
}

int qr_modules_with_quiet_zone(int version) {
    check_version(version);
    return 17 + 4 * version + 2 * kQuietZoneModules;
}

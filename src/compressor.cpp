#include "compressor.hpp"
#include "errors.hpp"
#include "report_sink.hpp"
#include <cstdio>
#include <limits>
#include <string>
#include <zlib.h>

CompressionResult compress_payload(const std::vector<uint8_t>& payload, ReportSink& report) {
    uLongf bound = compressBound(static_cast<uLong>(payload.size()));
    std::vector<uint8_t> candidate(bound);

    int ret = compress2(candidate.data(), &bound,
                        payload.data(), static_cast<uLong>(payload.size()),
                        Z_BEST_COMPRESSION);
    if (ret != Z_OK)
        throw std::runtime_error("zlib compress2 failed with code " + std::to_string(ret));
    candidate.resize(bound);

    size_t before = payload.size();
    size_t after = candidate.size();
    double ratio = before ? 100.0 * after / before : 100.0;

    char line[128];
    std::snprintf(line, sizeof(line), "Compressing %zu -> %zu bytes [%.0f%%]", before, after, ratio);
    report.info(line);

    CompressionResult result;
    if (after >= before) {
        report.warning("Compressed payload larger than source; sending it uncompressed");
        result.data = payload;
        result.applied = false;
    } else {
        result.data = std::move(candidate);
        result.applied = true;
    }
    return result;
}

std::vector<uint8_t> decompress_payload(const std::vector<uint8_t>& stream) {
    if (stream.size() > std::numeric_limits<uInt>::max())
        throw CorruptPayload("compressed stream too large to inflate in one pass");

    z_stream zs{};
    if (inflateInit(&zs) != Z_OK)
        throw std::runtime_error("zlib inflateInit failed");

    zs.next_in = const_cast<Bytef*>(stream.data());
    zs.avail_in = static_cast<uInt>(stream.size());

    std::vector<uint8_t> out;
    uint8_t buffer[16384];
    int ret = Z_OK;

    do {
        zs.next_out = buffer;
        zs.avail_out = sizeof(buffer);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            std::string msg = zs.msg ? zs.msg : "code " + std::to_string(ret);
            inflateEnd(&zs);
            throw CorruptPayload("zlib stream is corrupt: " + msg);
        }
        out.insert(out.end(), buffer, buffer + (sizeof(buffer) - zs.avail_out));
        // No progress possible and the stream has not ended: input is truncated.
        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            throw CorruptPayload("zlib stream is truncated");
        }
    } while (ret != Z_STREAM_END);

    bool trailing = zs.avail_in != 0;
    inflateEnd(&zs);
    if (trailing)
        throw CorruptPayload("trailing bytes after zlib stream");

    return out;
}

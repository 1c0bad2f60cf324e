#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
}

#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "frame_sink.hpp"

class ReportSink;

// Writes BGR frames into a looping animated GIF (libavformat gif muxer).
class FFmpegGifWriter {
public:
    // delay in GIF ticks (1/100 s) per frame
    FFmpegGifWriter(const std::string& path, int width, int height, int delayCentis);
    ~FFmpegGifWriter();

    FFmpegGifWriter(const FFmpegGifWriter&) = delete;
    FFmpegGifWriter& operator=(const FFmpegGifWriter&) = delete;

    void writeFrame(const cv::Mat& bgrFrame);
    // Flush the encoder and write the trailer.
    void finish();

private:
    std::string m_path;
    int m_width, m_height, m_delay;
    int64_t frameCounter = 0;
    bool finished = false;

    const AVCodec* codec = nullptr;
    AVCodecContext* codecContext = nullptr;
    AVFormatContext* formatContext = nullptr;
    AVStream* stream = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* pkt = nullptr;
    SwsContext* swsCtx = nullptr;

    void initEncoder();
    void drainPackets();
    void cleanup();
};

// AnimationAssembler on top of FFmpegGifWriter. Frames are read back from
// disk in the given order; all are scaled to the size of the first one.
// A failed run leaves no file at the outfile path.
class GifAssembler : public AnimationAssembler {
public:
    explicit GifAssembler(ReportSink& report) : report_(report) {}

    void assemble(const std::vector<std::string>& ordered_frames,
                  double delay_seconds,
                  const std::string& outfile) override;

private:
    ReportSink& report_;
};

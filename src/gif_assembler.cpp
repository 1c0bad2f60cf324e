#include "gif_assembler.h"
#include "report_sink.hpp"
#include <stdexcept>
#include <cmath>
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace {

std::string av_error_text(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

} // namespace

FFmpegGifWriter::FFmpegGifWriter(const std::string& path, int width, int height, int delayCentis)
    : m_path(path), m_width(width), m_height(height), m_delay(std::max(1, delayCentis))
{
    try {
        initEncoder();
    } catch (...) {
        cleanup();
        throw;
    }
}

void FFmpegGifWriter::initEncoder() {
    int ret = avformat_alloc_output_context2(&formatContext, nullptr, "gif", m_path.c_str());
    if (ret < 0 || !formatContext)
        throw std::runtime_error("GIF muxer not available: " + av_error_text(ret));

    codec = avcodec_find_encoder(AV_CODEC_ID_GIF);
    if (!codec)
        throw std::runtime_error("GIF codec not found");

    codecContext = avcodec_alloc_context3(codec);
    if (!codecContext)
        throw std::runtime_error("Failed to allocate codec context");

    codecContext->width = m_width;
    codecContext->height = m_height;
    codecContext->time_base = {1, 100};   // GIF delays are in centiseconds
    codecContext->pix_fmt = AV_PIX_FMT_RGB8;

    if (formatContext->oformat->flags & AVFMT_GLOBALHEADER)
        codecContext->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    if ((ret = avcodec_open2(codecContext, codec, nullptr)) < 0)
        throw std::runtime_error("Failed to open GIF codec: " + av_error_text(ret));

    stream = avformat_new_stream(formatContext, nullptr);
    if (!stream)
        throw std::runtime_error("Failed to create GIF stream");
    stream->time_base = codecContext->time_base;
    if ((ret = avcodec_parameters_from_context(stream->codecpar, codecContext)) < 0)
        throw std::runtime_error("Failed to copy codec parameters: " + av_error_text(ret));

    if (!(formatContext->oformat->flags & AVFMT_NOFILE)) {
        if ((ret = avio_open(&formatContext->pb, m_path.c_str(), AVIO_FLAG_WRITE)) < 0)
            throw std::runtime_error("Could not open '" + m_path + "': " + av_error_text(ret));
    }

    // loop=0: repeat forever
    AVDictionary* options = nullptr;
    av_dict_set(&options, "loop", "0", 0);
    ret = avformat_write_header(formatContext, &options);
    av_dict_free(&options);
    if (ret < 0)
        throw std::runtime_error("Failed to write GIF header: " + av_error_text(ret));

    frame = av_frame_alloc();
    pkt = av_packet_alloc();
    if (!frame || !pkt)
        throw std::runtime_error("Failed to allocate frame or packet");

    frame->format = codecContext->pix_fmt;
    frame->width = codecContext->width;
    frame->height = codecContext->height;

    if (av_frame_get_buffer(frame, 0) < 0)
        throw std::runtime_error("Could not allocate frame buffer");

    // Frames are black and white, point sampling keeps module edges hard.
    swsCtx = sws_getContext(
        m_width, m_height, AV_PIX_FMT_BGR24,
        m_width, m_height, AV_PIX_FMT_RGB8,
        SWS_POINT, nullptr, nullptr, nullptr
    );

    if (!swsCtx)
        throw std::runtime_error("Failed to initialize swscale context");
}

void FFmpegGifWriter::writeFrame(const cv::Mat& bgrFrame) {
    if (finished)
        throw std::logic_error("GIF writer already finished");
    if (bgrFrame.empty() || bgrFrame.type() != CV_8UC3 ||
        bgrFrame.cols != m_width || bgrFrame.rows != m_height)
        throw std::invalid_argument("GIF frame must be a " + std::to_string(m_width) + "x" +
                                    std::to_string(m_height) + " BGR image");

    if (av_frame_make_writable(frame) < 0)
        throw std::runtime_error("GIF frame buffer is not writable");

    const uint8_t* inData[1] = { bgrFrame.data };
    int inLinesize[1] = { static_cast<int>(bgrFrame.step) };

    sws_scale(swsCtx, inData, inLinesize, 0, m_height, frame->data, frame->linesize);
    frame->pts = frameCounter * m_delay;
    frameCounter++;

    int ret = avcodec_send_frame(codecContext, frame);
    if (ret < 0)
        throw std::runtime_error("Failed to encode GIF frame: " + av_error_text(ret));

    drainPackets();
}

void FFmpegGifWriter::drainPackets() {
    int ret;
    while ((ret = avcodec_receive_packet(codecContext, pkt)) == 0) {
        if (pkt->duration <= 0)
            pkt->duration = m_delay;
        av_packet_rescale_ts(pkt, codecContext->time_base, stream->time_base);
        pkt->stream_index = stream->index;
        ret = av_interleaved_write_frame(formatContext, pkt);
        if (ret < 0)
            throw std::runtime_error("Failed to write GIF frame: " + av_error_text(ret));
    }
    if (ret != AVERROR(EAGAIN) && ret != AVERROR_EOF)
        throw std::runtime_error("GIF encoder failed: " + av_error_text(ret));
}

void FFmpegGifWriter::finish() {
    if (finished) return;
    finished = true;

    int ret = avcodec_send_frame(codecContext, nullptr);
    if (ret < 0 && ret != AVERROR_EOF)
        throw std::runtime_error("Failed to flush GIF encoder: " + av_error_text(ret));
    drainPackets();

    if ((ret = av_write_trailer(formatContext)) < 0)
        throw std::runtime_error("Failed to write GIF trailer: " + av_error_text(ret));
}

void FFmpegGifWriter::cleanup() {
    if (codecContext) avcodec_free_context(&codecContext);
    if (frame) av_frame_free(&frame);
    if (pkt) av_packet_free(&pkt);
    if (swsCtx) { sws_freeContext(swsCtx); swsCtx = nullptr; }
    if (formatContext) {
        if (!(formatContext->oformat->flags & AVFMT_NOFILE) && formatContext->pb)
            avio_closep(&formatContext->pb);
        avformat_free_context(formatContext);
        formatContext = nullptr;
    }
}

FFmpegGifWriter::~FFmpegGifWriter() {
    cleanup();
}

void GifAssembler::assemble(const std::vector<std::string>& ordered_frames,
                            double delay_seconds,
                            const std::string& outfile) {
    if (ordered_frames.empty())
        throw std::invalid_argument("no frames to assemble");

    report_.info("Saving file to '" + outfile + "'");

    int delay = static_cast<int>(std::lround(delay_seconds * 100.0));
    cv::Mat first = cv::imread(ordered_frames.front(), cv::IMREAD_COLOR);
    if (first.empty())
        throw std::runtime_error("Could not read frame '" + ordered_frames.front() + "'");

    try {
        FFmpegGifWriter writer(outfile, first.cols, first.rows, delay);
        for (const auto& path : ordered_frames) {
            cv::Mat img = (&path == &ordered_frames.front()) ? first : cv::imread(path, cv::IMREAD_COLOR);
            if (img.empty())
                throw std::runtime_error("Could not read frame '" + path + "'");
            if (img.size() != first.size())
                cv::resize(img, img, first.size(), 0, 0, cv::INTER_NEAREST);
            writer.writeFrame(img);
        }
        writer.finish();
    } catch (...) {
        // The writer is closed by now; drop the partial file and report the cause.
        std::error_code ec;
        std::filesystem::remove(outfile, ec);
        throw;
    }
}

#include <gtest/gtest.h>

#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <fstream>

#include "fakes.hpp"
#include "gif_assembler.h"
#include "transmitter.hpp"

namespace fs = std::filesystem;

namespace {

std::vector<std::string> write_frames(const TempFrameDir& dir, int n, int size) {
    std::vector<std::string> paths;
    for (int i = 0; i < n; ++i) {
        cv::Mat img(size, size, CV_8UC1, cv::Scalar::all(255));
        cv::rectangle(img, cv::Rect(i * 10, i * 10, 20, 20), cv::Scalar::all(0), cv::FILLED);
        std::string path = dir.frame_path(static_cast<size_t>(i) * 100);
        cv::imwrite(path, img);
        paths.push_back(path);
    }
    return paths;
}

} // namespace

TEST(GifAssembler, WritesALoopingGif) {
    TempFrameDir frames;
    TempFrameDir out;
    RecordingSink sink;
    GifAssembler assembler(sink);

    std::string gif = (fs::path(out.path()) / "out.gif").string();
    assembler.assemble(write_frames(frames, 3, 120), 0.5, gif);

    ASSERT_TRUE(fs::exists(gif));
    EXPECT_GT(fs::file_size(gif), 0u);
    std::ifstream in(gif, std::ios::binary);
    char magic[6] = {};
    in.read(magic, sizeof(magic));
    EXPECT_EQ(std::string(magic, 3), "GIF");
    EXPECT_TRUE(sink.saw(sink.infos, "Saving file to '" + gif + "'"));
}

TEST(GifAssembler, OddSizedFramesFollowTheFirst) {
    TempFrameDir frames;
    TempFrameDir out;
    RecordingSink sink;
    GifAssembler assembler(sink);

    auto paths = write_frames(frames, 1, 100);
    cv::Mat bigger(140, 140, CV_8UC1, cv::Scalar::all(0));
    std::string extra = frames.frame_path(999);
    cv::imwrite(extra, bigger);
    paths.push_back(extra);

    std::string gif = (fs::path(out.path()) / "mixed.gif").string();
    EXPECT_NO_THROW(assembler.assemble(paths, 1.0, gif));
    EXPECT_GT(fs::file_size(gif), 0u);
}

TEST(GifAssembler, NothingToAssembleIsAnError) {
    RecordingSink sink;
    GifAssembler assembler(sink);
    EXPECT_THROW(assembler.assemble({}, 1.0, "unused.gif"), std::invalid_argument);
}

TEST(GifAssembler, UnreadableFrameIsAnError) {
    TempFrameDir out;
    RecordingSink sink;
    GifAssembler assembler(sink);
    std::string gif = (fs::path(out.path()) / "x.gif").string();
    EXPECT_THROW(assembler.assemble({out.frame_path(0)}, 1.0, gif), std::runtime_error);
}

TEST(GifAssembler, FailureMidwayLeavesNoPartialFile) {
    TempFrameDir frames;
    TempFrameDir out;
    RecordingSink sink;
    GifAssembler assembler(sink);

    auto paths = write_frames(frames, 2, 100);
    paths.push_back(frames.frame_path(5000));

    std::string gif = (fs::path(out.path()) / "partial.gif").string();
    EXPECT_THROW(assembler.assemble(paths, 1.0, gif), std::runtime_error);
    EXPECT_FALSE(fs::exists(gif));
}

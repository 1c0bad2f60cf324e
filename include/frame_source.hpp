#ifndef QRCOMM_FRAME_SOURCE_HPP
#define QRCOMM_FRAME_SOURCE_HPP

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

struct CapturedFrame {
    cv::Mat image;      // empty when the candidate could not be loaded
    std::string label;  // file name or "camera 0 #12", for reports
};

enum class FetchStatus { Frame, Timeout, Exhausted };

// A lazy, possibly infinite sequence of candidate images.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Waits at most `wait` for the next candidate.
    virtual FetchStatus next(CapturedFrame& out, std::chrono::milliseconds wait) = 0;
    virtual std::string describe() const = 0;
};

// Every regular file of a directory, in name order.
class DirectoryFrameSource : public FrameSource {
public:
    explicit DirectoryFrameSource(const std::string& directory);

    FetchStatus next(CapturedFrame& out, std::chrono::milliseconds wait) override;
    std::string describe() const override;

private:
    std::string directory_;
    std::vector<std::string> files_;
    std::size_t position_ = 0;
};

// One still image.
class ImageFileSource : public FrameSource {
public:
    explicit ImageFileSource(const std::string& path);

    FetchStatus next(CapturedFrame& out, std::chrono::milliseconds wait) override;
    std::string describe() const override;

private:
    std::string path_;
    bool consumed_ = false;
};

// Camera device or animated image / video file through cv::VideoCapture.
class VideoFrameSource : public FrameSource {
public:
    explicit VideoFrameSource(int device);
    explicit VideoFrameSource(const std::string& path);

    FetchStatus next(CapturedFrame& out, std::chrono::milliseconds wait) override;
    std::string describe() const override;

private:
    cv::VideoCapture cap_;
    std::string name_;
    bool live_;
    std::size_t frame_number_ = 0;
};

bool is_still_image_path(const std::string& path);

// Pick the source for an `rx <source>` argument: all digits is a camera
// index, a directory is a frame directory, a still image extension is a
// single image, anything else is opened as a video / animated image.
// Throws InvalidConfiguration when the source cannot be opened.
std::unique_ptr<FrameSource> open_frame_source(const std::string& source);

#endif // QRCOMM_FRAME_SOURCE_HPP

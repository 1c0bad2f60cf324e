#include "frame_source.hpp"
#include "errors.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace {

// Camera read failures are retried after this pause, within the caller's wait.
constexpr int kCameraRetryMs = 10;

std::string lower_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

bool is_still_image_path(const std::string& path) {
    static const char* kStill[] = {".png", ".jpg", ".jpeg", ".bmp", ".tif", ".tiff",
                                   ".webp", ".pbm", ".pgm", ".ppm"};
    std::string ext = lower_extension(path);
    return std::find(std::begin(kStill), std::end(kStill), ext) != std::end(kStill);
}

// ---------------------- DirectoryFrameSource ----------------------

DirectoryFrameSource::DirectoryFrameSource(const std::string& directory)
    : directory_(directory) {
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file())
            files_.push_back(entry.path().string());
    }
    if (ec)
        throw InvalidConfiguration("cannot list directory '" + directory_ + "': " + ec.message());
    std::sort(files_.begin(), files_.end());
}

FetchStatus DirectoryFrameSource::next(CapturedFrame& out, std::chrono::milliseconds) {
    if (position_ >= files_.size())
        return FetchStatus::Exhausted;

    const std::string& path = files_[position_++];
    out.label = fs::path(path).filename().string();
    out.image = cv::imread(path, cv::IMREAD_COLOR);
    return FetchStatus::Frame;
}

std::string DirectoryFrameSource::describe() const {
    return "directory '" + directory_ + "' (" + std::to_string(files_.size()) + " files)";
}

// ---------------------- ImageFileSource ----------------------

ImageFileSource::ImageFileSource(const std::string& path) : path_(path) {}

FetchStatus ImageFileSource::next(CapturedFrame& out, std::chrono::milliseconds) {
    if (consumed_)
        return FetchStatus::Exhausted;
    consumed_ = true;
    out.label = fs::path(path_).filename().string();
    out.image = cv::imread(path_, cv::IMREAD_COLOR);
    return FetchStatus::Frame;
}

std::string ImageFileSource::describe() const {
    return "image '" + path_ + "'";
}

// ---------------------- VideoFrameSource ----------------------

VideoFrameSource::VideoFrameSource(int device)
    : cap_(device), name_("camera " + std::to_string(device)), live_(true) {
    if (!cap_.isOpened())
        throw InvalidConfiguration("camera " + std::to_string(device) + " could not be opened");
}

VideoFrameSource::VideoFrameSource(const std::string& path)
    : cap_(path), name_(fs::path(path).filename().string()), live_(false) {
    if (!cap_.isOpened())
        throw InvalidConfiguration("'" + path + "' could not be opened as an image or video");
}

FetchStatus VideoFrameSource::next(CapturedFrame& out, std::chrono::milliseconds wait) {
    auto deadline = std::chrono::steady_clock::now() + wait;
    while (true) {
        cv::Mat image;
        if (cap_.read(image) && !image.empty()) {
            out.image = image;
            out.label = name_ + " #" + std::to_string(++frame_number_);
            return FetchStatus::Frame;
        }
        if (!live_)
            return FetchStatus::Exhausted;
        if (std::chrono::steady_clock::now() >= deadline)
            return FetchStatus::Timeout;
        std::this_thread::sleep_for(std::chrono::milliseconds(kCameraRetryMs));
    }
}

std::string VideoFrameSource::describe() const {
    return (live_ ? "camera stream " : "video '") + name_ + (live_ ? "" : "'");
}

// ---------------------- factory ----------------------

std::unique_ptr<FrameSource> open_frame_source(const std::string& source) {
    if (source.empty())
        throw InvalidConfiguration("missing receive source");

    bool digits = std::all_of(source.begin(), source.end(),
                              [](unsigned char c) { return std::isdigit(c) != 0; });
    if (digits && !fs::exists(source))
        return std::make_unique<VideoFrameSource>(std::stoi(source));

    std::error_code ec;
    if (fs::is_directory(source, ec))
        return std::make_unique<DirectoryFrameSource>(source);

    if (!fs::is_regular_file(source, ec))
        throw InvalidConfiguration("source '" + source + "' does not exist");

    if (is_still_image_path(source))
        return std::make_unique<ImageFileSource>(source);

    return std::make_unique<VideoFrameSource>(source);
}

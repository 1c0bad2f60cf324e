#include "opencv_display.hpp"

#include <opencv2/highgui.hpp>

#include <algorithm>
#include <utility>

using Clock = std::chrono::steady_clock;

namespace {
// waitKey slice; bounds how late a cancel request is noticed.
constexpr int kPollMs = 50;
constexpr int kKeyEscape = 27;
}

OpenCvDisplay::OpenCvDisplay(std::string window_name)
    : window_name_(std::move(window_name)) {}

OpenCvDisplay::~OpenCvDisplay() {
    close();
}

bool OpenCvDisplay::show(const cv::Mat& frame, std::chrono::milliseconds duration,
                         const std::atomic<bool>& cancel) {
    if (!opened_) {
        cv::namedWindow(window_name_, cv::WINDOW_AUTOSIZE);
        opened_ = true;
    }
    cv::imshow(window_name_, frame);

    auto deadline = Clock::now() + duration;
    // waitKey also pumps the GUI event loop, so call it at least once.
    do {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        int wait = static_cast<int>(std::max<long long>(1, std::min<long long>(left.count(), kPollMs)));
        int key = cv::waitKey(wait);
        if (key == kKeyEscape || key == 'q' || key == 'Q')
            return false;
        if (cancel.load())
            return false;
    } while (Clock::now() < deadline);

    return true;
}

void OpenCvDisplay::close() {
    if (opened_) {
        cv::destroyWindow(window_name_);
        opened_ = false;
    }
}

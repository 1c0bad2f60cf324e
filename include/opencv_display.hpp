#pragma once

#include "frame_sink.hpp"
#include <string>

// highgui window slideshow. Esc or 'q' in the window cancels.
class OpenCvDisplay : public Display {
public:
    explicit OpenCvDisplay(std::string window_name = "qrcomm - Transmitter");
    ~OpenCvDisplay() override;

    bool show(const cv::Mat& frame, std::chrono::milliseconds duration,
              const std::atomic<bool>& cancel) override;
    void close() override;

private:
    std::string window_name_;
    bool opened_ = false;
};

#pragma once

#include <opencv2/core.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

// Builds one looping animated image out of ordered still frames.
class AnimationAssembler {
public:
    virtual ~AnimationAssembler() = default;

    virtual void assemble(const std::vector<std::string>& ordered_frames,
                          double delay_seconds,
                          const std::string& outfile) = 0;
};

// Shows one frame for a fixed duration.
class Display {
public:
    virtual ~Display() = default;

    // Blocks for `duration` unless cancelled. Returns false when the wait was
    // cut short (cancel flag set or the user closed the slideshow).
    virtual bool show(const cv::Mat& frame, std::chrono::milliseconds duration,
                      const std::atomic<bool>& cancel) = 0;

    virtual void close() {}
};

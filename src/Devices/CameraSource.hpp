#pragma once

#include <cstdint>
#include <mutex>
#include <opencv2/opencv.hpp>

#include "app/video/FrameSource.hpp"
#include "utils/config.hpp"


namespace Devices {
/**
 * @brief OpenCV camera producing JPEG frames. Falls back to a synthetic test pattern
 *        when no camera can be opened.
 */
class CameraSource : public Vision::FrameSource {
public:
    explicit CameraSource(const Config::CameraConfig& config);
    ~CameraSource() override;

    /**
     * @brief Open the capture device, or select the test pattern
     *
     * @return int 0 on success. Never fails; a missing camera selects the test pattern.
     */
    int open() override;

    int close() override;

    std::optional<std::vector<uint8_t>> captureFrame() override;

    /**
     * @brief Set the JPEG quality
     *
     * @param quality 1 to 100
     * @return int 0 on success, -1 if out of range
     */
    int setJpegQuality(int quality);

    bool usingTestPattern() const {
        return m_UsePattern;
    }

    /**
     * @brief Draw the timestamp, caption and size annotations
     */
    void addOverlay(cv::Mat& frame) const;

    /**
     * @brief Shrink frames wider than maxWidth, keeping the aspect ratio
     */
    static void downscale(cv::Mat& frame, int maxWidth);

private:
    void renderTestPattern(cv::Mat& frame);

    Config::CameraConfig m_Config;
    cv::VideoCapture m_Capture;
    bool m_UsePattern = false;
    uint64_t m_PatternTick = 0;
    std::mutex m_Mutex;
};
}  // namespace Devices

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/signals2.hpp>
#include <opencv2/core.hpp>

#include "RcBase.hpp"
#include "RcMessageLib.hpp"

#include "app/video/StreamReceiver.hpp"
#include "app/video/StreamStats.hpp"
#include "utils/config.hpp"


namespace Modules {
/**
 * @brief Reference viewer. The receive loop runs in mainProc and decodes completed
 *        frames into a small ring; displayPending() draws the newest one and must be
 *        called from the thread that owns the HighGUI window.
 */
class StreamViewer : public Base {
public:
    StreamViewer(int moduleID, const std::string& name, const Config::ClientConfig& config);
    ~StreamViewer() override;

    int init(void) override;
    int stop(void) override;

    /**
     * @brief Show the newest decoded frame with the statistics overlay and poll the keyboard
     *
     * q or ESC stops the viewer, r forces a reconnect. In headless mode only the
     * periodic statistics are logged.
     *
     * @return int Key code returned by cv::waitKey, -1 if none
     */
    int displayPending(void);

    /**
     * @brief True once the receive loop gave up (stream ended without --reconnect, or
     *        the server stayed unreachable)
     */
    bool finished(void) const {
        return m_Finished.load();
    }

    Vision::StreamStats::Snapshot stats(void) const {
        return m_Stats.snapshot();
    }

protected:
    void mainProc() override;
    void OnTimer(void) override;

private:
    void handleFrame(const Vision::CompleteFrame& frame);
    void drawStats(cv::Mat& img) const;
    void logStats(const char* heading) const;

    Config::ClientConfig m_Config;
    Vision::StreamReceiver m_Receiver;
    Vision::StreamStats m_Stats;
    boost::signals2::scoped_connection m_FrameConnection;

    std::mutex m_FrameMutex;
    Msg::CircularBuffer<cv::Mat> m_Frames;
    bool m_WindowOpen = false;

    std::atomic<bool> m_Finished{false};
    std::atomic<bool> m_Stopped{false};
    std::atomic<uint64_t> m_DecodeErrors{0};
    std::atomic<uint64_t> m_FramesSkipped{0};
};
}  // namespace Modules

#include "RcStreamViewer.hpp"

#include <cstdio>
#include <thread>

#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "utils/logger.hpp"


namespace Modules {

using Vision::StreamReceiver;

namespace {
constexpr std::size_t FrameQueueDepth = 2;
constexpr std::chrono::milliseconds HeadlessStatsPeriod(5000);
constexpr std::chrono::milliseconds IdleDisplayWait(10);

constexpr int KeyEscape = 27;
}


StreamViewer::StreamViewer(int moduleID, const std::string& name, const Config::ClientConfig& config)
    : Base(moduleID, name),
      m_Config(config),
      m_Receiver(config, std::chrono::milliseconds(config.stalenessMs)),
      m_Frames(FrameQueueDepth) {
    m_FrameConnection = m_Receiver.onFrame.connect([this](const Vision::CompleteFrame& frame) {
        handleFrame(frame);
    });
}


StreamViewer::~StreamViewer() {
    stop();
}


int StreamViewer::init(void) {
    m_Stats.reset();
    setPeriod(static_cast<int>(HeadlessStatsPeriod.count()));

    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "%s: viewing udp://%s:%u%s\r\n", m_name.c_str(),
                                 m_Config.host.c_str(), m_Config.port, m_Config.headless ? " (headless)" : "");
    return 0;
}


int StreamViewer::stop(void) {
    if (m_Stopped.exchange(true)) {
        return 0;
    }

    requestStop();
    joinThreads();
    m_Receiver.disconnect();

    logStats("Viewer stopped");

    if (m_WindowOpen) {
        cv::destroyAllWindows();
        m_WindowOpen = false;
    }
    return 0;
}


void StreamViewer::mainProc() {
    Logger* logger = Logger::getLoggerInst();
    const std::chrono::milliseconds retryDelay(m_Config.retryBackoffMs);

    while (m_Running.load()) {
        if (m_Receiver.connect(m_Running) < 0) {
            if (!m_Config.reconnect) {
                break;
            }
            sleepFor(retryDelay);
            continue;
        }

        const StreamReceiver::ExitReason reason = m_Receiver.run(m_Running);
        m_Receiver.disconnect();

        if (reason == StreamReceiver::ExitReason::Stopped) {
            break;
        }
        logger->log(Logger::LOG_LVL_INFO, "%s: stream closed (%s)\r\n", m_name.c_str(),
                    StreamReceiver::exitReasonName(reason));

        if (reason == StreamReceiver::ExitReason::ReconnectRequested) {
            continue;
        }
        if (!m_Config.reconnect) {
            break;
        }
        sleepFor(retryDelay);
    }

    m_Finished.store(true);
}


void StreamViewer::OnTimer(void) {
    if (m_Config.headless && m_Stats.snapshot().frames > 0) {
        logStats("Viewer statistics");
    }
}


void StreamViewer::handleFrame(const Vision::CompleteFrame& frame) {
    if (!frame.data || frame.data->empty()) {
        return;
    }
    m_Stats.recordFrame(frame.size());

    cv::Mat img;
    try {
        const cv::Mat raw(1, static_cast<int>(frame.data->size()), CV_8UC1,
                          const_cast<uint8_t*>(frame.data->data()));
        img = cv::imdecode(raw, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Frame %u decode error: %s\r\n", frame.frameID, e.what());
    }

    if (img.empty()) {
        m_DecodeErrors++;
        return;
    }

    if (!m_Config.headless) {
        std::lock_guard<std::mutex> lock(m_FrameMutex);
        if (m_Frames.push(img)) {
            m_FramesSkipped++;
        }
    }
}


int StreamViewer::displayPending(void) {
    if (m_Config.headless) {
        std::this_thread::sleep_for(IdleDisplayWait);
        return -1;
    }

    cv::Mat frame;
    {
        std::lock_guard<std::mutex> lock(m_FrameMutex);
        size_t skipped = 0;
        std::optional<cv::Mat> newest = m_Frames.takeNewest(skipped);
        if (newest) {
            frame = *newest;
        }
        m_FramesSkipped += skipped;
    }

    if (!frame.empty()) {
        if (m_Config.showStats) {
            drawStats(frame);
        }
        cv::imshow(m_Config.windowName, frame);
        m_WindowOpen = true;
    }

    if (!m_WindowOpen) {
        std::this_thread::sleep_for(IdleDisplayWait);
        return -1;
    }

    int key = cv::waitKey(1);
    if (key < 0) {
        return key;
    }
    key &= 0xFF;

    if (key == 'q' || key == KeyEscape) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "%s: quit requested\r\n", m_name.c_str());
        requestStop();
    } else if (key == 'r') {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "%s: reconnect requested\r\n", m_name.c_str());
        m_Receiver.requestReconnect();
    }
    return key;
}


void StreamViewer::drawStats(cv::Mat& img) const {
    const Vision::StreamStats::Snapshot s = m_Stats.snapshot();
    const cv::Scalar green(0, 255, 0);
    char text[64];

    snprintf(text, sizeof(text), "FPS: %.1f", s.instantFps);
    cv::putText(img, text, cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 1.0, green, 2);

    snprintf(text, sizeof(text), "Avg FPS: %.1f", s.averageFps);
    cv::putText(img, text, cv::Point(10, 70), cv::FONT_HERSHEY_SIMPLEX, 0.7, green, 2);

    snprintf(text, sizeof(text), "Bandwidth: %.2f MB/s", s.bandwidthMBs);
    cv::putText(img, text, cv::Point(10, 100), cv::FONT_HERSHEY_SIMPLEX, 0.7, green, 2);
}


void StreamViewer::logStats(const char* heading) const {
    const Vision::StreamStats::Snapshot s = m_Stats.snapshot();
    const StreamReceiver::Stats rx = m_Receiver.stats();

    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO,
        "%s: %llu frames, %.1f fps (%.1f avg), %.2f MB/s, %.1f MB total, %llu expired, %llu late, %llu undecodable, %llu not shown\r\n",
        heading,
        static_cast<unsigned long long>(s.frames),
        s.instantFps,
        s.averageFps,
        s.bandwidthMBs,
        s.bytes / (1024.0 * 1024.0),
        static_cast<unsigned long long>(rx.reassembly.framesExpired),
        static_cast<unsigned long long>(rx.framesOutOfOrder),
        static_cast<unsigned long long>(m_DecodeErrors.load()),
        static_cast<unsigned long long>(m_FramesSkipped.load()));
}

}  // namespace Modules

#include "CameraSource.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>
#include <string>

#include "utils/logger.hpp"


namespace Devices {

CameraSource::CameraSource(const Config::CameraConfig& config) : m_Config(config) {}


CameraSource::~CameraSource() {
    close();
}


int CameraSource::open() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    Logger* logger = Logger::getLoggerInst();

    if (m_Config.testPattern) {
        m_UsePattern = true;
        logger->log(Logger::LOG_LVL_INFO, "Camera source: test pattern %dx%d\r\n", m_Config.width, m_Config.height);
        return 0;
    }

    const std::string& device = m_Config.device;
    const bool isIndex = !device.empty() &&
        std::all_of(device.begin(), device.end(), [](unsigned char c) { return std::isdigit(c); });

    bool opened = false;
    if (isIndex) {
        try {
            opened = m_Capture.open(std::stoi(device));
        } catch (const std::out_of_range&) {
            logger->log(Logger::LOG_LVL_WARN, "Camera index '%s' out of range\r\n", device.c_str());
        }
    } else {
        opened = m_Capture.open(device);
    }

    if (!opened || !m_Capture.isOpened()) {
        logger->log(Logger::LOG_LVL_WARN, "Could not open camera '%s', using test pattern\r\n", device.c_str());
        m_UsePattern = true;
        return 0;
    }

    m_Capture.set(cv::CAP_PROP_FRAME_WIDTH, m_Config.width);
    m_Capture.set(cv::CAP_PROP_FRAME_HEIGHT, m_Config.height);
    m_Capture.set(cv::CAP_PROP_FPS, m_Config.fps);
    m_Capture.set(cv::CAP_PROP_BUFFERSIZE, 1);

    logger->log(Logger::LOG_LVL_INFO, "Camera '%s' opened: %.0fx%.0f @ %.0ffps\r\n", device.c_str(),
                m_Capture.get(cv::CAP_PROP_FRAME_WIDTH), m_Capture.get(cv::CAP_PROP_FRAME_HEIGHT),
                m_Capture.get(cv::CAP_PROP_FPS));
    m_UsePattern = false;
    return 0;
}


int CameraSource::close() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_Capture.isOpened()) {
        m_Capture.release();
        Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Camera released\r\n");
    }
    return 0;
}


int CameraSource::setJpegQuality(int quality) {
    if (quality < 1 || quality > 100) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "JPEG quality must be between 1 and 100.\r\n");
        return -1;
    }
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Config.jpegQuality = quality;
    return 0;
}


std::optional<std::vector<uint8_t>> CameraSource::captureFrame() {
    std::lock_guard<std::mutex> lock(m_Mutex);

    cv::Mat frame;
    if (m_UsePattern) {
        renderTestPattern(frame);
    } else {
        if (!m_Capture.read(frame) || frame.empty()) {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Camera returned no frame\r\n");
            return std::nullopt;
        }
        if (m_Config.flip) {
            cv::flip(frame, frame, 0);
        }
    }

    if (frame.channels() == 4) {
        cv::cvtColor(frame, frame, cv::COLOR_BGRA2BGR);
    }

    downscale(frame, m_Config.maxWidth);

    if (m_Config.overlay) {
        addOverlay(frame);
    }

    std::vector<uint8_t> encoded;
    std::vector<int> params = { cv::IMWRITE_JPEG_QUALITY, m_Config.jpegQuality };
    if (!cv::imencode(".jpg", frame, encoded, params) || encoded.empty()) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "JPEG encode failed\r\n");
        return std::nullopt;
    }
    return encoded;
}


void CameraSource::addOverlay(cv::Mat& frame) const {
    std::time_t now = std::time(nullptr);
    std::tm localTime{};
    localtime_r(&now, &localTime);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &localTime);

    cv::putText(frame, ts, cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(0, 255, 0), 2);
    cv::putText(frame, "RC Car Live Stream", cv::Point(10, frame.rows - 20),
                cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 255), 2);

    const std::string sizeInfo = std::to_string(frame.cols) + "x" + std::to_string(frame.rows) +
                                 " @ " + std::to_string(m_Config.fps) + "fps";
    cv::putText(frame, sizeInfo, cv::Point(10, 60), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 255, 255), 1);
}


void CameraSource::downscale(cv::Mat& frame, int maxWidth) {
    if (maxWidth <= 0 || frame.cols <= maxWidth) {
        return;
    }
    const double scale = static_cast<double>(maxWidth) / frame.cols;
    const int newHeight = std::max(1, static_cast<int>(frame.rows * scale));
    cv::resize(frame, frame, cv::Size(maxWidth, newHeight), 0, 0, cv::INTER_AREA);
}


void CameraSource::renderTestPattern(cv::Mat& frame) {
    frame.create(m_Config.height, m_Config.width, CV_8UC3);

    // Eight vertical colour bars scrolling one pixel per frame
    static const cv::Scalar bars[] = {
        cv::Scalar(255, 255, 255), cv::Scalar(0, 255, 255), cv::Scalar(255, 255, 0), cv::Scalar(0, 255, 0),
        cv::Scalar(255, 0, 255),   cv::Scalar(0, 0, 255),   cv::Scalar(255, 0, 0),   cv::Scalar(16, 16, 16)
    };
    const int barWidth = std::max(1, m_Config.width / 8);
    const int shift = static_cast<int>(m_PatternTick % static_cast<uint64_t>(m_Config.width));
    for (int x = 0; x < m_Config.width; x++) {
        const int bar = (((x + shift) % m_Config.width) / barWidth) % 8;
        frame.col(x).setTo(bars[bar]);
    }
    m_PatternTick++;
}

}  // namespace Devices

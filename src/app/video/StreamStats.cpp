#include "app/video/StreamStats.hpp"


namespace Vision {

StreamStats::StreamStats(Clock::time_point start) : m_Start(start), m_WindowStart(start) {}


void StreamStats::recordFrame(std::size_t bytes, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Frames++;
    m_Bytes += bytes;
    m_WindowFrames++;

    const double window = std::chrono::duration<double>(now - m_WindowStart).count();
    if (window >= 1.0) {
        m_InstantFps = m_WindowFrames / window;
        m_WindowFrames = 0;
        m_WindowStart = now;
    }
}


StreamStats::Snapshot StreamStats::snapshot(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    Snapshot s;
    s.frames     = m_Frames;
    s.bytes      = m_Bytes;
    s.instantFps = m_InstantFps;
    s.elapsedSec = std::chrono::duration<double>(now - m_Start).count();
    if (s.elapsedSec > 0.0) {
        s.averageFps   = m_Frames / s.elapsedSec;
        s.bandwidthMBs = (m_Bytes / s.elapsedSec) / (1024.0 * 1024.0);
    }
    return s;
}


void StreamStats::reset(Clock::time_point start) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Start = start;
    m_WindowStart = start;
    m_WindowFrames = 0;
    m_InstantFps = 0.0;
    m_Frames = 0;
    m_Bytes = 0;
}

}  // namespace Vision

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>


namespace Vision {
/**
 * @brief Frame and byte counters with rate estimates for the receiving side.
 *
 * The instantaneous rate is recomputed once per second from the frames counted in that
 * second; the averages are taken over the whole session.
 */
class StreamStats {
public:
    using Clock = std::chrono::steady_clock;

    struct Snapshot {
        uint64_t frames     = 0;
        uint64_t bytes      = 0;
        double instantFps   = 0.0;
        double averageFps   = 0.0;
        double bandwidthMBs = 0.0;
        double elapsedSec   = 0.0;
    };

    explicit StreamStats(Clock::time_point start = Clock::now());

    void recordFrame(std::size_t bytes, Clock::time_point now = Clock::now());

    Snapshot snapshot(Clock::time_point now = Clock::now()) const;

    void reset(Clock::time_point start = Clock::now());

private:
    mutable std::mutex m_Mutex;
    Clock::time_point m_Start;
    Clock::time_point m_WindowStart;
    uint64_t m_WindowFrames = 0;
    double m_InstantFps = 0.0;
    uint64_t m_Frames = 0;
    uint64_t m_Bytes = 0;
};
}  // namespace Vision

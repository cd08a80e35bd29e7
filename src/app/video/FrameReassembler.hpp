#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "app/VideoFrame.hpp"
#include "app/video/VideoProtocol.hpp"


namespace Vision {

/**
 * @brief A fully reassembled frame. The bytes are immutable and shared between consumers.
 */
struct CompleteFrame {
    uint16_t frameID = 0;
    std::shared_ptr<const std::vector<uint8_t>> data;
    std::chrono::steady_clock::time_point completedAt{};

    std::size_t size() const noexcept {
        return data ? data->size() : 0;
    }
};


/**
 * @brief Rebuilds frames from video datagrams, tolerating loss, duplication and reordering.
 *
 * Not thread-safe; owned by a single receive thread. Counters are atomic so other
 * threads may read them.
 */
class FrameReassembler {
public:
    using Clock = std::chrono::steady_clock;

    struct Stats {
        uint64_t chunksAccepted   = 0;
        uint64_t duplicateChunks  = 0;
        uint64_t malformedPackets = 0;
        uint64_t framesCompleted  = 0;
        uint64_t framesExpired    = 0;
    };

    explicit FrameReassembler(std::chrono::milliseconds stalenessWindow = std::chrono::milliseconds(1000));

    /**
     * @brief Feed one video datagram (header + payload).
     *
     * @param pbuf Pointer to datagram
     * @param len Datagram length
     * @param now Arrival time
     * @return std::optional<CompleteFrame> The frame this datagram completed, if any
     */
    std::optional<CompleteFrame> feed(const uint8_t* pbuf, std::size_t len, Clock::time_point now = Clock::now());

    std::optional<CompleteFrame> feed(const std::vector<uint8_t>& datagram, Clock::time_point now = Clock::now()) {
        return feed(datagram.data(), datagram.size(), now);
    }

    /**
     * @brief Drop pending frames whose first chunk is older than the staleness window.
     *
     * @param now Current time
     * @return std::size_t Number of frames dropped
     */
    std::size_t sweep(Clock::time_point now = Clock::now());

    /**
     * @brief Drop every pending frame.
     */
    void clear();

    std::size_t pendingCount() const noexcept {
        return m_Pending.size();
    }

    bool isPending(uint16_t frameID) const {
        return m_Pending.find(frameID) != m_Pending.end();
    }

    std::chrono::milliseconds stalenessWindow() const noexcept {
        return m_StalenessWindow;
    }

    Stats stats() const;

private:
    std::chrono::milliseconds m_StalenessWindow;
    std::unordered_map<uint16_t, VideoFrame> m_Pending;

    std::atomic<uint64_t> m_ChunksAccepted{0};
    std::atomic<uint64_t> m_DuplicateChunks{0};
    std::atomic<uint64_t> m_MalformedPackets{0};
    std::atomic<uint64_t> m_FramesCompleted{0};
    std::atomic<uint64_t> m_FramesExpired{0};
};


/**
 * @brief Discards completed frames that are not newer than the last accepted one.
 *
 * frame_id is a 16-bit counter. A candidate is newer than the reference when
 * (candidate - reference) mod 65536 lies in [1, 32767]. After resyncAfter with no
 * accepted frame any id is accepted, so a restarted server is picked up again.
 */
class FrameOrderGuard {
public:
    using Clock = std::chrono::steady_clock;

    explicit FrameOrderGuard(std::chrono::milliseconds resyncAfter = std::chrono::milliseconds(2000))
        : m_ResyncAfter(resyncAfter) {}

    /**
     * @brief Decide whether a completed frame should be delivered.
     *
     * @param frameID Completed frame id
     * @param now Completion time
     * @return true if delivered, false if stale
     */
    bool accept(uint16_t frameID, Clock::time_point now = Clock::now());

    static bool isNewer(uint16_t candidate, uint16_t reference) noexcept {
        const uint16_t diff = static_cast<uint16_t>(candidate - reference);
        return diff != 0 && diff < 0x8000;
    }

    void reset() noexcept {
        m_HasLast = false;
    }

    std::optional<uint16_t> lastAccepted() const {
        if (!m_HasLast) {
            return std::nullopt;
        }
        return m_Last;
    }

    uint64_t rejected() const noexcept {
        return m_Rejected;
    }

private:
    std::chrono::milliseconds m_ResyncAfter;
    bool m_HasLast = false;
    uint16_t m_Last = 0;
    Clock::time_point m_LastAcceptedAt{};
    uint64_t m_Rejected = 0;
};

}  // namespace Vision

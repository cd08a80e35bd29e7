#ifndef VIDEOFRAME_HPP
#define VIDEOFRAME_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>


namespace Vision {
/**
 * @brief A frame under reassembly: the chunks received so far for one frame_id.
 */
class VideoFrame {
public:
    using Clock = std::chrono::steady_clock;

    VideoFrame() = default;

    VideoFrame(const VideoFrame& other) = default;

    VideoFrame(VideoFrame&& other) noexcept = default;

    ~VideoFrame() = default;

    VideoFrame& operator=(const VideoFrame& other) = default;

    VideoFrame& operator=(VideoFrame&& other) noexcept = default;

    /**
     * @brief Construct an empty pending frame.
     * @param frameID Frame identifier from the chunk header.
     * @param expectedSegments total_chunks declared by the first chunk seen.
     * @param firstSeen Arrival time of the first chunk.
     */
    VideoFrame(uint16_t frameID, uint16_t expectedSegments, Clock::time_point firstSeen);

    /**
     * @brief Store one chunk payload.
     * @param segID chunk_id of the payload.
     * @param src Pointer to payload bytes.
     * @param length Payload length.
     * @return true if stored, false if segID was already present or out of range.
     */
    bool append(uint16_t segID, const uint8_t* src, std::size_t length);

    /**
     * @brief True once every chunk 0..expectedSegments-1 is present.
     */
    bool isComplete() const noexcept {
        return expectedSegments_ > 0 && m_FrameSegMap.size() == expectedSegments_;
    }

    /**
     * @brief Concatenate the chunks in chunk_id order.
     * @return Frame bytes, or an empty vector while incomplete.
     */
    std::vector<uint8_t> bytes() const;

    uint16_t frameID() const noexcept { return frameID_; }

    uint16_t expectedSegments() const noexcept { return expectedSegments_; }

    std::size_t numSegments() const noexcept { return m_FrameSegMap.size(); }

    bool hasSegment(uint16_t segID) const { return m_FrameSegMap.count(segID) != 0; }

    Clock::time_point firstSeen() const noexcept { return firstSeen_; }

    /**
     * @brief Current payload size in bytes.
     */
    std::size_t size() const noexcept { return size_; }

    /**
     * @brief Drop all chunks and start over with a new chunk count.
     */
    void reset(uint16_t expectedSegments, Clock::time_point firstSeen);

private:
    uint16_t frameID_{0};
    uint16_t expectedSegments_{0};
    std::size_t size_{0};
    Clock::time_point firstSeen_{};
    std::map<uint16_t, std::vector<uint8_t>> m_FrameSegMap;
};
}  // namespace Vision

#endif

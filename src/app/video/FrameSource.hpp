#pragma once

#include <cstdint>
#include <optional>
#include <vector>


namespace Vision {
/**
 * @brief Producer of compressed frames for the stream server.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /**
     * @brief Acquire the underlying device
     *
     * @return int 0 on success, -1 on failure
     */
    virtual int open() = 0;

    virtual int close() = 0;

    /**
     * @brief Capture, annotate and encode one frame
     *
     * @return std::optional<std::vector<uint8_t>> Encoded bytes, or nullopt if no frame is available
     */
    virtual std::optional<std::vector<uint8_t>> captureFrame() = 0;
};
}  // namespace Vision

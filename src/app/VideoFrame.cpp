#include "app/VideoFrame.hpp"


namespace Vision {

VideoFrame::VideoFrame(uint16_t frameID, uint16_t expectedSegments, Clock::time_point firstSeen)
    : frameID_(frameID), expectedSegments_(expectedSegments), firstSeen_(firstSeen) {}


bool VideoFrame::append(uint16_t segID, const uint8_t* src, std::size_t length) {
    if (segID >= expectedSegments_) {
        return false;
    }

    auto inserted = m_FrameSegMap.emplace(segID, std::vector<uint8_t>());
    if (!inserted.second) {
        return false;  // duplicate
    }

    if (src && length > 0) {
        inserted.first->second.assign(src, src + length);
        size_ += length;
    }
    return true;
}


std::vector<uint8_t> VideoFrame::bytes() const {
    std::vector<uint8_t> data;
    if (!isComplete()) {
        return data;
    }

    data.reserve(size_);

    // std::map iterates in key order, so chunks land in chunk_id order
    for (const auto& [segID, segData] : m_FrameSegMap) {
        (void)segID;
        data.insert(data.end(), segData.begin(), segData.end());
    }
    return data;
}


void VideoFrame::reset(uint16_t expectedSegments, Clock::time_point firstSeen) {
    expectedSegments_ = expectedSegments;
    firstSeen_ = firstSeen;
    size_ = 0;
    m_FrameSegMap.clear();
}

}  // namespace Vision

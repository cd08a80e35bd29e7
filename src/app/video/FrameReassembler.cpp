#include "app/video/FrameReassembler.hpp"

#include "utils/logger.hpp"


namespace Vision {

FrameReassembler::FrameReassembler(std::chrono::milliseconds stalenessWindow)
    : m_StalenessWindow(stalenessWindow) {}


std::optional<CompleteFrame> FrameReassembler::feed(const uint8_t* pbuf, std::size_t len, Clock::time_point now) {
    std::optional<Protocol::PacketHeader> header = Protocol::PacketHeader::decode(pbuf, len);
    if (!header) {
        m_MalformedPackets++;
        return std::nullopt;
    }

    const std::size_t remaining = len - Protocol::HeaderSize;
    if (header->chunkLen > remaining ||
        header->totalChunks == 0 ||
        header->chunkID >= header->totalChunks) {
        m_MalformedPackets++;
        Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG,
            "Dropping malformed chunk: frame %u chunk %u/%u len %u (datagram %zu)\r\n",
            header->frameID, header->chunkID, header->totalChunks, header->chunkLen, len);
        return std::nullopt;
    }

    auto it = m_Pending.find(header->frameID);
    if (it == m_Pending.end()) {
        it = m_Pending.emplace(header->frameID, VideoFrame(header->frameID, header->totalChunks, now)).first;
    } else if (it->second.expectedSegments() != header->totalChunks) {
        // Same id, different shape: a wrapped counter or a restarted server. Start over.
        it->second.reset(header->totalChunks, now);
    }

    VideoFrame& pending = it->second;
    if (!pending.append(header->chunkID, pbuf + Protocol::HeaderSize, header->chunkLen)) {
        m_DuplicateChunks++;
        return std::nullopt;
    }
    m_ChunksAccepted++;

    if (!pending.isComplete()) {
        return std::nullopt;
    }

    CompleteFrame frame;
    frame.frameID = header->frameID;
    frame.data = std::make_shared<const std::vector<uint8_t>>(pending.bytes());
    frame.completedAt = now;

    m_Pending.erase(it);
    m_FramesCompleted++;
    return frame;
}


std::size_t FrameReassembler::sweep(Clock::time_point now) {
    std::size_t dropped = 0;
    for (auto it = m_Pending.begin(); it != m_Pending.end();) {
        if (now - it->second.firstSeen() > m_StalenessWindow) {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG,
                "Frame %u expired with %zu/%u chunks\r\n",
                it->first, it->second.numSegments(), it->second.expectedSegments());
            it = m_Pending.erase(it);
            dropped++;
        } else {
            ++it;
        }
    }
    m_FramesExpired += dropped;
    return dropped;
}


void FrameReassembler::clear() {
    m_Pending.clear();
}


FrameReassembler::Stats FrameReassembler::stats() const {
    Stats s;
    s.chunksAccepted   = m_ChunksAccepted.load();
    s.duplicateChunks  = m_DuplicateChunks.load();
    s.malformedPackets = m_MalformedPackets.load();
    s.framesCompleted  = m_FramesCompleted.load();
    s.framesExpired    = m_FramesExpired.load();
    return s;
}


bool FrameOrderGuard::accept(uint16_t frameID, Clock::time_point now) {
    const bool resync = m_HasLast && (now - m_LastAcceptedAt) > m_ResyncAfter;
    if (m_HasLast && !resync && !isNewer(frameID, m_Last)) {
        m_Rejected++;
        return false;
    }

    m_HasLast = true;
    m_Last = frameID;
    m_LastAcceptedAt = now;
    return true;
}

}  // namespace Vision

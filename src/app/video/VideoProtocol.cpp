#include "app/video/VideoProtocol.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <stdexcept>


namespace Vision {
namespace Protocol {

namespace {
const std::array<std::string, 6> ControlText = {
    "CONNECT",
    "CONNECTED",
    "DISCONNECT",
    "PING",
    "PONG",
    "STREAM_END"
};

void putU16(uint8_t* out, uint16_t value) {
    const uint16_t be = htons(value);
    std::memcpy(out, &be, sizeof(be));
}

uint16_t getU16(const uint8_t* in) {
    uint16_t be = 0;
    std::memcpy(&be, in, sizeof(be));
    return ntohs(be);
}
}


void PacketHeader::encode(uint8_t* out) const noexcept {
    putU16(out,     frameID);
    putU16(out + 2, totalChunks);
    putU16(out + 4, chunkID);
    putU16(out + 6, chunkLen);
}


std::optional<PacketHeader> PacketHeader::decode(const uint8_t* pbuf, std::size_t len) noexcept {
    if (!pbuf || len < HeaderSize) {
        return std::nullopt;
    }

    PacketHeader header;
    header.frameID     = getU16(pbuf);
    header.totalChunks = getU16(pbuf + 2);
    header.chunkID     = getU16(pbuf + 4);
    header.chunkLen    = getU16(pbuf + 6);
    return header;
}


std::optional<ControlMessage> parseControlMessage(const uint8_t* pbuf, std::size_t len) {
    if (!pbuf || len == 0) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i < ControlText.size(); ++i) {
        const std::string& text = ControlText[i];
        if (text.size() == len && std::memcmp(text.data(), pbuf, len) == 0) {
            return static_cast<ControlMessage>(i);
        }
    }
    return std::nullopt;
}


const std::string& controlMessageText(ControlMessage msg) {
    return ControlText.at(static_cast<std::size_t>(msg));
}


std::vector<Chunk> packetize(const uint8_t* frame, std::size_t length, uint16_t frameID, uint16_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("Chunk size cannot be zero");
    }

    std::vector<Chunk> chunks;
    if (!frame || length == 0) {
        return chunks;
    }

    const std::size_t numChunks = (length + chunkSize - 1) / chunkSize;
    if (numChunks > UINT16_MAX) {
        throw std::invalid_argument("Frame too large for 16-bit chunk count");
    }

    chunks.reserve(numChunks);
    std::size_t offset = 0;
    for (std::size_t chunkIdx = 0; chunkIdx < numChunks; ++chunkIdx) {
        const std::size_t bytesToSend = std::min<std::size_t>(length - offset, chunkSize);

        Chunk chunk;
        chunk.header.frameID     = frameID;
        chunk.header.totalChunks = static_cast<uint16_t>(numChunks);
        chunk.header.chunkID     = static_cast<uint16_t>(chunkIdx);
        chunk.header.chunkLen    = static_cast<uint16_t>(bytesToSend);

        chunk.datagram.resize(HeaderSize + bytesToSend);
        chunk.header.encode(chunk.datagram.data());
        std::memcpy(chunk.datagram.data() + HeaderSize, frame + offset, bytesToSend);

        offset += bytesToSend;
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}


std::vector<Chunk> packetize(const std::vector<uint8_t>& frame, uint16_t frameID, uint16_t chunkSize) {
    return packetize(frame.data(), frame.size(), frameID, chunkSize);
}

}  // namespace Protocol
}  // namespace Vision

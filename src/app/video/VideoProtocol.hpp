#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>


namespace Vision {
namespace Protocol {

// Wire header: [frame_id:u16][total_chunks:u16][chunk_id:u16][chunk_len:u16], big-endian
static constexpr std::size_t HeaderSize = 8;

// Keeps header + payload under a 1500 byte MTU after IP/UDP overhead
static constexpr uint16_t DefaultChunkSize = 1400;

static constexpr std::size_t MaxUDPLen = 65507;
static constexpr uint16_t MaxChunkSize = static_cast<uint16_t>(MaxUDPLen - HeaderSize);

/**
 * @brief Fixed size header carried in front of every video chunk.
 */
struct PacketHeader {
    uint16_t frameID     = 0;
    uint16_t totalChunks = 0;
    uint16_t chunkID     = 0;
    uint16_t chunkLen    = 0;

    /**
     * @brief Serialize the header in network byte order.
     *
     * @param out Destination, at least HeaderSize bytes
     */
    void encode(uint8_t* out) const noexcept;

    /**
     * @brief Parse a header from the front of a datagram.
     *
     * Only the fixed fields are read; payload consistency is checked by the caller.
     *
     * @param pbuf Pointer to datagram
     * @param len Datagram length
     * @return std::optional<PacketHeader> Header, or nullopt when len < HeaderSize
     */
    static std::optional<PacketHeader> decode(const uint8_t* pbuf, std::size_t len) noexcept;

    bool operator==(const PacketHeader& other) const noexcept {
        return frameID == other.frameID && totalChunks == other.totalChunks &&
               chunkID == other.chunkID && chunkLen == other.chunkLen;
    }
};

/**
 * @brief Control plane vocabulary. Sent as bare ASCII, no header.
 */
enum class ControlMessage : uint8_t {
    Connect,
    Connected,
    Disconnect,
    Ping,
    Pong,
    StreamEnd
};

/**
 * @brief Match a datagram against the control vocabulary.
 *
 * @param pbuf Pointer to datagram
 * @param len Datagram length
 * @return std::optional<ControlMessage> The message, or nullopt if the bytes are not an exact match
 */
std::optional<ControlMessage> parseControlMessage(const uint8_t* pbuf, std::size_t len);

/**
 * @brief Wire text of a control message.
 */
const std::string& controlMessageText(ControlMessage msg);

/**
 * @brief One datagram of a packetized frame: header plus serialized bytes (header + payload).
 */
struct Chunk {
    PacketHeader header;
    std::vector<uint8_t> datagram;

    const uint8_t* payload() const noexcept {
        return datagram.data() + HeaderSize;
    }

    std::size_t payloadSize() const noexcept {
        return header.chunkLen;
    }
};

/**
 * @brief Slice a compressed frame into ordered chunks.
 *
 * total_chunks = ceil(frame.size() / chunkSize). An empty frame yields no chunks.
 *
 * @param frame Compressed frame bytes
 * @param frameID Frame identifier stamped on every chunk
 * @param chunkSize Maximum payload per chunk
 * @return std::vector<Chunk> Chunks in increasing chunk_id order
 * @throws std::invalid_argument if chunkSize is zero or the frame needs more than 65535 chunks
 */
std::vector<Chunk> packetize(const std::vector<uint8_t>& frame, uint16_t frameID,
                             uint16_t chunkSize = DefaultChunkSize);

std::vector<Chunk> packetize(const uint8_t* frame, std::size_t length, uint16_t frameID,
                             uint16_t chunkSize = DefaultChunkSize);

}  // namespace Protocol
}  // namespace Vision

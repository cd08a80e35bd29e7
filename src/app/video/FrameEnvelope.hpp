#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>


namespace Vision {
namespace Envelope {

/**
 * @brief Standard base64 (RFC 4648, padded)
 */
std::string encodeBase64(const uint8_t* data, std::size_t len);

/**
 * @brief Seconds since the Unix epoch with sub-second precision
 */
double unixTimestamp(void);

/**
 * @brief {"type":"video_frame","data":"data:image/jpeg;base64,...","frame_id":N,"timestamp":T}
 */
std::string videoFrame(uint16_t frameID, const std::vector<uint8_t>& jpeg, double timestamp);

/**
 * @brief {"type":"connection","status":status,"message":message}
 */
std::string connection(const std::string& status, const std::string& message);

/**
 * @brief {"type":"pong","timestamp":T}
 */
std::string pong(double timestamp);

/**
 * @brief Build the reply to a text message from the WebSocket peer
 *
 * @param text Message received from the peer
 * @param timestamp Timestamp for the reply
 * @return std::optional<std::string> A pong for {"type":"ping"}, nullopt for anything else
 *         including text that is not JSON
 */
std::optional<std::string> replyTo(const std::string& text, double timestamp);

}  // namespace Envelope
}  // namespace Vision

#include "app/video/FrameEnvelope.hpp"

#include <chrono>

#include <boost/beast/core/detail/base64.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;


namespace Vision {
namespace Envelope {

namespace {
const char* const JpegDataUri = "data:image/jpeg;base64,";
}


std::string encodeBase64(const uint8_t* data, std::size_t len) {
    std::string out;
    if (!data || len == 0) {
        return out;
    }

    out.resize(boost::beast::detail::base64::encoded_size(len));
    const std::size_t written = boost::beast::detail::base64::encode(&out[0], data, len);
    out.resize(written);
    return out;
}


double unixTimestamp(void) {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}


std::string videoFrame(uint16_t frameID, const std::vector<uint8_t>& jpeg, double timestamp) {
    json j;
    j["type"]      = "video_frame";
    j["data"]      = std::string(JpegDataUri) + encodeBase64(jpeg.data(), jpeg.size());
    j["frame_id"]  = frameID;
    j["timestamp"] = timestamp;
    return j.dump();
}


std::string connection(const std::string& status, const std::string& message) {
    json j;
    j["type"]    = "connection";
    j["status"]  = status;
    j["message"] = message;
    return j.dump();
}


std::string pong(double timestamp) {
    json j;
    j["type"]      = "pong";
    j["timestamp"] = timestamp;
    return j.dump();
}


std::optional<std::string> replyTo(const std::string& text, double timestamp) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    auto type = j.find("type");
    if (type == j.end() || !type->is_string() || type->get<std::string>() != "ping") {
        return std::nullopt;
    }
    return pong(timestamp);
}

}  // namespace Envelope
}  // namespace Vision

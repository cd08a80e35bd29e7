#pragma once

#include <atomic>
#include <memory>
#include <string>

#include <boost/signals2.hpp>

#include "RcBase.hpp"

#include "app/video/StreamReceiver.hpp"
#include "Devices/network_interface/WebSocketServer.hpp"
#include "utils/config.hpp"


namespace Modules {
/**
 * @brief Forwards the UDP stream to a single WebSocket viewer.
 *
 * mainProc owns the upstream StreamReceiver and reconnects whenever the stream is
 * lost. Each completed frame is wrapped in a JSON envelope and posted to the
 * WebSocket io_context.
 */
class StreamBridge : public Base {
public:
    struct Stats {
        uint64_t framesProcessed = 0;
        uint64_t framesSent      = 0;
        uint64_t evictions       = 0;
        double elapsedSec        = 0.0;
    };

    StreamBridge(int moduleID, const std::string& name, const Config::ClientConfig& upstream,
                 const Config::BridgeConfig& config);
    ~StreamBridge() override;

    /**
     * @brief Start the WebSocket server
     *
     * @return int 0 on success, -1 if the WebSocket endpoint cannot be bound
     */
    int init(void) override;

    /**
     * @brief Disconnect upstream, send the closing envelope to the peer and stop the server
     */
    int stop(void) override;

    uint16_t webSocketPort(void) const {
        return m_WebSocket.localPort();
    }

    bool hasViewer(void) const {
        return m_WebSocket.hasPeer();
    }

    Stats stats(void) const;

protected:
    void mainProc() override;

private:
    void forwardFrame(const Vision::CompleteFrame& frame);

    Config::ClientConfig m_Upstream;
    Config::BridgeConfig m_Config;
    Network::WebSocketServer m_WebSocket;
    Vision::StreamReceiver m_Receiver;
    boost::signals2::scoped_connection m_FrameConnection;

    std::atomic<bool> m_Stopped{false};
    std::atomic<uint64_t> m_FramesProcessed{0};
    std::atomic<uint64_t> m_FramesSent{0};
    std::chrono::steady_clock::time_point m_StartTime;
};
}  // namespace Modules

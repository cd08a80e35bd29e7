#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "RcBase.hpp"

#include "app/video/FrameSource.hpp"
#include "app/video/VideoProtocol.hpp"
#include "Devices/network_interface/sockets.hpp"
#include "Devices/network_interface/SessionRegistry.hpp"
#include "utils/config.hpp"


namespace Modules {
/**
 * @brief UDP video stream server.
 *
 * Two loops share one datagram socket: the control loop (worker thread) maintains the
 * session registry from CONNECT/DISCONNECT/PING, the broadcast loop (mainProc) pulls
 * frames from the FrameSource and unicasts their chunks to every registered peer.
 * The timer evicts silent peers and logs throughput.
 */
class StreamServer : public Base {
public:
    struct Stats {
        uint64_t framesSent      = 0;
        uint64_t bytesSent       = 0;
        uint64_t datagramsSent   = 0;
        uint64_t sendFailures    = 0;
        uint64_t controlMessages = 0;
        uint64_t ignoredPackets  = 0;
        double elapsedSec        = 0.0;
    };

    /**
     * @brief Construct the server
     *
     * @param moduleID Module identifier
     * @param name Module name used in log lines
     * @param config Server options
     * @param source Frame producer, may be null when frames are pushed with broadcastFrame()
     * @param socket Pre-built socket; when null init() binds a UdpServer on config.host:config.port
     */
    StreamServer(int moduleID, const std::string& name, const Config::ServerConfig& config,
                 std::shared_ptr<Vision::FrameSource> source,
                 std::unique_ptr<Network::Sockets> socket = nullptr);
    ~StreamServer() override;

    int init(void) override;

    /**
     * @brief Stop both loops, send STREAM_END to every peer, clear the registry and close the socket
     */
    int stop(void) override;

    /**
     * @brief Handle one datagram received on the control socket
     *
     * @param pbuf Datagram bytes
     * @param len Datagram length
     * @param sender Source endpoint
     */
    void handleControlDatagram(const uint8_t* pbuf, size_t len, const udp::endpoint& sender);

    /**
     * @brief Packetize one frame and unicast every chunk to every registered peer
     *
     * A peer whose send fails is removed; the remaining peers still get the frame.
     *
     * @param frame Encoded frame
     * @return int Number of peers that received the whole frame, -1 if the frame cannot be packetized
     */
    int broadcastFrame(const std::vector<uint8_t>& frame);

    /**
     * @brief Assign the next frame id. The first id is 1; ids wrap after 65535.
     */
    uint16_t nextFrameID(void) {
        return static_cast<uint16_t>(m_FrameID.fetch_add(1) + 1);
    }

    const Network::SessionRegistry& sessions(void) const {
        return m_Sessions;
    }

    udp::endpoint localEndpoint(void) const;

    Stats stats(void) const;

protected:
    void mainProc() override;
    void OnTimer(void) override;

private:
    void controlLoop(void);
    int sendControl(Vision::Protocol::ControlMessage msg, const udp::endpoint& dest);
    void publishPeerCount(void);
    void logStats(const char* heading) const;

    Config::ServerConfig m_Config;
    std::shared_ptr<Vision::FrameSource> m_Source;
    std::unique_ptr<Network::Sockets> m_Socket;
    Network::SessionRegistry m_Sessions;

    std::atomic<uint16_t> m_FrameID{0};
    std::atomic<bool> m_Stopped{false};

    std::atomic<uint64_t> m_FramesSent{0};
    std::atomic<uint64_t> m_BytesSent{0};
    std::atomic<uint64_t> m_DatagramsSent{0};
    std::atomic<uint64_t> m_SendFailures{0};
    std::atomic<uint64_t> m_ControlMessages{0};
    std::atomic<uint64_t> m_IgnoredPackets{0};

    std::chrono::steady_clock::time_point m_StartTime;
    std::chrono::steady_clock::time_point m_LastStatsLog;
};
}  // namespace Modules

#include "RcStreamServer.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include "Devices/RegisterMap.hpp"
#include "Devices/network_interface/UdpServer.hpp"
#include "utils/logger.hpp"


namespace Modules {

using Vision::Protocol::ControlMessage;

namespace {
// Pace large frames so the sender does not overrun the radio queue
constexpr std::size_t PacingMinChunks = 10;
constexpr std::size_t PacingEvery     = 5;
constexpr std::chrono::microseconds PacingDelay(100);

constexpr std::chrono::milliseconds TimerPeriod(250);
}


StreamServer::StreamServer(int moduleID, const std::string& name, const Config::ServerConfig& config,
                           std::shared_ptr<Vision::FrameSource> source,
                           std::unique_ptr<Network::Sockets> socket)
    : Base(moduleID, name),
      m_Config(config),
      m_Source(std::move(source)),
      m_Socket(std::move(socket)),
      m_StartTime(std::chrono::steady_clock::now()),
      m_LastStatsLog(m_StartTime) {
    if (m_Config.chunkSize == 0) {
        throw std::invalid_argument("Chunk size cannot be zero");
    }
}


StreamServer::~StreamServer() {
    stop();
}


int StreamServer::init(void) {
    Logger* logger = Logger::getLoggerInst();

    if (!m_Socket) {
        try {
            m_Socket = std::make_unique<Network::UdpServer>(m_Config.host, m_Config.port, m_Config.sendBufferSize);
        } catch (const std::runtime_error& e) {
            logger->log(Logger::LOG_LVL_ERROR, "%s: %s\r\n", m_name.c_str(), e.what());
            return -1;
        }
    }

    if (m_Source && m_Source->open() < 0) {
        logger->log(Logger::LOG_LVL_ERROR, "%s: frame source failed to open\r\n", m_name.c_str());
        return -1;
    }

    m_StartTime = std::chrono::steady_clock::now();
    m_LastStatsLog = m_StartTime;

    RegisterMap* regMap = RegisterMap::getInstance();
    regMap->set(RegisterMap::RegisterKeys::ServerEndpoint, Network::toString(m_Socket->localEndpoint()));
    regMap->set(RegisterMap::RegisterKeys::ActivePeers, static_cast<int64_t>(0));

    setPeriod(static_cast<int>(TimerPeriod.count()));
    spawnWorker([this]() { controlLoop(); });

    logger->log(Logger::LOG_LVL_INFO, "%s listening on %s (chunk %u, max %d fps)\r\n", m_name.c_str(),
                Network::toString(m_Socket->localEndpoint()).c_str(), m_Config.chunkSize, m_Config.maxFps);
    return 0;
}


int StreamServer::stop(void) {
    if (m_Stopped.exchange(true)) {
        return 0;
    }

    requestStop();
    joinThreads();

    if (m_Socket) {
        for (const auto& peer : m_Sessions.snapshot()) {
            sendControl(ControlMessage::StreamEnd, peer);
        }
    }
    m_Sessions.clear();
    publishPeerCount();

    logStats("Stream stopped");

    if (m_Source) {
        m_Source->close();
    }
    if (m_Socket) {
        m_Socket->close();
    }
    return 0;
}


void StreamServer::controlLoop(void) {
    Logger* logger = Logger::getLoggerInst();
    std::vector<uint8_t> buffer(Vision::Protocol::MaxUDPLen);
    const std::chrono::milliseconds readTimeout(m_Config.readTimeoutMs);

    while (m_Running.load()) {
        udp::endpoint sender;
        boost::system::error_code ec;
        const size_t len = m_Socket->receive(buffer, sender, readTimeout, ec);

        if (ec == boost::asio::error::timed_out) {
            continue;
        }
        if (ec) {
            if (!m_Running.load()) {
                break;
            }
            logger->log(Logger::LOG_LVL_WARN, "%s: receive error: %s\r\n", m_name.c_str(), ec.message().c_str());
            sleepFor(std::chrono::milliseconds(10));
            continue;
        }

        handleControlDatagram(buffer.data(), len, sender);
    }
}


void StreamServer::handleControlDatagram(const uint8_t* pbuf, size_t len, const udp::endpoint& sender) {
    Logger* logger = Logger::getLoggerInst();
    m_Sessions.touch(sender);

    std::optional<ControlMessage> msg = Vision::Protocol::parseControlMessage(pbuf, len);
    if (!msg) {
        m_IgnoredPackets++;
        logger->log(Logger::LOG_LVL_DEBUG, "%s: ignoring %zu byte datagram from %s\r\n",
                    m_name.c_str(), len, Network::toString(sender).c_str());
        return;
    }
    m_ControlMessages++;

    switch (*msg) {
        case ControlMessage::Connect:
            if (m_Sessions.add(sender)) {
                logger->log(Logger::LOG_LVL_INFO, "Viewer connected: %s (%zu active)\r\n",
                            Network::toString(sender).c_str(), m_Sessions.count());
            }
            sendControl(ControlMessage::Connected, sender);
            publishPeerCount();
            break;

        case ControlMessage::Disconnect:
            if (m_Sessions.remove(sender)) {
                logger->log(Logger::LOG_LVL_INFO, "Viewer disconnected: %s (%zu active)\r\n",
                            Network::toString(sender).c_str(), m_Sessions.count());
                publishPeerCount();
            }
            break;

        case ControlMessage::Ping:
            sendControl(ControlMessage::Pong, sender);
            break;

        default:
            m_IgnoredPackets++;
            break;
    }
}


int StreamServer::sendControl(ControlMessage msg, const udp::endpoint& dest) {
    const std::string& text = Vision::Protocol::controlMessageText(msg);
    boost::system::error_code ec;
    if (!m_Socket->transmit(reinterpret_cast<const uint8_t*>(text.data()), text.size(), dest, ec)) {
        m_SendFailures++;
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Failed to send %s to %s: %s\r\n", text.c_str(),
                                     Network::toString(dest).c_str(), ec.message().c_str());
        if (m_Sessions.remove(dest)) {
            publishPeerCount();
        }
        return -1;
    }
    return 0;
}


int StreamServer::broadcastFrame(const std::vector<uint8_t>& frame) {
    if (frame.empty() || !m_Socket) {
        return 0;
    }

    const std::vector<udp::endpoint> peers = m_Sessions.snapshot();
    if (peers.empty()) {
        return 0;
    }

    const uint16_t frameID = nextFrameID();
    std::vector<Vision::Protocol::Chunk> chunks;
    try {
        chunks = Vision::Protocol::packetize(frame, frameID, m_Config.chunkSize);
    } catch (const std::invalid_argument& e) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Frame %u (%zu bytes) dropped: %s\r\n",
                                     frameID, frame.size(), e.what());
        return -1;
    }

    const bool pace = m_Config.pacing && chunks.size() > PacingMinChunks;
    int delivered = 0;

    for (const auto& peer : peers) {
        bool failed = false;
        for (std::size_t idx = 0; idx < chunks.size(); ++idx) {
            const auto& datagram = chunks[idx].datagram;
            boost::system::error_code ec;
            if (!m_Socket->transmit(datagram.data(), datagram.size(), peer, ec)) {
                m_SendFailures++;
                Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Send to %s failed, dropping viewer: %s\r\n",
                                             Network::toString(peer).c_str(), ec.message().c_str());
                failed = true;
                break;
            }
            m_DatagramsSent++;

            if (pace && idx % PacingEvery == 0) {
                std::this_thread::sleep_for(PacingDelay);
            }
        }

        if (failed) {
            m_Sessions.remove(peer);
            publishPeerCount();
            continue;
        }
        m_BytesSent += frame.size();
        delivered++;
    }

    m_FramesSent++;
    return delivered;
}


void StreamServer::mainProc() {
    const auto interval = std::chrono::microseconds(1000000 / std::max(1, m_Config.maxFps));
    auto lastFrame = std::chrono::steady_clock::time_point{};

    while (m_Running.load()) {
        if (!m_Source || m_Sessions.count() == 0) {
            sleepFor(std::chrono::milliseconds(10));
            continue;
        }

        const auto now = std::chrono::steady_clock::now();
        const auto target = lastFrame + interval;
        if (now < target) {
            std::this_thread::sleep_until(target);
            continue;
        }

        std::optional<std::vector<uint8_t>> frame = m_Source->captureFrame();
        if (!frame || frame->empty()) {
            sleepFor(std::chrono::milliseconds(1));
            continue;
        }

        lastFrame = now;
        broadcastFrame(*frame);
    }
}


void StreamServer::OnTimer(void) {
    const auto now = std::chrono::steady_clock::now();

    if (m_Config.sessionTimeoutMs > 0) {
        const auto evicted = m_Sessions.evictInactive(now, std::chrono::milliseconds(m_Config.sessionTimeoutMs));
        for (const auto& peer : evicted) {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Viewer %s silent for %d ms, removed\r\n",
                                         Network::toString(peer).c_str(), m_Config.sessionTimeoutMs);
        }
        if (!evicted.empty()) {
            publishPeerCount();
        }
    }

    RegisterMap* regMap = RegisterMap::getInstance();
    regMap->set(RegisterMap::RegisterKeys::FramesSent, static_cast<int64_t>(m_FramesSent.load()));
    regMap->set(RegisterMap::RegisterKeys::BytesSent, static_cast<int64_t>(m_BytesSent.load()));

    if (m_Config.statsPeriodMs > 0 &&
        now - m_LastStatsLog >= std::chrono::milliseconds(m_Config.statsPeriodMs)) {
        m_LastStatsLog = now;
        if (m_FramesSent.load() > 0) {
            logStats("Stream statistics");
        }
    }
}


void StreamServer::publishPeerCount(void) {
    RegisterMap::getInstance()->set(RegisterMap::RegisterKeys::ActivePeers, static_cast<int64_t>(m_Sessions.count()));
}


udp::endpoint StreamServer::localEndpoint(void) const {
    return m_Socket ? m_Socket->localEndpoint() : udp::endpoint();
}


StreamServer::Stats StreamServer::stats(void) const {
    Stats s;
    s.framesSent      = m_FramesSent.load();
    s.bytesSent       = m_BytesSent.load();
    s.datagramsSent   = m_DatagramsSent.load();
    s.sendFailures    = m_SendFailures.load();
    s.controlMessages = m_ControlMessages.load();
    s.ignoredPackets  = m_IgnoredPackets.load();
    s.elapsedSec      = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_StartTime).count();
    return s;
}


void StreamServer::logStats(const char* heading) const {
    const Stats s = stats();
    if (s.elapsedSec <= 0.0) {
        return;
    }

    Logger* logger = Logger::getLoggerInst();
    logger->log(Logger::LOG_LVL_INFO, "%s: %llu frames, %.1f fps avg, %.2f MB/s, %.1f MB total, %llu send failures, %zu viewers\r\n",
                heading,
                static_cast<unsigned long long>(s.framesSent),
                s.framesSent / s.elapsedSec,
                (s.bytesSent / s.elapsedSec) / (1024.0 * 1024.0),
                s.bytesSent / (1024.0 * 1024.0),
                static_cast<unsigned long long>(s.sendFailures),
                m_Sessions.count());
}

}  // namespace Modules

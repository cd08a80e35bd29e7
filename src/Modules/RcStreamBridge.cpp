#include "RcStreamBridge.hpp"

#include "app/video/FrameEnvelope.hpp"
#include "utils/logger.hpp"


namespace Modules {

using Vision::StreamReceiver;

namespace {
Network::WebSocketServer::Options webSocketOptions(const Config::BridgeConfig& config) {
    Network::WebSocketServer::Options opt;
    opt.host              = config.wsHost;
    opt.port              = config.wsPort;
    opt.idleTimeout       = std::chrono::milliseconds(config.idleTimeoutMs);
    opt.handshakeTimeout  = std::chrono::milliseconds(config.handshakeTimeoutMs);
    opt.keepAlivePings    = config.keepAlivePings;
    opt.maxQueuedMessages = static_cast<std::size_t>(config.maxQueuedMessages);
    return opt;
}
}


StreamBridge::StreamBridge(int moduleID, const std::string& name, const Config::ClientConfig& upstream,
                           const Config::BridgeConfig& config)
    : Base(moduleID, name),
      m_Upstream(upstream),
      m_Config(config),
      m_WebSocket(webSocketOptions(config)),
      m_Receiver(upstream, std::chrono::milliseconds(config.stalenessMs)),
      m_StartTime(std::chrono::steady_clock::now()) {
    m_FrameConnection = m_Receiver.onFrame.connect([this](const Vision::CompleteFrame& frame) {
        forwardFrame(frame);
    });
}


StreamBridge::~StreamBridge() {
    stop();
}


int StreamBridge::init(void) {
    m_WebSocket.setWelcomeMessage(Vision::Envelope::connection("connected", "UDP video stream connected"));
    m_WebSocket.setMessageHandler([](const std::string& text) {
        return Vision::Envelope::replyTo(text, Vision::Envelope::unixTimestamp());
    });

    if (m_WebSocket.start() < 0) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "%s: WebSocket server failed to start\r\n", m_name.c_str());
        return -1;
    }

    m_StartTime = std::chrono::steady_clock::now();
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "%s: forwarding udp://%s:%u to ws://%s:%u\r\n", m_name.c_str(),
                                 m_Upstream.host.c_str(), m_Upstream.port,
                                 m_Config.wsHost.c_str(), m_WebSocket.localPort());
    return 0;
}


int StreamBridge::stop(void) {
    if (m_Stopped.exchange(true)) {
        return 0;
    }

    requestStop();
    joinThreads();
    m_Receiver.disconnect();

    m_WebSocket.stop(Vision::Envelope::connection("closing", "Stream ending"));

    const Stats s = stats();
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO,
        "%s stopped: %llu frames processed, %llu sent, %.1f fps avg, %llu viewer evictions\r\n",
        m_name.c_str(),
        static_cast<unsigned long long>(s.framesProcessed),
        static_cast<unsigned long long>(s.framesSent),
        s.elapsedSec > 0.0 ? s.framesProcessed / s.elapsedSec : 0.0,
        static_cast<unsigned long long>(s.evictions));
    return 0;
}


void StreamBridge::mainProc() {
    Logger* logger = Logger::getLoggerInst();
    const std::chrono::milliseconds reconnectDelay(m_Config.reconnectDelayMs);

    // The bridge never gives up on the upstream server
    while (m_Running.load()) {
        if (m_Receiver.connect(m_Running) == 0) {
            const StreamReceiver::ExitReason reason = m_Receiver.run(m_Running);
            m_Receiver.disconnect();

            if (reason == StreamReceiver::ExitReason::Stopped) {
                break;
            }
            logger->log(Logger::LOG_LVL_WARN, "%s: upstream lost (%s), reconnecting\r\n", m_name.c_str(),
                        StreamReceiver::exitReasonName(reason));
        }
        sleepFor(reconnectDelay);
    }
}


void StreamBridge::forwardFrame(const Vision::CompleteFrame& frame) {
    m_FramesProcessed++;
    if (!frame.data || !m_WebSocket.hasPeer()) {
        return;
    }

    auto message = std::make_shared<const std::string>(
        Vision::Envelope::videoFrame(frame.frameID, *frame.data, Vision::Envelope::unixTimestamp()));
    m_WebSocket.publish(std::move(message));
    m_FramesSent++;
}


StreamBridge::Stats StreamBridge::stats(void) const {
    Stats s;
    s.framesProcessed = m_FramesProcessed.load();
    s.framesSent      = m_FramesSent.load();
    s.evictions       = m_WebSocket.evictions();
    s.elapsedSec      = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_StartTime).count();
    return s;
}

}  // namespace Modules

#include "app/video/StreamReceiver.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include "Devices/RegisterMap.hpp"
#include "Devices/network_interface/UdpServer.hpp"
#include "utils/logger.hpp"


namespace Vision {

using Protocol::ControlMessage;

namespace {
constexpr std::chrono::milliseconds MaxBackoff(8000);
constexpr std::chrono::milliseconds SweepInterval(100);
constexpr std::chrono::milliseconds SleepSlice(50);

// Sleep in short slices so a cleared running flag is noticed quickly
bool sleepWhileRunning(const std::atomic<bool>& running, std::chrono::milliseconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (running.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, SleepSlice));
    }
    return false;
}
}


StreamReceiver::StreamReceiver(const Config::ClientConfig& config, std::chrono::milliseconds stalenessWindow)
    : m_Config(config), m_Reassembler(stalenessWindow), m_RecvBuffer(Protocol::MaxUDPLen) {}


StreamReceiver::~StreamReceiver() {
    disconnect();
}


int StreamReceiver::openSocket(void) {
    if (m_Socket) {
        return 0;
    }

    try {
        // Ephemeral port on any interface; the server replies to the source address
        m_Socket = std::make_unique<Network::UdpServer>("0.0.0.0", 0, 0);
    } catch (const std::runtime_error& e) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Receiver socket: %s\r\n", e.what());
        return -1;
    }
    return 0;
}


bool StreamReceiver::sendControl(ControlMessage msg) {
    if (!m_Socket) {
        return false;
    }

    const std::string& text = Protocol::controlMessageText(msg);
    boost::system::error_code ec;
    if (!m_Socket->transmit(reinterpret_cast<const uint8_t*>(text.data()), text.size(), m_Server, ec)) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Failed to send %s to %s: %s\r\n", text.c_str(),
                                     Network::toString(m_Server).c_str(), ec.message().c_str());
        return false;
    }
    if (msg == ControlMessage::Ping) {
        m_PingsSent++;
    }
    return true;
}


bool StreamReceiver::awaitConnected(const std::atomic<bool>& running) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_Config.handshakeTimeoutMs);
    const std::chrono::milliseconds slice(std::max(1, std::min(m_Config.readTimeoutMs, m_Config.handshakeTimeoutMs)));

    while (running.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        udp::endpoint sender;
        boost::system::error_code ec;
        const size_t len = m_Socket->receive(m_RecvBuffer, sender, std::min(remaining + std::chrono::milliseconds(1), slice), ec);
        if (ec == boost::asio::error::timed_out) {
            continue;
        }
        if (ec) {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Handshake receive error: %s\r\n", ec.message().c_str());
            return false;
        }

        // Chunks left over from an earlier session may arrive first
        std::optional<ControlMessage> msg = Protocol::parseControlMessage(m_RecvBuffer.data(), len);
        if (msg && *msg == ControlMessage::Connected) {
            return true;
        }
    }
    return false;
}


int StreamReceiver::connect(const std::atomic<bool>& running) {
    Logger* logger = Logger::getLoggerInst();

    std::optional<udp::endpoint> server = Network::UdpServer::resolve(m_Config.host, m_Config.port);
    if (!server) {
        logger->log(Logger::LOG_LVL_ERROR, "Cannot resolve stream server %s:%u\r\n", m_Config.host.c_str(), m_Config.port);
        return -1;
    }
    m_Server = *server;
    m_State.store(State::Connecting);

    std::chrono::milliseconds backoff(m_Config.retryBackoffMs);
    for (int attempt = 1; attempt <= m_Config.maxHandshakeAttempts && running.load(); attempt++) {
        if (openSocket() < 0) {
            m_State.store(State::Disconnected);
            return -1;
        }

        logger->log(Logger::LOG_LVL_INFO, "Connecting to %s (attempt %d/%d)\r\n",
                    Network::toString(m_Server).c_str(), attempt, m_Config.maxHandshakeAttempts);

        if (sendControl(ControlMessage::Connect) && awaitConnected(running)) {
            m_State.store(State::Connected);
            m_ReconnectRequested.store(false);
            m_Reassembler.clear();
            m_OrderGuard.reset();
            logger->log(Logger::LOG_LVL_INFO, "Connected to stream server %s\r\n", Network::toString(m_Server).c_str());
            return 0;
        }

        if (attempt < m_Config.maxHandshakeAttempts) {
            logger->log(Logger::LOG_LVL_WARN, "No CONNECTED from %s, retrying in %lld ms\r\n",
                        Network::toString(m_Server).c_str(), static_cast<long long>(backoff.count()));
            if (!sleepWhileRunning(running, backoff)) {
                break;
            }
            backoff = std::min(backoff * 2, MaxBackoff);
        }
    }

    m_State.store(State::Disconnected);
    if (running.load()) {
        logger->log(Logger::LOG_LVL_ERROR, "Stream server %s unreachable after %d attempts\r\n",
                    Network::toString(m_Server).c_str(), m_Config.maxHandshakeAttempts);
    }
    return -1;
}


StreamReceiver::ExitReason StreamReceiver::run(const std::atomic<bool>& running) {
    if (m_State.load() != State::Connected || !m_Socket) {
        return ExitReason::NotConnected;
    }

    Logger* logger = Logger::getLoggerInst();
    const std::chrono::milliseconds readTimeout(m_Config.readTimeoutMs);
    const std::chrono::milliseconds keepAlive(m_Config.keepAliveMs);

    auto lastPing = std::chrono::steady_clock::now();
    auto lastSweep = lastPing;
    int silentTimeouts = 0;

    while (running.load()) {
        if (m_ReconnectRequested.exchange(false)) {
            return ExitReason::ReconnectRequested;
        }

        udp::endpoint sender;
        boost::system::error_code ec;
        const size_t len = m_Socket->receive(m_RecvBuffer, sender, readTimeout, ec);
        const auto now = std::chrono::steady_clock::now();

        if (ec == boost::asio::error::timed_out) {
            m_ReadTimeouts++;
            silentTimeouts++;
            sendControl(ControlMessage::Ping);
            lastPing = now;
            m_Reassembler.sweep(now);
            lastSweep = now;

            if (m_Config.maxSilentTimeouts > 0 && silentTimeouts >= m_Config.maxSilentTimeouts) {
                logger->log(Logger::LOG_LVL_WARN, "No data from %s for %d read timeouts\r\n",
                            Network::toString(m_Server).c_str(), silentTimeouts);
                return ExitReason::Timeout;
            }
            continue;
        }
        if (ec) {
            if (!running.load()) {
                break;
            }
            logger->log(Logger::LOG_LVL_WARN, "Stream receive error: %s\r\n", ec.message().c_str());
            return ExitReason::Error;
        }

        silentTimeouts = 0;

        std::optional<ControlMessage> msg = Protocol::parseControlMessage(m_RecvBuffer.data(), len);
        if (msg) {
            switch (*msg) {
                case ControlMessage::StreamEnd:
                    logger->log(Logger::LOG_LVL_INFO, "Server %s ended the stream\r\n", Network::toString(sender).c_str());
                    m_State.store(State::Disconnected);
                    onStreamEnd();
                    return ExitReason::StreamEnded;

                case ControlMessage::Pong:
                    m_PongsReceived++;
                    break;

                default:
                    break;
            }
        } else {
            std::optional<CompleteFrame> frame = m_Reassembler.feed(m_RecvBuffer.data(), len, now);
            if (frame) {
                if (m_OrderGuard.accept(frame->frameID, now)) {
                    deliver(*frame);
                } else {
                    m_FramesOutOfOrder++;
                    logger->log(Logger::LOG_LVL_DEBUG, "Discarding late frame %u\r\n", frame->frameID);
                }
            }
        }

        if (now - lastSweep >= SweepInterval) {
            m_Reassembler.sweep(now);
            lastSweep = now;
        }

        // Keep the session alive while frames flow so the server's inactivity timer never fires
        if (now - lastPing >= keepAlive) {
            sendControl(ControlMessage::Ping);
            lastPing = now;
        }
    }
    return ExitReason::Stopped;
}


void StreamReceiver::deliver(const CompleteFrame& frame) {
    m_FramesDelivered++;
    m_BytesDelivered += frame.size();
    RegisterMap::getInstance()->increment(RegisterMap::RegisterKeys::FramesReceived);
    onFrame(frame);
}


void StreamReceiver::disconnect(void) {
    if (!m_Socket) {
        m_State.store(State::Disconnected);
        return;
    }

    if (m_State.load() == State::Connected) {
        sendControl(ControlMessage::Disconnect);
        Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Disconnected from %s\r\n", Network::toString(m_Server).c_str());
    }
    m_State.store(State::Disconnected);
    m_Socket->close();
    m_Socket.reset();
    m_Reassembler.clear();
}


StreamReceiver::Stats StreamReceiver::stats(void) const {
    Stats s;
    s.framesDelivered  = m_FramesDelivered.load();
    s.bytesDelivered   = m_BytesDelivered.load();
    s.framesOutOfOrder = m_FramesOutOfOrder.load();
    s.readTimeouts     = m_ReadTimeouts.load();
    s.pingsSent        = m_PingsSent.load();
    s.pongsReceived    = m_PongsReceived.load();
    s.reassembly       = m_Reassembler.stats();
    return s;
}


const char* StreamReceiver::exitReasonName(ExitReason reason) {
    switch (reason) {
        case ExitReason::Stopped:            return "stopped";
        case ExitReason::StreamEnded:        return "stream ended";
        case ExitReason::Timeout:            return "timeout";
        case ExitReason::ReconnectRequested: return "reconnect requested";
        case ExitReason::Error:              return "socket error";
        case ExitReason::NotConnected:       return "not connected";
        default:                             return "unknown";
    }
}

}  // namespace Vision

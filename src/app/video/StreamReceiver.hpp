#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

#include <boost/signals2.hpp>

#include "app/video/FrameReassembler.hpp"
#include "app/video/VideoProtocol.hpp"
#include "Devices/network_interface/sockets.hpp"
#include "utils/config.hpp"


namespace Vision {
/**
 * @brief Client side of the stream protocol: handshake, keep-alive, reassembly and
 *        ordering. Used by the viewer and by the bridge.
 *
 * connect(), run() and disconnect() are called from one thread. Completed frames are
 * published through onFrame on that thread.
 */
class StreamReceiver {
public:
    enum class State : uint8_t {
        Disconnected,
        Connecting,
        Connected
    };

    enum class ExitReason : uint8_t {
        Stopped,             // running flag cleared
        StreamEnded,         // server sent STREAM_END
        Timeout,             // too many silent read timeouts
        ReconnectRequested,  // requestReconnect() was called
        Error,               // socket error
        NotConnected         // run() called without a successful connect()
    };

    struct Stats {
        uint64_t framesDelivered = 0;
        uint64_t bytesDelivered  = 0;
        uint64_t framesOutOfOrder = 0;
        uint64_t readTimeouts    = 0;
        uint64_t pingsSent       = 0;
        uint64_t pongsReceived   = 0;
        FrameReassembler::Stats reassembly;
    };

    /**
     * @brief Construct a receiver
     *
     * @param config Server address, timeouts and retry budget
     * @param stalenessWindow Age after which an incomplete frame is dropped
     */
    StreamReceiver(const Config::ClientConfig& config, std::chrono::milliseconds stalenessWindow);
    ~StreamReceiver();

    StreamReceiver(const StreamReceiver&) = delete;
    StreamReceiver& operator=(const StreamReceiver&) = delete;

    /**
     * @brief Perform the CONNECT/CONNECTED handshake, retrying with exponential backoff
     *
     * @param running Cleared by the owner to abandon the attempt
     * @return int 0 when connected, -1 when the attempt budget is exhausted or running was cleared
     */
    int connect(const std::atomic<bool>& running);

    /**
     * @brief Receive loop. Returns when the stream ends, times out, errors, or running is cleared.
     *
     * @param running Observed at every read timeout tick
     * @return ExitReason
     */
    ExitReason run(const std::atomic<bool>& running);

    /**
     * @brief Send DISCONNECT if connected and close the socket
     */
    void disconnect(void);

    /**
     * @brief Ask run() to return ExitReason::ReconnectRequested. Thread-safe.
     */
    void requestReconnect(void) {
        m_ReconnectRequested.store(true);
    }

    State state(void) const {
        return m_State.load();
    }

    Stats stats(void) const;

    /**
     * @brief Completed frame that passed the ordering check
     */
    boost::signals2::signal<void(const CompleteFrame&)> onFrame;

    /**
     * @brief Server announced STREAM_END
     */
    boost::signals2::signal<void()> onStreamEnd;

    static const char* exitReasonName(ExitReason reason);

private:
    int openSocket(void);
    bool sendControl(Protocol::ControlMessage msg);
    bool awaitConnected(const std::atomic<bool>& running);
    void deliver(const CompleteFrame& frame);

    Config::ClientConfig m_Config;
    FrameReassembler m_Reassembler;
    FrameOrderGuard m_OrderGuard;

    std::unique_ptr<Network::Sockets> m_Socket;
    udp::endpoint m_Server;
    std::vector<uint8_t> m_RecvBuffer;

    std::atomic<State> m_State{State::Disconnected};
    std::atomic<bool> m_ReconnectRequested{false};

    std::atomic<uint64_t> m_FramesDelivered{0};
    std::atomic<uint64_t> m_BytesDelivered{0};
    std::atomic<uint64_t> m_FramesOutOfOrder{0};
    std::atomic<uint64_t> m_ReadTimeouts{0};
    std::atomic<uint64_t> m_PingsSent{0};
    std::atomic<uint64_t> m_PongsReceived{0};
};
}  // namespace Vision

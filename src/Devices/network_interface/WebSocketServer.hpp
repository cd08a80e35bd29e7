#ifndef WEBSOCKET_SERVER_HPP
#define WEBSOCKET_SERVER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>


namespace Network {

namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp           = boost::asio::ip::tcp;

class WebSocketServer;

/**
 * @brief One WebSocket connection. All members run on the server's io_context thread.
 */
class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(tcp::socket&& socket, WebSocketServer& server, uint64_t id);

    /**
     * @brief Start the WebSocket handshake
     */
    void run(void);

    /**
     * @brief Queue a text message. When the queue is full the oldest unsent message is dropped.
     *
     * @return true if queued
     */
    bool send(std::shared_ptr<const std::string> message);

    /**
     * @brief Flush queued messages, then perform the closing handshake
     *
     * @param reason Close code and reason sent to the peer
     * @param onClosed Invoked once the connection is closed, successfully or not
     */
    void close(const websocket::close_reason& reason, std::function<void()> onClosed);

    bool isOpen(void) const {
        return m_Accepted && !m_Closing && !m_Closed;
    }

    const std::string& remote(void) const {
        return m_Remote;
    }

    uint64_t id(void) const {
        return m_ID;
    }

private:
    void onAccept(beast::error_code ec);
    void doRead(void);
    void onRead(beast::error_code ec, std::size_t bytes);
    void doWrite(void);
    void onWrite(beast::error_code ec, std::size_t bytes);
    void doClose(void);
    void finish(void);

    websocket::stream<beast::tcp_stream> m_Ws;
    beast::flat_buffer m_Buffer;
    std::deque<std::shared_ptr<const std::string>> m_Queue;
    WebSocketServer& m_Server;
    uint64_t m_ID;
    std::string m_Remote;

    bool m_Started  = false;
    bool m_Accepted = false;
    bool m_Writing  = false;
    bool m_Closing  = false;
    bool m_Closed   = false;
    websocket::close_reason m_CloseReason;
    std::function<void()> m_OnClosed;
};


/**
 * @brief WebSocket server that serves at most one peer.
 *
 * A new connection evicts the current peer with close code 1008 before its own
 * handshake starts. The io_context runs on a private thread; publish() and stop()
 * may be called from any thread.
 */
class WebSocketServer {
public:
    struct Options {
        std::string host = "0.0.0.0";
        uint16_t port    = 8765;
        std::chrono::milliseconds idleTimeout{30000};
        std::chrono::milliseconds handshakeTimeout{10000};
        bool keepAlivePings = true;
        std::size_t maxQueuedMessages = 4;
    };

    using MessageHandler = std::function<std::optional<std::string>(const std::string&)>;

    explicit WebSocketServer(const Options& options);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /**
     * @brief Bind, listen and start the io_context thread
     *
     * @return int 0 on success, -1 if the endpoint cannot be bound
     */
    int start(void);

    /**
     * @brief Stop accepting, send closingMessage to the peer, close it and join the io thread
     *
     * @param closingMessage Final text message, empty for none
     */
    void stop(const std::string& closingMessage = std::string());

    /**
     * @brief Hand a message to the io_context for delivery to the current peer
     */
    void publish(std::shared_ptr<const std::string> message);

    bool hasPeer(void) const {
        return m_HasPeer.load();
    }

    uint16_t localPort(void) const {
        return m_LocalPort;
    }

    /**
     * @brief Text sent to every peer right after its handshake
     */
    void setWelcomeMessage(const std::string& message) {
        m_WelcomeMessage = message;
    }

    /**
     * @brief Handler for text received from the peer; a returned string is sent back
     */
    void setMessageHandler(MessageHandler handler) {
        m_MessageHandler = std::move(handler);
    }

    uint64_t messagesSent(void) const { return m_MessagesSent.load(); }
    uint64_t messagesDropped(void) const { return m_MessagesDropped.load(); }
    uint64_t evictions(void) const { return m_Evictions.load(); }

private:
    friend class WebSocketSession;

    void doAccept(void);
    void onAccept(beast::error_code ec, tcp::socket socket);

    // Session callbacks, io_context thread only
    void sessionOpened(const std::shared_ptr<WebSocketSession>& session);
    void sessionClosed(const WebSocketSession* session);
    void sessionMessage(const std::shared_ptr<WebSocketSession>& session, const std::string& text);

    Options m_Options;
    boost::asio::io_context m_IoContext;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> m_Work;
    tcp::acceptor m_Acceptor;
    std::thread m_Thread;

    std::shared_ptr<WebSocketSession> m_Peer;
    uint64_t m_NextID = 0;

    std::string m_WelcomeMessage;
    MessageHandler m_MessageHandler;

    uint16_t m_LocalPort = 0;
    std::atomic<bool> m_Running{false};
    std::atomic<bool> m_HasPeer{false};
    std::atomic<uint64_t> m_MessagesSent{0};
    std::atomic<uint64_t> m_MessagesDropped{0};
    std::atomic<uint64_t> m_Evictions{0};
};

}  // namespace Network

#endif

#include "WebSocketServer.hpp"

#include <future>

#include <boost/beast/http.hpp>

#include "Devices/RegisterMap.hpp"
#include "utils/logger.hpp"


namespace Network {

namespace {
constexpr std::chrono::seconds CloseGracePeriod(3);
const char* const ServerName = "rc-stream-bridge";
}


WebSocketSession::WebSocketSession(tcp::socket&& socket, WebSocketServer& server, uint64_t id)
    : m_Ws(std::move(socket)), m_Server(server), m_ID(id) {
    beast::error_code ec;
    const tcp::endpoint ep = beast::get_lowest_layer(m_Ws).socket().remote_endpoint(ec);
    m_Remote = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
}


void WebSocketSession::run(void) {
    if (m_Started || m_Closed) {
        return;
    }
    m_Started = true;

    // The websocket stream has its own timeouts
    beast::get_lowest_layer(m_Ws).expires_never();

    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = m_Server.m_Options.handshakeTimeout;
    opt.idle_timeout      = m_Server.m_Options.idleTimeout;
    opt.keep_alive_pings  = m_Server.m_Options.keepAlivePings;
    m_Ws.set_option(opt);

    m_Ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(beast::http::field::server, ServerName);
    }));
    m_Ws.text(true);

    m_Ws.async_accept(beast::bind_front_handler(&WebSocketSession::onAccept, shared_from_this()));
}


void WebSocketSession::onAccept(beast::error_code ec) {
    if (m_Closing) {
        if (ec) {
            finish();
        } else {
            m_Accepted = true;
            doClose();
        }
        return;
    }

    if (ec) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "WebSocket handshake with %s failed: %s\r\n",
                                     m_Remote.c_str(), ec.message().c_str());
        finish();
        return;
    }

    m_Accepted = true;
    m_Server.sessionOpened(shared_from_this());
    doRead();
}


void WebSocketSession::doRead(void) {
    m_Ws.async_read(m_Buffer, beast::bind_front_handler(&WebSocketSession::onRead, shared_from_this()));
}


void WebSocketSession::onRead(beast::error_code ec, std::size_t bytes) {
    (void)bytes;
    if (m_Closed) {
        return;
    }

    if (ec) {
        // A close we initiated completes in doClose()
        if (m_Closing) {
            return;
        }
        if (ec == websocket::error::closed) {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Viewer %s closed the connection\r\n", m_Remote.c_str());
        } else {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Viewer %s dropped: %s\r\n",
                                         m_Remote.c_str(), ec.message().c_str());
        }
        finish();
        return;
    }

    if (m_Ws.got_text()) {
        const std::string text = beast::buffers_to_string(m_Buffer.data());
        m_Server.sessionMessage(shared_from_this(), text);
    }
    m_Buffer.consume(m_Buffer.size());
    doRead();
}


bool WebSocketSession::send(std::shared_ptr<const std::string> message) {
    if (!message || !isOpen()) {
        return false;
    }

    // The message at the front is on the wire while a write is in progress
    const std::size_t inFlight = m_Writing ? 1 : 0;
    const std::size_t limit = m_Server.m_Options.maxQueuedMessages;
    if (limit > 0 && m_Queue.size() - inFlight >= limit) {
        m_Queue.erase(m_Queue.begin() + static_cast<std::ptrdiff_t>(inFlight));
        m_Server.m_MessagesDropped++;
    }

    m_Queue.push_back(std::move(message));
    if (!m_Writing) {
        doWrite();
    }
    return true;
}


void WebSocketSession::doWrite(void) {
    m_Writing = true;
    m_Ws.async_write(boost::asio::buffer(*m_Queue.front()),
                     beast::bind_front_handler(&WebSocketSession::onWrite, shared_from_this()));
}


void WebSocketSession::onWrite(beast::error_code ec, std::size_t bytes) {
    (void)bytes;
    m_Writing = false;
    if (m_Closed) {
        return;
    }

    if (ec) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Write to viewer %s failed: %s\r\n",
                                     m_Remote.c_str(), ec.message().c_str());
        finish();
        return;
    }

    m_Server.m_MessagesSent++;
    m_Queue.pop_front();
    if (!m_Queue.empty()) {
        doWrite();
        return;
    }

    if (m_Closing) {
        doClose();
    }
}


void WebSocketSession::close(const websocket::close_reason& reason, std::function<void()> onClosed) {
    if (m_Closed) {
        if (onClosed) {
            onClosed();
        }
        return;
    }

    if (m_Closing) {
        std::function<void()> previous = std::move(m_OnClosed);
        m_OnClosed = [previous, onClosed]() {
            if (previous) previous();
            if (onClosed) onClosed();
        };
        return;
    }

    m_Closing = true;
    m_CloseReason = reason;
    m_OnClosed = std::move(onClosed);

    if (!m_Accepted) {
        // No WebSocket yet: drop the TCP connection. A pending handshake completes with an error.
        beast::get_lowest_layer(m_Ws).close();
        if (!m_Started) {
            finish();
        }
        return;
    }

    if (!m_Writing) {
        doClose();
    }
}


void WebSocketSession::doClose(void) {
    auto self = shared_from_this();
    m_Ws.async_close(m_CloseReason, [self](beast::error_code ec) {
        if (ec) {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Close handshake with %s: %s\r\n",
                                         self->m_Remote.c_str(), ec.message().c_str());
        }
        self->finish();
    });
}


void WebSocketSession::finish(void) {
    if (m_Closed) {
        return;
    }
    m_Closed = true;
    m_Queue.clear();
    beast::get_lowest_layer(m_Ws).close();

    m_Server.sessionClosed(this);

    if (m_OnClosed) {
        std::function<void()> callback = std::move(m_OnClosed);
        m_OnClosed = nullptr;
        callback();
    }
}


WebSocketServer::WebSocketServer(const Options& options)
    : m_Options(options),
      m_Work(boost::asio::make_work_guard(m_IoContext)),
      m_Acceptor(m_IoContext) {}


WebSocketServer::~WebSocketServer() {
    stop();
}


int WebSocketServer::start(void) {
    Logger* logger = Logger::getLoggerInst();
    if (m_Running.load()) {
        return 0;
    }

    beast::error_code ec;
    const boost::asio::ip::address address = boost::asio::ip::make_address(m_Options.host, ec);
    if (ec) {
        logger->log(Logger::LOG_LVL_ERROR, "Invalid WebSocket bind address %s\r\n", m_Options.host.c_str());
        return -1;
    }

    const tcp::endpoint endpoint(address, m_Options.port);
    m_Acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
        m_Acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        m_Acceptor.bind(endpoint, ec);
    }
    if (!ec) {
        m_Acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        logger->log(Logger::LOG_LVL_ERROR, "Failed to listen on %s:%u: %s\r\n",
                    m_Options.host.c_str(), m_Options.port, ec.message().c_str());
        beast::error_code ignored;
        m_Acceptor.close(ignored);
        return -1;
    }

    m_LocalPort = m_Acceptor.local_endpoint(ec).port();
    m_Running.store(true);
    doAccept();

    m_Thread = std::thread([this]() {
        try {
            m_IoContext.run();
        } catch (const std::exception& e) {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "WebSocket io_context stopped: %s\r\n", e.what());
        }
    });

    logger->log(Logger::LOG_LVL_INFO, "WebSocket server listening on ws://%s:%u\r\n",
                m_Options.host.c_str(), m_LocalPort);
    return 0;
}


void WebSocketServer::stop(const std::string& closingMessage) {
    if (!m_Running.exchange(false)) {
        return;
    }

    auto closed = std::make_shared<std::promise<void>>();
    std::future<void> closedFuture = closed->get_future();

    boost::asio::post(m_IoContext, [this, closed, closingMessage]() {
        beast::error_code ec;
        m_Acceptor.close(ec);

        std::shared_ptr<WebSocketSession> peer = std::move(m_Peer);
        m_Peer.reset();
        m_HasPeer.store(false);

        if (!peer) {
            closed->set_value();
            return;
        }

        if (!closingMessage.empty()) {
            peer->send(std::make_shared<const std::string>(closingMessage));
        }
        peer->close(websocket::close_reason(websocket::close_code::going_away, "server shutdown"),
                    [closed]() { closed->set_value(); });
    });

    if (closedFuture.wait_for(CloseGracePeriod) != std::future_status::ready) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "WebSocket peer did not finish closing\r\n");
    }

    m_Work.reset();
    m_IoContext.stop();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }

    RegisterMap::getInstance()->set(RegisterMap::RegisterKeys::BridgePeer, std::string());
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "WebSocket server stopped (%llu sent, %llu dropped, %llu evictions)\r\n",
                                 static_cast<unsigned long long>(m_MessagesSent.load()),
                                 static_cast<unsigned long long>(m_MessagesDropped.load()),
                                 static_cast<unsigned long long>(m_Evictions.load()));
}


void WebSocketServer::publish(std::shared_ptr<const std::string> message) {
    if (!message || !m_Running.load()) {
        return;
    }

    boost::asio::post(m_IoContext, [this, message]() {
        if (!m_Peer || !m_Peer->isOpen() || !m_Peer->send(message)) {
            m_MessagesDropped++;
        }
    });
}


void WebSocketServer::doAccept(void) {
    m_Acceptor.async_accept([this](beast::error_code ec, tcp::socket socket) {
        onAccept(ec, std::move(socket));
    });
}


void WebSocketServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == boost::asio::error::operation_aborted || !m_Running.load()) {
            return;
        }
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "WebSocket accept failed: %s\r\n", ec.message().c_str());
        doAccept();
        return;
    }

    if (!m_Running.load()) {
        return;
    }

    auto session = std::make_shared<WebSocketSession>(std::move(socket), *this, ++m_NextID);
    std::shared_ptr<WebSocketSession> previous = std::move(m_Peer);
    m_Peer = session;
    m_HasPeer.store(false);

    if (previous) {
        // Single viewer: the current peer is closed before the newcomer's handshake starts
        m_Evictions++;
        Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Single-viewer policy: closing %s, replaced by %s\r\n",
                                     previous->remote().c_str(), session->remote().c_str());

        std::weak_ptr<WebSocketSession> next = session;
        previous->close(websocket::close_reason(websocket::close_code::policy_error, "replaced by new viewer"),
                        [next]() {
                            if (auto s = next.lock()) {
                                s->run();
                            }
                        });
    } else {
        session->run();
    }

    doAccept();
}


void WebSocketServer::sessionOpened(const std::shared_ptr<WebSocketSession>& session) {
    if (session != m_Peer) {
        // Superseded while its handshake was in flight
        session->close(websocket::close_reason(websocket::close_code::policy_error, "replaced by new viewer"), nullptr);
        return;
    }

    m_HasPeer.store(true);
    RegisterMap::getInstance()->set(RegisterMap::RegisterKeys::BridgePeer, session->remote());
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Viewer connected: %s\r\n", session->remote().c_str());

    if (!m_WelcomeMessage.empty()) {
        session->send(std::make_shared<const std::string>(m_WelcomeMessage));
    }
}


void WebSocketServer::sessionClosed(const WebSocketSession* session) {
    if (m_Peer.get() != session) {
        return;
    }

    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Viewer disconnected: %s\r\n", m_Peer->remote().c_str());
    m_Peer.reset();
    RegisterMap::getInstance()->set(RegisterMap::RegisterKeys::BridgePeer, std::string());
    m_HasPeer.store(false);
}


void WebSocketServer::sessionMessage(const std::shared_ptr<WebSocketSession>& session, const std::string& text) {
    if (!m_MessageHandler) {
        return;
    }

    std::optional<std::string> reply = m_MessageHandler(text);
    if (reply) {
        session->send(std::make_shared<const std::string>(std::move(*reply)));
    }
}

}  // namespace Network

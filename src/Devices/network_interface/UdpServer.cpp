#include "UdpServer.hpp"

#include <poll.h>

#include <cerrno>
#include <stdexcept>

#include "utils/logger.hpp"
#include "app/video/VideoProtocol.hpp"


using namespace Network;

namespace {
// Longest wait for send buffer space once the kernel reports EAGAIN
constexpr int SendWaitMs = 100;
}


UdpServer::UdpServer(const std::string& host, unsigned short port, std::size_t sendBufferSize)
    : m_Socket(m_IoContext) {
    Logger* logger = Logger::getLoggerInst();

    std::string ipAddress = host.empty() ? "0.0.0.0" : host;
    std::optional<std::string> ifaceAddress = Sockets::findInterface(ipAddress.c_str());
    if (ifaceAddress) {
        ipAddress = *ifaceAddress;
    }

    boost::system::error_code ec;
    boost::asio::ip::address address = boost::asio::ip::make_address(ipAddress, ec);
    if (ec) {
        std::optional<udp::endpoint> resolved = UdpServer::resolve(ipAddress, port);
        if (!resolved) {
            logger->log(Logger::LOG_LVL_ERROR, "Could not resolve bind address %s\r\n", ipAddress.c_str());
            throw std::runtime_error("Could not resolve bind address " + ipAddress);
        }
        address = resolved->address();
    }

    udp::endpoint listenEndpoint(address, port);
    m_Socket.open(listenEndpoint.protocol(), ec);
    if (ec) {
        logger->log(Logger::LOG_LVL_ERROR, "Failed to open UDP socket: %s\r\n", ec.message().c_str());
        throw std::runtime_error("Failed to open UDP socket: " + ec.message());
    }

    m_Socket.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
        logger->log(Logger::LOG_LVL_WARN, "SO_REUSEADDR not applied: %s\r\n", ec.message().c_str());
    }

    if (sendBufferSize > 0) {
        m_Socket.set_option(boost::asio::socket_base::send_buffer_size(static_cast<int>(sendBufferSize)), ec);
        if (ec) {
            logger->log(Logger::LOG_LVL_WARN, "SO_SNDBUF not applied: %s\r\n", ec.message().c_str());
        }
    }

    m_Socket.bind(listenEndpoint, ec);
    if (ec) {
        logger->log(Logger::LOG_LVL_ERROR, "Failed to bind UDP socket %s:%u: %s\r\n",
                    address.to_string().c_str(), port, ec.message().c_str());
        boost::system::error_code ignored;
        m_Socket.close(ignored);
        throw std::runtime_error("Failed to bind UDP socket: " + ec.message());
    }

    m_LocalEndpoint = m_Socket.local_endpoint(ec);
    m_Fd = m_Socket.native_handle();

    logger->log(Logger::LOG_LVL_INFO, "Opened UDP socket: %s:%u\r\n",
                address.to_string().c_str(), m_LocalEndpoint.port());
}


UdpServer::~UdpServer() {
    close();
}


bool UdpServer::transmit(const uint8_t* pBuf, size_t length, const udp::endpoint& dest, boost::system::error_code& ec) {
    std::lock_guard<std::mutex> lock(m_TxMutex);
    if (m_Fd < 0) {
        ec = boost::asio::error::bad_descriptor;
        return false;
    }

    // asio marks the descriptor non-blocking for async receives, so EAGAIN means the
    // send buffer is full: wait briefly for room instead of dropping the chunk
    for (;;) {
        const ssize_t sent = ::sendto(m_Fd, pBuf, length, MSG_NOSIGNAL, dest.data(),
                                      static_cast<socklen_t>(dest.size()));
        if (sent >= 0) {
            ec.clear();
            return static_cast<size_t>(sent) == length;
        }

        const int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (err == EAGAIN || err == EWOULDBLOCK) {
            struct pollfd pfd = {m_Fd, POLLOUT, 0};
            const int ready = ::poll(&pfd, 1, SendWaitMs);
            if (ready > 0) {
                continue;
            }
            if (ready == 0) {
                ec = boost::asio::error::would_block;
                return false;
            }
            if (errno == EINTR) {
                continue;
            }
            ec = boost::system::error_code(errno, boost::system::system_category());
            return false;
        }

        ec = boost::system::error_code(err, boost::system::system_category());
        return false;
    }
}


size_t UdpServer::receive(std::vector<uint8_t>& buffer, udp::endpoint& sender,
                          std::chrono::milliseconds timeout, boost::system::error_code& ec) {
    std::lock_guard<std::mutex> lock(m_RxMutex);
    if (!m_Socket.is_open()) {
        ec = boost::asio::error::bad_descriptor;
        return 0;
    }

    if (buffer.size() < Vision::Protocol::MaxUDPLen) {
        buffer.resize(Vision::Protocol::MaxUDPLen);
    }

    // Blocking receive with a deadline: start the async op and run the private
    // io_context for at most the timeout
    ec = boost::asio::error::would_block;
    std::size_t received = 0;
    m_Socket.async_receive_from(boost::asio::buffer(buffer), sender,
        [&ec, &received](const boost::system::error_code& err, std::size_t bytes) {
            ec = err;
            received = bytes;
        });

    m_IoContext.restart();
    m_IoContext.run_for(timeout);

    if (!m_IoContext.stopped()) {
        boost::system::error_code cancelEc;
        m_Socket.cancel(cancelEc);
        m_IoContext.run();

        if (ec == boost::asio::error::operation_aborted) {
            ec = boost::asio::error::timed_out;
            return 0;
        }
    }

    return ec ? 0 : received;
}


void UdpServer::close(void) {
    std::lock_guard<std::mutex> rxLock(m_RxMutex);
    std::lock_guard<std::mutex> txLock(m_TxMutex);
    if (!m_Socket.is_open()) {
        return;
    }
    m_Fd = -1;

    boost::system::error_code ec;
    m_Socket.cancel(ec);
    m_Socket.close(ec);
    if (ec) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Failed to close UDP socket: %s\r\n", ec.message().c_str());
        return;
    }
    Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Closed UDP socket on port %u\r\n", m_LocalEndpoint.port());
}


udp::endpoint UdpServer::localEndpoint(void) const {
    return m_LocalEndpoint;
}


std::optional<udp::endpoint> UdpServer::resolve(const std::string& host, unsigned short port) {
    std::string target = host;
    std::optional<std::string> ifaceAddress = Sockets::findInterface(host.c_str());
    if (ifaceAddress) {
        target = *ifaceAddress;
    }

    boost::system::error_code ec;
    boost::asio::ip::address address = boost::asio::ip::make_address(target, ec);
    if (!ec) {
        return udp::endpoint(address, port);
    }

    boost::asio::io_context ioContext;
    udp::resolver resolver(ioContext);
    udp::resolver::results_type results = resolver.resolve(udp::v4(), target, std::to_string(port), ec);
    if (ec || results.empty()) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Failed to resolve %s: %s\r\n",
                                     target.c_str(), ec ? ec.message().c_str() : "no results");
        return std::nullopt;
    }
    return results.begin()->endpoint();
}

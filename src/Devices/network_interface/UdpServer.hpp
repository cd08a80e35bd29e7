#ifndef UdpServer_HPP
#define UdpServer_HPP

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

#include "sockets.hpp"
#include <boost/asio.hpp>

namespace Network {

/**
 * @brief Bound UDP socket with timed receives.
 *
 * One thread may sit in receive() while other threads call transmit(). Only receive()
 * and close() touch the asio socket object; transmit() writes to the raw descriptor
 * with ::sendto, relying on the kernel allowing a concurrent sendto/recvfrom pair on
 * one datagram socket. Sends are serialized among themselves.
 */
class UdpServer : public Sockets {
public:
    static constexpr std::size_t DefaultSendBuffer = 1024 * 1024;

    /**
     * @brief Open and bind the socket
     *
     * @param host Interface name, IPv4 address, or "0.0.0.0"/empty for any
     * @param port Port to bind, 0 for an ephemeral port
     * @param sendBufferSize SO_SNDBUF in bytes, 0 keeps the OS default
     * @throws std::runtime_error if the address cannot be resolved or bound
     */
    UdpServer(const std::string& host, unsigned short port, std::size_t sendBufferSize = DefaultSendBuffer);
    ~UdpServer();

    bool transmit(const uint8_t* pBuf, size_t length, const udp::endpoint& dest, boost::system::error_code& ec) override;

    size_t receive(std::vector<uint8_t>& buffer, udp::endpoint& sender,
                   std::chrono::milliseconds timeout, boost::system::error_code& ec) override;

    void close(void) override;

    udp::endpoint localEndpoint(void) const override;

    /**
     * @brief Resolve a host name or address to a UDP endpoint
     *
     * @param host Host name, dotted address or interface name
     * @param port Destination port
     * @return std::optional<udp::endpoint>
     */
    static std::optional<udp::endpoint> resolve(const std::string& host, unsigned short port);

private:
    boost::asio::io_context m_IoContext;
    udp::socket m_Socket;
    udp::endpoint m_LocalEndpoint;

    int m_Fd = -1;  // Guarded by m_TxMutex

    std::mutex m_RxMutex;
    std::mutex m_TxMutex;
};

}

#endif

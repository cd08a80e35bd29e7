#ifndef SOCKETS_HPP
#define SOCKETS_HPP

#include <sys/socket.h>
#include <netinet/in.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <arpa/inet.h>
#include <netdb.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>

using boost::asio::ip::udp;

namespace Network {

/**
 * @brief Datagram socket seam. The stream server, the viewer and the bridge talk to the
 *        network only through this interface so tests can substitute a fake.
 */
class Sockets {
public:
    virtual ~Sockets() {}

    /**
     * @brief Send one datagram
     *
     * @param pBuf Pointer to datagram
     * @param length Datagram length
     * @param dest Destination endpoint
     * @param ec Set on failure
     * @return true if the whole datagram was handed to the kernel
     */
    virtual bool transmit(const uint8_t* pBuf, size_t length, const udp::endpoint& dest, boost::system::error_code& ec) = 0;

    /**
     * @brief Block until a datagram arrives or the timeout elapses
     *
     * @param buffer Receive buffer, resized to hold a maximum size datagram if smaller
     * @param sender Source endpoint of the datagram
     * @param timeout Maximum time to wait
     * @param ec boost::asio::error::timed_out on timeout, other errors as reported by the OS
     * @return size_t Number of bytes received
     */
    virtual size_t receive(std::vector<uint8_t>& buffer, udp::endpoint& sender,
                           std::chrono::milliseconds timeout, boost::system::error_code& ec) = 0;

    virtual void close(void) = 0;

    virtual udp::endpoint localEndpoint(void) const = 0;

    /**
     * @brief Look up the IPv4 address of a network interface
     *
     * @param name Interface name, e.g. "wlan0"
     * @return std::optional<std::string> Dotted address, or nullopt if the interface has none
     */
    static std::optional<std::string> findInterface(const char* name) {
        if (!name) {
            return std::nullopt;
        }

        struct ifaddrs* ifaddr = nullptr;
        if (getifaddrs(&ifaddr) == -1) {
            return std::nullopt;
        }

        std::string ipAddress;
        for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
            if (ifa->ifa_addr == nullptr) continue;

            if (ifa->ifa_addr->sa_family == AF_INET &&
                std::string(ifa->ifa_name) == name) {
                char host[NI_MAXHOST];
                int s = getnameinfo(ifa->ifa_addr, sizeof(struct sockaddr_in),
                                    host, NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);
                if (s == 0) {
                    ipAddress = host;
                    break;
                }
            }
        }
        freeifaddrs(ifaddr);

        if (ipAddress.empty()) {
            return std::nullopt;
        }

        return ipAddress;
    }
};


inline std::string toString(const udp::endpoint& endpoint) {
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

}  // namespace Network

#endif

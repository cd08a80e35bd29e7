#ifndef SESSION_REGISTRY_HPP
#define SESSION_REGISTRY_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <vector>

#include <boost/asio.hpp>

using boost::asio::ip::udp;

namespace Network {

/**
 * @brief Set of datagram peers currently subscribed to the stream.
 *
 * Mutated by the control loop, snapshotted by the broadcast loop. Every method takes the
 * same mutex; snapshot() returns a copy so callers never iterate under the lock.
 */
class SessionRegistry {
public:
    using Clock = std::chrono::steady_clock;

    struct Session {
        udp::endpoint endpoint;
        Clock::time_point connectedAt;
        Clock::time_point lastSeen;
    };

    /**
     * @brief Register a peer, or refresh it if already present
     *
     * @return true if the peer was not registered before
     */
    bool add(const udp::endpoint& peer, Clock::time_point now = Clock::now());

    /**
     * @brief Remove a peer
     *
     * @return true if the peer was registered
     */
    bool remove(const udp::endpoint& peer);

    /**
     * @brief Refresh last_seen of a registered peer
     *
     * @return true if the peer is registered
     */
    bool touch(const udp::endpoint& peer, Clock::time_point now = Clock::now());

    bool contains(const udp::endpoint& peer) const;

    std::vector<udp::endpoint> snapshot() const;

    std::vector<Session> sessions() const;

    std::size_t count() const;

    void clear();

    /**
     * @brief Drop peers not heard from within the timeout
     *
     * @param now Current time
     * @param timeout Inactivity limit
     * @return std::vector<udp::endpoint> The peers removed
     */
    std::vector<udp::endpoint> evictInactive(Clock::time_point now, std::chrono::milliseconds timeout);

private:
    mutable std::mutex m_Mutex;
    std::map<udp::endpoint, Session> m_Sessions;
};

}  // namespace Network

#endif

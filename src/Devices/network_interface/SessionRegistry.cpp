#include "SessionRegistry.hpp"


namespace Network {

bool SessionRegistry::add(const udp::endpoint& peer, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    auto it = m_Sessions.find(peer);
    if (it != m_Sessions.end()) {
        it->second.lastSeen = now;
        return false;
    }

    m_Sessions.emplace(peer, Session{peer, now, now});
    return true;
}


bool SessionRegistry::remove(const udp::endpoint& peer) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Sessions.erase(peer) > 0;
}


bool SessionRegistry::touch(const udp::endpoint& peer, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    auto it = m_Sessions.find(peer);
    if (it == m_Sessions.end()) {
        return false;
    }
    it->second.lastSeen = now;
    return true;
}


bool SessionRegistry::contains(const udp::endpoint& peer) const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Sessions.find(peer) != m_Sessions.end();
}


std::vector<udp::endpoint> SessionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    std::vector<udp::endpoint> peers;
    peers.reserve(m_Sessions.size());
    for (const auto& entry : m_Sessions) {
        peers.push_back(entry.first);
    }
    return peers;
}


std::vector<SessionRegistry::Session> SessionRegistry::sessions() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    std::vector<Session> out;
    out.reserve(m_Sessions.size());
    for (const auto& entry : m_Sessions) {
        out.push_back(entry.second);
    }
    return out;
}


std::size_t SessionRegistry::count() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Sessions.size();
}


void SessionRegistry::clear() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Sessions.clear();
}


std::vector<udp::endpoint> SessionRegistry::evictInactive(Clock::time_point now, std::chrono::milliseconds timeout) {
    std::vector<udp::endpoint> evicted;
    std::lock_guard<std::mutex> lock(m_Mutex);
    for (auto it = m_Sessions.begin(); it != m_Sessions.end();) {
        if (now - it->second.lastSeen > timeout) {
            evicted.push_back(it->first);
            it = m_Sessions.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

}  // namespace Network

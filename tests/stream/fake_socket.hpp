#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "Devices/network_interface/sockets.hpp"


/**
 * @brief In-memory datagram socket. Records every transmit and serves injected datagrams
 *        to receive().
 */
class FakeSocket : public Network::Sockets {
public:
    struct Datagram {
        udp::endpoint peer;
        std::vector<uint8_t> bytes;

        std::string text() const {
            return std::string(bytes.begin(), bytes.end());
        }
    };

    bool transmit(const uint8_t* pBuf, size_t length, const udp::endpoint& dest, boost::system::error_code& ec) override {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_Failing.count(dest) > 0) {
            ec = boost::asio::error::host_unreachable;
            return false;
        }
        m_Sent.push_back(Datagram{dest, std::vector<uint8_t>(pBuf, pBuf + length)});
        m_Cv.notify_all();
        ec.clear();
        return true;
    }

    size_t receive(std::vector<uint8_t>& buffer, udp::endpoint& sender,
                   std::chrono::milliseconds timeout, boost::system::error_code& ec) override {
        std::unique_lock<std::mutex> lock(m_Mutex);
        if (!m_Cv.wait_for(lock, timeout, [this]() { return !m_Inbox.empty() || m_Closed; })) {
            ec = boost::asio::error::timed_out;
            return 0;
        }
        if (m_Inbox.empty()) {
            ec = boost::asio::error::operation_aborted;
            return 0;
        }

        Datagram d = std::move(m_Inbox.front());
        m_Inbox.pop_front();
        if (buffer.size() < d.bytes.size()) {
            buffer.resize(d.bytes.size());
        }
        std::copy(d.bytes.begin(), d.bytes.end(), buffer.begin());
        sender = d.peer;
        ec.clear();
        return d.bytes.size();
    }

    void close(void) override {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Closed = true;
        m_Cv.notify_all();
    }

    udp::endpoint localEndpoint(void) const override {
        return udp::endpoint(boost::asio::ip::make_address("0.0.0.0"), 9999);
    }

    void inject(const std::string& text, const udp::endpoint& from) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Inbox.push_back(Datagram{from, std::vector<uint8_t>(text.begin(), text.end())});
        m_Cv.notify_all();
    }

    void failFor(const udp::endpoint& peer) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Failing.insert(peer);
    }

    std::vector<Datagram> sent(void) const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return std::vector<Datagram>(m_Sent.begin(), m_Sent.end());
    }

    std::vector<Datagram> sentTo(const udp::endpoint& peer) const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        std::vector<Datagram> out;
        for (const auto& d : m_Sent) {
            if (d.peer == peer) {
                out.push_back(d);
            }
        }
        return out;
    }

    void clearSent(void) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Sent.clear();
    }

    bool closed(void) const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Closed;
    }

    /**
     * @brief Wait until pred holds for the sent datagrams
     */
    bool waitForSent(const std::function<bool(const std::vector<Datagram>&)>& pred, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_Mutex);
        return m_Cv.wait_for(lock, timeout, [&]() { return pred(m_Sent); });
    }

private:
    mutable std::mutex m_Mutex;
    std::condition_variable m_Cv;
    std::vector<Datagram> m_Sent;
    std::deque<Datagram> m_Inbox;
    std::set<udp::endpoint> m_Failing;
    bool m_Closed = false;
};


inline udp::endpoint makeEndpoint(const char* ip, unsigned short port) {
    return udp::endpoint(boost::asio::ip::make_address(ip), port);
}

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

#include "Devices/network_interface/UdpServer.hpp"

using Network::UdpServer;


namespace {
udp::endpoint loopback(unsigned short port) {
    return udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port);
}
}


TEST(UdpServer, TimedReceiveReportsTimeout) {
    UdpServer server("127.0.0.1", 0);
    ASSERT_NE(0, server.localEndpoint().port());

    std::vector<uint8_t> buffer;
    udp::endpoint sender;
    boost::system::error_code ec;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(0u, server.receive(buffer, sender, std::chrono::milliseconds(30), ec));
    EXPECT_EQ(boost::asio::error::timed_out, ec);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
}


TEST(UdpServer, DatagramReachesPeer) {
    UdpServer a("127.0.0.1", 0);
    UdpServer b("127.0.0.1", 0);

    const char* text = "CONNECT";
    boost::system::error_code ec;
    ASSERT_TRUE(a.transmit(reinterpret_cast<const uint8_t*>(text), std::strlen(text), b.localEndpoint(), ec));
    EXPECT_FALSE(ec);

    std::vector<uint8_t> buffer;
    udp::endpoint sender;
    const size_t len = b.receive(buffer, sender, std::chrono::milliseconds(1000), ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ("CONNECT", std::string(buffer.begin(), buffer.begin() + len));
    EXPECT_EQ(a.localEndpoint().port(), sender.port());
}


// One thread sits in timed receives while another sends on the same socket
TEST(UdpServer, SendWhileReceiving) {
    UdpServer a("127.0.0.1", 0);
    UdpServer b("127.0.0.1", 0);
    const udp::endpoint toA = loopback(a.localEndpoint().port());
    const udp::endpoint toB = loopback(b.localEndpoint().port());

    std::atomic<bool> running{true};
    std::atomic<int> receivedByA{0};
    std::thread rx([&]() {
        std::vector<uint8_t> buffer;
        while (running.load()) {
            udp::endpoint sender;
            boost::system::error_code ec;
            if (a.receive(buffer, sender, std::chrono::milliseconds(1), ec) > 0 && !ec) {
                receivedByA++;
            }
        }
    });

    std::thread echo([&]() {
        const uint8_t ping[] = {'P', 'I', 'N', 'G'};
        for (int i = 0; i < 200; i++) {
            boost::system::error_code ec;
            b.transmit(ping, sizeof(ping), toA, ec);
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    });

    const std::vector<uint8_t> chunk(512, 0x5A);
    int failures = 0;
    for (int i = 0; i < 20000; i++) {
        boost::system::error_code ec;
        if (!a.transmit(chunk.data(), chunk.size(), toB, ec)) {
            failures++;
        }
    }

    echo.join();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (receivedByA.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    running.store(false);
    rx.join();

    EXPECT_EQ(0, failures);
    EXPECT_GT(receivedByA.load(), 0);
}


TEST(UdpServer, TransmitAfterCloseFails) {
    UdpServer a("127.0.0.1", 0);
    const udp::endpoint self = loopback(a.localEndpoint().port());
    a.close();

    const uint8_t byte = 0;
    boost::system::error_code ec;
    EXPECT_FALSE(a.transmit(&byte, 1, self, ec));
    EXPECT_EQ(boost::asio::error::bad_descriptor, ec);

    std::vector<uint8_t> buffer;
    udp::endpoint sender;
    EXPECT_EQ(0u, a.receive(buffer, sender, std::chrono::milliseconds(10), ec));
    EXPECT_EQ(boost::asio::error::bad_descriptor, ec);
}

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "Devices/network_interface/SessionRegistry.hpp"

using Network::SessionRegistry;


namespace {
udp::endpoint ep(const char* ip, unsigned short port) {
    return udp::endpoint(boost::asio::ip::make_address(ip), port);
}
}


TEST(SessionRegistry, AddRemoveContains) {
    SessionRegistry reg;
    const auto a = ep("1.2.3.4", 5000);
    const auto b = ep("1.2.3.4", 5001);

    EXPECT_TRUE(reg.add(a));
    EXPECT_FALSE(reg.add(a));
    EXPECT_TRUE(reg.add(b));
    EXPECT_EQ(2u, reg.count());
    EXPECT_TRUE(reg.contains(a));

    EXPECT_TRUE(reg.remove(a));
    EXPECT_FALSE(reg.remove(a));
    EXPECT_FALSE(reg.contains(a));
    EXPECT_EQ(1u, reg.count());

    reg.clear();
    EXPECT_EQ(0u, reg.count());
}


TEST(SessionRegistry, TouchOnlyKnownPeers) {
    SessionRegistry reg;
    const auto a = ep("10.0.0.1", 9000);
    EXPECT_FALSE(reg.touch(a));
    EXPECT_EQ(0u, reg.count());

    reg.add(a);
    EXPECT_TRUE(reg.touch(a));
}


TEST(SessionRegistry, SnapshotIsACopy) {
    SessionRegistry reg;
    reg.add(ep("10.0.0.1", 1));
    reg.add(ep("10.0.0.2", 2));

    auto peers = reg.snapshot();
    reg.clear();
    EXPECT_EQ(2u, peers.size());
}


TEST(SessionRegistry, EvictsSilentPeers) {
    const auto t0 = SessionRegistry::Clock::now();
    const auto quiet = ep("10.0.0.1", 1);
    const auto chatty = ep("10.0.0.2", 2);

    SessionRegistry reg;
    reg.add(quiet, t0);
    reg.add(chatty, t0);
    reg.touch(chatty, t0 + std::chrono::seconds(10));

    auto evicted = reg.evictInactive(t0 + std::chrono::seconds(16), std::chrono::seconds(15));
    ASSERT_EQ(1u, evicted.size());
    EXPECT_EQ(quiet, evicted[0]);
    EXPECT_TRUE(reg.contains(chatty));

    // A refreshed CONNECT keeps the original connect time
    reg.add(chatty, t0 + std::chrono::seconds(20));
    auto sessions = reg.sessions();
    ASSERT_EQ(1u, sessions.size());
    EXPECT_EQ(t0, sessions[0].connectedAt);
    EXPECT_EQ(t0 + std::chrono::seconds(20), sessions[0].lastSeen);
}


TEST(SessionRegistry, ConcurrentMutation) {
    SessionRegistry reg;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&reg, t]() {
            for (int i = 0; i < 250; i++) {
                const auto peer = ep("127.0.0.1", static_cast<unsigned short>(10000 + t * 1000 + i));
                reg.add(peer);
                reg.snapshot();
                if (i % 2 == 0) {
                    reg.remove(peer);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(500u, reg.count());
}

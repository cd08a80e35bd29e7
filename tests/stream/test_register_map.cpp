#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "Devices/RegisterMap.hpp"


class RegisterMapTest : public ::testing::Test {
protected:
    void SetUp() override {
        RegisterMap::getInstance()->clear();
    }

    void TearDown() override {
        RegisterMap::getInstance()->clear();
    }
};


TEST_F(RegisterMapTest, TypedGet) {
    RegisterMap* reg = RegisterMap::getInstance();
    reg->set(RegisterMap::RegisterKeys::ServerEndpoint, std::string("0.0.0.0:9999"));
    reg->set(RegisterMap::RegisterKeys::ActivePeers, static_cast<int64_t>(3));

    EXPECT_EQ("0.0.0.0:9999", reg->get<std::string>(RegisterMap::RegisterKeys::ServerEndpoint).value());
    EXPECT_EQ(3, reg->get<int64_t>(RegisterMap::RegisterKeys::ActivePeers).value());

    // Wrong type or missing key
    EXPECT_FALSE(reg->get<double>(RegisterMap::RegisterKeys::ActivePeers).has_value());
    EXPECT_FALSE(reg->get<std::string>(RegisterMap::RegisterKeys::BridgePeer).has_value());

    reg->erase(RegisterMap::RegisterKeys::ActivePeers);
    EXPECT_FALSE(reg->get<int64_t>(RegisterMap::RegisterKeys::ActivePeers).has_value());
}


TEST_F(RegisterMapTest, IncrementCounter) {
    RegisterMap* reg = RegisterMap::getInstance();
    EXPECT_EQ(1, reg->increment(RegisterMap::RegisterKeys::FramesReceived));
    EXPECT_EQ(6, reg->increment(RegisterMap::RegisterKeys::FramesReceived, 5));

    reg->set(RegisterMap::RegisterKeys::BridgePeer, std::string("x"));
    EXPECT_EQ(-1, reg->increment(RegisterMap::RegisterKeys::BridgePeer));
    EXPECT_EQ(-1, reg->increment(RegisterMap::RegisterKeys::MaxKeys));
}


TEST_F(RegisterMapTest, ConcurrentIncrement) {
    RegisterMap* reg = RegisterMap::getInstance();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([reg]() {
            for (int i = 0; i < 1000; i++) {
                reg->increment(RegisterMap::RegisterKeys::FramesSent);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(4000, reg->get<int64_t>(RegisterMap::RegisterKeys::FramesSent).value());
}
